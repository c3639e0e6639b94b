#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Client
// ═══════════════════════════════════════════════════════════════════════════
// JSON-RPC 2.0 request/response over an IChannel, plus the MCP discovery
// handshake. At most one call is outstanding per client; concurrent callers
// queue on the call mutex.

#include "mcpmux/error.hpp"
#include "mcpmux/json/wire_json.hpp"
#include "mcpmux/protocol/descriptors.hpp"
#include "mcpmux/transport/channel.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcpmux {

// ─────────────────────────────────────────────────────────────────────────────
// Discovery Outcome
// ─────────────────────────────────────────────────────────────────────────────
// Each capability listing ends in exactly one of three ways. NotImplemented
// (JSON-RPC -32601) is an expected answer, not a failure.

template <typename T>
struct Listed {
    std::vector<T> items;
};

struct NotImplemented {};

struct Failed {
    Error error;
};

template <typename T>
using DiscoveryOutcome = std::variant<Listed<T>, NotImplemented, Failed>;

/// Items of a Listed outcome, empty otherwise
template <typename T>
[[nodiscard]] std::vector<T> items_or_empty(const DiscoveryOutcome<T>& outcome) {
    if (const auto* listed = std::get_if<Listed<T>>(&outcome)) {
        return listed->items;
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// ProtocolClient
// ─────────────────────────────────────────────────────────────────────────────

class ProtocolClient {
public:
    /// Upper bound on nextCursor pages followed per listing
    static constexpr std::size_t kMaxDiscoveryPages = 100;

    ProtocolClient(std::shared_ptr<IChannel> channel, std::string label, Implementation client_info);

    // Non-copyable, non-movable (owns a mutex)
    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    /// Send a request and wait for the response with the same id.
    ///   ConnectionFault     channel write/read failure or peer exit
    ///   ProtocolFault       no matching response in time, or a malformed one
    ///   ToolExecutionError  the response carried an error object
    ///   Cancelled           the channel was cancelled
    [[nodiscard]] Result<Json> call(const std::string& method,
                                    std::optional<Json> params,
                                    std::chrono::milliseconds timeout);

    [[nodiscard]] Result<void> notify(const std::string& method,
                                      std::optional<Json> params,
                                      std::chrono::milliseconds timeout);

    // ─────────────────────────────────────────────────────────────────────────
    // Handshake
    // ─────────────────────────────────────────────────────────────────────────

    /// initialize + notifications/initialized; returns the reported serverInfo
    [[nodiscard]] Result<std::optional<Implementation>> initialize(std::chrono::milliseconds timeout);

    [[nodiscard]] DiscoveryOutcome<ToolDescriptor> list_tools(std::chrono::milliseconds timeout);
    [[nodiscard]] DiscoveryOutcome<ResourceDescriptor> list_resources(std::chrono::milliseconds timeout);
    [[nodiscard]] DiscoveryOutcome<PromptDescriptor> list_prompts(std::chrono::milliseconds timeout);

    /// Initialize, then list tools, resources and prompts independently.
    /// Individual failures leave that list empty; only cancellation fails the whole.
    /// `timeout` bounds each call separately.
    [[nodiscard]] Result<Capabilities> handshake(std::chrono::milliseconds timeout);

    // ─────────────────────────────────────────────────────────────────────────
    // Invocation
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] Result<Json> call_tool(const std::string& name, const Json& arguments,
                                         std::chrono::milliseconds timeout);
    [[nodiscard]] Result<Json> read_resource(const std::string& uri, std::chrono::milliseconds timeout);
    [[nodiscard]] Result<Json> get_prompt(const std::string& name, const Json& arguments,
                                          std::chrono::milliseconds timeout);

    [[nodiscard]] const std::shared_ptr<IChannel>& channel() const noexcept { return channel_; }

private:
    template <typename T>
    [[nodiscard]] DiscoveryOutcome<T> discover(const std::string& method, const char* field,
                                               std::chrono::milliseconds timeout);

    void handle_server_request(const Json& request, std::chrono::milliseconds timeout);

    std::shared_ptr<IChannel> channel_;
    std::string label_;
    Implementation client_info_;

    std::mutex call_mutex_;
    std::int64_t next_id_{1};
    WireDecoder decoder_;
};

}  // namespace mcpmux
