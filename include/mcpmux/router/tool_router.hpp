#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Tool Router
// ═══════════════════════════════════════════════════════════════════════════
// Public face of mcpmux. Owns the connection registry and routes tool,
// resource and prompt calls to the live connection of the named server.
//
// Usage:
//   auto router = mcpmux::ToolRouter::create();
//   auto server = router->add_server({.id = "git", .command = "uvx", .args = {"mcp-server-git"}});
//   auto started = router->start_server(server.id);
//   auto result = router->execute_tool("git", "git_status", {{"repo_path", "."}});

#include "mcpmux/config/hub_config.hpp"
#include "mcpmux/error.hpp"
#include "mcpmux/host/host_profile.hpp"
#include "mcpmux/protocol/descriptors.hpp"
#include "mcpmux/registry/connection_registry.hpp"
#include "mcpmux/registry/server_config.hpp"
#include "mcpmux/transport/transport_adapter.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux {

struct ToolCall {
    std::string server_id;
    std::string tool_name;
    Json arguments = Json::object();
};

struct ToolCallOutcome {
    ToolCall call;
    std::string server_name;
    Result<Json> result;
};

class ToolRouter {
public:
    ToolRouter(HubConfig config, HostProfile host, std::shared_ptr<ITransportAdapter> adapter);

    /// Router for this process: host profile and child environment come from
    /// the current environment, processes are spawned by TransportAdapter
    [[nodiscard]] static std::unique_ptr<ToolRouter> create(HubConfig config = {});

    ToolRouter(const ToolRouter&) = delete;
    ToolRouter& operator=(const ToolRouter&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Server lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ServerConfig add_server(ServerConfig config);
    [[nodiscard]] Result<StartResult> start_server(const std::string& id);
    [[nodiscard]] Result<StopResult> stop_server(const std::string& id);
    [[nodiscard]] Result<DeleteResult> delete_server(const std::string& id);
    [[nodiscard]] Result<ServerConfig> update_server(const std::string& id, const ServerUpdate& update);

    [[nodiscard]] Result<ServerConfig> get_server(const std::string& id) const;
    [[nodiscard]] std::vector<ServerConfig> list_servers() const;
    [[nodiscard]] bool is_connected(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> active_server_ids() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Invocation
    // ─────────────────────────────────────────────────────────────────────────

    /// A result flagged `isError: true` comes back as ToolExecutionError with the result in `details`
    [[nodiscard]] Result<Json> execute_tool(const std::string& id, const std::string& tool_name, Json arguments);
    [[nodiscard]] Result<Json> get_resource(const std::string& id, const std::string& uri);
    [[nodiscard]] Result<Json> get_prompt(const std::string& id, const std::string& name, Json arguments);

    /// Run every call concurrently; a failing call never affects the others
    [[nodiscard]] std::vector<ToolCallOutcome> execute_tool_calls(const std::vector<ToolCall>& calls);

    /// "[server - tool]" blocks separated by blank lines, for prompt context
    [[nodiscard]] static std::string format_tool_results(const std::vector<ToolCallOutcome>& outcomes);

    // ─────────────────────────────────────────────────────────────────────────
    // Aggregation (active servers only)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<AnnotatedTool> get_all_tools() const;

    /// Case-insensitive substring match on tool name or description
    [[nodiscard]] std::vector<AnnotatedTool> search_tools(std::string_view query) const;

    /// Tools whose name or description words appear in `message`, in discovery order
    [[nodiscard]] std::vector<AnnotatedTool> recommend_tools(std::string_view message,
                                                             std::size_t limit = 5) const;

    [[nodiscard]] const HubConfig& config() const noexcept { return registry_.config(); }

private:
    ConnectionRegistry registry_;
};

}  // namespace mcpmux
