#ifndef MCPMUX_TESTS_SCRIPTED_CHANNEL_HPP
#define MCPMUX_TESTS_SCRIPTED_CHANNEL_HPP

#include "mcpmux/transport/channel.hpp"
#include "mcpmux/transport/transport_adapter.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace mcpmux::testing {

// ─────────────────────────────────────────────────────────────────────────────
// ScriptedChannel
// ─────────────────────────────────────────────────────────────────────────────
// In-process IChannel. Every message the client sends is recorded and handed
// to a responder, whose lines become readable on the receive side.
//
// Usage:
//   auto channel = std::make_shared<ScriptedChannel>(mcp_responder(McpScript{}));
//   channel->hold("initialize");      // park initialize until release()
//   ProtocolClient client(channel, "test", {"tests", "1.0"});

class ScriptedChannel final : public IChannel {
public:
    using Responder = std::function<std::vector<std::string>(const Json& message)>;

    explicit ScriptedChannel(Responder responder = {})
        : responder_(std::move(responder))
    {}

    Result<void> send(const Json& message, std::chrono::milliseconds /*timeout*/) override {
        std::vector<std::string> lines;
        {
            std::lock_guard lock(mutex_);
            if (cancelled_) {
                return tl::unexpected(Error::cancelled("Channel was cancelled"));
            }
            if (peer_closed_) {
                return tl::unexpected(Error::connection_fault("Process closed its stdin"));
            }
            sent_.push_back(message);

            const auto method = message.value("method", std::string{});
            if (held_methods_.count(method) > 0) {
                held_.push_back(message);
                cv_.notify_all();
                return {};
            }
            if (responder_) {
                lines = responder_(message);
            }
            for (auto& line : lines) {
                lines_.push_back(std::move(line));
            }
        }
        cv_.notify_all();
        return {};
    }

    Result<std::optional<std::string>> receive_line(std::chrono::milliseconds timeout) override {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return cancelled_ || !lines_.empty() || peer_closed_; });

        if (cancelled_) {
            return tl::unexpected(Error::cancelled("Channel was cancelled"));
        }
        if (!lines_.empty()) {
            auto line = std::move(lines_.front());
            lines_.pop_front();
            return std::optional<std::string>(std::move(line));
        }
        if (peer_closed_) {
            return tl::unexpected(Error::connection_fault("Process exited"));
        }
        return std::optional<std::string>{};
    }

    void cancel() noexcept override {
        {
            std::lock_guard lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    void close() override {
        cancel();
        closed_ = true;
        ++close_count_;
    }

    [[nodiscard]] bool is_open() const override { return !closed_; }

    [[nodiscard]] std::string describe() const override { return "scripted"; }

    // ─────────────────────────────────────────────────────────────────────────
    // Script control
    // ─────────────────────────────────────────────────────────────────────────

    /// Make `line` readable as if the peer wrote it
    void push_line(std::string line) {
        {
            std::lock_guard lock(mutex_);
            lines_.push_back(std::move(line));
        }
        cv_.notify_all();
    }

    /// Simulate the peer exiting: reads drain then fail, sends fail
    void close_peer() {
        {
            std::lock_guard lock(mutex_);
            peer_closed_ = true;
        }
        cv_.notify_all();
    }

    /// Park requests for `method` without an answer until release()
    void hold(const std::string& method) {
        std::lock_guard lock(mutex_);
        held_methods_.insert(method);
    }

    /// Answer every parked request and stop holding
    void release() {
        {
            std::lock_guard lock(mutex_);
            held_methods_.clear();
            for (const auto& message : held_) {
                if (responder_) {
                    for (auto& line : responder_(message)) {
                        lines_.push_back(std::move(line));
                    }
                }
            }
            held_.clear();
        }
        cv_.notify_all();
    }

    /// Block until a request for a held method arrives
    bool wait_for_held(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return !held_.empty(); });
    }

    [[nodiscard]] std::vector<Json> sent() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }

    [[nodiscard]] std::size_t count_sent(const std::string& method) const {
        std::lock_guard lock(mutex_);
        std::size_t n = 0;
        for (const auto& message : sent_) {
            if (message.value("method", std::string{}) == method) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]] bool was_cancelled() const {
        std::lock_guard lock(mutex_);
        return cancelled_;
    }

    [[nodiscard]] int close_count() const noexcept { return close_count_; }

private:
    Responder responder_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> lines_;
    std::vector<Json> sent_;
    std::set<std::string> held_methods_;
    std::vector<Json> held_;
    bool cancelled_{false};
    bool peer_closed_{false};

    std::atomic<bool> closed_{false};
    std::atomic<int> close_count_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// MCP responder
// ─────────────────────────────────────────────────────────────────────────────

struct McpScript {
    Json tools = Json::array();
    Json resources = Json::array();
    Json prompts = Json::array();
    bool resources_not_implemented = false;
    bool prompts_not_implemented = false;
    Json server_info = {{"name", "scripted-server"}, {"version", "0.0.1"}};

    /// tools/call handler; receives params, returns the result object
    std::function<Json(const Json& params)> on_tool_call;
};

inline std::string rpc_result(const Json& id, Json result) {
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}}.dump();
}

inline std::string rpc_error(const Json& id, int code, const std::string& message) {
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}}.dump();
}

/// Responder that plays a well-behaved MCP server described by `script`
inline ScriptedChannel::Responder mcp_responder(McpScript script) {
    return [script = std::move(script)](const Json& message) -> std::vector<std::string> {
        if (!message.contains("id") || !message.contains("method")) {
            return {};
        }
        const Json& id = message["id"];
        const auto method = message["method"].get<std::string>();
        const Json params = message.value("params", Json::object());

        if (method == "initialize") {
            return {rpc_result(id, {{"protocolVersion", "2024-11-05"},
                                    {"capabilities", Json::object()},
                                    {"serverInfo", script.server_info}})};
        }
        if (method == "tools/list") {
            return {rpc_result(id, {{"tools", script.tools}})};
        }
        if (method == "resources/list") {
            if (script.resources_not_implemented) {
                return {rpc_error(id, -32601, "Method not found")};
            }
            return {rpc_result(id, {{"resources", script.resources}})};
        }
        if (method == "prompts/list") {
            if (script.prompts_not_implemented) {
                return {rpc_error(id, -32601, "Method not found")};
            }
            return {rpc_result(id, {{"prompts", script.prompts}})};
        }
        if (method == "tools/call" && script.on_tool_call) {
            return {rpc_result(id, script.on_tool_call(params))};
        }
        if (method == "resources/read") {
            return {rpc_result(id, {{"contents", Json::array({
                {{"uri", params.value("uri", std::string{})}, {"text", "scripted"}}})}})};
        }
        if (method == "prompts/get") {
            return {rpc_result(id, {{"messages", Json::array()}})};
        }
        return {rpc_error(id, -32601, "Method not found")};
    };
}

inline Json tool_json(const std::string& name, const std::string& description) {
    return {{"name", name}, {"description", description}, {"inputSchema", {{"type", "object"}}}};
}

// ─────────────────────────────────────────────────────────────────────────────
// ScriptedAdapter
// ─────────────────────────────────────────────────────────────────────────────
// ITransportAdapter that hands out ScriptedChannels. Scripts are looked up by
// server id, then by command, then fall back to `default_script`.

class ScriptedAdapter final : public ITransportAdapter {
public:
    Result<OpenedChannel> open(const ServerConfig& config, const HostProfile& /*host*/) override {
        std::lock_guard lock(mutex_);
        ++opens_;

        if (auto failure = failures_.find(config.id); failure != failures_.end()) {
            return tl::unexpected(failure->second);
        }

        McpScript script = default_script;
        if (auto it = scripts_.find(config.id); it != scripts_.end()) {
            script = it->second;
        }

        auto channel = std::make_shared<ScriptedChannel>(mcp_responder(std::move(script)));
        if (auto it = held_.find(config.id); it != held_.end()) {
            channel->hold(it->second);
        }
        channels_[config.id].push_back(channel);
        cv_.notify_all();
        return OpenedChannel{channel, "/scripted/" + config.command};
    }

    void script(const std::string& server_id, McpScript script) {
        std::lock_guard lock(mutex_);
        scripts_[server_id] = std::move(script);
    }

    /// Every open for `server_id` fails with `error`
    void fail(const std::string& server_id, Error error) {
        std::lock_guard lock(mutex_);
        failures_[server_id] = std::move(error);
    }

    /// Channels opened for `server_id` park `method` until released
    void hold(const std::string& server_id, const std::string& method) {
        std::lock_guard lock(mutex_);
        held_[server_id] = method;
    }

    /// Most recent channel opened for `server_id`, waiting up to `timeout` for one
    std::shared_ptr<ScriptedChannel> channel(const std::string& server_id,
                                             std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [&] { return channels_.count(server_id) > 0; });
        const auto it = channels_.find(server_id);
        return it == channels_.end() ? nullptr : it->second.back();
    }

    [[nodiscard]] int opens() const {
        std::lock_guard lock(mutex_);
        return opens_;
    }

    McpScript default_script;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int opens_{0};
    std::map<std::string, McpScript> scripts_;
    std::map<std::string, Error> failures_;
    std::map<std::string, std::string> held_;
    std::map<std::string, std::vector<std::shared_ptr<ScriptedChannel>>> channels_;
};

}  // namespace mcpmux::testing

#endif  // MCPMUX_TESTS_SCRIPTED_CHANNEL_HPP
