#include "mcpmux/client/protocol_client.hpp"
#include "mcpmux/log/logger.hpp"

#include <format>
#include <type_traits>

namespace mcpmux {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kMaxLoggedLine = 200;

std::string preview(std::string_view line) {
    if (line.size() <= kMaxLoggedLine) {
        return std::string(line);
    }
    return std::string(line.substr(0, kMaxLoggedLine)) + "...";
}

bool is_blank(std::string_view line) noexcept {
    return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

/// Fold one discovery outcome into `target`. Only cancellation is propagated.
template <typename T>
Result<void> absorb(const std::string& label, const char* what,
                    DiscoveryOutcome<T> outcome, std::vector<T>& target) {
    return std::visit([&](auto&& value) -> Result<void> {
        using V = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<V, Listed<T>>) {
            MCPMUX_LOG_INFO(std::format("[{}] Discovered {} {}", label, value.items.size(), what));
            target = std::move(value.items);
        } else if constexpr (std::is_same_v<V, NotImplemented>) {
            MCPMUX_LOG_INFO(std::format("[{}] Server does not implement {} listing", label, what));
            target.clear();
        } else {
            if (value.error.code == ErrorCode::Cancelled) {
                return tl::unexpected(value.error);
            }
            MCPMUX_LOG_WARN(std::format("[{}] Listing {} failed: {}", label, what, value.error.describe()));
            target.clear();
        }
        return {};
    }, std::move(outcome));
}

}  // namespace

ProtocolClient::ProtocolClient(std::shared_ptr<IChannel> channel,
                               std::string label,
                               Implementation client_info)
    : channel_(std::move(channel))
    , label_(std::move(label))
    , client_info_(std::move(client_info))
{}

// ─────────────────────────────────────────────────────────────────────────────
// Request / Response
// ─────────────────────────────────────────────────────────────────────────────

Result<Json> ProtocolClient::call(const std::string& method,
                                  std::optional<Json> params,
                                  std::chrono::milliseconds timeout) {
    std::lock_guard lock(call_mutex_);

    const std::int64_t id = next_id_++;
    const JsonRpcRequest request(method, JsonRpcId::integer(id), std::move(params));
    const auto deadline = Clock::now() + timeout;

    MCPMUX_LOG_DEBUG(std::format("[{}] -> {} (id {})", label_, method, id));

    auto sent = channel_->send(request.to_json(), timeout);
    if (!sent) {
        return tl::unexpected(sent.error());
    }

    // Receive lines until our response arrives. The server may interleave
    // notifications, its own requests, stale responses and plain log output.
    while (true) {
        const auto now = Clock::now();
        if (now >= deadline) {
            return tl::unexpected(Error::protocol_fault(std::format(
                "No response to '{}' within {} ms", method, timeout.count())));
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        auto line = channel_->receive_line(remaining);
        if (!line) {
            return tl::unexpected(line.error());
        }
        if (!line->has_value()) {
            continue;  // Timed out; the deadline check above reports it
        }

        const std::string& text = **line;
        if (is_blank(text)) {
            continue;
        }
        if (!looks_like_json_object(text)) {
            MCPMUX_LOG_DEBUG(std::format("[{}] Skipping non-JSON output: {}", label_, preview(text)));
            continue;
        }

        auto message = decoder_.decode(text);
        if (!message) {
            MCPMUX_LOG_DEBUG(std::format("[{}] Skipping undecodable line ({}): {}",
                                         label_, message.error().message, preview(text)));
            continue;
        }

        switch (classify_message(*message)) {
            case MessageKind::Request:
                handle_server_request(*message, remaining);
                continue;
            case MessageKind::Notification:
                MCPMUX_LOG_DEBUG(std::format("[{}] <- notification {}",
                                             label_, (*message)["method"].get<std::string>()));
                continue;
            case MessageKind::Invalid:
                MCPMUX_LOG_DEBUG(std::format("[{}] Skipping message without id or method", label_));
                continue;
            case MessageKind::Response:
                break;
        }

        const Json& raw_id = message->at("id");
        const bool ours = raw_id.is_number_integer() && raw_id.get<std::int64_t>() == id;
        if (!ours) {
            MCPMUX_LOG_DEBUG(std::format("[{}] Skipping response for id {}", label_, raw_id.dump()));
            continue;
        }

        auto response = JsonRpcResponse::from_json(*message);
        if (!response) {
            return tl::unexpected(Error::protocol_fault(std::format(
                "Malformed response to '{}': {}", method, response.error().message)));
        }

        if (response->is_error()) {
            const auto& rpc_error = std::get<JsonRpcError>(response->outcome);
            MCPMUX_LOG_DEBUG(std::format("[{}] <- {} error {}: {}",
                                         label_, method, rpc_error.code, rpc_error.message));
            return tl::unexpected(Error::from_rpc_error(rpc_error));
        }

        MCPMUX_LOG_DEBUG(std::format("[{}] <- {} (id {})", label_, method, id));
        return std::get<Json>(std::move(response->outcome));
    }
}

Result<void> ProtocolClient::notify(const std::string& method,
                                    std::optional<Json> params,
                                    std::chrono::milliseconds timeout) {
    std::lock_guard lock(call_mutex_);
    const JsonRpcNotification notification(method, std::move(params));
    return channel_->send(notification.to_json(), timeout);
}

void ProtocolClient::handle_server_request(const Json& request, std::chrono::milliseconds timeout) {
    const auto method = request["method"].get<std::string>();
    const Json& request_id = request["id"];

    // Server-initiated requests other than ping need client features we do not offer
    Json reply;
    if (method == "ping") {
        reply = JsonRpcResponse::make_result(request_id, Json::object());
    } else {
        MCPMUX_LOG_DEBUG(std::format("[{}] Rejecting server request {}", label_, method));
        reply = JsonRpcResponse::make_error(request_id, RpcErrorCode::MethodNotFound,
                                            "Method not found: " + method);
    }

    auto sent = channel_->send(reply, timeout);
    if (!sent) {
        // The pending receive reports the broken channel
        MCPMUX_LOG_WARN(std::format("[{}] Failed to answer {}: {}", label_, method, sent.error().describe()));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Handshake
// ─────────────────────────────────────────────────────────────────────────────

Result<std::optional<Implementation>> ProtocolClient::initialize(std::chrono::milliseconds timeout) {
    const Json params = {
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", Json::object()},
        {"clientInfo", client_info_.to_json()}
    };

    auto result = call("initialize", params, timeout);
    if (!result) {
        return tl::unexpected(result.error());
    }

    std::optional<Implementation> server_info;
    if (result->is_object()) {
        const auto info = result->find("serverInfo");
        if (info != result->end() && info->is_object()) {
            server_info = Implementation::from_json(*info);
        }
        const auto version = result->find("protocolVersion");
        if (version != result->end() && version->is_string() && *version != MCP_PROTOCOL_VERSION) {
            MCPMUX_LOG_DEBUG(std::format("[{}] Server negotiated protocol version {}",
                                         label_, version->get<std::string>()));
        }
    }

    auto sent = notify("notifications/initialized", std::nullopt, timeout);
    if (!sent) {
        return tl::unexpected(sent.error());
    }
    return server_info;
}

template <typename T>
DiscoveryOutcome<T> ProtocolClient::discover(const std::string& method, const char* field,
                                             std::chrono::milliseconds timeout) {
    std::vector<T> items;
    std::optional<std::string> cursor;

    for (std::size_t page = 0; page < kMaxDiscoveryPages; ++page) {
        std::optional<Json> params;
        if (cursor) {
            params = Json{{"cursor", *cursor}};
        }

        auto result = call(method, std::move(params), timeout);
        if (!result) {
            if (result.error().is_method_not_found() && items.empty()) {
                return NotImplemented{};
            }
            return Failed{result.error()};
        }

        if (!result->is_object()) {
            return Failed{Error::protocol_fault(std::format("'{}' returned a non-object result", method))};
        }

        const auto list = result->find(field);
        if (list != result->end()) {
            if (!list->is_array()) {
                return Failed{Error::protocol_fault(std::format("'{}' result field '{}' is not an array",
                                                                method, field))};
            }
            for (const auto& entry : *list) {
                if (entry.is_object()) {
                    items.push_back(T::from_json(entry));
                }
            }
        }

        const auto next = result->find("nextCursor");
        if (next == result->end() || !next->is_string() || next->get<std::string>().empty()) {
            return Listed<T>{std::move(items)};
        }
        cursor = next->get<std::string>();
    }

    MCPMUX_LOG_WARN(std::format("[{}] '{}' still paginating after {} pages, keeping what was listed",
                                label_, method, kMaxDiscoveryPages));
    return Listed<T>{std::move(items)};
}

DiscoveryOutcome<ToolDescriptor> ProtocolClient::list_tools(std::chrono::milliseconds timeout) {
    return discover<ToolDescriptor>("tools/list", "tools", timeout);
}

DiscoveryOutcome<ResourceDescriptor> ProtocolClient::list_resources(std::chrono::milliseconds timeout) {
    return discover<ResourceDescriptor>("resources/list", "resources", timeout);
}

DiscoveryOutcome<PromptDescriptor> ProtocolClient::list_prompts(std::chrono::milliseconds timeout) {
    return discover<PromptDescriptor>("prompts/list", "prompts", timeout);
}

Result<Capabilities> ProtocolClient::handshake(std::chrono::milliseconds timeout) {
    Capabilities capabilities;

    auto info = initialize(timeout);
    if (!info) {
        if (info.error().code == ErrorCode::Cancelled) {
            return tl::unexpected(info.error());
        }
        MCPMUX_LOG_WARN(std::format("[{}] initialize failed, continuing with discovery: {}",
                                    label_, info.error().describe()));
    } else {
        capabilities.server_info = std::move(*info);
    }

    if (auto r = absorb(label_, "tools", list_tools(timeout), capabilities.tools); !r) {
        return tl::unexpected(r.error());
    }
    if (auto r = absorb(label_, "resources", list_resources(timeout), capabilities.resources); !r) {
        return tl::unexpected(r.error());
    }
    if (auto r = absorb(label_, "prompts", list_prompts(timeout), capabilities.prompts); !r) {
        return tl::unexpected(r.error());
    }

    return capabilities;
}

// ─────────────────────────────────────────────────────────────────────────────
// Invocation
// ─────────────────────────────────────────────────────────────────────────────

Result<Json> ProtocolClient::call_tool(const std::string& name, const Json& arguments,
                                       std::chrono::milliseconds timeout) {
    Json params = {{"name", name}, {"arguments", arguments.is_null() ? Json::object() : arguments}};
    return call("tools/call", std::move(params), timeout);
}

Result<Json> ProtocolClient::read_resource(const std::string& uri, std::chrono::milliseconds timeout) {
    return call("resources/read", Json{{"uri", uri}}, timeout);
}

Result<Json> ProtocolClient::get_prompt(const std::string& name, const Json& arguments,
                                        std::chrono::milliseconds timeout) {
    Json params = {{"name", name}};
    if (!arguments.is_null()) {
        params["arguments"] = arguments;
    }
    return call("prompts/get", std::move(params), timeout);
}

}  // namespace mcpmux
