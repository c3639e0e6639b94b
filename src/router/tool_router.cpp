#include "mcpmux/router/tool_router.hpp"

#include "mcpmux/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <format>
#include <future>
#include <utility>

namespace mcpmux {

namespace {

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

/// Split on any run of characters for which `is_separator` holds; empty pieces dropped
template <typename Pred>
std::vector<std::string> split_words(const std::string& text, Pred is_separator) {
    std::vector<std::string> words;
    std::string current;
    for (const char c : text) {
        if (is_separator(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

/// Name words score 2, description words longer than 3 characters score 1
int relevance(const ToolDescriptor& tool, const std::string& lowered_message) {
    int score = 0;

    const auto name_words = split_words(to_lower(tool.name), [](unsigned char c) {
        return c == '_' || c == '-' || std::isspace(c) != 0;
    });
    for (const auto& word : name_words) {
        if (contains(lowered_message, word)) {
            score += 2;
        }
    }

    const auto description_words = split_words(to_lower(tool.description), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    for (const auto& word : description_words) {
        if (word.size() > 3 && contains(lowered_message, word)) {
            score += 1;
        }
    }
    return score;
}

bool is_error_result(const Json& result) {
    return result.is_object() && result.contains("isError") && result["isError"].is_boolean()
        && result["isError"].get<bool>();
}

/// First text content block of a failed tool result, for the error message
std::string error_text(const Json& result, const std::string& tool_name) {
    if (result.contains("content") && result["content"].is_array()) {
        for (const auto& block : result["content"]) {
            if (block.is_object() && block.value("type", "") == "text" && block.contains("text")
                && block["text"].is_string()) {
                return block["text"].get<std::string>();
            }
        }
    }
    return std::format("Tool '{}' reported an error", tool_name);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

ToolRouter::ToolRouter(HubConfig config, HostProfile host, std::shared_ptr<ITransportAdapter> adapter)
    : registry_(std::move(config), std::move(host), std::move(adapter)) {}

std::unique_ptr<ToolRouter> ToolRouter::create(HubConfig config) {
    auto env = Environment::from_process();
    auto host = resolve_host_profile(env);

    MCPMUX_LOG_INFO(std::format("Host profile: platform={} restricted={} scratch={}",
                                to_string(host.platform), host.is_restricted_host,
                                host.scratch_dir.string()));

    ProcessOptions options;
    options.stderr_handling = config.stderr_handling;
    options.spawn_timeout = config.spawn_timeout;
    options.shutdown_grace = config.shutdown_grace;

    auto adapter = std::make_shared<TransportAdapter>(std::move(env), options);
    return std::make_unique<ToolRouter>(std::move(config), std::move(host), std::move(adapter));
}

// ─────────────────────────────────────────────────────────────────────────────
// Server lifecycle
// ─────────────────────────────────────────────────────────────────────────────

ServerConfig ToolRouter::add_server(ServerConfig config) {
    return registry_.add(std::move(config));
}

Result<StartResult> ToolRouter::start_server(const std::string& id) {
    return registry_.start(id);
}

Result<StopResult> ToolRouter::stop_server(const std::string& id) {
    return registry_.stop(id);
}

Result<DeleteResult> ToolRouter::delete_server(const std::string& id) {
    return registry_.remove(id);
}

Result<ServerConfig> ToolRouter::update_server(const std::string& id, const ServerUpdate& update) {
    return registry_.update(id, update);
}

Result<ServerConfig> ToolRouter::get_server(const std::string& id) const {
    return registry_.get(id);
}

std::vector<ServerConfig> ToolRouter::list_servers() const {
    return registry_.list();
}

bool ToolRouter::is_connected(const std::string& id) const {
    return registry_.client_for(id).has_value();
}

std::vector<std::string> ToolRouter::active_server_ids() const {
    std::vector<std::string> ids;
    for (const auto& server : registry_.list()) {
        if (server.status == ServerStatus::Active) {
            ids.push_back(server.id);
        }
    }
    return ids;
}

// ─────────────────────────────────────────────────────────────────────────────
// Invocation
// ─────────────────────────────────────────────────────────────────────────────

Result<Json> ToolRouter::execute_tool(const std::string& id, const std::string& tool_name, Json arguments) {
    auto client = registry_.client_for(id);
    if (!client) {
        return tl::unexpected(client.error());
    }

    MCPMUX_LOG_DEBUG(std::format("[{}] Calling tool '{}'", id, tool_name));
    auto result = (*client)->call_tool(tool_name, arguments, config().call_timeout);
    if (!result) {
        MCPMUX_LOG_WARN(std::format("[{}] Tool '{}' failed: {}", id, tool_name, result.error().describe()));
        return result;
    }

    if (is_error_result(*result)) {
        auto message = error_text(*result, tool_name);
        MCPMUX_LOG_WARN(std::format("[{}] Tool '{}' reported an error: {}", id, tool_name, message));
        return tl::unexpected(Error::tool_execution(std::move(message), *result));
    }
    return result;
}

Result<Json> ToolRouter::get_resource(const std::string& id, const std::string& uri) {
    auto client = registry_.client_for(id);
    if (!client) {
        return tl::unexpected(client.error());
    }
    return (*client)->read_resource(uri, config().call_timeout);
}

Result<Json> ToolRouter::get_prompt(const std::string& id, const std::string& name, Json arguments) {
    auto client = registry_.client_for(id);
    if (!client) {
        return tl::unexpected(client.error());
    }
    return (*client)->get_prompt(name, arguments, config().call_timeout);
}

std::vector<ToolCallOutcome> ToolRouter::execute_tool_calls(const std::vector<ToolCall>& calls) {
    std::vector<std::future<Result<Json>>> futures;
    futures.reserve(calls.size());

    for (const auto& call : calls) {
        futures.push_back(std::async(std::launch::async, [this, call]() -> Result<Json> {
            try {
                return execute_tool(call.server_id, call.tool_name, call.arguments);
            } catch (const std::exception& e) {
                return tl::unexpected(Error::tool_execution(
                    std::format("Tool '{}' threw: {}", call.tool_name, e.what())));
            }
        }));
    }

    std::vector<ToolCallOutcome> outcomes;
    outcomes.reserve(calls.size());
    for (std::size_t i = 0; i < calls.size(); ++i) {
        std::string server_name = calls[i].server_id;
        if (auto server = registry_.get(calls[i].server_id)) {
            server_name = server->display_name();
        }
        outcomes.push_back(ToolCallOutcome{calls[i], std::move(server_name), futures[i].get()});
    }
    return outcomes;
}

std::string ToolRouter::format_tool_results(const std::vector<ToolCallOutcome>& outcomes) {
    std::string formatted;
    for (const auto& outcome : outcomes) {
        if (!formatted.empty()) {
            formatted += "\n\n";
        }

        formatted += std::format("[{} - {}]", outcome.server_name, outcome.call.tool_name);
        if (!outcome.result) {
            formatted += " Error: " + outcome.result.error().message;
        } else if (outcome.result->is_null()) {
            formatted += " No result";
        } else if (outcome.result->is_string()) {
            formatted += "\n" + outcome.result->get<std::string>();
        } else {
            formatted += "\n" + outcome.result->dump(2);
        }
    }
    return formatted;
}

// ─────────────────────────────────────────────────────────────────────────────
// Aggregation
// ─────────────────────────────────────────────────────────────────────────────

std::vector<AnnotatedTool> ToolRouter::get_all_tools() const {
    std::vector<AnnotatedTool> all;
    for (const auto& server : registry_.list()) {
        if (server.status != ServerStatus::Active || !server.tools) {
            continue;
        }
        for (const auto& tool : *server.tools) {
            all.push_back(AnnotatedTool{server.id, server.display_name(), tool});
        }
    }
    return all;
}

std::vector<AnnotatedTool> ToolRouter::search_tools(std::string_view query) const {
    const auto needle = to_lower(query);

    std::vector<AnnotatedTool> matches;
    for (auto& entry : get_all_tools()) {
        if (contains(to_lower(entry.tool.name), needle) || contains(to_lower(entry.tool.description), needle)) {
            matches.push_back(std::move(entry));
        }
    }
    return matches;
}

std::vector<AnnotatedTool> ToolRouter::recommend_tools(std::string_view message, std::size_t limit) const {
    const auto lowered = to_lower(message);

    std::vector<AnnotatedTool> recommended;
    for (auto& entry : get_all_tools()) {
        if (recommended.size() >= limit) {
            break;
        }
        if (relevance(entry.tool, lowered) > 0) {
            recommended.push_back(std::move(entry));
        }
    }
    return recommended;
}

}  // namespace mcpmux
