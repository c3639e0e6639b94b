#include "mcpmux/registry/server_config.hpp"
#include "mcpmux/log/redact.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <utility>

namespace mcpmux {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::int64_t epoch_millis(ServerConfig::Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

template <typename T>
Json list_to_json(const std::vector<T>& items) {
    Json out = Json::array();
    for (const auto& item : items) {
        out.push_back(item.to_json());
    }
    return out;
}

/// Optional string field; ConfigurationError when present but not a string
Result<std::optional<std::string>> string_field(const Json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::optional<std::string>{};
    }
    if (!j[key].is_string()) {
        return tl::unexpected(Error::configuration(std::string("'") + key + "' must be a string"));
    }
    return std::optional<std::string>(j[key].get<std::string>());
}

/// Optional array of strings; empty when absent
Result<std::vector<std::string>> string_array(const Json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || j[key].is_null()) {
        return out;
    }
    const auto invalid = [key] {
        return tl::unexpected(Error::configuration(std::string("'") + key + "' must be an array of strings"));
    };
    if (!j[key].is_array()) {
        return invalid();
    }
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            return invalid();
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

}  // namespace

std::optional<TransportKind> transport_kind_from_string(std::string_view text) noexcept {
    if (text == "local-process" || text == "stdio") {
        return TransportKind::LocalProcess;
    }
    if (text == "remote-http" || text == "http") {
        return TransportKind::RemoteHttp;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// RemoteAuth
// ─────────────────────────────────────────────────────────────────────────────

Json RemoteAuth::to_json(bool redact) const {
    Json j = {
        {"scheme", scheme == Scheme::Bearer ? "bearer" : "header"},
        {"token", redact ? std::string(kRedacted) : token}
    };
    if (scheme == Scheme::Header) {
        j["headerName"] = header_name;
    }
    return j;
}

Result<RemoteAuth> RemoteAuth::from_json(const Json& j) {
    if (!j.is_object()) {
        return tl::unexpected(Error::configuration("'auth' must be an object"));
    }

    RemoteAuth auth;
    auto scheme = string_field(j, "scheme");
    if (!scheme) {
        return tl::unexpected(scheme.error());
    }
    const auto scheme_name = lowercase(scheme->value_or("bearer"));
    if (scheme_name == "bearer") {
        auth.scheme = Scheme::Bearer;
    } else if (scheme_name == "header") {
        auth.scheme = Scheme::Header;
    } else {
        return tl::unexpected(Error::configuration("Unknown auth scheme '" + scheme_name + "'"));
    }

    auto header = string_field(j, "headerName");
    if (!header) {
        return tl::unexpected(header.error());
    }
    if (header->has_value()) {
        auth.header_name = **header;
    }

    auto token = string_field(j, "token");
    if (!token) {
        return tl::unexpected(token.error());
    }
    if (!token->has_value() || (*token)->empty()) {
        return tl::unexpected(Error::configuration("'auth.token' must not be empty"));
    }
    auth.token = **token;
    return auth;
}

// ─────────────────────────────────────────────────────────────────────────────
// ServerConfig
// ─────────────────────────────────────────────────────────────────────────────

Json ServerConfig::to_json(bool redact) const {
    Json j = {
        {"id", id},
        {"name", name},
        {"description", description},
        {"transport", std::string(to_string(transport))},
        {"status", std::string(to_string(status))},
        {"restartRequired", restart_required},
        {"createdAt", epoch_millis(created_at)},
        {"updatedAt", epoch_millis(updated_at)}
    };

    if (transport == TransportKind::LocalProcess) {
        j["command"] = command;
        j["args"] = redact ? redact_args(args) : args;
        Json env_json = Json::object();
        for (const auto& [key, value] : env) {
            env_json[key] = redact ? std::string(kRedacted) : value;
        }
        j["env"] = std::move(env_json);
        if (!required_env.empty()) {
            j["requiredEnv"] = required_env;
        }
    } else {
        j["url"] = url;
        if (auth) {
            j["auth"] = auth->to_json(redact);
        }
    }

    if (!resolved_command.empty()) {
        j["resolvedCommand"] = resolved_command;
    }
    if (tools) {
        j["tools"] = list_to_json(*tools);
    }
    if (resources) {
        j["resources"] = list_to_json(*resources);
    }
    if (prompts) {
        j["prompts"] = list_to_json(*prompts);
    }
    if (server_info) {
        j["serverInfo"] = server_info->to_json();
    }
    if (last_error) {
        j["lastError"] = last_error->to_json();
    }
    return j;
}

Result<ServerConfig> ServerConfig::from_json(const Json& j) {
    if (!j.is_object()) {
        return tl::unexpected(Error::configuration("Server definition must be a JSON object"));
    }

    ServerConfig config;

    for (const auto& [key, target] : {std::pair{"id", &config.id},
                                      std::pair{"name", &config.name},
                                      std::pair{"description", &config.description},
                                      std::pair{"command", &config.command},
                                      std::pair{"url", &config.url}}) {
        auto value = string_field(j, key);
        if (!value) {
            return tl::unexpected(value.error());
        }
        if (value->has_value()) {
            *target = **value;
        }
    }

    auto transport = string_field(j, "transport");
    if (!transport) {
        return tl::unexpected(transport.error());
    }
    if (transport->has_value()) {
        const auto kind = transport_kind_from_string(**transport);
        if (!kind) {
            return tl::unexpected(Error::configuration("Unknown transport '" + **transport + "'"));
        }
        config.transport = *kind;
    } else if (!config.url.empty() && config.command.empty()) {
        config.transport = TransportKind::RemoteHttp;
    }

    auto args = string_array(j, "args");
    if (!args) {
        return tl::unexpected(args.error());
    }
    config.args = std::move(*args);

    auto required_env = string_array(j, "requiredEnv");
    if (!required_env) {
        return tl::unexpected(required_env.error());
    }
    config.required_env = std::move(*required_env);

    if (j.contains("env") && !j["env"].is_null()) {
        if (!j["env"].is_object()) {
            return tl::unexpected(Error::configuration("'env' must be an object of strings"));
        }
        const auto& env = j["env"];
        for (auto it = env.begin(); it != env.end(); ++it) {
            if (!it.value().is_string()) {
                return tl::unexpected(Error::configuration("'env." + it.key() + "' must be a string"));
            }
            config.env[it.key()] = it.value().get<std::string>();
        }
    }

    if (j.contains("auth") && !j["auth"].is_null()) {
        auto auth = RemoteAuth::from_json(j["auth"]);
        if (!auth) {
            return tl::unexpected(auth.error());
        }
        config.auth = std::move(*auth);
    }

    return config;
}

// ─────────────────────────────────────────────────────────────────────────────
// ServerUpdate
// ─────────────────────────────────────────────────────────────────────────────

bool ServerUpdate::changes_connection(const ServerConfig& current) const {
    return (transport && *transport != current.transport)
        || (command && *command != current.command)
        || (args && *args != current.args)
        || (env && *env != current.env)
        || (required_env && *required_env != current.required_env)
        || (url && *url != current.url)
        || (auth && auth != current.auth)
        || (clear_auth && current.auth.has_value());
}

void ServerUpdate::apply_to(ServerConfig& config) const {
    if (name) config.name = *name;
    if (description) config.description = *description;
    if (transport) config.transport = *transport;
    if (command) config.command = *command;
    if (args) config.args = *args;
    if (env) config.env = *env;
    if (required_env) config.required_env = *required_env;
    if (url) config.url = *url;
    if (clear_auth) {
        config.auth.reset();
    }
    if (auth) config.auth = *auth;
}

// ─────────────────────────────────────────────────────────────────────────────
// StartResult
// ─────────────────────────────────────────────────────────────────────────────

StartResult StartResult::from_config(const ServerConfig& config) {
    StartResult result;
    result.status = config.status;
    result.tools = config.tools.value_or(std::vector<ToolDescriptor>{});
    result.resources = config.resources.value_or(std::vector<ResourceDescriptor>{});
    result.prompts = config.prompts.value_or(std::vector<PromptDescriptor>{});
    return result;
}

Json StartResult::to_json() const {
    return {
        {"status", std::string(to_string(status))},
        {"tools", list_to_json(tools)},
        {"resources", list_to_json(resources)},
        {"prompts", list_to_json(prompts)}
    };
}

}  // namespace mcpmux
