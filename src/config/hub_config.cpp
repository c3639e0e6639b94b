#include "mcpmux/config/hub_config.hpp"

#include <charconv>
#include <cstdint>
#include <format>
#include <fstream>
#include <system_error>

namespace mcpmux {

namespace {

/// Positive integer from an environment variable; nullopt when unset
Result<std::optional<std::int64_t>> positive_integer(const Environment& env, std::string_view name) {
    const auto raw = env.get(name);
    if (!raw.has_value() || raw->empty()) {
        return std::optional<std::int64_t>{};
    }

    std::int64_t value = 0;
    const auto* first = raw->data();
    const auto* last = raw->data() + raw->size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value <= 0) {
        return tl::unexpected(Error::configuration(std::format(
            "{} must be a positive integer, got '{}'", name, *raw)));
    }
    return std::optional<std::int64_t>(value);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Builder helpers
// ─────────────────────────────────────────────────────────────────────────────

HubConfig& HubConfig::with_call_timeout(std::chrono::milliseconds timeout) {
    call_timeout = timeout;
    return *this;
}

HubConfig& HubConfig::with_handshake_timeout(std::chrono::milliseconds timeout) {
    handshake_timeout = timeout;
    return *this;
}

HubConfig& HubConfig::with_spawn_timeout(std::chrono::milliseconds timeout) {
    spawn_timeout = timeout;
    return *this;
}

HubConfig& HubConfig::with_shutdown_grace(std::chrono::milliseconds grace) {
    shutdown_grace = grace;
    return *this;
}

HubConfig& HubConfig::with_worker_threads(std::size_t threads) {
    worker_threads = threads;
    return *this;
}

HubConfig& HubConfig::with_client_info(Implementation info) {
    client_info = std::move(info);
    return *this;
}

HubConfig& HubConfig::with_stderr_handling(StderrHandling handling) {
    stderr_handling = handling;
    return *this;
}

Result<void> HubConfig::validate() const {
    if (call_timeout.count() <= 0) {
        return tl::unexpected(Error::configuration("call_timeout must be positive"));
    }
    if (handshake_timeout.count() <= 0) {
        return tl::unexpected(Error::configuration("handshake_timeout must be positive"));
    }
    if (spawn_timeout.count() <= 0) {
        return tl::unexpected(Error::configuration("spawn_timeout must be positive"));
    }
    if (shutdown_grace.count() < 0) {
        return tl::unexpected(Error::configuration("shutdown_grace must not be negative"));
    }
    if (worker_threads == 0) {
        return tl::unexpected(Error::configuration("worker_threads must be at least 1"));
    }
    if (client_info.name.empty()) {
        return tl::unexpected(Error::configuration("client_info.name must not be empty"));
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Environment
// ─────────────────────────────────────────────────────────────────────────────

Result<HubConfig> hub_config_from_env(const Environment& env) {
    HubConfig config;

    struct TimeoutVariable {
        std::string_view name;
        std::chrono::milliseconds HubConfig::*field;
    };
    constexpr TimeoutVariable kTimeouts[] = {
        {"MCPMUX_CALL_TIMEOUT_MS", &HubConfig::call_timeout},
        {"MCPMUX_HANDSHAKE_TIMEOUT_MS", &HubConfig::handshake_timeout},
        {"MCPMUX_SPAWN_TIMEOUT_MS", &HubConfig::spawn_timeout},
    };

    for (const auto& variable : kTimeouts) {
        auto value = positive_integer(env, variable.name);
        if (!value) {
            return tl::unexpected(value.error());
        }
        if (value->has_value()) {
            config.*variable.field = std::chrono::milliseconds{**value};
        }
    }

    auto threads = positive_integer(env, "MCPMUX_WORKER_THREADS");
    if (!threads) {
        return tl::unexpected(threads.error());
    }
    if (threads->has_value()) {
        config.worker_threads = static_cast<std::size_t>(**threads);
    }

    if (const auto level = env.get("MCPMUX_LOG_LEVEL"); level && !level->empty()) {
        const auto parsed = log_level_from_string(*level);
        if (!parsed) {
            return tl::unexpected(Error::configuration(std::format(
                "MCPMUX_LOG_LEVEL has unknown level '{}'", *level)));
        }
        config.log_level = *parsed;
    }

    if (auto valid = config.validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    return config;
}

// ─────────────────────────────────────────────────────────────────────────────
// Server definitions
// ─────────────────────────────────────────────────────────────────────────────

Result<std::vector<ServerConfig>> parse_server_definitions(const Json& document) {
    std::vector<ServerConfig> servers;

    if (document.is_object() && document.contains("mcpServers")) {
        const auto& entries = document["mcpServers"];
        if (!entries.is_object()) {
            return tl::unexpected(Error::configuration("'mcpServers' must be an object keyed by server id"));
        }
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            auto server = ServerConfig::from_json(it.value());
            if (!server) {
                Error error = server.error();
                error.message = std::format("Server '{}': {}", it.key(), error.message);
                return tl::unexpected(std::move(error));
            }
            if (server->id.empty()) {
                server->id = it.key();
            }
            if (server->name.empty()) {
                server->name = it.key();
            }
            servers.push_back(std::move(*server));
        }
        return servers;
    }

    if (document.is_array()) {
        for (std::size_t i = 0; i < document.size(); ++i) {
            auto server = ServerConfig::from_json(document[i]);
            if (!server) {
                Error error = server.error();
                error.message = std::format("Server #{}: {}", i, error.message);
                return tl::unexpected(std::move(error));
            }
            servers.push_back(std::move(*server));
        }
        return servers;
    }

    return tl::unexpected(Error::configuration(
        "Expected {\"mcpServers\": {...}} or an array of server definitions"));
}

Result<std::vector<ServerConfig>> load_server_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return tl::unexpected(Error::configuration("Cannot open server file " + path.string()));
    }

    const Json document = Json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded()) {
        return tl::unexpected(Error::configuration("Server file " + path.string() + " is not valid JSON"));
    }
    return parse_server_definitions(document);
}

}  // namespace mcpmux
