#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Hub Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Tunables shared by every server the router manages, and loading of server
// definitions from a JSON file.

#include "mcpmux/error.hpp"
#include "mcpmux/host/host_profile.hpp"
#include "mcpmux/log/logger.hpp"
#include "mcpmux/protocol/descriptors.hpp"
#include "mcpmux/registry/server_config.hpp"
#include "mcpmux/transport/process_channel.hpp"
#include "mcpmux/version.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace mcpmux {

struct HubConfig {
    // Bound on each tool/resource/prompt call
    std::chrono::milliseconds call_timeout{30000};

    // Bound on each initialize and discovery call
    std::chrono::milliseconds handshake_timeout{10000};

    // Bound on fork-to-exec
    std::chrono::milliseconds spawn_timeout{5000};

    // SIGTERM-to-SIGKILL delay on teardown
    std::chrono::milliseconds shutdown_grace{100};

    // Threads in the pool that runs lifecycle jobs and batch tool calls
    std::size_t worker_threads{4};

    Implementation client_info{"mcpmux", MCPMUX_VERSION_STRING};

    StderrHandling stderr_handling{StderrHandling::Log};

    // Set from MCPMUX_LOG_LEVEL; applied by whoever configures logging
    std::optional<LogLevel> log_level;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-style helpers
    // ─────────────────────────────────────────────────────────────────────────
    // Usage:
    //   HubConfig config;
    //   config.with_call_timeout(5s).with_worker_threads(8);

    HubConfig& with_call_timeout(std::chrono::milliseconds timeout);
    HubConfig& with_handshake_timeout(std::chrono::milliseconds timeout);
    HubConfig& with_spawn_timeout(std::chrono::milliseconds timeout);
    HubConfig& with_shutdown_grace(std::chrono::milliseconds grace);
    HubConfig& with_worker_threads(std::size_t threads);
    HubConfig& with_client_info(Implementation info);
    HubConfig& with_stderr_handling(StderrHandling handling);

    /// ConfigurationError for non-positive timeouts or zero worker threads
    [[nodiscard]] Result<void> validate() const;
};

/// Defaults overridden by MCPMUX_CALL_TIMEOUT_MS, MCPMUX_HANDSHAKE_TIMEOUT_MS,
/// MCPMUX_SPAWN_TIMEOUT_MS, MCPMUX_WORKER_THREADS and MCPMUX_LOG_LEVEL
[[nodiscard]] Result<HubConfig> hub_config_from_env(const Environment& env);

/// Accepts {"mcpServers": {"<id>": {...}}} or an array of definitions
[[nodiscard]] Result<std::vector<ServerConfig>> parse_server_definitions(const Json& document);

[[nodiscard]] Result<std::vector<ServerConfig>> load_server_file(const std::filesystem::path& path);

}  // namespace mcpmux
