#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Adapter
// ═══════════════════════════════════════════════════════════════════════════
// Opens a channel for a ServerConfig. local-process servers go through
// validation, launch preparation, executable resolution and spawn, in that
// order. remote-http is recognised but not implemented.

#include "mcpmux/error.hpp"
#include "mcpmux/host/host_profile.hpp"
#include "mcpmux/registry/server_config.hpp"
#include "mcpmux/transport/channel.hpp"
#include "mcpmux/transport/process_channel.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcpmux {

struct OpenedChannel {
    std::shared_ptr<IChannel> channel;
    std::string resolved_command;
};

/// Seam used by the registry; tests inject scripted channels through it
class ITransportAdapter {
public:
    virtual ~ITransportAdapter() = default;

    [[nodiscard]] virtual Result<OpenedChannel> open(const ServerConfig& config,
                                                     const HostProfile& host) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Launch Preparation
// ─────────────────────────────────────────────────────────────────────────────

/// Everything needed to spawn, before the executable is resolved
struct LaunchPlan {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> environment;
    std::vector<std::filesystem::path> scratch_dirs;  // Created best-effort before spawning
};

/// Reject any override whose value is empty or whitespace-only
[[nodiscard]] Result<void> validate_env_overrides(const std::map<std::string, std::string>& env);

/// Every name in `required` must be non-blank in `overrides` or, failing that, in `process_env`
[[nodiscard]] Result<void> check_required_env(const std::vector<std::string>& required,
                                              const std::map<std::string, std::string>& overrides,
                                              const Environment& process_env);

/// Merge process env, restricted-host defaults and caller overrides (in that
/// order) and add launcher flags. Pure: touches neither filesystem nor processes.
[[nodiscard]] Result<LaunchPlan> prepare_launch(const ServerConfig& config,
                                                const HostProfile& host,
                                                const Environment& process_env);

// ─────────────────────────────────────────────────────────────────────────────
// TransportAdapter
// ─────────────────────────────────────────────────────────────────────────────

struct ProcessOptions {
    StderrHandling stderr_handling{StderrHandling::Log};
    std::chrono::milliseconds spawn_timeout{5000};
    std::chrono::milliseconds shutdown_grace{100};
};

class TransportAdapter final : public ITransportAdapter {
public:
    TransportAdapter(Environment process_env, ProcessOptions options);

    [[nodiscard]] Result<OpenedChannel> open(const ServerConfig& config,
                                             const HostProfile& host) override;

private:
    [[nodiscard]] Result<OpenedChannel> open_local_process(const ServerConfig& config,
                                                           const HostProfile& host);

    Environment process_env_;
    ProcessOptions options_;
};

}  // namespace mcpmux
