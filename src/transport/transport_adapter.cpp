#include "mcpmux/transport/transport_adapter.hpp"
#include "mcpmux/log/logger.hpp"
#include "mcpmux/log/redact.hpp"
#include "mcpmux/transport/executable_resolver.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <system_error>

namespace mcpmux {

namespace {

namespace fs = std::filesystem;

constexpr std::array<std::string_view, 3> kRestrictedNpmFlags = {
    "--no-audit", "--no-fund", "--prefer-offline"
};

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool is_npm_launcher(const std::string& command) {
    const auto name = fs::path(command).filename().string();
    return name == "npm" || name == "npx";
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Launch Preparation
// ─────────────────────────────────────────────────────────────────────────────

Result<void> validate_env_overrides(const std::map<std::string, std::string>& env) {
    for (const auto& [key, value] : env) {
        if (key.empty()) {
            return tl::unexpected(Error::configuration("Environment variable name must not be empty"));
        }
        if (is_blank(value)) {
            return tl::unexpected(Error::configuration(std::format(
                "Environment variable '{}' has an empty value; provide a value or remove it", key)));
        }
    }
    return {};
}

Result<void> check_required_env(const std::vector<std::string>& required,
                                const std::map<std::string, std::string>& overrides,
                                const Environment& process_env) {
    for (const auto& name : required) {
        if (const auto it = overrides.find(name); it != overrides.end() && !is_blank(it->second)) {
            continue;
        }
        const auto inherited = process_env.get(name);
        if (inherited && !is_blank(*inherited)) {
            continue;
        }
        return tl::unexpected(Error::configuration(std::format(
            "Required environment variable '{}' is missing; set it in the server env or the host environment",
            name)));
    }
    return {};
}

Result<LaunchPlan> prepare_launch(const ServerConfig& config,
                                  const HostProfile& host,
                                  const Environment& process_env) {
    if (auto valid = validate_env_overrides(config.env); !valid) {
        return tl::unexpected(valid.error());
    }
    if (auto present = check_required_env(config.required_env, config.env, process_env); !present) {
        return tl::unexpected(present.error());
    }
    if (config.command.empty() || is_blank(config.command)) {
        return tl::unexpected(Error::configuration(std::format(
            "Server '{}' has no command", config.id)));
    }

    LaunchPlan plan;
    plan.command = config.command;
    plan.args = config.args;
    plan.environment = process_env.variables();

    if (host.is_restricted_host) {
        const fs::path scratch = host.scratch_dir;
        const fs::path npm_global = scratch / ".npm-global";
        const fs::path global_modules = npm_global / "lib" / "node_modules";
        const fs::path local_modules = scratch / "node_modules";

        plan.scratch_dirs = {scratch / ".npm-cache", global_modules, local_modules};

        auto& env = plan.environment;
        env["NPM_CONFIG_CACHE"] = (scratch / ".npm-cache").string();
        env["NPM_CONFIG_PREFIX"] = npm_global.string();
        env["NPM_CONFIG_UPDATE_NOTIFIER"] = "false";
        env["NPM_CONFIG_AUDIT"] = "false";
        env["NPM_CONFIG_FUND"] = "false";
        env["NPM_CONFIG_LOGLEVEL"] = "error";

        const auto home = env.find("HOME");
        if (home == env.end() || home->second.empty() || home->second.front() != '/') {
            env["HOME"] = scratch.string();
        }

        const std::string module_dirs = local_modules.string() + ":" + global_modules.string();
        const auto node_path = env.find("NODE_PATH");
        if (node_path == env.end() || node_path->second.empty()) {
            env["NODE_PATH"] = module_dirs;
        } else {
            node_path->second += ":" + module_dirs;
        }

        if (is_npm_launcher(plan.command)) {
            for (const auto flag : kRestrictedNpmFlags) {
                if (std::find(plan.args.begin(), plan.args.end(), flag) == plan.args.end()) {
                    plan.args.emplace_back(flag);
                }
            }
        }
    }

    // Caller overrides win over everything above
    for (const auto& [key, value] : config.env) {
        plan.environment[key] = value;
    }

    return plan;
}

// ─────────────────────────────────────────────────────────────────────────────
// TransportAdapter
// ─────────────────────────────────────────────────────────────────────────────

TransportAdapter::TransportAdapter(Environment process_env, ProcessOptions options)
    : process_env_(std::move(process_env))
    , options_(options)
{}

Result<OpenedChannel> TransportAdapter::open(const ServerConfig& config, const HostProfile& host) {
    switch (config.transport) {
        case TransportKind::LocalProcess:
            return open_local_process(config, host);
        case TransportKind::RemoteHttp:
            MCPMUX_LOG_WARN(std::format("[{}] remote-http transport requested for {}",
                                        config.id, config.url));
            return tl::unexpected(Error::transport_unavailable(
                "The remote-http transport is not implemented"));
    }
    return tl::unexpected(Error::transport_unavailable("Unknown transport kind"));
}

Result<OpenedChannel> TransportAdapter::open_local_process(const ServerConfig& config,
                                                           const HostProfile& host) {
    auto plan = prepare_launch(config, host, process_env_);
    if (!plan) {
        MCPMUX_LOG_ERROR(std::format("[{}] {}", config.id, plan.error().describe()));
        return tl::unexpected(plan.error());
    }

    if (host.is_restricted_host) {
        MCPMUX_LOG_INFO(std::format("[{}] Restricted host ({}), using scratch dir {}",
                                    config.id, to_string(host.platform), host.scratch_dir.string()));
        for (const auto& dir : plan->scratch_dirs) {
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec) {
                MCPMUX_LOG_WARN(std::format("[{}] Could not create {}: {}",
                                            config.id, dir.string(), ec.message()));
            }
        }
    }

    const auto path_it = plan->environment.find("PATH");
    const std::optional<std::string> search_path = (path_it != plan->environment.end())
        ? std::optional<std::string>(path_it->second)
        : std::nullopt;

    const ExecutableResolver resolver(host);
    auto resolution = resolver.resolve(plan->command, search_path);
    if (!resolution) {
        MCPMUX_LOG_ERROR(std::format("[{}] {}", config.id, resolution.error().describe()));
        return tl::unexpected(resolution.error());
    }

    MCPMUX_LOG_INFO(std::format("[{}] Launching {} {} via {} (env overrides: {})",
                                config.id, resolution->path, format_args(plan->args),
                                to_string(resolution->strategy), redact_env(config.env)));

    ProcessLaunch launch;
    launch.label = config.id;
    launch.executable = resolution->path;
    launch.args = std::move(plan->args);
    launch.environment = std::move(plan->environment);
    launch.stderr_handling = options_.stderr_handling;
    launch.spawn_timeout = options_.spawn_timeout;
    launch.shutdown_grace = options_.shutdown_grace;

    auto channel = ProcessChannel::spawn(std::move(launch));
    if (!channel) {
        MCPMUX_LOG_ERROR(std::format("[{}] {}", config.id, channel.error().describe()));
        return tl::unexpected(channel.error());
    }

    return OpenedChannel{std::shared_ptr<IChannel>(std::move(*channel)), resolution->path};
}

}  // namespace mcpmux
