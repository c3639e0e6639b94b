#include "mcpmux/host/host_profile.hpp"

#include <system_error>

extern char** environ;

namespace mcpmux {

namespace {

// Marker variable -> platform, checked in order
struct PlatformMarker {
    std::string_view variable;
    HostPlatform platform;
};

constexpr PlatformMarker kPlatformMarkers[] = {
    {"VERCEL", HostPlatform::Vercel},
    {"NETLIFY", HostPlatform::Netlify},
    {"AWS_LAMBDA_FUNCTION_NAME", HostPlatform::AwsLambda},
    {"FUNCTION_NAME", HostPlatform::GcpFunctions},
    {"K_SERVICE", HostPlatform::CloudRun},
};

constexpr std::string_view kStaticFallbackDirs[] = {
    "/usr/local/bin",
    "/usr/bin",
    "/bin",
    "/opt/homebrew/bin",
};

constexpr std::string_view kPlatformFallbackDirs[] = {
    "/vercel/.local/bin",
    "/opt/buildhome/.local/bin",
};

HostPlatform detect_platform(const Environment& env) {
    for (const auto& marker : kPlatformMarkers) {
        if (env.has_value(marker.variable)) {
            return marker.platform;
        }
    }

    if (!env.has_value("HOME")) {
        return HostPlatform::UnknownRestricted;
    }

    // Bundled function code is unpacked under /var/task on Lambda-style hosts
    const auto node_env = env.get("NODE_ENV");
    const bool production = node_env.has_value() && *node_env == "production";
    const bool under_var_task = env.working_dir().string().find("/var/task") != std::string::npos;
    if (production && under_var_task) {
        return HostPlatform::UnknownRestricted;
    }

    return HostPlatform::Standard;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Environment
// ─────────────────────────────────────────────────────────────────────────────

Environment::Environment(VariableMap variables, std::filesystem::path working_dir)
    : variables_(std::move(variables))
    , working_dir_(std::move(working_dir))
{}

Environment Environment::from_process() {
    VariableMap variables;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string_view pair(*entry);
        const auto eq = pair.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        variables.emplace(std::string(pair.substr(0, eq)), std::string(pair.substr(eq + 1)));
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        cwd.clear();
    }
    return Environment(std::move(variables), std::move(cwd));
}

std::optional<std::string> Environment::get(std::string_view name) const {
    const auto it = variables_.find(std::string(name));
    if (it == variables_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Environment::has_value(std::string_view name) const {
    const auto value = get(name);
    return value.has_value() && !value->empty();
}

// ─────────────────────────────────────────────────────────────────────────────
// Resolution
// ─────────────────────────────────────────────────────────────────────────────

HostProfile resolve_host_profile(const Environment& env) {
    HostProfile profile;
    profile.platform = detect_platform(env);
    profile.is_restricted_host = (profile.platform != HostPlatform::Standard);

    const auto tmpdir = env.get("TMPDIR");
    if (tmpdir && !tmpdir->empty() && tmpdir->front() == '/') {
        profile.scratch_dir = *tmpdir;
    }

    for (const auto dir : kStaticFallbackDirs) {
        profile.executable_fallback_paths.emplace_back(dir);
    }
    if (env.has_value("HOME")) {
        profile.executable_fallback_paths.push_back(
            std::filesystem::path(*env.get("HOME")) / ".local" / "bin");
    }
    for (const auto dir : kPlatformFallbackDirs) {
        profile.executable_fallback_paths.emplace_back(dir);
    }
    if (profile.is_restricted_host) {
        profile.executable_fallback_paths.push_back(profile.scratch_dir / ".npm-global" / "bin");
    }

    return profile;
}

}  // namespace mcpmux
