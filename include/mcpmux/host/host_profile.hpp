#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Host Profile
// ═══════════════════════════════════════════════════════════════════════════
// Describes the hosting environment once: whether we run on a restricted
// (serverless-style) host, where scratch files may be written, and which
// directories to search for relocated launchers. Resolved from an
// Environment snapshot and then passed by value to whoever needs it.

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux {

/// Read-only snapshot of the process environment
class Environment {
public:
    using VariableMap = std::map<std::string, std::string>;

    Environment() = default;
    explicit Environment(VariableMap variables, std::filesystem::path working_dir = {});

    /// Snapshot `environ` and the current working directory
    [[nodiscard]] static Environment from_process();

    /// Value of `name`, or nullopt when unset
    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;

    /// True when `name` is set to a non-empty value
    [[nodiscard]] bool has_value(std::string_view name) const;

    [[nodiscard]] const VariableMap& variables() const noexcept { return variables_; }
    [[nodiscard]] const std::filesystem::path& working_dir() const noexcept { return working_dir_; }

private:
    VariableMap variables_;
    std::filesystem::path working_dir_;
};

/// Hosting platform detected from indicator variables
enum class HostPlatform {
    Standard,
    Vercel,
    Netlify,
    AwsLambda,
    GcpFunctions,
    CloudRun,
    UnknownRestricted
};

[[nodiscard]] constexpr std::string_view to_string(HostPlatform platform) noexcept {
    switch (platform) {
        case HostPlatform::Standard:          return "standard";
        case HostPlatform::Vercel:            return "vercel";
        case HostPlatform::Netlify:           return "netlify";
        case HostPlatform::AwsLambda:         return "aws-lambda";
        case HostPlatform::GcpFunctions:      return "gcp-functions";
        case HostPlatform::CloudRun:          return "cloud-run";
        case HostPlatform::UnknownRestricted: return "unknown-restricted";
    }
    return "unknown";
}

struct HostProfile {
    bool is_restricted_host{false};
    HostPlatform platform{HostPlatform::Standard};
    std::filesystem::path scratch_dir{"/tmp"};
    std::vector<std::filesystem::path> executable_fallback_paths;
};

/// Pure function of `env`; never fails and defaults to "not restricted"
[[nodiscard]] HostProfile resolve_host_profile(const Environment& env);

}  // namespace mcpmux
