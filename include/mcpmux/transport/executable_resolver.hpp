#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Executable Resolution
// ═══════════════════════════════════════════════════════════════════════════
// Turns a configured command name into an executable path by trying an
// ordered list of strategies. Every attempt is recorded so a failed start can
// say exactly where it looked.

#include "mcpmux/error.hpp"
#include "mcpmux/host/host_profile.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux {

enum class ResolutionStrategy {
    ExplicitPath,       // Command contains '/', used as given
    SearchPath,         // Each directory of PATH
    WellKnownLocation   // HostProfile fallbacks, relocated launchers only
};

[[nodiscard]] constexpr std::string_view to_string(ResolutionStrategy strategy) noexcept {
    switch (strategy) {
        case ResolutionStrategy::ExplicitPath:      return "explicit-path";
        case ResolutionStrategy::SearchPath:        return "search-path";
        case ResolutionStrategy::WellKnownLocation: return "well-known-location";
    }
    return "unknown";
}

struct ResolutionAttempt {
    ResolutionStrategy strategy;
    std::string candidate;
    std::string outcome;   // "ok", "not found", "not executable", "skipped: ..."

    [[nodiscard]] Json to_json() const;
};

struct Resolution {
    std::string path;
    ResolutionStrategy strategy{ResolutionStrategy::SearchPath};
    std::vector<ResolutionAttempt> attempts;
};

class ExecutableResolver {
public:
    explicit ExecutableResolver(HostProfile profile);

    /// Resolve `command` against `search_path` (a PATH-style list) and the host fallbacks.
    /// TransportUnavailable with the attempt list in `details` when nothing qualifies.
    [[nodiscard]] Result<Resolution> resolve(std::string_view command,
                                             const std::optional<std::string>& search_path) const;

    /// npx, npm, node, uvx, uv, python, python3, bun, bunx, deno, docker
    [[nodiscard]] static bool is_relocated_launcher(std::string_view name) noexcept;

    [[nodiscard]] const HostProfile& host_profile() const noexcept { return profile_; }

private:
    HostProfile profile_;
};

}  // namespace mcpmux
