#include "mcpmux/transport/executable_resolver.hpp"
#include "mcpmux/log/logger.hpp"

#include <unistd.h>

#include <algorithm>
#include <array>
#include <filesystem>
#include <format>
#include <system_error>

namespace mcpmux {

namespace {

namespace fs = std::filesystem;

constexpr std::array<std::string_view, 11> kRelocatedLaunchers = {
    "npx", "npm", "node", "uvx", "uv", "python", "python3", "bun", "bunx", "deno", "docker"
};

constexpr std::string_view kOk{"ok"};

std::string check_candidate(const fs::path& candidate) {
    std::error_code ec;
    const auto status = fs::status(candidate, ec);
    if (ec || !fs::exists(status)) {
        return "not found";
    }
    if (fs::is_directory(status)) {
        return "is a directory";
    }
    if (::access(candidate.c_str(), X_OK) != 0) {
        return "not executable";
    }
    return std::string(kOk);
}

std::vector<fs::path> split_search_path(const std::string& search_path) {
    std::vector<fs::path> dirs;
    std::size_t start = 0;
    while (start <= search_path.size()) {
        const auto colon = search_path.find(':', start);
        const auto end = (colon == std::string::npos) ? search_path.size() : colon;
        const auto entry = search_path.substr(start, end - start);
        // An empty PATH element means the current directory
        dirs.emplace_back(entry.empty() ? "." : entry);
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    return dirs;
}

}  // namespace

Json ResolutionAttempt::to_json() const {
    return {
        {"strategy", std::string(to_string(strategy))},
        {"candidate", candidate},
        {"outcome", outcome}
    };
}

ExecutableResolver::ExecutableResolver(HostProfile profile)
    : profile_(std::move(profile))
{}

bool ExecutableResolver::is_relocated_launcher(std::string_view name) noexcept {
    return std::find(kRelocatedLaunchers.begin(), kRelocatedLaunchers.end(), name)
        != kRelocatedLaunchers.end();
}

Result<Resolution> ExecutableResolver::resolve(
    std::string_view command,
    const std::optional<std::string>& search_path
) const {
    if (command.empty()) {
        return tl::unexpected(Error::configuration("Command must not be empty"));
    }

    Resolution resolution;
    auto attempt = [&resolution](ResolutionStrategy strategy, const fs::path& candidate) {
        auto outcome = check_candidate(candidate);
        const bool accepted = (outcome == kOk);
        MCPMUX_LOG_DEBUG(std::format("Resolve {}: {} -> {}", to_string(strategy),
                                     candidate.string(), outcome));
        resolution.attempts.push_back({strategy, candidate.string(), std::move(outcome)});
        if (accepted) {
            resolution.path = candidate.string();
            resolution.strategy = strategy;
        }
        return accepted;
    };

    const bool explicit_path = (command.find('/') != std::string_view::npos);
    const auto name = fs::path(command).filename().string();

    // ─────────────────────────────────────────────────────────────────────────
    // Strategy 1: explicit path
    // ─────────────────────────────────────────────────────────────────────────
    if (explicit_path) {
        if (attempt(ResolutionStrategy::ExplicitPath, fs::path(command))) {
            return resolution;
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Strategy 2: search path
    // ─────────────────────────────────────────────────────────────────────────
    if (explicit_path) {
        resolution.attempts.push_back({ResolutionStrategy::SearchPath, std::string(command),
                                       "skipped: command is a path"});
    } else if (!search_path.has_value() || search_path->empty()) {
        resolution.attempts.push_back({ResolutionStrategy::SearchPath, std::string(command),
                                       "skipped: PATH is not set"});
    } else {
        for (const auto& dir : split_search_path(*search_path)) {
            if (attempt(ResolutionStrategy::SearchPath, dir / name)) {
                return resolution;
            }
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Strategy 3: well-known locations for relocated launchers
    // ─────────────────────────────────────────────────────────────────────────
    if (!is_relocated_launcher(name)) {
        resolution.attempts.push_back({ResolutionStrategy::WellKnownLocation, name,
                                       "skipped: not a relocated launcher"});
    } else {
        for (const auto& dir : profile_.executable_fallback_paths) {
            if (attempt(ResolutionStrategy::WellKnownLocation, dir / name)) {
                return resolution;
            }
        }
    }

    Json attempts = Json::array();
    for (const auto& a : resolution.attempts) {
        attempts.push_back(a.to_json());
    }

    Error error = Error::transport_unavailable(std::format(
        "Could not resolve executable '{}' ({} candidates tried)",
        command, resolution.attempts.size()));
    error.details = Json{{"attempts", std::move(attempts)}};
    return tl::unexpected(std::move(error));
}

}  // namespace mcpmux
