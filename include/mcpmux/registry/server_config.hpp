#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Definition and lifecycle snapshot of one external tool provider. The
// registry owns the live record; every ServerConfig handed to a caller is an
// immutable copy.

#include "mcpmux/error.hpp"
#include "mcpmux/protocol/descriptors.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux {

// ─────────────────────────────────────────────────────────────────────────────
// Enumerations
// ─────────────────────────────────────────────────────────────────────────────

enum class TransportKind {
    LocalProcess,
    RemoteHttp
};

[[nodiscard]] constexpr std::string_view to_string(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::LocalProcess: return "local-process";
        case TransportKind::RemoteHttp:   return "remote-http";
    }
    return "unknown";
}

/// Accepts "local-process"/"stdio" and "remote-http"/"http"
[[nodiscard]] std::optional<TransportKind> transport_kind_from_string(std::string_view text) noexcept;

enum class ServerStatus {
    Inactive,
    Starting,
    Active,
    Stopping,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(ServerStatus status) noexcept {
    switch (status) {
        case ServerStatus::Inactive: return "inactive";
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Active:   return "active";
        case ServerStatus::Stopping: return "stopping";
        case ServerStatus::Error:    return "error";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Remote Authentication
// ─────────────────────────────────────────────────────────────────────────────

struct RemoteAuth {
    enum class Scheme { Bearer, Header };

    Scheme scheme{Scheme::Bearer};
    std::string header_name{"Authorization"};
    std::string token;

    [[nodiscard]] Json to_json(bool redact = true) const;
    [[nodiscard]] static Result<RemoteAuth> from_json(const Json& j);

    friend bool operator==(const RemoteAuth&, const RemoteAuth&) = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// ServerConfig
// ─────────────────────────────────────────────────────────────────────────────

struct ServerConfig {
    using Clock = std::chrono::system_clock;

    std::string id;
    std::string name;
    std::string description;
    TransportKind transport{TransportKind::LocalProcess};

    // local-process
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// Variables that must be non-blank in `env` or the host environment before spawning
    std::vector<std::string> required_env;

    // remote-http
    std::string url;
    std::optional<RemoteAuth> auth;

    // Lifecycle; maintained by the registry
    ServerStatus status{ServerStatus::Inactive};
    std::optional<std::vector<ToolDescriptor>> tools;
    std::optional<std::vector<ResourceDescriptor>> resources;
    std::optional<std::vector<PromptDescriptor>> prompts;
    std::optional<Implementation> server_info;
    std::optional<Error> last_error;
    std::string resolved_command;
    bool restart_required{false};
    Clock::time_point created_at{};
    Clock::time_point updated_at{};

    /// Display name, falling back to the id
    [[nodiscard]] const std::string& display_name() const noexcept {
        return name.empty() ? id : name;
    }

    /// With `redact`, env values and the auth token are replaced by <redacted>
    [[nodiscard]] Json to_json(bool redact = true) const;

    /// Parse a definition (id, name, transport, command/args/env/requiredEnv or url/auth).
    /// Lifecycle fields are ignored; ConfigurationError on malformed input.
    [[nodiscard]] static Result<ServerConfig> from_json(const Json& j);
};

/// Partial update; unset fields are left alone
struct ServerUpdate {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<TransportKind> transport;
    std::optional<std::string> command;
    std::optional<std::vector<std::string>> args;
    std::optional<std::map<std::string, std::string>> env;
    std::optional<std::vector<std::string>> required_env;
    std::optional<std::string> url;
    std::optional<RemoteAuth> auth;
    bool clear_auth{false};

    /// True when applying this would change how the server is connected to
    [[nodiscard]] bool changes_connection(const ServerConfig& current) const;

    void apply_to(ServerConfig& config) const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Operation Results
// ─────────────────────────────────────────────────────────────────────────────

struct StartResult {
    ServerStatus status{ServerStatus::Inactive};
    std::vector<ToolDescriptor> tools;
    std::vector<ResourceDescriptor> resources;
    std::vector<PromptDescriptor> prompts;

    [[nodiscard]] static StartResult from_config(const ServerConfig& config);
    [[nodiscard]] Json to_json() const;
};

struct StopResult {
    ServerStatus status{ServerStatus::Inactive};
};

struct DeleteResult {
    bool success{false};
};

}  // namespace mcpmux
