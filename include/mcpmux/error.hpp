#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// mcpmux Error
// ═══════════════════════════════════════════════════════════════════════════
// Single error type shared by the transport, protocol, registry and router
// layers. Callers branch on `code`; `message` is for humans.

#include "mcpmux/protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcpmux {

using Json = nlohmann::json;

/// Failure classes surfaced to callers
enum class ErrorCode {
    ConfigurationError,    ///< Missing or empty required setting, detected before spawning
    TransportUnavailable,  ///< Transport kind not implemented, or no executable resolved
    ConnectionFault,       ///< Channel could not be opened or died
    ProtocolFault,         ///< Malformed response, or no response within the bound
    ToolExecutionError,    ///< Remote side reported an application-level failure
    NotConnected,          ///< Server has no active connection
    NotFound,              ///< Unknown server id
    PreconditionFailed,    ///< Operation not allowed in the current lifecycle state
    Cancelled              ///< Call abandoned because the connection was stopped
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ConfigurationError:   return "ConfigurationError";
        case ErrorCode::TransportUnavailable: return "TransportUnavailable";
        case ErrorCode::ConnectionFault:      return "ConnectionFault";
        case ErrorCode::ProtocolFault:        return "ProtocolFault";
        case ErrorCode::ToolExecutionError:   return "ToolExecutionError";
        case ErrorCode::NotConnected:         return "NotConnected";
        case ErrorCode::NotFound:             return "NotFound";
        case ErrorCode::PreconditionFailed:   return "PreconditionFailed";
        case ErrorCode::Cancelled:            return "Cancelled";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code{ErrorCode::ConnectionFault};
    std::string message;
    std::optional<JsonRpcError> rpc_error{};  ///< Original RPC error when the remote side sent one
    std::optional<Json> details{};            ///< Extra payload (e.g. a failed tool result)

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static Error configuration(std::string msg) {
        return {ErrorCode::ConfigurationError, std::move(msg)};
    }

    [[nodiscard]] static Error transport_unavailable(std::string msg) {
        return {ErrorCode::TransportUnavailable, std::move(msg)};
    }

    [[nodiscard]] static Error connection_fault(std::string msg) {
        return {ErrorCode::ConnectionFault, std::move(msg)};
    }

    [[nodiscard]] static Error protocol_fault(std::string msg) {
        return {ErrorCode::ProtocolFault, std::move(msg)};
    }

    [[nodiscard]] static Error tool_execution(std::string msg, std::optional<Json> details = std::nullopt) {
        return {ErrorCode::ToolExecutionError, std::move(msg), std::nullopt, std::move(details)};
    }

    [[nodiscard]] static Error from_rpc_error(const JsonRpcError& err) {
        return {ErrorCode::ToolExecutionError, err.message, err, err.data};
    }

    [[nodiscard]] static Error not_connected(const std::string& server_id) {
        return {ErrorCode::NotConnected, "Server '" + server_id + "' has no active connection"};
    }

    [[nodiscard]] static Error not_found(const std::string& server_id) {
        return {ErrorCode::NotFound, "Unknown server '" + server_id + "'"};
    }

    [[nodiscard]] static Error precondition_failed(std::string msg) {
        return {ErrorCode::PreconditionFailed, std::move(msg)};
    }

    [[nodiscard]] static Error cancelled(std::string msg = "Request was cancelled") {
        return {ErrorCode::Cancelled, std::move(msg)};
    }

    /// True when the remote side answered with JSON-RPC "method not found"
    [[nodiscard]] bool is_method_not_found() const noexcept {
        return rpc_error.has_value() && rpc_error->code == RpcErrorCode::MethodNotFound;
    }

    /// "<Code>: <message>" for logs and user-visible text
    [[nodiscard]] std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"code", std::string(to_string(code))}, {"message", message}};
        if (rpc_error) {
            j["rpcError"] = rpc_error->to_json();
        }
        if (details) {
            j["details"] = *details;
        }
        return j;
    }
};

template <typename T>
using Result = tl::expected<T, Error>;

}  // namespace mcpmux
