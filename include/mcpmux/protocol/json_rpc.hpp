#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace mcpmux {

using Json = nlohmann::json;

inline constexpr const char* kJsonRpcVersion = "2.0";

// Standard JSON-RPC error codes
namespace RpcErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
}

struct EnvelopeError {
    enum class Code {
        NotAnObject,
        InvalidVersion,
        MissingField,
        InvalidId
    };

    Code code{Code::MissingField};
    std::string message;
};

template <typename T>
using EnvelopeResult = tl::expected<T, EnvelopeError>;

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] Json to_json() const;
    static EnvelopeResult<JsonRpcId> from_json(const Json& node);

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    JsonRpcId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    std::optional<Json> params_;
};

struct JsonRpcError {
    int code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonRpcError from_json(const Json& node);
};

/// A response is either a result payload or an error object, never both.
struct JsonRpcResponse {
    JsonRpcId id;
    std::variant<Json, JsonRpcError> outcome;

    [[nodiscard]] bool is_error() const noexcept {
        return std::holds_alternative<JsonRpcError>(outcome);
    }

    static EnvelopeResult<JsonRpcResponse> from_json(const Json& payload);

    /// Build a reply to a server-initiated request
    [[nodiscard]] static Json make_result(const Json& id, Json result);
    [[nodiscard]] static Json make_error(const Json& id, int code, std::string message);
};

/// Shape of an incoming message, decided from the presence of id/method
enum class MessageKind {
    Request,       // method + id (server-initiated request)
    Notification,  // method, no id
    Response,      // id, no method
    Invalid
};

[[nodiscard]] MessageKind classify_message(const Json& message) noexcept;

}  // namespace mcpmux
