#include "mcpmux/protocol/json_rpc.hpp"

namespace mcpmux {

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

Json JsonRpcId::to_json() const {
    Json node;
    std::visit([&](const auto& id_value) { node = id_value; }, value);
    return node;
}

EnvelopeResult<JsonRpcId> JsonRpcId::from_json(const Json& node) {
    if (node.is_number_integer() == true) {
        return JsonRpcId::integer(node.get<std::int64_t>());
    }
    if (node.is_string() == true) {
        return JsonRpcId::string(node.get<std::string>());
    }

    return tl::unexpected(EnvelopeError{
        EnvelopeError::Code::InvalidId,
        "id must be an integer or string"});
}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               JsonRpcId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonRpcError JsonRpcError::from_json(const Json& node) {
    JsonRpcError err;
    if (node.is_object() == false) {
        err.code = RpcErrorCode::InternalError;
        err.message = node.is_string() ? node.get<std::string>() : node.dump();
        return err;
    }
    const auto code_it = node.find("code");
    if (code_it != node.end() && code_it->is_number_integer()) {
        err.code = code_it->get<int>();
    }
    const auto message_it = node.find("message");
    if (message_it != node.end() && message_it->is_string()) {
        err.message = message_it->get<std::string>();
    }
    if (node.contains("data")) {
        err.data = node.at("data");
    }
    return err;
}

EnvelopeResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(EnvelopeError{
            EnvelopeError::Code::NotAnObject,
            "response must be a JSON object"});
    }

    const auto version_it = payload.find("jsonrpc");
    if (version_it != payload.end() &&
        ((version_it->is_string() == false) || (*version_it != kJsonRpcVersion))) {
        return tl::unexpected(EnvelopeError{
            EnvelopeError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }

    const bool has_id_field = payload.contains("id");
    if (has_id_field == false) {
        return tl::unexpected(EnvelopeError{
            EnvelopeError::Code::MissingField,
            "missing id field"});
    }
    auto parsed_id = JsonRpcId::from_json(payload.at("id"));
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    if (payload.contains("error")) {
        return JsonRpcResponse{*parsed_id, JsonRpcError::from_json(payload.at("error"))};
    }
    if (payload.contains("result")) {
        return JsonRpcResponse{*parsed_id, payload.at("result")};
    }

    return tl::unexpected(EnvelopeError{
        EnvelopeError::Code::MissingField,
        "response has neither result nor error"});
}

Json JsonRpcResponse::make_result(const Json& id, Json result) {
    return {{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", std::move(result)}};
}

Json JsonRpcResponse::make_error(const Json& id, int code, std::string message) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {{"code", code}, {"message", std::move(message)}}}
    };
}

MessageKind classify_message(const Json& message) noexcept {
    if (message.is_object() == false) {
        return MessageKind::Invalid;
    }
    const auto id_it = message.find("id");
    const bool has_id = (id_it != message.end()) && (id_it->is_null() == false);
    const auto method_it = message.find("method");
    const bool has_method = (method_it != message.end()) && method_it->is_string();

    if (has_method && has_id) {
        return MessageKind::Request;
    }
    if (has_method) {
        return MessageKind::Notification;
    }
    if (has_id) {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

}  // namespace mcpmux
