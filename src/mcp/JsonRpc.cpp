#include "JsonRpc.hpp"

namespace mcp_host {
namespace jsonrpc {

json make_request(RequestId id, const std::string& method, const json& params) {
    return {
        {"jsonrpc", kVersion},
        {"id", id},
        {"method", method},
        {"params", params}
    };
}

json make_notification(const std::string& method, const json& params) {
    json notification = {
        {"jsonrpc", kVersion},
        {"method", method}
    };
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

std::string encode(const json& message) {
    try {
        return message.dump() + "\n";
    } catch (const json::type_error& e) {
        throw RpcError(kInvalidParams, std::string("Cannot encode message: ") + e.what());
    }
}

MessageKind classify(const json& message) {
    if (!message.is_object()) {
        return MessageKind::Invalid;
    }

    bool has_id = message.contains("id") && !message["id"].is_null();
    bool has_method = message.contains("method") && message["method"].is_string();

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

bool response_id(const json& message, RequestId& id) {
    if (!message.is_object() || !message.contains("id")) {
        return false;
    }
    const auto& value = message["id"];
    if (!value.is_number_integer()) {
        return false;
    }
    id = value.get<RequestId>();
    return true;
}

bool is_error_response(const json& message) {
    return message.contains("error") && !message["error"].is_null();
}

RpcError error_from_response(const json& message) {
    const auto& error = message.at("error");
    if (!error.is_object()) {
        return RpcError(kInternalError, error.is_string() ? error.get<std::string>() : error.dump());
    }

    int code = kInternalError;
    if (error.contains("code") && error["code"].is_number_integer()) {
        code = error["code"].get<int>();
    }
    std::string text = "Unknown error";
    if (error.contains("message") && error["message"].is_string()) {
        text = error["message"].get<std::string>();
    }
    return RpcError(code, text, error.value("data", json()));
}

const char* to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::Response: return "response";
        case MessageKind::Notification: return "notification";
        case MessageKind::Request: return "request";
        case MessageKind::Invalid: return "invalid";
    }
    return "invalid";
}

} // namespace jsonrpc
} // namespace mcp_host
