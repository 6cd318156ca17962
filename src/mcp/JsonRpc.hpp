#pragma once

#include "core/Errors.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace mcp_host {

using json = nlohmann::json;
using RequestId = int64_t;

namespace jsonrpc {

constexpr const char* kVersion = "2.0";

// Standard JSON-RPC 2.0 error codes
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

/**
 * @brief Classification of a decoded inbound message
 */
enum class MessageKind {
    Response,      // has id, no method
    Notification,  // has method, no id
    Request,       // has both id and method (server-initiated call)
    Invalid
};

/**
 * @brief Build a request object {jsonrpc, id, method, params}
 */
json make_request(RequestId id, const std::string& method, const json& params = json::object());

/**
 * @brief Build a notification object (no id; params omitted when null)
 */
json make_notification(const std::string& method, const json& params = nullptr);

/**
 * @brief Serialize a message as a single ndjson line (terminated by '\n')
 * @throws RpcError with kInvalidParams when a string is not valid UTF-8
 */
std::string encode(const json& message);

/**
 * @brief Decide what kind of message a decoded object is
 */
MessageKind classify(const json& message);

/**
 * @brief Extract the numeric id of a response
 * @return false when the id is missing or not an integer
 */
bool response_id(const json& message, RequestId& id);

/**
 * @brief True when a response carries an error object
 */
bool is_error_response(const json& message);

/**
 * @brief Build an RpcError from the response's error object
 */
RpcError error_from_response(const json& message);

/**
 * @brief Label for log output
 */
const char* to_string(MessageKind kind);

} // namespace jsonrpc
} // namespace mcp_host
