#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace mcp_host {

/**
 * @brief Base class for all errors raised by the MCP host library
 */
class McpError : public std::runtime_error {
public:
    explicit McpError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Server process could not be launched (missing binary, permissions, pipes)
 */
class SpawnError : public McpError {
public:
    using McpError::McpError;
};

/**
 * @brief Reading from or writing to the server process failed
 */
class TransportError : public McpError {
public:
    using McpError::McpError;
};

/**
 * @brief Server answered a request with a JSON-RPC error object
 *
 * what() is the server's error.message; code and data are kept verbatim.
 */
class RpcError : public McpError {
public:
    RpcError(int code, const std::string& message, nlohmann::json data = nullptr)
        : McpError(message), code_(code), data_(std::move(data)) {}

    int code() const { return code_; }
    const nlohmann::json& data() const { return data_; }

private:
    int code_;
    nlohmann::json data_;
};

/**
 * @brief No response arrived before the request deadline
 */
class TimeoutError : public McpError {
public:
    using McpError::McpError;
};

/**
 * @brief Connection was torn down while the request was still pending
 */
class ConnectionClosedError : public McpError {
public:
    using McpError::McpError;
};

/**
 * @brief Operation requires a connected server
 */
class NotConnectedError : public McpError {
public:
    using McpError::McpError;
};

/**
 * @brief Host configuration file is unreadable or malformed
 */
class ConfigError : public McpError {
public:
    using McpError::McpError;
};

} // namespace mcp_host
