#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcp_host {

using json = nlohmann::json;

/**
 * @brief Transport used to reach an MCP server
 */
enum class TransportKind {
    Stdio,
    Http
};

/**
 * @brief Launch configuration for one MCP server
 */
struct ServerConfig {
    std::string id;                          // Manager key (defaults to name)
    std::string name;                        // Human-readable name, used in logs and tool ids
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // Overlaid on the parent environment
    std::string cwd;                         // Empty: inherit the parent's working directory
    TransportKind transport = TransportKind::Stdio;
    std::string url;                         // Http only
    bool enabled = true;
    bool use_shell = false;                  // Run through /bin/sh -c
    std::vector<std::string> allowed_tools;  // Empty or "*": every tool
    std::string source = "manual";           // Where the entry came from
};

/**
 * @brief Metadata for a tool exposed by a server
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments (null when not provided)
};

/**
 * @brief Result of tools/call, passed through verbatim
 */
struct ToolCallResult {
    json content = json::array();  // [{type, text?, data?, mimeType?}]
    bool is_error = false;
    json raw;                      // Complete result object
};

/**
 * @brief Connection state of a single client
 */
enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected,
    Error
};

const char* to_string(ConnectionStatus status);
const char* to_string(TransportKind kind);

/**
 * @brief User-facing label: Connected, Connecting, Error or Stopped
 */
const char* status_label(ConnectionStatus status);

/**
 * @brief Parse the result of tools/list
 * @throws std::invalid_argument if result has no tools array
 */
std::vector<ToolDescriptor> parse_tools_list(const json& result);

/**
 * @brief Parse the result of tools/call
 * @throws std::invalid_argument if result is not an object
 */
ToolCallResult parse_tool_call_result(const json& result);

json to_json(const ToolDescriptor& tool);

} // namespace mcp_host
