#include "Types.hpp"
#include <stdexcept>

namespace mcp_host {

const char* to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Error: return "error";
    }
    return "disconnected";
}

const char* to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http: return "http";
    }
    return "stdio";
}

const char* status_label(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Connected: return "Connected";
        case ConnectionStatus::Connecting: return "Connecting";
        case ConnectionStatus::Error: return "Error";
        case ConnectionStatus::Disconnected: return "Stopped";
    }
    return "Stopped";
}

std::vector<ToolDescriptor> parse_tools_list(const json& result) {
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        throw std::invalid_argument("Invalid tools/list result: missing tools array");
    }

    std::vector<ToolDescriptor> tools;
    for (const auto& entry : result["tools"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            throw std::invalid_argument("Invalid tools/list result: tool without name");
        }

        ToolDescriptor tool;
        tool.name = entry["name"].get<std::string>();
        if (entry.contains("description") && entry["description"].is_string()) {
            tool.description = entry["description"].get<std::string>();
        }
        tool.input_schema = entry.value("inputSchema", json());
        tools.push_back(std::move(tool));
    }
    return tools;
}

ToolCallResult parse_tool_call_result(const json& result) {
    if (!result.is_object()) {
        throw std::invalid_argument("Invalid tools/call result: expected an object");
    }

    ToolCallResult call_result;
    if (result.contains("content") && result["content"].is_array()) {
        call_result.content = result["content"];
    }
    call_result.is_error = result.contains("isError") && result["isError"].is_boolean()
        && result["isError"].get<bool>();
    call_result.raw = result;
    return call_result;
}

json to_json(const ToolDescriptor& tool) {
    json value = {
        {"name", tool.name},
        {"description", tool.description}
    };
    if (!tool.input_schema.is_null()) {
        value["inputSchema"] = tool.input_schema;
    }
    return value;
}

} // namespace mcp_host
