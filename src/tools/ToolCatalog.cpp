#include "ToolCatalog.hpp"
#include <spdlog/spdlog.h>
#include <cctype>

namespace mcp_host {

namespace {

constexpr const char* kPrefix = "mcp_";

} // namespace

ToolCatalog::ToolCatalog(ServerManager& manager)
    : manager_(manager) {}

std::string ToolCatalog::make_tool_id(const std::string& server_name, const std::string& tool_name) {
    std::string sanitized = server_name;
    for (auto& c : sanitized) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            c = '_';
        }
    }
    return kPrefix + sanitized + "_" + tool_name;
}

std::string ToolCatalog::display_name(const std::string& tool_name) {
    std::string result;
    result.reserve(tool_name.size());

    bool word_start = true;
    for (char c : tool_name) {
        if (c == '_') {
            result += ' ';
            word_start = true;
        } else if (word_start) {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            word_start = false;
        } else {
            result += c;
        }
    }
    return result;
}

std::string ToolCatalog::extract_original_tool_name(const std::string& tool_id) {
    const std::string prefix = kPrefix;
    if (tool_id.compare(0, prefix.size(), prefix) != 0) {
        return tool_id;
    }

    // Server segment runs up to the next underscore and must be non-empty
    auto sep = tool_id.find('_', prefix.size());
    if (sep == std::string::npos || sep == prefix.size() || sep + 1 >= tool_id.size()) {
        return tool_id;
    }
    return tool_id.substr(sep + 1);
}

std::vector<CatalogEntry> ToolCatalog::entries() const {
    std::vector<CatalogEntry> result;
    for (const auto& attributed : manager_.all_tools()) {
        CatalogEntry entry;
        entry.id = make_tool_id(attributed.server_name, attributed.tool.name);
        entry.display_name = display_name(attributed.tool.name);
        entry.description = attributed.tool.description.empty() ? attributed.tool.name
                                                                 : attributed.tool.description;
        entry.server_id = attributed.server_id;
        entry.server_name = attributed.server_name;
        result.push_back(std::move(entry));
    }
    return result;
}

json ToolCatalog::definitions() const {
    json result = json::array();
    for (const auto& attributed : manager_.all_tools()) {
        const auto& tool = attributed.tool;
        json parameters = tool.input_schema.is_object()
            ? tool.input_schema
            : json{{"type", "object"}, {"properties", json::object()}};

        result.push_back({
            {"name", make_tool_id(attributed.server_name, tool.name)},
            {"description", "[MCP: " + attributed.server_name + "] " +
                                (tool.description.empty() ? tool.name : tool.description)},
            {"parameters", parameters},
            {"server_id", attributed.server_id},
            {"tool_name", tool.name}
        });
    }
    return result;
}

CatalogCallResult ToolCatalog::call(const std::string& tool_id, const json& arguments) {
    CatalogCallResult result;

    for (const auto& attributed : manager_.all_tools()) {
        if (make_tool_id(attributed.server_name, attributed.tool.name) != tool_id) {
            continue;
        }

        spdlog::debug("Calling {} on server {}", attributed.tool.name, attributed.server_id);
        try {
            ToolCallResult call = manager_.call_tool(attributed.server_id, attributed.tool.name,
                                                     arguments.is_null() ? json::object() : arguments);
            result.success = true;
            result.data = call.raw.is_null()
                ? json{{"content", call.content}, {"isError", call.is_error}}
                : call.raw;
        } catch (const std::exception& e) {
            spdlog::warn("MCP tool {} failed: {}", tool_id, e.what());
            result.error = e.what();
        }
        return result;
    }

    result.error = "MCP tool not found: " + tool_id;
    return result;
}

std::string format_call_result(const CatalogCallResult& result) {
    if (!result.success) {
        return json{{"success", false}, {"error", result.error}}.dump();
    }

    const json& data = result.data;
    if (data.is_object() && data.contains("content") && data["content"].is_array()) {
        std::string text;
        for (const auto& item : data["content"]) {
            if (!item.is_object()) {
                continue;
            }
            std::string type = item.contains("type") && item["type"].is_string()
                ? item["type"].get<std::string>() : "unknown";

            if (!text.empty()) {
                text += "\n";
            }
            if (type == "text" && item.contains("text") && item["text"].is_string()) {
                text += item["text"].get<std::string>();
            } else {
                text += "[" + type + "]";
                if (item.contains("mimeType") && item["mimeType"].is_string()) {
                    text += " " + item["mimeType"].get<std::string>();
                }
            }
        }
        if (!text.empty()) {
            return text;
        }
    }

    return data.dump();
}

} // namespace mcp_host
