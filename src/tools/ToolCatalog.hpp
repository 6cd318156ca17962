#pragma once

#include "mcp/ServerManager.hpp"
#include <string>
#include <vector>

namespace mcp_host {

/**
 * @brief One row of the host's tool picker
 */
struct CatalogEntry {
    std::string id;            // Prefixed tool id: mcp_<server>_<tool>
    std::string display_name;
    std::string description;
    std::string source = "mcp";
    std::string server_id;
    std::string server_name;
    bool enabled_by_default = false;
};

/**
 * @brief Outcome of a catalog call, never thrown
 */
struct CatalogCallResult {
    bool success = false;
    json data;
    std::string error;
};

/**
 * @brief Exposes the manager's tools to an agent under prefixed ids
 *
 * Tool ids embed the server name so two servers may expose tools with the
 * same name. The catalog holds no state of its own; every query reflects
 * the manager's current connections.
 */
class ToolCatalog {
public:
    explicit ToolCatalog(ServerManager& manager);

    /**
     * @brief Build the prefixed id for a server tool
     *
     * Characters of the server name outside [A-Za-z0-9_] become '_'.
     */
    static std::string make_tool_id(const std::string& server_name, const std::string& tool_name);

    /**
     * @brief Human-readable tool name: search_notes -> Search Notes
     */
    static std::string display_name(const std::string& tool_name);

    /**
     * @brief Strip the mcp_<server>_ prefix from a tool id
     *
     * Ids without the prefix are returned unchanged.
     */
    static std::string extract_original_tool_name(const std::string& tool_id);

    std::vector<CatalogEntry> entries() const;

    /**
     * @brief Function-calling definitions for every available tool
     * @return Array of {name, description, parameters, server_id, tool_name}
     */
    json definitions() const;

    /**
     * @brief Call a tool by its prefixed id
     *
     * Unknown ids, disconnected servers and RPC failures all come back as
     * success=false with the error text.
     */
    CatalogCallResult call(const std::string& tool_id, const json& arguments = json::object());

private:
    ServerManager& manager_;
};

/**
 * @brief Render a call result as text for the model
 */
std::string format_call_result(const CatalogCallResult& result);

} // namespace mcp_host
