#pragma once

#include "mcp/Types.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_host {

/**
 * @brief Server list and per-server flags loaded from a host config file
 *
 * File format (comments allowed):
 * @code
 * {
 *   "mcpServers": {
 *     "notes": {"command": "notes-mcp", "args": [], "env": {}, "cwd": "",
 *               "type": "stdio", "tools": ["search_notes"], "enabled": true}
 *   },
 *   "autoStart": {"notes": true},
 *   "enabled": {"notes": true},
 *   "requestTimeoutMs": 30000
 * }
 * @endcode
 *
 * The top-level "enabled" map overrides the per-entry "enabled" field.
 */
struct HostConfig {
    std::vector<ServerConfig> servers;
    std::map<std::string, bool> auto_start;
    std::map<std::string, bool> enabled;  // overrides written by set_enabled()
    std::optional<std::chrono::milliseconds> request_timeout;

    // Document as read; save() rewrites only the keys this struct owns
    json document;

    /**
     * @brief Load a config file
     * @throws ConfigError if the file cannot be read or parsed
     */
    static HostConfig load(const std::filesystem::path& path);

    /**
     * @brief Parse config text
     * @param source Label used in error messages
     * @throws ConfigError on malformed content
     */
    static HostConfig parse(const std::string& text, const std::string& source = "<memory>");

    /**
     * @brief Write the config back, pretty-printed
     *
     * Entries and keys that were not parsed (skipped servers, unknown
     * fields) are written back unchanged. Comments are not preserved.
     *
     * @throws ConfigError if the file cannot be written
     */
    void save(const std::filesystem::path& path) const;

    json to_json() const;

    bool is_auto_start(const std::string& id) const;
    bool is_enabled(const std::string& id) const;

    /**
     * @brief Record an enabled override for a server
     * @throws ConfigError for unknown servers
     */
    void set_enabled(const std::string& id, bool value);

    /**
     * @brief Find a server by id
     */
    const ServerConfig* find(const std::string& id) const;
};

/**
 * @brief Convert one raw server entry into a ServerConfig
 *
 * The transport comes from "type" ("stdio"/"local", "http"/"sse"), or is
 * inferred from "command" vs "url" when absent.
 *
 * @return nullopt when the entry has neither a command nor a url
 * @throws ConfigError when a field has the wrong type
 */
std::optional<ServerConfig> parse_server_entry(const std::string& name, const json& entry,
                                               const std::string& source);

} // namespace mcp_host
