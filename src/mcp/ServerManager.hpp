#pragma once

#include "MCPClient.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcp_host {

/**
 * @brief A tool together with the server that exposes it
 */
struct AttributedTool {
    std::string server_id;
    std::string server_name;
    ToolDescriptor tool;
};

/**
 * @brief Snapshot of one managed server, for settings/status surfaces
 */
struct ServerStatus {
    std::string server_id;
    std::string server_name;
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::optional<std::string> error;
    std::vector<ToolDescriptor> tools;
    std::optional<int> pid;
    std::optional<std::chrono::system_clock::time_point> connected_at;
    bool auto_start = false;
    bool enabled = true;
};

/**
 * @brief Event published by the manager
 */
struct ManagerEvent {
    enum class Type {
        ServerStatusChanged,
        ServerToolsUpdated
    };

    Type type = Type::ServerStatusChanged;
    std::string server_id;
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::optional<std::string> error;
    std::vector<ToolDescriptor> tools;
};

using ManagerListener = std::function<void(const ManagerEvent&)>;

/**
 * @brief Creates the client for a configured server
 */
using ClientFactory = std::function<std::shared_ptr<MCPClient>(const ServerConfig&, const ClientOptions&)>;

/**
 * @brief Owns one MCPClient per configured server
 *
 * Aggregates tool catalogs with server attribution, applies the per-server
 * auto-start flag and exposes start/stop per server. Built once by the
 * host and passed by reference to every consumer.
 *
 * Thread-safe. Adding and removing servers are atomic with respect to each
 * other; clients are started and stopped outside the manager lock so
 * servers never block each other.
 */
class ServerManager {
public:
    /**
     * @param options Options handed to every client
     * @param factory Client factory; defaults to MCPClient over ProcessTransport
     */
    explicit ServerManager(ClientOptions options = {}, ClientFactory factory = nullptr);
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /**
     * @brief Register a server
     * @throws std::invalid_argument on empty or duplicate id
     */
    void add_server(ServerConfig config, bool auto_start = false);

    /**
     * @brief Stop (if running) and forget a server
     * @return false if the id was unknown
     */
    bool remove_server(const std::string& id);

    /**
     * @brief Start one server and wait for its handshake
     * @throws std::invalid_argument for unknown or disabled servers
     * @throws McpError subclasses when the connection fails
     */
    void start_server(const std::string& id);

    /**
     * @brief Stop one server
     * @throws std::invalid_argument for unknown servers
     */
    void stop_server(const std::string& id);

    /**
     * @brief Start every enabled server flagged for auto-start, concurrently
     *
     * Failures are logged, not thrown.
     *
     * @return Number of servers that connected
     */
    size_t start_auto_servers();

    /**
     * @brief Stop every server
     */
    void shutdown();

    /**
     * @brief Call a tool on a specific server
     * @throws NotConnectedError if the server is unknown or not connected
     */
    ToolCallResult call_tool(const std::string& server_id, const std::string& tool_name,
                             const json& arguments = json::object());

    /**
     * @brief Tools of every connected server, filtered by allowlists
     */
    std::vector<AttributedTool> all_tools() const;

    std::vector<ServerStatus> statuses() const;
    std::optional<ServerStatus> status(const std::string& id) const;
    std::vector<std::string> server_ids() const;
    bool has_server(const std::string& id) const;
    bool has_connected_servers() const;

    bool is_auto_start(const std::string& id) const;

    /**
     * @brief Change the auto-start flag of a server
     * @throws std::invalid_argument for unknown servers
     */
    void set_auto_start(const std::string& id, bool auto_start);

    /**
     * @brief Current auto-start flags keyed by server id, for persistence
     */
    std::map<std::string, bool> auto_start_flags() const;

    bool is_enabled(const std::string& id) const;

    /**
     * @brief Enable or disable a server
     *
     * Enabling starts the server and waits for its handshake; disabling
     * stops it. The flag is kept even when the start fails.
     *
     * @throws std::invalid_argument for unknown servers
     * @throws McpError subclasses when the enabled server fails to connect
     */
    void set_enabled(const std::string& id, bool enabled);

    /**
     * @brief Current enabled flags keyed by server id, for persistence
     */
    std::map<std::string, bool> enabled_flags() const;

    ListenerId add_listener(ManagerListener listener);
    void remove_listener(ListenerId id);

    /**
     * @brief Apply an allowlist to a tool list
     *
     * Empty allowlist or one containing "*" keeps every tool.
     */
    static std::vector<ToolDescriptor> filter_allowed(const std::vector<ToolDescriptor>& tools,
                                                      const std::vector<std::string>& allowed);

private:
    struct Entry {
        ServerConfig config;
        bool auto_start = false;
        std::shared_ptr<MCPClient> client;
        ListenerId listener_id = 0;
        std::optional<std::chrono::system_clock::time_point> connected_at;
    };

    // Copy of the collection so clients are queried outside the manager lock
    std::vector<std::pair<std::string, Entry>> entries() const;
    std::shared_ptr<MCPClient> client_for(const std::string& id) const;
    void on_client_event(const std::string& id, const ClientEvent& event);
    ServerStatus snapshot(const std::string& id, const Entry& entry) const;
    void emit(const ManagerEvent& event);

    ClientOptions options_;
    ClientFactory factory_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> servers_;

    std::mutex listeners_mutex_;
    std::map<ListenerId, ManagerListener> listeners_;
    ListenerId next_listener_id_ = 1;
};

} // namespace mcp_host
