#include "ServerManager.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>
#include <set>
#include <stdexcept>

namespace mcp_host {

ServerManager::ServerManager(ClientOptions options, ClientFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [](const ServerConfig& config, const ClientOptions& options) {
            return std::make_shared<MCPClient>(config, options);
        };
    }
}

ServerManager::~ServerManager() {
    shutdown();
}

void ServerManager::add_server(ServerConfig config, bool auto_start) {
    if (config.id.empty()) {
        config.id = config.name;
    }
    if (config.id.empty()) {
        throw std::invalid_argument("Server id cannot be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (servers_.count(config.id) != 0) {
        throw std::invalid_argument("Duplicate server id: " + config.id);
    }

    Entry entry;
    entry.config = config;
    entry.auto_start = auto_start;
    entry.client = factory_(config, options_);
    if (!entry.client) {
        throw std::invalid_argument("Client factory returned no client for: " + config.id);
    }

    std::string id = config.id;
    entry.listener_id = entry.client->add_listener([this, id](const ClientEvent& event) {
        on_client_event(id, event);
    });

    servers_.emplace(id, std::move(entry));
    spdlog::info("Added MCP server: {} ({})", config.name, id);
}

bool ServerManager::remove_server(const std::string& id) {
    std::shared_ptr<MCPClient> client;
    ListenerId listener_id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(id);
        if (it == servers_.end()) {
            return false;
        }
        client = it->second.client;
        listener_id = it->second.listener_id;
        servers_.erase(it);
    }

    client->remove_listener(listener_id);
    try {
        client->stop();
    } catch (const std::exception& e) {
        spdlog::warn("Error stopping removed server {}: {}", id, e.what());
    }

    spdlog::info("Removed MCP server: {}", id);
    return true;
}

void ServerManager::start_server(const std::string& id) {
    std::shared_ptr<MCPClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(id);
        if (it == servers_.end()) {
            throw std::invalid_argument("Server not found: " + id);
        }
        if (!it->second.config.enabled) {
            throw std::invalid_argument("Server is disabled: " + id);
        }
        client = it->second.client;
    }

    try {
        client->start();
    } catch (const std::exception& e) {
        spdlog::error("Failed to start server {}: {}", id, e.what());
        throw;
    }
}

void ServerManager::stop_server(const std::string& id) {
    std::shared_ptr<MCPClient> client = client_for(id);
    if (!client) {
        throw std::invalid_argument("Server not found: " + id);
    }
    client->stop();
}

size_t ServerManager::start_auto_servers() {
    std::vector<std::pair<std::string, std::shared_ptr<MCPClient>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : servers_) {
            if (entry.auto_start && entry.config.enabled) {
                targets.emplace_back(id, entry.client);
            }
        }
    }

    if (targets.empty()) {
        return 0;
    }

    spdlog::info("Auto-starting {} server(s)...", targets.size());

    std::vector<std::future<void>> starts;
    for (auto& [id, client] : targets) {
        starts.push_back(std::async(std::launch::async, [client] { client->start(); }));
    }

    size_t connected = 0;
    for (size_t i = 0; i < starts.size(); ++i) {
        const auto& id = targets[i].first;
        try {
            starts[i].get();
            ++connected;
            spdlog::info("Auto-started: {}", id);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to auto-start {}: {}", id, e.what());
        }
    }
    return connected;
}

void ServerManager::shutdown() {
    std::vector<std::pair<std::string, std::shared_ptr<MCPClient>>> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : servers_) {
            clients.emplace_back(id, entry.client);
        }
    }

    if (clients.empty()) {
        return;
    }

    spdlog::info("Shutting down all MCP clients...");
    std::vector<std::future<void>> stops;
    for (auto& [id, client] : clients) {
        stops.push_back(std::async(std::launch::async, [client] { client->stop(); }));
    }
    for (size_t i = 0; i < stops.size(); ++i) {
        try {
            stops[i].get();
        } catch (const std::exception& e) {
            spdlog::warn("Stop error for {}: {}", clients[i].first, e.what());
        }
    }
}

ToolCallResult ServerManager::call_tool(const std::string& server_id, const std::string& tool_name,
                                        const json& arguments) {
    std::shared_ptr<MCPClient> client = client_for(server_id);
    if (!client) {
        throw NotConnectedError("Server not connected: " + server_id);
    }
    return client->call_tool(tool_name, arguments);
}

std::vector<AttributedTool> ServerManager::all_tools() const {
    std::vector<AttributedTool> tools;

    for (const auto& [id, entry] : entries()) {
        if (entry.client->status() != ConnectionStatus::Connected) {
            continue;
        }
        for (auto& tool : filter_allowed(entry.client->tools(), entry.config.allowed_tools)) {
            tools.push_back({id, entry.config.name, std::move(tool)});
        }
    }
    return tools;
}

std::vector<ServerStatus> ServerManager::statuses() const {
    std::vector<ServerStatus> result;
    for (const auto& [id, entry] : entries()) {
        result.push_back(snapshot(id, entry));
    }
    return result;
}

std::optional<ServerStatus> ServerManager::status(const std::string& id) const {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(id);
        if (it == servers_.end()) {
            return std::nullopt;
        }
        entry = it->second;
    }
    return snapshot(id, entry);
}

std::vector<std::string> ServerManager::server_ids() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : servers_) {
        ids.push_back(id);
    }
    return ids;
}

bool ServerManager::has_server(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.count(id) != 0;
}

bool ServerManager::has_connected_servers() const {
    auto current = entries();
    return std::any_of(current.begin(), current.end(), [](const auto& item) {
        return item.second.client->status() == ConnectionStatus::Connected;
    });
}

bool ServerManager::is_auto_start(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    return it != servers_.end() && it->second.auto_start;
}

void ServerManager::set_auto_start(const std::string& id, bool auto_start) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        throw std::invalid_argument("Server not found: " + id);
    }
    it->second.auto_start = auto_start;
    spdlog::debug("Auto-start for {} set to {}", id, auto_start);
}

std::map<std::string, bool> ServerManager::auto_start_flags() const {
    std::map<std::string, bool> flags;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : servers_) {
        flags[id] = entry.auto_start;
    }
    return flags;
}

bool ServerManager::is_enabled(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    return it != servers_.end() && it->second.config.enabled;
}

void ServerManager::set_enabled(const std::string& id, bool enabled) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(id);
        if (it == servers_.end()) {
            throw std::invalid_argument("Server not found: " + id);
        }
        it->second.config.enabled = enabled;
    }
    spdlog::info("Server {} {}", id, enabled ? "enabled" : "disabled");

    if (enabled) {
        start_server(id);
    } else {
        stop_server(id);
    }
}

std::map<std::string, bool> ServerManager::enabled_flags() const {
    std::map<std::string, bool> flags;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : servers_) {
        flags[id] = entry.config.enabled;
    }
    return flags;
}

ListenerId ServerManager::add_listener(ManagerListener listener) {
    if (!listener) {
        throw std::invalid_argument("Listener cannot be null");
    }
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ListenerId id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void ServerManager::remove_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

std::vector<ToolDescriptor> ServerManager::filter_allowed(const std::vector<ToolDescriptor>& tools,
                                                          const std::vector<std::string>& allowed) {
    if (allowed.empty() || std::find(allowed.begin(), allowed.end(), "*") != allowed.end()) {
        return tools;
    }

    std::set<std::string> names(allowed.begin(), allowed.end());
    std::vector<ToolDescriptor> filtered;
    for (const auto& tool : tools) {
        if (names.count(tool.name) != 0) {
            filtered.push_back(tool);
        }
    }
    return filtered;
}

std::vector<std::pair<std::string, ServerManager::Entry>> ServerManager::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {servers_.begin(), servers_.end()};
}

std::shared_ptr<MCPClient> ServerManager::client_for(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        return nullptr;
    }
    return it->second.client;
}

void ServerManager::on_client_event(const std::string& id, const ClientEvent& event) {
    ManagerEvent forwarded;
    forwarded.server_id = id;

    switch (event.type) {
        case ClientEvent::Type::Connected:
            forwarded.type = ManagerEvent::Type::ServerStatusChanged;
            forwarded.status = ConnectionStatus::Connected;
            break;
        case ClientEvent::Type::Disconnected:
            forwarded.type = ManagerEvent::Type::ServerStatusChanged;
            forwarded.status = ConnectionStatus::Disconnected;
            if (!event.message.empty()) {
                forwarded.error = event.message;
            }
            break;
        case ClientEvent::Type::Error:
            forwarded.type = ManagerEvent::Type::ServerStatusChanged;
            forwarded.status = ConnectionStatus::Error;
            forwarded.error = event.message;
            break;
        case ClientEvent::Type::Tools:
            forwarded.type = ManagerEvent::Type::ServerToolsUpdated;
            forwarded.tools = event.tools;
            break;
        case ClientEvent::Type::Notification:
            spdlog::debug("[{}] Notification: {}", id, event.method);
            return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(id);
        if (it == servers_.end()) {
            return;
        }
        if (event.type == ClientEvent::Type::Connected) {
            it->second.connected_at = std::chrono::system_clock::now();
        } else if (event.type != ClientEvent::Type::Tools) {
            it->second.connected_at.reset();
        }
    }

    emit(forwarded);
}

ServerStatus ServerManager::snapshot(const std::string& id, const Entry& entry) const {
    ServerStatus status;
    status.server_id = id;
    status.server_name = entry.config.name;
    status.status = entry.client->status();
    status.error = entry.client->last_error();
    status.tools = entry.client->tools();
    status.pid = entry.client->pid();
    status.connected_at = entry.connected_at;
    status.auto_start = entry.auto_start;
    status.enabled = entry.config.enabled;
    return status;
}

void ServerManager::emit(const ManagerEvent& event) {
    std::vector<ManagerListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }

    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::error("Manager listener error: {}", e.what());
        }
    }
}

} // namespace mcp_host
