#include "HostConfig.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace mcp_host {

namespace {

template <typename T>
T field(const json& entry, const char* key, const std::string& server, T fallback) {
    if (!entry.contains(key) || entry[key].is_null()) {
        return fallback;
    }
    try {
        return entry[key].get<T>();
    } catch (const json::exception& e) {
        throw ConfigError("Invalid field '" + std::string(key) + "' for server '" + server + "': " + e.what());
    }
}

std::map<std::string, bool> flag_map(const json& root, const char* key, const std::string& source) {
    if (!root.contains(key)) {
        return {};
    }
    try {
        return root[key].get<std::map<std::string, bool>>();
    } catch (const json::exception& e) {
        throw ConfigError("Invalid '" + std::string(key) + "' in " + source + ": " + e.what());
    }
}

} // namespace

std::optional<ServerConfig> parse_server_entry(const std::string& name, const json& entry,
                                               const std::string& source) {
    if (!entry.is_object()) {
        throw ConfigError("Server entry '" + name + "' must be an object");
    }

    std::string type = field<std::string>(entry, "type", name, "");
    std::string command = field<std::string>(entry, "command", name, "");
    std::string url = field<std::string>(entry, "url", name, "");

    bool is_stdio = type == "stdio" || type == "local" || (type.empty() && !command.empty());
    bool is_http = type == "http" || type == "sse" || (type.empty() && !url.empty());

    ServerConfig config;
    config.id = name;
    config.name = name;
    config.source = source;
    config.enabled = field<bool>(entry, "enabled", name, true);
    config.allowed_tools = field<std::vector<std::string>>(entry, "tools", name, {});

    if (is_stdio && !command.empty()) {
        config.transport = TransportKind::Stdio;
        config.command = command;
        config.args = field<std::vector<std::string>>(entry, "args", name, {});
        config.env = field<std::map<std::string, std::string>>(entry, "env", name, {});
        config.cwd = field<std::string>(entry, "cwd", name, "");
        config.use_shell = field<bool>(entry, "shell", name, false);
        return config;
    }
    if (is_http && !url.empty()) {
        config.transport = TransportKind::Http;
        config.url = url;
        return config;
    }

    spdlog::warn("Skipping server '{}' from {}: no command or url", name, source);
    return std::nullopt;
}

HostConfig HostConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    HostConfig config = parse(buffer.str(), path.string());
    spdlog::info("Loaded {} server(s) from {}", config.servers.size(), path.string());
    return config;
}

HostConfig HostConfig::parse(const std::string& text, const std::string& source) {
    json root;
    try {
        root = json::parse(text, nullptr, true, /*ignore_comments=*/true);
    } catch (const json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + source + ": " + e.what());
    }

    if (!root.is_object()) {
        throw ConfigError("Config root must be an object: " + source);
    }

    HostConfig config;

    const char* servers_key = root.contains("mcpServers") ? "mcpServers" : "servers";
    if (root.contains(servers_key)) {
        const auto& servers = root[servers_key];
        if (!servers.is_object()) {
            throw ConfigError(std::string("'") + servers_key + "' must be an object in " + source);
        }
        for (const auto& [name, entry] : servers.items()) {
            if (auto server = parse_server_entry(name, entry, source)) {
                config.servers.push_back(std::move(*server));
            }
        }
    }

    config.auto_start = flag_map(root, "autoStart", source);
    config.enabled = flag_map(root, "enabled", source);
    for (auto& server : config.servers) {
        auto it = config.enabled.find(server.id);
        if (it != config.enabled.end()) {
            server.enabled = it->second;
        }
    }

    if (root.contains("requestTimeoutMs")) {
        const auto& timeout = root["requestTimeoutMs"];
        if (!timeout.is_number_integer() || timeout.get<int64_t>() <= 0) {
            throw ConfigError("'requestTimeoutMs' must be a positive integer in " + source);
        }
        config.request_timeout = std::chrono::milliseconds(timeout.get<int64_t>());
    }

    config.document = std::move(root);
    return config;
}

json HostConfig::to_json() const {
    json root = document.is_object() ? document : json::object();

    const char* servers_key = root.contains("mcpServers") || !root.contains("servers") ? "mcpServers" : "servers";
    json& servers_json = root[servers_key];
    if (!servers_json.is_object()) {
        servers_json = json::object();
    }

    // Servers added in code have no entry in the document yet
    for (const auto& server : servers) {
        if (servers_json.contains(server.id)) {
            continue;
        }
        json entry;
        if (server.transport == TransportKind::Http) {
            entry["type"] = "http";
            entry["url"] = server.url;
        } else {
            entry["type"] = "stdio";
            entry["command"] = server.command;
            entry["args"] = server.args;
            if (!server.env.empty()) {
                entry["env"] = server.env;
            }
            if (!server.cwd.empty()) {
                entry["cwd"] = server.cwd;
            }
            if (server.use_shell) {
                entry["shell"] = true;
            }
        }
        if (!server.allowed_tools.empty()) {
            entry["tools"] = server.allowed_tools;
        }
        if (!server.enabled) {
            entry["enabled"] = false;
        }
        servers_json[server.id] = entry;
    }

    root["autoStart"] = auto_start;
    if (!enabled.empty()) {
        root["enabled"] = enabled;
    }
    if (request_timeout) {
        root["requestTimeoutMs"] = request_timeout->count();
    }
    return root;
}

void HostConfig::save(const std::filesystem::path& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    file << to_json().dump(2) << "\n";
    if (!file) {
        throw ConfigError("Failed to write config file: " + path.string());
    }
    spdlog::info("Saved config to {}", path.string());
}

bool HostConfig::is_auto_start(const std::string& id) const {
    auto it = auto_start.find(id);
    return it != auto_start.end() && it->second;
}

bool HostConfig::is_enabled(const std::string& id) const {
    const auto* server = find(id);
    return server != nullptr && server->enabled;
}

void HostConfig::set_enabled(const std::string& id, bool value) {
    auto it = std::find_if(servers.begin(), servers.end(),
                           [&id](const ServerConfig& server) { return server.id == id; });
    if (it == servers.end()) {
        throw ConfigError("Server not found in config: " + id);
    }
    it->enabled = value;
    enabled[id] = value;
}

const ServerConfig* HostConfig::find(const std::string& id) const {
    for (const auto& server : servers) {
        if (server.id == id) {
            return &server;
        }
    }
    return nullptr;
}

} // namespace mcp_host
