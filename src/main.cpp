#include "core/Errors.hpp"
#include "core/HostConfig.hpp"
#include "mcp/ServerManager.hpp"
#include "tools/ToolCatalog.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <iostream>
#include <memory>

namespace {

constexpr int kToolFailed = 2;

bool configure_logging(const std::string& log_level) {
    // stdout carries command output; logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("mcp-host"));

    if (log_level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (log_level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (log_level == "critical") {
        spdlog::set_level(spdlog::level::critical);
    } else {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return false;
    }
    return true;
}

mcp_host::ClientOptions client_options(const mcp_host::HostConfig& config) {
    mcp_host::ClientOptions options;
    if (config.request_timeout) {
        options.request_timeout = *config.request_timeout;
    }
    return options;
}

void register_servers(mcp_host::ServerManager& manager, const mcp_host::HostConfig& config) {
    for (const auto& server : config.servers) {
        manager.add_server(server, config.is_auto_start(server.id));
    }
}

int run_tools(const mcp_host::HostConfig& config, const std::string& only_server) {
    mcp_host::ServerManager manager(client_options(config));
    register_servers(manager, config);

    for (const auto& server : config.servers) {
        if (!server.enabled || (!only_server.empty() && server.id != only_server)) {
            continue;
        }
        try {
            manager.start_server(server.id);
        } catch (const std::exception& e) {
            std::cerr << server.id << ": " << e.what() << std::endl;
        }
    }

    mcp_host::ToolCatalog catalog(manager);
    for (const auto& entry : catalog.entries()) {
        std::cout << entry.id << "  " << entry.description << std::endl;
    }
    manager.shutdown();
    return 0;
}

int run_call(const mcp_host::HostConfig& config, const std::string& server_id,
             const std::string& tool_name, const std::string& arguments_text) {
    mcp_host::json arguments;
    try {
        arguments = mcp_host::json::parse(arguments_text);
    } catch (const mcp_host::json::parse_error& e) {
        std::cerr << "Invalid --args JSON: " << e.what() << std::endl;
        return 1;
    }

    const auto* server = config.find(server_id);
    if (!server) {
        throw mcp_host::ConfigError("Server not found in config: " + server_id);
    }

    mcp_host::ServerManager manager(client_options(config));
    register_servers(manager, config);
    manager.start_server(server_id);

    mcp_host::ToolCatalog catalog(manager);
    auto result = catalog.call(mcp_host::ToolCatalog::make_tool_id(server->name, tool_name), arguments);
    std::cout << mcp_host::format_call_result(result) << std::endl;
    manager.shutdown();

    bool is_error = result.success && result.data.is_object() &&
                    result.data.contains("isError") && result.data["isError"].is_boolean() &&
                    result.data["isError"].get<bool>();
    return (!result.success || is_error) ? kToolFailed : 0;
}

int run_status(const mcp_host::HostConfig& config) {
    mcp_host::ServerManager manager(client_options(config));
    register_servers(manager, config);
    manager.start_auto_servers();

    for (const auto& status : manager.statuses()) {
        std::cout << status.server_name << "  " << mcp_host::status_label(status.status);
        if (status.error) {
            std::cout << "  " << *status.error;
        }
        std::cout << "  " << status.tools.size() << " tools" << std::endl;
    }
    manager.shutdown();
    return 0;
}

int run_autostart(const std::string& config_path, const std::string& server_id, const std::string& value) {
    auto config = mcp_host::HostConfig::load(config_path);
    if (!config.find(server_id)) {
        throw mcp_host::ConfigError("Server not found in config: " + server_id);
    }
    config.auto_start[server_id] = value == "on";
    config.save(config_path);
    std::cout << server_id << " auto-start " << value << std::endl;
    return 0;
}

int run_enable(const std::string& config_path, const std::string& server_id, const std::string& value) {
    auto config = mcp_host::HostConfig::load(config_path);
    config.set_enabled(server_id, value == "on");
    config.save(config_path);
    std::cout << server_id << (value == "on" ? " enabled" : " disabled") << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"MCP Host - run and query MCP servers over stdio"};
    app.require_subcommand(0, 1);

    std::string log_level = "warn";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("warn");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    std::string config_path;
    std::string server_id;
    std::string tool_name;
    std::string arguments_text = "{}";
    std::string toggle;

    auto* tools_cmd = app.add_subcommand("tools", "List tools of the configured servers");
    tools_cmd->add_option("-c,--config", config_path, "Config file")->required()->check(CLI::ExistingFile);
    tools_cmd->add_option("-s,--server", server_id, "Only start this server");

    auto* call_cmd = app.add_subcommand("call", "Call a tool on one server");
    call_cmd->add_option("-c,--config", config_path, "Config file")->required()->check(CLI::ExistingFile);
    call_cmd->add_option("server", server_id, "Server id")->required();
    call_cmd->add_option("tool", tool_name, "Tool name")->required();
    call_cmd->add_option("-a,--args", arguments_text, "Tool arguments as JSON");

    auto* status_cmd = app.add_subcommand("status", "Start auto-start servers and report their state");
    status_cmd->add_option("-c,--config", config_path, "Config file")->required()->check(CLI::ExistingFile);

    auto* autostart_cmd = app.add_subcommand("autostart", "Set the auto-start flag of a server");
    autostart_cmd->add_option("-c,--config", config_path, "Config file")->required()->check(CLI::ExistingFile);
    autostart_cmd->add_option("server", server_id, "Server id")->required();
    autostart_cmd->add_option("value", toggle, "on or off")->required()->check(CLI::IsMember({"on", "off"}));

    auto* enable_cmd = app.add_subcommand("enable", "Enable or disable a server");
    enable_cmd->add_option("-c,--config", config_path, "Config file")->required()->check(CLI::ExistingFile);
    enable_cmd->add_option("server", server_id, "Server id")->required();
    enable_cmd->add_option("value", toggle, "on or off")->required()->check(CLI::IsMember({"on", "off"}));

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "mcp-host version 1.0.0" << std::endl;
        return 0;
    }

    if (!configure_logging(log_level)) {
        return 1;
    }

    try {
        if (*autostart_cmd) {
            return run_autostart(config_path, server_id, toggle);
        }
        if (*enable_cmd) {
            return run_enable(config_path, server_id, toggle);
        }

        if (!*tools_cmd && !*call_cmd && !*status_cmd) {
            std::cout << app.help() << std::endl;
            return 0;
        }

        auto config = mcp_host::HostConfig::load(config_path);
        spdlog::info("Log level: {}", log_level);

        if (*tools_cmd) {
            return run_tools(config, server_id);
        }
        if (*call_cmd) {
            return run_call(config, server_id, tool_name, arguments_text);
        }
        return run_status(config);

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
