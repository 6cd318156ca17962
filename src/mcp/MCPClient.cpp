#include "MCPClient.hpp"
#include "JsonRpc.hpp"
#include "ProcessTransport.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace mcp_host {

namespace {

std::future<json> failed_future(std::exception_ptr error) {
    std::promise<json> promise;
    promise.set_exception(error);
    return promise.get_future();
}

} // namespace

MCPClient::MCPClient(ServerConfig config, ClientOptions options, TransportFactory factory)
    : config_(std::move(config)),
      options_(std::move(options)),
      factory_(std::move(factory)),
      framer_(config_.name) {
    if (config_.name.empty()) {
        throw std::invalid_argument("Server name cannot be empty");
    }
    if (config_.id.empty()) {
        config_.id = config_.name;
    }
    if (!factory_) {
        factory_ = [] { return std::make_unique<ProcessTransport>(); };
    }
}

MCPClient::~MCPClient() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    try {
        teardown("Client destroyed");
    } catch (const std::exception& e) {
        spdlog::error("[{}] Error during client teardown: {}", config_.name, e.what());
    }
}

void MCPClient::start() {
    ensure_not_reader_thread("start");
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ == ConnectionStatus::Connected || status_ == ConnectionStatus::Connecting) {
            return;
        }
        status_ = ConnectionStatus::Connecting;
        error_.reset();
    }

    // A previous connection may have ended on its own; release what is left of it
    teardown("Connection closed");

    try {
        if (config_.transport != TransportKind::Stdio) {
            throw McpError(std::string("Unsupported transport '") + to_string(config_.transport)
                + "' for server '" + config_.name + "'");
        }

        auto transport = factory_();
        if (!transport) {
            throw SpawnError("No transport available for server '" + config_.name + "'");
        }
        transport->open(config_);

        ITransport* raw = transport.get();
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            transport_ = std::move(transport);
            connection_open_ = true;
            stopping_ = false;
        }
        reader_ = std::thread([this, raw] { reader_loop(raw); });

        json init_result = send_request("initialize", {
            {"protocolVersion", options_.protocol_version},
            {"capabilities", {
                {"tools", json::object()}
            }},
            {"clientInfo", {
                {"name", options_.client_name},
                {"version", options_.client_version}
            }}
        }).get();

        json server_info = init_result.is_object() ? init_result.value("serverInfo", json()) : json();
        spdlog::info("[{}] Initialized: {}", config_.name, server_info.is_null() ? "no serverInfo" : server_info.dump());
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            server_info_ = server_info;
        }

        send_notification("notifications/initialized");

        std::vector<ToolDescriptor> tools = parse_tools_list(send_request("tools/list", json::object()).get());
        spdlog::info("[{}] Found {} tools", config_.name, tools.size());

        {
            // Same locks as handle_closed(), so a close can't slip between check and transition
            std::lock_guard<std::mutex> write_lock(write_mutex_);
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!connection_open_) {
                throw ConnectionClosedError("Server exited during initialization");
            }
            status_ = ConnectionStatus::Connected;
            tools_ = tools;
        }

        ClientEvent tools_event;
        tools_event.type = ClientEvent::Type::Tools;
        tools_event.tools = std::move(tools);
        emit(tools_event);

        ClientEvent connected;
        connected.type = ClientEvent::Type::Connected;
        emit(connected);
    } catch (const std::exception& e) {
        std::string message = e.what();
        spdlog::error("[{}] Failed to start: {}", config_.name, message);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            status_ = ConnectionStatus::Error;
            error_ = message;
        }

        ClientEvent error;
        error.type = ClientEvent::Type::Error;
        error.message = message;
        emit(error);

        teardown("Connection closed");
        throw;
    }
}

void MCPClient::stop() {
    ensure_not_reader_thread("stop");
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    ConnectionStatus current;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        current = status_;
    }

    if (current == ConnectionStatus::Disconnected) {
        // Reap a process that already exited on its own; nothing to report
        teardown("Connection closed");
        return;
    }

    if (current == ConnectionStatus::Connected) {
        try {
            auto shutdown = send_request("shutdown", json::object(), options_.shutdown_timeout);
            if (shutdown.wait_for(options_.shutdown_timeout) == std::future_status::ready) {
                shutdown.get();
            } else {
                spdlog::debug("[{}] No reply to shutdown", config_.name);
            }
        } catch (const std::exception& e) {
            spdlog::debug("[{}] Ignoring shutdown error: {}", config_.name, e.what());
        }
    }

    teardown("Connection closed");

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        changed = status_ != ConnectionStatus::Disconnected;
        status_ = ConnectionStatus::Disconnected;
        error_.reset();
    }

    spdlog::info("[{}] Stopped", config_.name);
    if (changed) {
        ClientEvent disconnected;
        disconnected.type = ClientEvent::Type::Disconnected;
        emit(disconnected);
    }
}

ToolCallResult MCPClient::call_tool(const std::string& name, const json& arguments) {
    ensure_not_reader_thread("call_tool");
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ != ConnectionStatus::Connected) {
            throw NotConnectedError("MCP server not connected");
        }
    }

    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("[{}] Calling tool: {} with args: {}", config_.name, name,
                      arguments.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    json result = send_request("tools/call", {
        {"name", name},
        {"arguments", arguments.is_null() ? json::object() : arguments}
    }).get();

    return parse_tool_call_result(result);
}

std::future<json> MCPClient::send_request(const std::string& method, const json& params,
                                          std::optional<std::chrono::milliseconds> timeout) {
    // Only the read loop settles requests; waiting on it from there never returns
    ensure_not_reader_thread("send_request");
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (!transport_ || !connection_open_) {
        return failed_future(std::make_exception_ptr(ConnectionClosedError("Process not running")));
    }

    RequestId id = ++next_id_;
    std::string line;
    try {
        line = jsonrpc::encode(jsonrpc::make_request(id, method, params));
    } catch (const RpcError&) {
        return failed_future(std::current_exception());
    }
    auto future = pending_.add(id, method, timeout.value_or(options_.request_timeout));

    spdlog::debug("[{}] -> {}", config_.name, line.substr(0, line.size() - 1));

    try {
        transport_->write(line);
    } catch (const TransportError&) {
        pending_.reject(id, std::current_exception());
    }
    return future;
}

void MCPClient::send_notification(const std::string& method, const json& params) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (!transport_ || !connection_open_) {
        throw ConnectionClosedError("Process not running");
    }

    std::string line = jsonrpc::encode(jsonrpc::make_notification(method, params));
    spdlog::debug("[{}] -> {}", config_.name, line.substr(0, line.size() - 1));
    transport_->write(line);
}

ConnectionStatus MCPClient::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

std::optional<std::string> MCPClient::last_error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return error_;
}

std::vector<ToolDescriptor> MCPClient::tools() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return tools_;
}

json MCPClient::server_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

std::optional<int> MCPClient::pid() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!transport_) {
        return std::nullopt;
    }
    return transport_->pid();
}

size_t MCPClient::pending_requests() const {
    return pending_.size();
}

ListenerId MCPClient::add_listener(ClientListener listener) {
    if (!listener) {
        throw std::invalid_argument("Listener cannot be null");
    }
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ListenerId id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void MCPClient::remove_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

void MCPClient::reader_loop(ITransport* transport) {
    reader_id_ = std::this_thread::get_id();
    spdlog::debug("[{}] Read loop started", config_.name);

    try {
        while (true) {
            ReadEvent event = transport->read(next_read_timeout());

            switch (event.kind) {
                case ReadEvent::Kind::Stdout:
                    // Lines of one chunk are dispatched strictly in arrival order
                    for (const auto& message : framer_.feed(event.data)) {
                        dispatch(message);
                    }
                    break;
                case ReadEvent::Kind::Stderr:
                    for (const auto& line : stderr_lines_.feed(event.data)) {
                        spdlog::warn("[{}] stderr: {}", config_.name, line);
                    }
                    break;
                case ReadEvent::Kind::Timeout:
                    break;
                case ReadEvent::Kind::Closed:
                    handle_closed(transport);
                    reader_id_ = std::thread::id();
                    return;
            }

            pending_.expire();
        }
    } catch (const std::exception& e) {
        handle_fault(transport, e.what());
    }

    reader_id_ = std::thread::id();
}

void MCPClient::dispatch(const json& message) {
    auto kind = jsonrpc::classify(message);
    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("[{}] <- {} {}", config_.name, jsonrpc::to_string(kind),
                      message.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    switch (kind) {
        case jsonrpc::MessageKind::Response:
            pending_.settle(message);
            break;
        case jsonrpc::MessageKind::Notification: {
            ClientEvent notification;
            notification.type = ClientEvent::Type::Notification;
            notification.method = message["method"].get<std::string>();
            notification.params = message.value("params", json());
            emit(notification);
            break;
        }
        case jsonrpc::MessageKind::Request:
            spdlog::debug("[{}] Ignoring server request: {}", config_.name, message["method"].dump());
            break;
        case jsonrpc::MessageKind::Invalid:
            spdlog::debug("[{}] Ignoring invalid message", config_.name);
            break;
    }
}

void MCPClient::handle_closed(ITransport* transport) {
    bool was_connected = false;
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        connection_open_ = false;
        if (stopping_) {
            // Requested teardown: stop()/start() finish the cleanup
            return;
        }
        // Flipped before pending requests are rejected, so a retry sees NotConnectedError
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ == ConnectionStatus::Connected) {
            status_ = ConnectionStatus::Disconnected;
            was_connected = true;
        }
    }

    auto exit = transport->exit_status();
    std::string reason = exit ? exit->describe() : "Server closed its output";
    spdlog::info("[{}] Server connection closed{}", config_.name, reason.empty() ? "" : ": " + reason);

    // A server that closed stdout may still be running
    transport->terminate();

    size_t rejected = pending_.reject_all(reason.empty() ? "Connection closed" : "Connection closed: " + reason);
    if (rejected > 0) {
        spdlog::warn("[{}] Rejected {} pending requests", config_.name, rejected);
    }
    framer_.clear();
    stderr_lines_.clear();

    if (was_connected) {
        ClientEvent disconnected;
        disconnected.type = ClientEvent::Type::Disconnected;
        disconnected.message = reason;
        emit(disconnected);
    }
}

void MCPClient::handle_fault(ITransport* transport, const std::string& message) {
    bool was_connected = false;
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        connection_open_ = false;
        if (stopping_) {
            return;
        }
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ == ConnectionStatus::Connected) {
            status_ = ConnectionStatus::Error;
            error_ = message;
            was_connected = true;
        }
    }

    spdlog::error("[{}] Process error: {}", config_.name, message);
    transport->terminate();
    pending_.reject_all("Connection closed: " + message);

    if (was_connected) {
        ClientEvent error;
        error.type = ClientEvent::Type::Error;
        error.message = message;
        emit(error);
    }
}

void MCPClient::teardown(const std::string& reason) {
    ITransport* transport = nullptr;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        stopping_ = true;
        connection_open_ = false;
        transport = transport_.get();
    }

    // Rejected before the join: a listener on the read loop may be waiting on one of them
    size_t rejected = pending_.reject_all(reason);
    if (rejected > 0) {
        spdlog::debug("[{}] Rejected {} pending requests: {}", config_.name, rejected, reason);
    }

    if (transport) {
        transport->terminate();
    }
    if (reader_.joinable()) {
        reader_.join();
    }

    framer_.clear();
    stderr_lines_.clear();

    std::unique_ptr<ITransport> released;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        released = std::move(transport_);
    }
    // Destroying the transport reaps the process
    released.reset();
}

void MCPClient::emit(const ClientEvent& event) {
    std::vector<ClientListener> listeners;
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
            spdlog::error("[{}] Listener error: {}", config_.name, e.what());
        }
    }
}

void MCPClient::ensure_not_reader_thread(const char* operation) const {
    if (reader_id_.load() == std::this_thread::get_id()) {
        throw std::logic_error(std::string("MCPClient::") + operation
            + " cannot be called from a client event listener");
    }
}

std::chrono::milliseconds MCPClient::next_read_timeout() const {
    auto deadline = pending_.next_deadline();
    if (!deadline) {
        return options_.poll_interval;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline - RequestCorrelator::Clock::now());
    // Round up so a wake-up never lands just before the deadline
    remaining += std::chrono::milliseconds(1);
    return std::clamp(remaining, std::chrono::milliseconds(0), options_.poll_interval);
}

} // namespace mcp_host
