#pragma once

#include "ITransport.hpp"
#include "RequestCorrelator.hpp"
#include "Types.hpp"
#include "core/LineFramer.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcp_host {

/**
 * @brief Tuning knobs for a client connection
 */
struct ClientOptions {
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds shutdown_timeout{2000};
    std::chrono::milliseconds poll_interval{100};  // Upper bound on one read-loop wait
    std::string client_name = "mcp-host";
    std::string client_version = "1.0.0";
    std::string protocol_version = "2024-11-05";
};

/**
 * @brief Event published by a client to its listeners
 */
struct ClientEvent {
    enum class Type {
        Connected,
        Disconnected,  // message: exit reason, empty for a requested stop
        Error,         // message: error text
        Tools,         // tools: freshly listed tools
        Notification   // method/params: server notification
    };

    Type type = Type::Connected;
    std::string message;
    std::vector<ToolDescriptor> tools;
    std::string method;
    json params;
};

using ClientListener = std::function<void(const ClientEvent&)>;
using ListenerId = size_t;

/**
 * @brief Client for a single stdio MCP server
 *
 * Owns at most one server process at a time and drives the connection
 * state machine:
 *
 *   disconnected -> connecting -> connected -> disconnected
 *                        |                         ^
 *                        +--------> error ---------+ (start() retries)
 *
 * A dedicated read loop feeds server output through the ndjson framer and
 * settles pending requests; requests are written to stdin in send order.
 */
class MCPClient {
public:
    /**
     * @brief Construct client for one server
     * @param config Server launch configuration
     * @param options Timeouts and client identity
     * @param factory Creates the transport for each start(); defaults to ProcessTransport
     */
    explicit MCPClient(ServerConfig config, ClientOptions options = {}, TransportFactory factory = nullptr);
    ~MCPClient();

    MCPClient(const MCPClient&) = delete;
    MCPClient& operator=(const MCPClient&) = delete;

    /**
     * @brief Spawn the server, perform the handshake and list its tools
     *
     * No-op when already connecting or connected. On failure the client
     * ends in the error state with everything torn down, an Error event is
     * emitted and the exception is rethrown.
     */
    void start();

    /**
     * @brief Shut the server down and reject all pending requests
     *
     * No-op when already disconnected.
     */
    void stop();

    /**
     * @brief Invoke a tool on the connected server
     * @return The server's content/isError, uninterpreted
     * @throws NotConnectedError if the client is not connected
     * @throws RpcError, TimeoutError, ConnectionClosedError for transport-level failures
     * @throws std::logic_error when called from a listener on the read loop
     */
    ToolCallResult call_tool(const std::string& name, const json& arguments = json::object());

    /**
     * @brief Send a request and return a future for its result
     * @param timeout Overrides ClientOptions::request_timeout
     * @throws std::logic_error when called from a listener on the read loop
     */
    std::future<json> send_request(const std::string& method, const json& params,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Send a notification (no response expected)
     * @throws TransportError if the server cannot be written to
     */
    void send_notification(const std::string& method, const json& params = nullptr);

    ConnectionStatus status() const;
    std::optional<std::string> last_error() const;
    std::vector<ToolDescriptor> tools() const;
    json server_info() const;
    std::optional<int> pid() const;
    size_t pending_requests() const;
    const ServerConfig& config() const { return config_; }

    /**
     * @brief Register an event listener
     *
     * Listeners run on the thread that triggers the event. Notification and
     * unsolicited Disconnected events arrive on the read loop, where
     * start(), stop(), call_tool() and send_request() throw std::logic_error.
     */
    ListenerId add_listener(ClientListener listener);
    void remove_listener(ListenerId id);

private:
    void reader_loop(ITransport* transport);
    void dispatch(const json& message);
    void handle_closed(ITransport* transport);
    void handle_fault(ITransport* transport, const std::string& message);
    void teardown(const std::string& reason);
    void emit(const ClientEvent& event);
    void ensure_not_reader_thread(const char* operation) const;
    std::chrono::milliseconds next_read_timeout() const;

    ServerConfig config_;
    ClientOptions options_;
    TransportFactory factory_;

    std::mutex lifecycle_mutex_;  // serializes start/stop/destruction

    mutable std::mutex state_mutex_;
    ConnectionStatus status_ = ConnectionStatus::Disconnected;
    std::optional<std::string> error_;
    std::vector<ToolDescriptor> tools_;
    json server_info_;

    mutable std::mutex write_mutex_;  // transport_, next_id_, connection_open_
    std::unique_ptr<ITransport> transport_;
    RequestId next_id_ = 0;
    bool connection_open_ = false;

    RequestCorrelator pending_;
    std::thread reader_;
    std::atomic<std::thread::id> reader_id_{};
    std::atomic<bool> stopping_{false};

    // Touched only by the read loop, or after it has been joined
    NdjsonFramer framer_;
    LineFramer stderr_lines_;

    std::mutex listeners_mutex_;
    std::map<ListenerId, ClientListener> listeners_;
    ListenerId next_listener_id_ = 1;
};

} // namespace mcp_host
