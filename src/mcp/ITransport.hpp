#pragma once

#include "mcp/Types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mcp_host {

/**
 * @brief Outcome of a single transport read
 */
struct ReadEvent {
    enum class Kind {
        Stdout,   // protocol bytes from the server
        Stderr,   // diagnostic text, never parsed as protocol
        Timeout,  // nothing arrived within the timeout
        Closed    // server output ended or the transport was terminated
    };

    Kind kind = Kind::Timeout;
    std::string data;
};

/**
 * @brief How the server process ended
 */
struct ExitStatus {
    std::optional<int> code;    // Set when the process exited normally
    std::optional<int> signal;  // Set when the process was killed by a signal

    /**
     * @brief Human-readable reason, empty for a clean exit with code 0
     */
    std::string describe() const;
};

/**
 * @brief Abstract interface for the channel to one MCP server process
 *
 * Implementations own the process (or a simulation of it) and expose its
 * three standard streams. A transport is opened once; a client creates a
 * fresh transport for every start().
 *
 * read() is called from a single reader thread; write() and terminate()
 * may be called from other threads.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Launch the server described by config
     * @throws SpawnError if the process cannot be started
     */
    virtual void open(const ServerConfig& config) = 0;

    /**
     * @brief Write raw bytes to the server's stdin
     * @throws TransportError if the write fails
     */
    virtual void write(const std::string& data) = 0;

    /**
     * @brief Wait up to timeout for output from the server
     * @throws TransportError on an unrecoverable read fault
     */
    virtual ReadEvent read(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Ask the server to terminate and wake any blocked read()
     *
     * Does not wait for the process to exit.
     */
    virtual void terminate() = 0;

    /**
     * @brief Exit status once the server has ended, if known
     */
    virtual std::optional<ExitStatus> exit_status() = 0;

    /**
     * @brief Process id while the server is running
     */
    virtual std::optional<int> pid() const = 0;

    /**
     * @brief Check if the server is still running and reachable
     */
    virtual bool is_open() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

} // namespace mcp_host
