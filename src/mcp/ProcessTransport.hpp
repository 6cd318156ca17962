#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <mutex>
#include <sys/types.h>

namespace mcp_host {

/**
 * @brief Transport that runs the MCP server as a child process
 *
 * stdin is used for outbound ndjson, stdout carries protocol messages and
 * stderr is surfaced as diagnostic text. Exec failures (missing binary,
 * permission denied, bad working directory) are reported synchronously by
 * open() through a close-on-exec status pipe, so no child is left behind.
 */
class ProcessTransport : public ITransport {
public:
    ProcessTransport();
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    void open(const ServerConfig& config) override;
    void write(const std::string& data) override;
    ReadEvent read(std::chrono::milliseconds timeout) override;
    void terminate() override;
    std::optional<ExitStatus> exit_status() override;
    std::optional<int> pid() const override;
    bool is_open() const override;

    /**
     * @brief Argument vector used to launch a server
     *
     * With use_shell the command line is handed to /bin/sh -c, arguments
     * single-quoted.
     */
    static std::vector<std::string> build_argv(const ServerConfig& config);

    /**
     * @brief Parent environment overlaid with config env, as KEY=VALUE entries
     */
    static std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides);

private:
    std::optional<ExitStatus> try_reap(std::chrono::milliseconds wait);
    void close_fd(int& fd);

    std::string name_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int wake_pipe_[2] = {-1, -1};

    std::atomic<bool> stdout_open_{false};
    std::atomic<bool> terminated_{false};
    bool stderr_open_ = false;

    mutable std::mutex process_mutex_;  // pid_ and exit_
    std::mutex write_mutex_;
    std::optional<ExitStatus> exit_;
};

} // namespace mcp_host
