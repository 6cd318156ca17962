#include "ProcessTransport.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace mcp_host {

namespace {

// Written by the child to the status pipe when it fails before exec completes
struct ChildFailure {
    int stage;  // 0: chdir, 1: exec
    int error;
};

constexpr size_t kReadChunk = 4096;

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        std::signal(SIGPIPE, SIG_IGN);
    });
}

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string spawn_error_message(const ServerConfig& config, const ChildFailure& failure) {
    std::string reason = std::strerror(failure.error);
    if (failure.stage == 0) {
        return "Failed to spawn '" + config.command + "': cannot change directory to '"
            + config.cwd + "' (" + reason + ")";
    }
    if (failure.error == ENOENT) {
        return "Failed to spawn '" + config.command + "': command not found (" + reason + ")";
    }
    if (failure.error == EACCES) {
        return "Failed to spawn '" + config.command + "': permission denied (" + reason + ")";
    }
    return "Failed to spawn '" + config.command + "': " + reason;
}

} // namespace

std::string ExitStatus::describe() const {
    if (signal) {
        return "Killed by signal " + std::to_string(*signal);
    }
    if (code && *code != 0) {
        return "Exit code " + std::to_string(*code);
    }
    return "";
}

ProcessTransport::ProcessTransport() {
    ignore_sigpipe_once();
}

ProcessTransport::~ProcessTransport() {
    // Closing stdin lets well-behaved servers exit on their own
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        close_fd(stdin_fd_);
    }

    bool running = false;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        running = pid_ > 0 && !exit_;
        if (running) {
            ::kill(pid_, SIGTERM);
        }
    }

    if (running && !try_reap(std::chrono::milliseconds(200))) {
        std::lock_guard<std::mutex> lock(process_mutex_);
        spdlog::warn("[{}] Server did not exit after SIGTERM, sending SIGKILL", name_);
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
        }
    }

    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(wake_pipe_[0]);
    close_fd(wake_pipe_[1]);
}

std::vector<std::string> ProcessTransport::build_argv(const ServerConfig& config) {
    if (config.use_shell) {
        std::string command_line = config.command;
        for (const auto& arg : config.args) {
            command_line += " " + shell_quote(arg);
        }
        return {"/bin/sh", "-c", command_line};
    }

    std::vector<std::string> argv;
    argv.push_back(config.command);
    argv.insert(argv.end(), config.args.begin(), config.args.end());
    return argv;
}

std::vector<std::string> ProcessTransport::build_environment(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string text(*entry);
        auto eq = text.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[text.substr(0, eq)] = text.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        result.push_back(key + "=" + value);
    }
    return result;
}

void ProcessTransport::open(const ServerConfig& config) {
    if (pid_ > 0) {
        throw std::logic_error("ProcessTransport already opened");
    }
    if (config.command.empty()) {
        throw SpawnError("Failed to spawn server '" + config.name + "': empty command");
    }

    name_ = config.name;

    // Everything the child needs is prepared before fork
    std::vector<std::string> argv_storage = build_argv(config);
    std::vector<std::string> env_storage = build_environment(config.env);
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);
    const char* cwd = config.cwd.empty() ? nullptr : config.cwd.c_str();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (::pipe2(in_pipe, O_CLOEXEC) == -1 || ::pipe2(out_pipe, O_CLOEXEC) == -1 ||
        ::pipe2(err_pipe, O_CLOEXEC) == -1 || ::pipe2(status_pipe, O_CLOEXEC) == -1 ||
        ::pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) == -1) {
        int error = errno;
        close_all();
        close_fd(wake_pipe_[0]);
        close_fd(wake_pipe_[1]);
        throw SpawnError("Failed to create pipes for '" + config.command + "': " + std::strerror(error));
    }

    spdlog::info("[{}] Spawning: {}", name_, [&] {
        std::string line;
        for (const auto& arg : argv_storage) {
            line += (line.empty() ? "" : " ") + arg;
        }
        return line;
    }());

    pid_t child = ::fork();
    if (child == -1) {
        int error = errno;
        close_all();
        close_fd(wake_pipe_[0]);
        close_fd(wake_pipe_[1]);
        throw SpawnError("Failed to fork for '" + config.command + "': " + std::strerror(error));
    }

    if (child == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        ChildFailure failure{0, 0};
        if (cwd && ::chdir(cwd) == -1) {
            failure = {0, errno};
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
            failure = {1, errno};
        }
        ssize_t ignored = ::write(status_pipe[1], &failure, sizeof(failure));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    ChildFailure failure{0, 0};
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (n == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n > 0) {
        // exec never happened: reap the child and report
        int status = 0;
        while (::waitpid(child, &status, 0) == -1 && errno == EINTR) {
        }
        close_all();
        close_fd(wake_pipe_[0]);
        close_fd(wake_pipe_[1]);
        std::string message = spawn_error_message(config, failure);
        spdlog::error("[{}] {}", name_, message);
        throw SpawnError(message);
    }

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        pid_ = child;
    }
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    stdout_open_ = true;
    stderr_open_ = true;

    spdlog::info("[{}] Server process started (pid {})", name_, child);
}

void ProcessTransport::write(const std::string& data) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0) {
        throw TransportError("Server process not running");
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + offset, data.size() - offset);
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportError("Failed to write to server stdin: " + std::string(std::strerror(errno)));
        }
        offset += static_cast<size_t>(n);
    }
}

ReadEvent ProcessTransport::read(std::chrono::milliseconds timeout) {
    char buffer[kReadChunk];

    while (true) {
        if (terminated_ || !stdout_open_) {
            return {ReadEvent::Kind::Closed, {}};
        }

        pollfd fds[3];
        nfds_t count = 0;
        int stdout_index = -1;
        int stderr_index = -1;
        fds[count] = {wake_pipe_[0], POLLIN, 0};
        int wake_index = static_cast<int>(count++);
        fds[count] = {stdout_fd_, POLLIN, 0};
        stdout_index = static_cast<int>(count++);
        if (stderr_open_) {
            fds[count] = {stderr_fd_, POLLIN, 0};
            stderr_index = static_cast<int>(count++);
        }

        int ready = ::poll(fds, count, static_cast<int>(timeout.count()));
        if (ready == -1) {
            if (errno == EINTR) {
                return {ReadEvent::Kind::Timeout, {}};
            }
            throw TransportError("Failed to poll server output: " + std::string(std::strerror(errno)));
        }
        if (ready == 0) {
            return {ReadEvent::Kind::Timeout, {}};
        }

        if (fds[wake_index].revents != 0) {
            return {ReadEvent::Kind::Closed, {}};
        }

        // Diagnostics first so a crash trace is logged before the exit is reported
        if (stderr_index >= 0 && fds[stderr_index].revents != 0) {
            ssize_t n = ::read(stderr_fd_, buffer, sizeof(buffer));
            if (n > 0) {
                return {ReadEvent::Kind::Stderr, std::string(buffer, static_cast<size_t>(n))};
            }
            if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                stderr_open_ = false;
            }
            continue;
        }

        if (fds[stdout_index].revents != 0) {
            ssize_t n = ::read(stdout_fd_, buffer, sizeof(buffer));
            if (n > 0) {
                return {ReadEvent::Kind::Stdout, std::string(buffer, static_cast<size_t>(n))};
            }
            if (n == -1 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            if (n == -1) {
                throw TransportError("Failed to read server stdout: " + std::string(std::strerror(errno)));
            }
            stdout_open_ = false;
            spdlog::debug("[{}] Server stdout closed", name_);
            return {ReadEvent::Kind::Closed, {}};
        }
    }
}

void ProcessTransport::terminate() {
    terminated_ = true;

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (pid_ > 0 && !exit_) {
            spdlog::info("[{}] Terminating server process (pid {})", name_, pid_);
            ::kill(pid_, SIGTERM);
        }
    }

    if (wake_pipe_[1] >= 0) {
        char byte = 1;
        ssize_t ignored = ::write(wake_pipe_[1], &byte, 1);
        (void)ignored;
    }
}

std::optional<ExitStatus> ProcessTransport::exit_status() {
    return try_reap(std::chrono::milliseconds(500));
}

std::optional<ExitStatus> ProcessTransport::try_reap(std::chrono::milliseconds wait) {
    auto deadline = std::chrono::steady_clock::now() + wait;

    while (true) {
        {
            std::lock_guard<std::mutex> lock(process_mutex_);
            if (exit_ || pid_ <= 0) {
                return exit_;
            }

            int status = 0;
            pid_t result = ::waitpid(pid_, &status, WNOHANG);
            if (result == pid_) {
                ExitStatus reaped;
                if (WIFEXITED(status)) {
                    reaped.code = WEXITSTATUS(status);
                } else if (WIFSIGNALED(status)) {
                    reaped.signal = WTERMSIG(status);
                }
                exit_ = reaped;
                spdlog::info("[{}] Server process exited: code={}, signal={}", name_,
                             reaped.code ? std::to_string(*reaped.code) : "none",
                             reaped.signal ? std::to_string(*reaped.signal) : "none");
                return exit_;
            }
            if (result == -1 && errno != EINTR) {
                spdlog::warn("[{}] waitpid failed: {}", name_, std::strerror(errno));
                exit_ = ExitStatus{};
                return exit_;
            }
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

std::optional<int> ProcessTransport::pid() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (pid_ > 0 && !exit_) {
        return static_cast<int>(pid_);
    }
    return std::nullopt;
}

bool ProcessTransport::is_open() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return pid_ > 0 && !exit_ && !terminated_ && stdout_open_;
}

void ProcessTransport::close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace mcp_host
