#include "client/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace quotebridge::client {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using core::errors::Ok;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

// Child side only. When pipe2 handed back the standard descriptor itself, dup2
// is a no-op and would leave FD_CLOEXEC set across exec.
void redirect(const int fd, const int target) {
    if (fd != target) {
        static_cast<void>(dup2(fd, target));
        return;
    }
    const int flags = fcntl(fd, F_GETFD);
    if (flags >= 0) {
        static_cast<void>(fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC));
    }
}

}  // namespace

core::errors::Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(
    const ProcessCommand& command) {
    if (command.program.empty()) {
        return BridgeError{ErrorCategory::Input, "Worker program cannot be empty.",
                           "empty_program"};
    }

    // A dead peer must surface as EPIPE on write, not kill this process.
    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        return BridgeError{ErrorCategory::Internal, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        close_pair(stdin_pipe);
        return BridgeError{ErrorCategory::Internal, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }

    std::vector<char*> argv;
    argv.reserve(command.args.size() + 2);
    argv.push_back(const_cast<char*>(command.program.c_str()));
    for (const auto& arg : command.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        return BridgeError{ErrorCategory::Internal, "Failed to fork process.",
                           "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(std::signal(SIGPIPE, SIG_DFL));
        redirect(stdin_pipe[0], STDIN_FILENO);
        redirect(stdout_pipe[1], STDOUT_FILENO);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    static_cast<void>(close(stdin_pipe[0]));
    static_cast<void>(close(stdout_pipe[1]));
    return std::make_unique<ChildProcess>(SpawnKey{}, pid, stdin_pipe[1], stdout_pipe[0]);
}

ChildProcess::ChildProcess(SpawnKey, const pid_t pid, const int write_fd,
                           const int read_fd)
    : pid_(pid), write_fd_(write_fd), read_fd_(read_fd) {}

ChildProcess::~ChildProcess() {
    close_write();
    close_read();
    if (!exited_) {
        kill();
    }
}

core::errors::Result<Ok> ChildProcess::write_line(const std::string& line) {
    if (write_fd_ < 0) {
        return BridgeError{ErrorCategory::Protocol, "Worker input channel is closed.",
                           "write_failed"};
    }

    const std::string framed = line + "\n";
    std::size_t written = 0;
    while (written < framed.size()) {
        const ssize_t n = write(write_fd_, framed.data() + written, framed.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return BridgeError{ErrorCategory::Protocol,
                           "Failed to write to worker process (it may have exited).",
                           "write_failed"};
    }
    return Ok{};
}

std::optional<std::string> ChildProcess::read_line() {
    char buffer[4096];
    while (true) {
        const auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        if (read_fd_ < 0) {
            break;
        }

        const ssize_t n = read(read_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            read_buffer_.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        close_read();
        break;
    }

    if (read_buffer_.empty()) {
        return std::nullopt;
    }
    std::string tail;
    tail.swap(read_buffer_);
    return tail;
}

void ChildProcess::close_write() {
    close_fd(write_fd_);
}

void ChildProcess::close_read() {
    close_fd(read_fd_);
}

bool ChildProcess::reap(const bool block) {
    if (exited_) {
        return true;
    }
    while (true) {
        const pid_t waited = waitpid(pid_, &status_, block ? 0 : WNOHANG);
        if (waited == pid_) {
            exited_ = true;
            return true;
        }
        if (waited < 0 && errno == EINTR) {
            continue;
        }
        if (waited < 0) {
            // Nothing left to wait for (already reaped elsewhere).
            exited_ = true;
            status_ = 0;
            return true;
        }
        return false;
    }
}

bool ChildProcess::wait_for_exit(const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (reap(false)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void ChildProcess::kill() {
    if (exited_) {
        return;
    }
    static_cast<void>(::kill(pid_, SIGKILL));
    static_cast<void>(reap(true));
}

std::optional<int> ChildProcess::exit_code() const {
    if (!exited_) {
        return std::nullopt;
    }
    if (WIFEXITED(status_)) {
        return WEXITSTATUS(status_);
    }
    if (WIFSIGNALED(status_)) {
        return 128 + WTERMSIG(status_);
    }
    return -1;
}

}  // namespace quotebridge::client
