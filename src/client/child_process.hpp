#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace quotebridge::client {

struct ProcessCommand {
    std::string program;  // resolved through PATH when it has no slash
    std::vector<std::string> args;
};

// A spawned child wired to two pipes: we write its stdin, we read its stdout.
// stderr is inherited. Destruction kills and reaps a child that is still alive.
class ChildProcess {
public:
    static core::errors::Result<std::unique_ptr<ChildProcess>> spawn(
        const ProcessCommand& command);

private:
    struct SpawnKey {
        explicit SpawnKey() = default;
    };

public:
    // Only spawn() can name SpawnKey.
    ChildProcess(SpawnKey, pid_t pid, int write_fd, int read_fd);
    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    core::errors::Result<core::errors::Ok> write_line(const std::string& line);

    // Blocks until a full line arrives; nullopt once the child closes stdout.
    std::optional<std::string> read_line();

    void close_write();
    void close_read();

    // True when the child exited within the timeout.
    bool wait_for_exit(std::chrono::milliseconds timeout);
    void kill();

    bool exited() const { return exited_; }
    pid_t pid() const { return pid_; }
    std::optional<int> exit_code() const;

private:
    bool reap(bool block);

    pid_t pid_ = -1;
    int write_fd_ = -1;
    int read_fd_ = -1;
    bool exited_ = false;
    int status_ = 0;
    std::string read_buffer_;
};

}  // namespace quotebridge::client
