#pragma once

#include <chrono>
#include <memory>
#include "client/child_process.hpp"
#include "client/transport.hpp"
#include "core/logging/logger.hpp"

namespace quotebridge::client {

class PipeTransport : public Transport {
public:
    PipeTransport(ProcessCommand command, core::logging::Logger& logger);
    ~PipeTransport() override;

    core::errors::Result<core::errors::Ok> open() override;
    core::errors::Result<core::errors::Ok> send(const protocol::Request& request) override;
    core::errors::Result<protocol::Response> receive() override;
    void close(std::chrono::milliseconds grace) override;
    bool is_open() const override { return process_ != nullptr; }

    // Valid while open; -1 otherwise.
    pid_t worker_pid() const;

private:
    void teardown();

    ProcessCommand command_;
    core::logging::Logger& logger_;
    std::unique_ptr<ChildProcess> process_;
};

}  // namespace quotebridge::client
