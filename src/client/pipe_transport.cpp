#include "client/pipe_transport.hpp"

#include <utility>

namespace quotebridge::client {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using core::errors::Ok;

PipeTransport::PipeTransport(ProcessCommand command, core::logging::Logger& logger)
    : command_(std::move(command)), logger_(logger) {}

PipeTransport::~PipeTransport() {
    teardown();
}

pid_t PipeTransport::worker_pid() const {
    return process_ ? process_->pid() : -1;
}

core::errors::Result<Ok> PipeTransport::open() {
    if (process_) {
        return Ok{};
    }

    logger_.debug("Starting worker: " + command_.program);
    auto spawned = ChildProcess::spawn(command_);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    process_ = std::move(core::errors::get_value(spawned));

    const auto ready_line = process_->read_line();
    if (!ready_line.has_value()) {
        teardown();
        return BridgeError{ErrorCategory::Handshake,
                           "Worker exited before sending a readiness signal.",
                           "handshake_missing",
                           "Check the worker path and its stderr output."};
    }
    logger_.debug("Handshake line: " + ready_line.value());
    if (!protocol::is_ready_message(ready_line.value())) {
        teardown();
        return BridgeError{ErrorCategory::Handshake,
                           "Unexpected server handshake: " + ready_line.value(),
                           "handshake_invalid"};
    }
    return Ok{};
}

core::errors::Result<Ok> PipeTransport::send(const protocol::Request& request) {
    if (!process_) {
        return BridgeError{ErrorCategory::NotRunning, "Server process is not running.",
                           "worker_not_running"};
    }
    const std::string line = protocol::encode_request(request);
    logger_.debug("Sending request: " + line);
    return process_->write_line(line);
}

core::errors::Result<protocol::Response> PipeTransport::receive() {
    if (!process_) {
        return BridgeError{ErrorCategory::NotRunning, "Server process is not running.",
                           "worker_not_running"};
    }
    const auto line = process_->read_line();
    logger_.debug("Raw response line: " + line.value_or(""));
    if (!line.has_value() ||
        line->find_first_not_of(" \t\r") == std::string::npos) {
        return BridgeError{ErrorCategory::Protocol, "Server returned an empty response.",
                           "empty_response"};
    }
    return protocol::parse_response(line.value());
}

void PipeTransport::close(const std::chrono::milliseconds grace) {
    if (!process_) {
        return;
    }
    process_->close_write();
    if (!process_->wait_for_exit(grace)) {
        logger_.debug("Shutdown timed out; killing process.");
        process_->kill();
    }
    teardown();
}

void PipeTransport::teardown() {
    if (!process_) {
        return;
    }
    process_->close_write();
    process_->close_read();
    process_->kill();
    process_.reset();
}

}  // namespace quotebridge::client
