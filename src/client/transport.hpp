#pragma once

#include <chrono>
#include "core/errors/bridge_errors.hpp"
#include "protocol/wire_contract.hpp"

namespace quotebridge::client {

// Moves protocol messages between the client and one worker.
class Transport {
public:
    virtual ~Transport() = default;

    // Brings the worker up and completes the readiness handshake.
    virtual core::errors::Result<core::errors::Ok> open() = 0;

    virtual core::errors::Result<core::errors::Ok> send(const protocol::Request& request) = 0;

    // Reads exactly one response line.
    virtual core::errors::Result<protocol::Response> receive() = 0;

    // Closes our write side, waits up to `grace` for exit, then kills.
    virtual void close(std::chrono::milliseconds grace) = 0;

    virtual bool is_open() const = 0;
};

}  // namespace quotebridge::client
