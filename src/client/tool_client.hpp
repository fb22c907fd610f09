#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include "client/child_process.hpp"
#include "client/transport.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"

namespace quotebridge::client {

struct ClientOptions {
    std::chrono::milliseconds shutdown_grace{2000};
};

// Drives one worker: handshake, correlated request/response, shutdown.
class ToolClient {
public:
    ToolClient(std::unique_ptr<Transport> transport, core::logging::Logger& logger,
               ClientOptions options = {});
    // Spawns `command` over stdio pipes.
    ToolClient(ProcessCommand command, core::logging::Logger& logger,
               ClientOptions options = {});
    ~ToolClient();

    ToolClient(const ToolClient&) = delete;
    ToolClient& operator=(const ToolClient&) = delete;

    core::errors::Result<core::errors::Ok> start();
    core::errors::Result<nlohmann::json> invoke(const protocol::ToolCall& call);
    void shutdown();

    bool running() const;

private:
    std::unique_ptr<Transport> transport_;
    core::logging::Logger& logger_;
    ClientOptions options_;
};

// Scoped session: start() on construction, shutdown() on every exit path.
class ClientSession {
public:
    explicit ClientSession(ToolClient& client);
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    bool ok() const { return !core::errors::is_error(started_); }
    const core::errors::BridgeError& error() const {
        return core::errors::get_error(started_);
    }
    ToolClient& client() { return client_; }

private:
    ToolClient& client_;
    core::errors::Result<core::errors::Ok> started_;
};

}  // namespace quotebridge::client
