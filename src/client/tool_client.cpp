#include "client/tool_client.hpp"

#include <utility>
#include "client/pipe_transport.hpp"
#include "core/config/request_id.hpp"

namespace quotebridge::client {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using core::errors::Ok;
using protocol::Request;
using protocol::RequestType;

ToolClient::ToolClient(std::unique_ptr<Transport> transport,
                       core::logging::Logger& logger, ClientOptions options)
    : transport_(std::move(transport)), logger_(logger), options_(options) {}

ToolClient::ToolClient(ProcessCommand command, core::logging::Logger& logger,
                       ClientOptions options)
    : ToolClient(std::make_unique<PipeTransport>(std::move(command), logger), logger,
                 options) {}

ToolClient::~ToolClient() {
    shutdown();
}

bool ToolClient::running() const {
    return transport_ && transport_->is_open();
}

core::errors::Result<Ok> ToolClient::start() {
    if (running()) {
        return Ok{};
    }
    auto opened = transport_->open();
    if (core::errors::is_error(opened)) {
        logger_.debug("Worker handshake failed: " +
                      core::errors::get_error(opened).message);
        return opened;
    }
    logger_.debug("Worker is ready.");
    return Ok{};
}

core::errors::Result<nlohmann::json> ToolClient::invoke(const protocol::ToolCall& call) {
    if (!running()) {
        return BridgeError{ErrorCategory::NotRunning, "Server process is not running.",
                           "worker_not_running", "Call start() before invoke()."};
    }

    Request request;
    request.type = RequestType::Invoke;
    request.id = core::config::generate_request_id();
    request.tool = call.name;
    request.arguments = call.arguments;

    auto sent = transport_->send(request);
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }

    auto received = transport_->receive();
    if (core::errors::is_error(received)) {
        return core::errors::get_error(received);
    }
    const auto& response = core::errors::get_value(received);

    if (response.id != request.id) {
        return BridgeError{ErrorCategory::Correlation,
                           "Server response did not match the request id.",
                           "id_mismatch"};
    }
    if (response.error.has_value()) {
        return BridgeError{ErrorCategory::Remote, response.error.value(), "remote_error"};
    }
    return response.result.value_or(nlohmann::json::object());
}

void ToolClient::shutdown() {
    if (!running()) {
        return;
    }

    Request request;
    request.type = RequestType::Shutdown;
    request.id = core::config::generate_request_id();
    auto sent = transport_->send(request);
    if (core::errors::is_error(sent)) {
        logger_.debug("Shutdown request not delivered: " +
                      core::errors::get_error(sent).message);
    }

    transport_->close(options_.shutdown_grace);
    logger_.debug("Worker stopped.");
}

ClientSession::ClientSession(ToolClient& client)
    : client_(client), started_(client.start()) {}

ClientSession::~ClientSession() {
    client_.shutdown();
}

}  // namespace quotebridge::client
