#include "worker/tool_worker.hpp"

#include <iostream>
#include <utility>

namespace quotebridge::worker {

using nlohmann::json;
using protocol::Arguments;
using protocol::Request;
using protocol::RequestType;
using protocol::ToolKind;

namespace {

std::string argument_or_empty(const Arguments& arguments, const std::string& key) {
    const auto it = arguments.find(key);
    return it == arguments.end() ? std::string() : it->second;
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

std::string to_string(const WorkerState state) {
    switch (state) {
        case WorkerState::Starting:
            return "starting";
        case WorkerState::Ready:
            return "ready";
        case WorkerState::Processing:
            return "processing";
        case WorkerState::ShuttingDown:
            return "shutting_down";
        case WorkerState::Terminated:
            return "terminated";
        default:
            return "unknown";
    }
}

ToolWorker::ToolWorker(market::DataResolver resolver, core::logging::Logger& logger)
    : resolver_(std::move(resolver)), logger_(logger) {}

void ToolWorker::transition(const WorkerState next) {
    logger_.debug("Worker transition " + to_string(state_) + " -> " + to_string(next));
    state_ = next;
}

void ToolWorker::emit(std::ostream& out, const std::string& line) {
    out << line << '\n';
    out.flush();
}

int ToolWorker::run(std::istream& in, std::ostream& out) {
    logger_.info("Starting stdio tool worker and sending readiness signal.");
    transition(WorkerState::Ready);
    emit(out, protocol::make_ready_message());

    std::string line;
    while (state_ == WorkerState::Ready && std::getline(in, line)) {
        if (is_blank(line)) {
            continue;
        }

        auto parsed = protocol::parse_request(line);
        if (core::errors::is_error(parsed)) {
            const auto& err = core::errors::get_error(parsed);
            logger_.warn("Rejecting payload: " + err.message);
            emit(out, protocol::make_error_response(protocol::kUnknownRequestId,
                                                    err.message));
            ++handled_;
            continue;
        }

        const Request& request = core::errors::get_value(parsed);
        if (request.type == RequestType::Shutdown) {
            logger_.info("Shutdown requested by client (id=" + request.id + ").");
            transition(WorkerState::ShuttingDown);
            emit(out, protocol::make_result_response(
                          request.id, json{{"status", "shutting_down"}}));
            ++handled_;
            break;
        }

        transition(WorkerState::Processing);
        emit(out, handle_invoke(request));
        ++handled_;
        transition(WorkerState::Ready);
    }

    if (state_ == WorkerState::Ready) {
        logger_.info("Input closed; stopping worker.");
    }
    transition(WorkerState::Terminated);
    return 0;
}

std::string ToolWorker::handle_invoke(const Request& request) {
    logger_.info("Executing tool '" + request.tool + "' for request " + request.id + ".");

    auto tool = protocol::resolve_tool(request.tool);
    if (core::errors::is_error(tool)) {
        const auto& err = core::errors::get_error(tool);
        logger_.warn("Request " + request.id + ": " + err.message);
        return protocol::make_error_response(request.id, err.message);
    }

    auto result = dispatch(core::errors::get_value(tool), request.arguments);
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        logger_.warn("Error while executing request " + request.id + ": " + err.message);
        return protocol::make_error_response(request.id, err.message);
    }

    logger_.info("Tool '" + request.tool + "' completed for request " + request.id + ".");
    return protocol::make_result_response(request.id, core::errors::get_value(result));
}

core::errors::Result<json> ToolWorker::dispatch(const ToolKind tool,
                                                const Arguments& arguments) {
    switch (tool) {
        case ToolKind::GetPrice: {
            auto quote = resolver_.get_price(argument_or_empty(arguments, "symbol"));
            if (core::errors::is_error(quote)) {
                return core::errors::get_error(quote);
            }
            return json{{"data", protocol::quote_to_json(core::errors::get_value(quote))}};
        }
        case ToolKind::Compare: {
            auto comparison =
                resolver_.compare(argument_or_empty(arguments, "symbol_a"),
                                  argument_or_empty(arguments, "symbol_b"));
            if (core::errors::is_error(comparison)) {
                return core::errors::get_error(comparison);
            }
            return json{{"data", protocol::comparison_to_json(
                                     core::errors::get_value(comparison))}};
        }
    }
    return core::errors::BridgeError{core::errors::ErrorCategory::Internal,
                                     "Unhandled tool kind.", "unhandled_tool"};
}

}  // namespace quotebridge::worker
