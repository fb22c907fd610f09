#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "market/data_resolver.hpp"
#include "protocol/wire_contract.hpp"

namespace quotebridge::worker {

enum class WorkerState {
    Starting,
    Ready,
    Processing,
    ShuttingDown,
    Terminated
};

std::string to_string(WorkerState state);

// Server side of the line protocol: one request line in, one response line out.
class ToolWorker {
public:
    ToolWorker(market::DataResolver resolver, core::logging::Logger& logger);

    // Announces readiness, then serves until shutdown or end of input.
    int run(std::istream& in, std::ostream& out);

    WorkerState state() const { return state_; }
    std::size_t handled_count() const { return handled_; }

private:
    void transition(WorkerState next);
    void emit(std::ostream& out, const std::string& line);
    std::string handle_invoke(const protocol::Request& request);
    core::errors::Result<nlohmann::json> dispatch(protocol::ToolKind tool,
                                                  const protocol::Arguments& arguments);

    market::DataResolver resolver_;
    core::logging::Logger& logger_;
    WorkerState state_ = WorkerState::Starting;
    std::size_t handled_ = 0;
};

}  // namespace quotebridge::worker
