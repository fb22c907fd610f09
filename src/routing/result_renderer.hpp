#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"

namespace quotebridge::routing {

// Turns a tool result into the one-line answer shown to the user.
std::string render_result(const protocol::ToolCall& call, const nlohmann::json& result);

}  // namespace quotebridge::routing
