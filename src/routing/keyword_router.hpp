#pragma once

#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace quotebridge::routing {

// Deterministic prompt classifier: no network, keyword and ticker matching only.
class KeywordRouter {
public:
    core::errors::Result<protocol::ToolCall> route(const std::string& prompt) const;

    // Candidate tickers in the order they should be used.
    static std::vector<std::string> extract_symbols(const std::string& prompt);
};

}  // namespace quotebridge::routing
