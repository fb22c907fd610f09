#pragma once
#include <map>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace quotebridge::protocol {

    // Closed set of operations the worker knows how to run
    enum class ToolKind {
        GetPrice,
        Compare
    };

    using Arguments = std::map<std::string, std::string>;

    // What the router hands to the client
    struct ToolCall {
        std::string name;     // e.g., "get_price", "compare"
        Arguments arguments;  // e.g., {"symbol": "AAPL"}
    };

    inline std::string to_string(const ToolKind kind) {
        switch (kind) {
            case ToolKind::GetPrice: return "get_price";
            case ToolKind::Compare:  return "compare";
            default: return "unknown";
        }
    }

    // Maps a wire tool name onto ToolKind; anything else is rejected here.
    inline core::errors::Result<ToolKind> resolve_tool(const std::string& name) {
        if (name == "get_price") {
            return ToolKind::GetPrice;
        }
        if (name == "compare") {
            return ToolKind::Compare;
        }
        return core::errors::BridgeError{core::errors::ErrorCategory::Input,
                                         "Unknown tool '" + name + "'.",
                                         "unknown_tool"};
    }

} // namespace quotebridge::protocol
