#include "routing/result_renderer.hpp"

namespace quotebridge::routing {

using nlohmann::json;

namespace {

std::string text_field(const json& object, const char* key, const char* fallback) {
    if (!object.is_object()) {
        return fallback;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

const json& data_of(const json& result) {
    static const json kEmpty = json::object();
    if (!result.is_object()) {
        return kEmpty;
    }
    const auto it = result.find("data");
    if (it == result.end() || !it->is_object()) {
        return kEmpty;
    }
    return *it;
}

}  // namespace

std::string render_result(const protocol::ToolCall& call, const json& result) {
    auto tool = protocol::resolve_tool(call.name);
    if (core::errors::is_error(tool)) {
        return "Received an unexpected tool response.";
    }

    const json& data = data_of(result);
    switch (core::errors::get_value(tool)) {
        case protocol::ToolKind::GetPrice:
            return "The current price of " + text_field(data, "symbol", "UNKNOWN") +
                   " is $" + text_field(data, "price", "?") + " (" +
                   text_field(data, "source", "unknown") + ").";
        case protocol::ToolKind::Compare:
            return text_field(data, "summary", "Comparison data unavailable.");
    }
    return "Received an unexpected tool response.";
}

}  // namespace quotebridge::routing
