#include "protocol/wire_contract.hpp"

namespace quotebridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

BridgeError invalid_request(const std::string& message) {
    return BridgeError{ErrorCategory::Input, message, "invalid_request"};
}

BridgeError invalid_response(const std::string& message) {
    return BridgeError{ErrorCategory::Protocol, message, "invalid_response"};
}

std::string argument_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

}  // namespace

core::errors::Result<Request> parse_request(const std::string& line) {
    const json payload = json::parse(line, nullptr, false);
    if (payload.is_discarded()) {
        return invalid_request("Invalid JSON payload.");
    }
    if (!payload.is_object()) {
        return invalid_request("Request must be a JSON object.");
    }

    const auto type_it = payload.find("type");
    if (type_it == payload.end() || !type_it->is_string()) {
        return invalid_request("Request type must be a string.");
    }

    Request request;
    const auto& type = type_it->get_ref<const std::string&>();
    if (type == "invoke") {
        request.type = RequestType::Invoke;
    } else if (type == "shutdown") {
        request.type = RequestType::Shutdown;
    } else {
        return invalid_request("Unsupported message type '" + type + "'.");
    }

    const auto id_it = payload.find("id");
    if (id_it == payload.end() || !id_it->is_string() ||
        id_it->get_ref<const std::string&>().empty()) {
        return invalid_request("Request id must be a non-empty string.");
    }
    request.id = id_it->get<std::string>();

    if (request.type == RequestType::Shutdown) {
        return request;
    }

    const auto tool_it = payload.find("tool");
    if (tool_it == payload.end() || !tool_it->is_string()) {
        return invalid_request("Invoke request must name a tool.");
    }
    request.tool = tool_it->get<std::string>();

    const auto args_it = payload.find("arguments");
    if (args_it != payload.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return invalid_request("Invoke arguments must be an object.");
        }
        for (const auto& item : args_it->items()) {
            request.arguments.emplace(item.key(), argument_text(item.value()));
        }
    }

    return request;
}

std::string make_ready_message() {
    return json{{"type", "ready"}, {"version", kProtocolVersion}}.dump();
}

std::string make_result_response(const std::string& id, const json& result) {
    return json{{"type", "response"}, {"id", id}, {"result", result}}.dump();
}

std::string make_error_response(const std::string& id, const std::string& message) {
    return json{{"type", "response"}, {"id", id}, {"error", message}}.dump();
}

std::string encode_request(const Request& request) {
    json payload;
    payload["type"] = to_string(request.type);
    payload["id"] = request.id;
    if (request.type == RequestType::Invoke) {
        payload["tool"] = request.tool;
        payload["arguments"] = request.arguments;
    }
    return payload.dump();
}

core::errors::Result<Response> parse_response(const std::string& line) {
    const json payload = json::parse(line, nullptr, false);
    if (payload.is_discarded()) {
        return invalid_response("Server returned a response that is not valid JSON.");
    }
    if (!payload.is_object()) {
        return invalid_response("Server response must be a JSON object.");
    }

    Response response;
    const auto id_it = payload.find("id");
    if (id_it != payload.end() && id_it->is_string()) {
        response.id = id_it->get<std::string>();
    }

    const auto error_it = payload.find("error");
    if (error_it != payload.end() && !error_it->is_null()) {
        response.error = error_it->is_string() ? error_it->get<std::string>()
                                               : error_it->dump();
    }

    const auto result_it = payload.find("result");
    if (result_it != payload.end() && !result_it->is_null()) {
        response.result = *result_it;
    }

    if (!response.error.has_value() && !response.result.has_value()) {
        return invalid_response("Server response carries neither result nor error.");
    }
    return response;
}

bool is_ready_message(const std::string& line) {
    const json payload = json::parse(line, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return false;
    }
    const auto type_it = payload.find("type");
    return type_it != payload.end() && type_it->is_string() && *type_it == "ready";
}

json quote_to_json(const PriceQuote& quote) {
    json payload;
    payload["symbol"] = quote.symbol;
    payload["price"] = format_price(quote.price);
    payload["source"] = to_string(quote.source);
    return payload;
}

json comparison_to_json(const ComparisonResult& comparison) {
    json payload;
    payload["quote_a"] = quote_to_json(comparison.quote_a);
    payload["quote_b"] = quote_to_json(comparison.quote_b);
    payload["summary"] = comparison.summary;
    return payload;
}

}  // namespace quotebridge::protocol
