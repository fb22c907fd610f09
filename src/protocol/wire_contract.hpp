#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/quote_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace quotebridge::protocol {

constexpr const char* kProtocolVersion = "1.0";
constexpr const char* kUnknownRequestId = "unknown";

enum class RequestType {
    Invoke,
    Shutdown
};

struct Request {
    RequestType type = RequestType::Invoke;
    std::string id;
    std::string tool;  // empty for shutdown
    Arguments arguments;
};

struct Response {
    std::string id;
    std::optional<nlohmann::json> result;
    std::optional<std::string> error;
};

inline std::string to_string(const RequestType type) {
    switch (type) {
        case RequestType::Invoke:
            return "invoke";
        case RequestType::Shutdown:
            return "shutdown";
        default:
            return "unknown";
    }
}

// Worker side
core::errors::Result<Request> parse_request(const std::string& line);
std::string make_ready_message();
std::string make_result_response(const std::string& id, const nlohmann::json& result);
std::string make_error_response(const std::string& id, const std::string& message);

// Client side
std::string encode_request(const Request& request);
core::errors::Result<Response> parse_response(const std::string& line);
bool is_ready_message(const std::string& line);

nlohmann::json quote_to_json(const PriceQuote& quote);
nlohmann::json comparison_to_json(const ComparisonResult& comparison);

}  // namespace quotebridge::protocol
