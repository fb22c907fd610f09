#pragma once
#include <string>
#include <variant>

namespace quotebridge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,        // E.g., malformed request line or CLI flag
        NotFound,     // E.g., symbol missing from live and fallback sources
        Handshake,    // E.g., worker did not announce readiness
        NotRunning,   // E.g., invoke before start() or after shutdown()
        Protocol,     // E.g., empty or unparseable response line
        Correlation,  // E.g., response id differs from the request id
        Remote,       // E.g., worker reported an error for a valid request
        Internal      // E.g., pipe or fork failure
    };

    // The standardized error payload
    struct BridgeError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    // Stand-in value for operations that only succeed or fail.
    struct Ok {};

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Mutable access so move-only values can be taken out of a Result.
    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::NotFound: return "not_found";
            case ErrorCategory::Handshake: return "handshake";
            case ErrorCategory::NotRunning: return "not_running";
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::Correlation: return "correlation";
            case ErrorCategory::Remote: return "remote";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace quotebridge::core::errors
