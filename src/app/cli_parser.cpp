#include "cli_parser.hpp"
#include <charconv>
#include <cstdlib>
#include <optional>
#include <system_error>
#include <vector>

namespace quotebridge::app::cli {

    using namespace quotebridge::core::errors;
    using quotebridge::core::logging::LogLevel;

    // 1. Raw Options Struct (Internal only)
    struct RawWorkerOptions {
        std::optional<std::string> fallback_csv;
        std::optional<std::string> live_host;
        std::optional<std::string> live_timeout_ms;
        std::optional<std::string> log_level;
        bool offline = false;
    };

    struct RawClientOptions {
        std::optional<std::string> worker;
        std::optional<std::string> fallback_csv;
        std::optional<std::string> query;
        bool offline = false;
        bool debug = false;
    };

    namespace {

        std::vector<std::string> collect_args(int argc, char* argv[]) {
            std::vector<std::string> args;
            for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
                args.push_back(argv[i]);
            }
            return args;
        }

        BridgeError missing_value(const std::string& flag) {
            return BridgeError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

    } // namespace

    Result<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return BridgeError{ErrorCategory::Input, "Unknown log level: " + text, "invalid_log_level",
                           "Use one of: debug, info, warn, error."};
    }

    Result<WorkerOptions> parse_worker_args(int argc, char* argv[]) {
        RawWorkerOptions raw;
        const auto args = collect_args(argc, argv);

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--fallback-csv") {
                if (i + 1 < args.size()) raw.fallback_csv = args[++i];
                else return missing_value("--fallback-csv");
            } else if (args[i] == "--live-host") {
                if (i + 1 < args.size()) raw.live_host = args[++i];
                else return missing_value("--live-host");
            } else if (args[i] == "--live-timeout-ms") {
                if (i + 1 < args.size()) raw.live_timeout_ms = args[++i];
                else return missing_value("--live-timeout-ms");
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return missing_value("--log-level");
            } else if (args[i] == "--offline") {
                raw.offline = true;
            } else {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        WorkerOptions options;
        options.offline = raw.offline;

        if (raw.fallback_csv) {
            options.fallback_csv = raw.fallback_csv.value();
        } else if (const char* env_csv = std::getenv(kFallbackCsvEnv); env_csv != nullptr && *env_csv != '\0') {
            options.fallback_csv = env_csv;
        }

        if (raw.live_host) {
            if (raw.live_host->empty()) {
                return BridgeError{ErrorCategory::Input, "--live-host cannot be empty", "missing_value"};
            }
            options.live_host = raw.live_host.value();
        }

        // Exception-free integer parsing
        if (raw.live_timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.live_timeout_ms->data();
            const char* end = raw.live_timeout_ms->data() + raw.live_timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return BridgeError{ErrorCategory::Input, "Invalid number for --live-timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout == 0 || timeout > 60000) {
                return BridgeError{ErrorCategory::Input, "--live-timeout-ms out of bounds", "bounds_error", "Must be between 1 and 60000."};
            }
            options.live_timeout_ms = timeout;
        }

        if (raw.log_level) {
            auto level = parse_log_level(raw.log_level.value());
            if (is_error(level)) {
                return get_error(level);
            }
            options.log_level = get_value(level);
        }

        return options;
    }

    Result<ClientOptions> parse_client_args(int argc, char* argv[]) {
        RawClientOptions raw;
        const auto args = collect_args(argc, argv);

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--worker") {
                if (i + 1 < args.size()) raw.worker = args[++i];
                else return missing_value("--worker");
            } else if (args[i] == "--fallback-csv") {
                if (i + 1 < args.size()) raw.fallback_csv = args[++i];
                else return missing_value("--fallback-csv");
            } else if (args[i] == "--query") {
                if (i + 1 < args.size()) raw.query = args[++i];
                else return missing_value("--query");
            } else if (args[i] == "--offline") {
                raw.offline = true;
            } else if (args[i] == "--debug") {
                raw.debug = true;
            } else {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument",
                                   "Usage: quotebridge [--worker PATH] [--fallback-csv PATH] [--offline] [--debug] [--query TEXT]"};
            }
        }

        ClientOptions options;
        options.offline = raw.offline;
        options.debug = raw.debug;

        if (raw.worker) {
            std::filesystem::path p(raw.worker.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return BridgeError{ErrorCategory::Input, "Worker executable does not exist: " + p.string(), "invalid_path"};
            }
            options.worker_path = std::move(p);
        }
        if (raw.fallback_csv) options.fallback_csv = std::filesystem::path(raw.fallback_csv.value());
        if (raw.query) {
            if (raw.query->find_first_not_of(" \t") == std::string::npos) {
                return BridgeError{ErrorCategory::Input, "--query cannot be empty", "missing_value"};
            }
            options.query = raw.query.value();
        }

        return options;
    }

} // namespace quotebridge::app::cli
