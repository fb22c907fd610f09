#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"

namespace quotebridge::app::cli {

    constexpr const char* kFallbackCsvEnv = "QUOTEBRIDGE_FALLBACK_CSV";

    // Validated flags for quotebridge_worker
    struct WorkerOptions {
        std::filesystem::path fallback_csv = "stocks_data.csv";
        bool offline = false;
        std::string live_host = "query1.finance.yahoo.com";
        uint32_t live_timeout_ms = 5000;
        core::logging::LogLevel log_level = core::logging::LogLevel::INFO;
    };

    // Validated flags for the interactive quotebridge client
    struct ClientOptions {
        std::optional<std::filesystem::path> worker_path;
        std::optional<std::filesystem::path> fallback_csv;
        bool offline = false;
        bool debug = false;
        std::optional<std::string> query;
    };

    core::errors::Result<WorkerOptions> parse_worker_args(int argc, char* argv[]);
    core::errors::Result<ClientOptions> parse_client_args(int argc, char* argv[]);
    core::errors::Result<core::logging::LogLevel> parse_log_level(const std::string& text);
}
