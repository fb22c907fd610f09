#include <cstdlib>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/bridge_errors.hpp"

namespace {

using quotebridge::app::cli::ClientOptions;
using quotebridge::app::cli::parse_client_args;
using quotebridge::app::cli::parse_log_level;
using quotebridge::app::cli::parse_worker_args;
using quotebridge::app::cli::WorkerOptions;
using quotebridge::core::errors::ErrorCategory;
using quotebridge::core::errors::get_error;
using quotebridge::core::errors::get_value;
using quotebridge::core::errors::is_error;
using quotebridge::core::errors::Result;
using quotebridge::core::logging::LogLevel;

template <typename Options, typename Parser>
Result<Options> parse_tokens(Parser parser, const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("quotebridge");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parser(static_cast<int>(argv.size()), argv.data());
}

Result<WorkerOptions> parse_worker(const std::vector<std::string>& tokens) {
    return parse_tokens<WorkerOptions>(parse_worker_args, tokens);
}

Result<ClientOptions> parse_client(const std::vector<std::string>& tokens) {
    return parse_tokens<ClientOptions>(parse_client_args, tokens);
}

TEST(CliParserTest, WorkerDefaults) {
    unsetenv(quotebridge::app::cli::kFallbackCsvEnv);
    auto result = parse_worker({});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.fallback_csv.string(), "stocks_data.csv");
    EXPECT_FALSE(options.offline);
    EXPECT_EQ(options.live_host, "query1.finance.yahoo.com");
    EXPECT_EQ(options.live_timeout_ms, 5000u);
    EXPECT_EQ(options.log_level, LogLevel::INFO);
}

TEST(CliParserTest, WorkerParsesAllFlags) {
    auto result = parse_worker({"--fallback-csv", "/tmp/prices.csv", "--offline",
                                "--live-host", "example.test", "--live-timeout-ms",
                                "250", "--log-level", "debug"});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.fallback_csv.string(), "/tmp/prices.csv");
    EXPECT_TRUE(options.offline);
    EXPECT_EQ(options.live_host, "example.test");
    EXPECT_EQ(options.live_timeout_ms, 250u);
    EXPECT_EQ(options.log_level, LogLevel::DEBUG);
}

TEST(CliParserTest, WorkerReadsCsvPathFromEnvironment) {
    setenv(quotebridge::app::cli::kFallbackCsvEnv, "/data/env_prices.csv", 1);
    auto from_env = parse_worker({});
    auto from_flag = parse_worker({"--fallback-csv", "flag.csv"});
    unsetenv(quotebridge::app::cli::kFallbackCsvEnv);

    ASSERT_FALSE(is_error(from_env));
    EXPECT_EQ(get_value(from_env).fallback_csv.string(), "/data/env_prices.csv");
    ASSERT_FALSE(is_error(from_flag));
    EXPECT_EQ(get_value(from_flag).fallback_csv.string(), "flag.csv");
}

TEST(CliParserTest, WorkerFailsWhenValueMissing) {
    auto result = parse_worker({"--fallback-csv"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, WorkerRejectsUnknownArgument) {
    auto result = parse_worker({"--verbose"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, WorkerRejectsNonNumericTimeout) {
    auto result = parse_worker({"--live-timeout-ms", "12ab"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, WorkerRejectsTimeoutOutOfBounds) {
    auto zero = parse_worker({"--live-timeout-ms", "0"});
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "bounds_error");

    auto huge = parse_worker({"--live-timeout-ms", "600000"});
    ASSERT_TRUE(is_error(huge));
    EXPECT_EQ(get_error(huge).code, "bounds_error");
}

TEST(CliParserTest, LogLevelParsing) {
    auto warn = parse_log_level("warn");
    ASSERT_FALSE(is_error(warn));
    EXPECT_EQ(get_value(warn), LogLevel::WARN);

    auto bogus = parse_log_level("loud");
    ASSERT_TRUE(is_error(bogus));
    EXPECT_EQ(get_error(bogus).code, "invalid_log_level");
    EXPECT_FALSE(get_error(bogus).hint.empty());
}

TEST(CliParserTest, ClientParsesFlags) {
    auto result = parse_client({"--offline", "--debug", "--fallback-csv", "prices.csv",
                                "--query", "price of AAPL"});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_TRUE(options.offline);
    EXPECT_TRUE(options.debug);
    ASSERT_TRUE(options.fallback_csv.has_value());
    EXPECT_EQ(options.fallback_csv->string(), "prices.csv");
    ASSERT_TRUE(options.query.has_value());
    EXPECT_EQ(options.query.value(), "price of AAPL");
    EXPECT_FALSE(options.worker_path.has_value());
}

TEST(CliParserTest, ClientRejectsMissingWorkerExecutable) {
    auto result = parse_client({"--worker", "/definitely/not/here/quotebridge_worker"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ClientAcceptsExistingWorkerExecutable) {
    auto result = parse_client({"--worker", QUOTEBRIDGE_WORKER_BIN});
    ASSERT_FALSE(is_error(result));
    ASSERT_TRUE(get_value(result).worker_path.has_value());
}

TEST(CliParserTest, ClientRejectsBlankQuery) {
    auto result = parse_client({"--query", "   "});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, ClientUnknownArgumentCarriesUsageHint) {
    auto result = parse_client({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
    EXPECT_NE(get_error(result).hint.find("Usage"), std::string::npos);
}

}  // namespace
