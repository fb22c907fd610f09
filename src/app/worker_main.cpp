#include <chrono>
#include <iostream>
#include <memory>
#include <utility>
#include "app/cli_parser.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "market/data_resolver.hpp"
#include "market/fallback_table.hpp"
#include "market/yahoo_price_source.hpp"
#include "worker/tool_worker.hpp"

int main(int argc, char* argv[]) {
    // stdout carries the protocol; every log line goes to stderr.
    quotebridge::core::logging::StreamLogger logger(std::cerr, "worker");

    auto parsed = quotebridge::app::cli::parse_worker_args(argc, argv);
    if (quotebridge::core::errors::is_error(parsed)) {
        const auto& err = quotebridge::core::errors::get_error(parsed);
        logger.error("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            logger.info("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = quotebridge::core::errors::get_value(parsed);
    logger.set_min_level(options.log_level);

    auto table = quotebridge::market::FallbackTable::load(options.fallback_csv, logger);

    std::unique_ptr<quotebridge::market::LivePriceSource> live;
    if (options.offline) {
        logger.info("Live source disabled; answering from the fallback table only.");
    } else {
        quotebridge::market::LiveSourceConfig live_config;
        live_config.host = options.live_host;
        live_config.timeout = std::chrono::milliseconds(options.live_timeout_ms);
        live = std::make_unique<quotebridge::market::YahooPriceSource>(live_config, logger);
    }

    quotebridge::market::DataResolver resolver(std::move(table), std::move(live), logger);
    quotebridge::worker::ToolWorker worker(std::move(resolver), logger);
    return worker.run(std::cin, std::cout);
}
