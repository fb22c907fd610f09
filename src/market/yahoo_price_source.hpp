#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "core/logging/logger.hpp"
#include "market/live_price_source.hpp"

namespace quotebridge::market {

struct LiveSourceConfig {
    std::string host = "query1.finance.yahoo.com";
    std::string port = "443";
    std::chrono::milliseconds timeout{5000};
};

// Pulls the last traded price from the Yahoo Finance chart endpoint over HTTPS.
class YahooPriceSource : public LivePriceSource {
public:
    YahooPriceSource(LiveSourceConfig config, core::logging::Logger& logger);

    std::optional<double> fetch(const std::string& symbol) override;

    // Exposed for tests: extracts the price from a chart API body.
    static std::optional<double> parse_chart_body(const std::string& body);

private:
    std::optional<std::string> http_get(const std::string& target);

    LiveSourceConfig config_;
    core::logging::Logger& logger_;
};

}  // namespace quotebridge::market
