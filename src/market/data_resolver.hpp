#pragma once

#include <memory>
#include <optional>
#include <string>
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "market/fallback_table.hpp"
#include "market/live_price_source.hpp"
#include "protocol/quote_contract.hpp"

namespace quotebridge::market {

class DataResolver {
public:
    // A null live source means the live tier is unavailable.
    DataResolver(FallbackTable fallback, std::unique_ptr<LivePriceSource> live,
                 core::logging::Logger& logger);

    core::errors::Result<protocol::PriceQuote> get_price(const std::string& symbol) const;

    core::errors::Result<protocol::ComparisonResult> compare(
        const std::string& symbol_a, const std::string& symbol_b) const;

    static std::string summarize(const protocol::PriceQuote& a,
                                 const protocol::PriceQuote& b);

private:
    std::optional<double> try_live(const std::string& symbol) const;

    FallbackTable fallback_;
    std::unique_ptr<LivePriceSource> live_;
    core::logging::Logger& logger_;
};

}  // namespace quotebridge::market
