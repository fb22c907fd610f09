#include "market/data_resolver.hpp"

#include <cmath>
#include <exception>
#include <utility>
#include "market/symbol.hpp"

namespace quotebridge::market {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using protocol::ComparisonResult;
using protocol::PriceQuote;
using protocol::QuoteSource;

DataResolver::DataResolver(FallbackTable fallback,
                           std::unique_ptr<LivePriceSource> live,
                           core::logging::Logger& logger)
    : fallback_(std::move(fallback)), live_(std::move(live)), logger_(logger) {}

std::optional<double> DataResolver::try_live(const std::string& symbol) const {
    if (!live_) {
        return std::nullopt;
    }
    try {
        const auto price = live_->fetch(symbol);
        if (!price.has_value() || !std::isfinite(price.value()) || price.value() < 0.0) {
            return std::nullopt;
        }
        return price;
    } catch (const std::exception& ex) {
        logger_.debug("Live lookup for " + symbol + " threw: " + ex.what());
        return std::nullopt;
    } catch (...) {
        logger_.debug("Live lookup for " + symbol + " threw a non-standard exception.");
        return std::nullopt;
    }
}

core::errors::Result<PriceQuote> DataResolver::get_price(const std::string& symbol) const {
    const std::string clean_symbol = normalize_symbol(symbol);
    if (clean_symbol.empty()) {
        return BridgeError{ErrorCategory::NotFound,
                           "Symbol must be a non-empty string.", "empty_symbol"};
    }

    if (const auto live_price = try_live(clean_symbol)) {
        logger_.info("Using live price for " + clean_symbol + ".");
        return PriceQuote{clean_symbol, live_price.value(), QuoteSource::Live};
    }

    const auto fallback_price = fallback_.lookup(clean_symbol);
    if (!fallback_price.has_value()) {
        return BridgeError{ErrorCategory::NotFound,
                           "Price not available for symbol " + clean_symbol + ".",
                           "symbol_not_found"};
    }

    logger_.info("Using CSV fallback for " + clean_symbol + ".");
    return PriceQuote{clean_symbol, fallback_price.value(), QuoteSource::Fallback};
}

core::errors::Result<ComparisonResult> DataResolver::compare(
    const std::string& symbol_a, const std::string& symbol_b) const {
    auto quote_a = get_price(symbol_a);
    if (core::errors::is_error(quote_a)) {
        return core::errors::get_error(quote_a);
    }
    auto quote_b = get_price(symbol_b);
    if (core::errors::is_error(quote_b)) {
        return core::errors::get_error(quote_b);
    }

    ComparisonResult result;
    result.quote_a = core::errors::get_value(quote_a);
    result.quote_b = core::errors::get_value(quote_b);
    result.summary = summarize(result.quote_a, result.quote_b);
    return result;
}

std::string DataResolver::summarize(const PriceQuote& a, const PriceQuote& b) {
    const std::string pa = protocol::format_price(a.price);
    const std::string pb = protocol::format_price(b.price);
    if (a.price > b.price) {
        return a.symbol + " is trading higher than " + b.symbol + " (" + pa +
               " vs " + pb + ").";
    }
    if (a.price < b.price) {
        return a.symbol + " is trading lower than " + b.symbol + " (" + pa +
               " vs " + pb + ").";
    }
    return a.symbol + " and " + b.symbol + " have the same price at " + pa + ".";
}

}  // namespace quotebridge::market
