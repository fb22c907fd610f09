#pragma once

#include <cstdio>
#include <string>

namespace quotebridge::protocol {

// Which tier answered a price lookup
enum class QuoteSource {
    Live,
    Fallback
};

struct PriceQuote {
    std::string symbol;  // always upper-case
    double price = 0.0;  // never negative
    QuoteSource source = QuoteSource::Fallback;
};

struct ComparisonResult {
    PriceQuote quote_a;
    PriceQuote quote_b;
    std::string summary;
};

inline std::string to_string(const QuoteSource source) {
    switch (source) {
        case QuoteSource::Live:
            return "live";
        case QuoteSource::Fallback:
            return "fallback";
        default:
            return "unknown";
    }
}

// Prices travel as two-decimal strings ("380.50").
inline std::string format_price(const double price) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f", price);
    return buffer;
}

}  // namespace quotebridge::protocol
