#pragma once

#include <optional>
#include <string>

namespace quotebridge::market {

// Live quote provider queried before the fallback table. Implementations
// report every failure as nullopt and never throw.
class LivePriceSource {
public:
    virtual ~LivePriceSource() = default;
    virtual std::optional<double> fetch(const std::string& symbol) = 0;
};

}  // namespace quotebridge::market
