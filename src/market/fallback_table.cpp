#include "market/fallback_table.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>
#include "market/symbol.hpp"

namespace quotebridge::market {

namespace {

std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

std::optional<double> parse_price(const std::string& text) {
    // Plain decimal notation only; strtod alone would also take hex and inf.
    if (text.empty() || text.find_first_not_of("0123456789.eE+-") != std::string::npos) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    if (!std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

FallbackTable::FallbackTable(std::unordered_map<std::string, double> prices)
    : prices_(std::move(prices)) {}

FallbackTable FallbackTable::load(const std::filesystem::path& csv_path,
                                  core::logging::Logger& logger) {
    std::ifstream in(csv_path);
    if (!in.is_open()) {
        logger.warn("Fallback CSV not found at " + csv_path.string() +
                    "; continuing with an empty table.");
        return FallbackTable{};
    }

    std::unordered_map<std::string, double> prices;
    std::string line;
    std::size_t line_no = 0;
    std::size_t skipped = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line_no == 1) {
            continue;  // header
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }

        const auto fields = split_row(line);
        if (fields.size() < 2 || fields[0].empty()) {
            ++skipped;
            continue;
        }
        const auto price = parse_price(fields[1]);
        if (!price.has_value()) {
            ++skipped;
            continue;
        }
        prices[to_upper(fields[0])] = price.value();
    }

    logger.info("Loaded " + std::to_string(prices.size()) +
                " fallback prices from " + csv_path.string() + " (skipped " +
                std::to_string(skipped) + " malformed rows).");
    return FallbackTable{std::move(prices)};
}

std::optional<double> FallbackTable::lookup(const std::string& symbol) const {
    const auto it = prices_.find(to_upper(symbol));
    if (it == prices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t FallbackTable::size() const {
    return prices_.size();
}

}  // namespace quotebridge::market
