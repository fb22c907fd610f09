#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/logging/logger.hpp"

namespace quotebridge::market {

// Read-only symbol -> price table backing the live source.
class FallbackTable {
public:
    FallbackTable() = default;
    explicit FallbackTable(std::unordered_map<std::string, double> prices);

    // Missing file yields an empty table; malformed rows are skipped.
    static FallbackTable load(const std::filesystem::path& csv_path,
                              core::logging::Logger& logger);

    std::optional<double> lookup(const std::string& symbol) const;
    std::size_t size() const;

private:
    std::unordered_map<std::string, double> prices_;
};

}  // namespace quotebridge::market
