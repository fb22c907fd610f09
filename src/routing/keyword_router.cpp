#include "routing/keyword_router.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <regex>
#include <unordered_set>
#include <utility>
#include "market/symbol.hpp"

namespace quotebridge::routing {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using protocol::ToolCall;
using protocol::ToolKind;

namespace {

const std::unordered_set<std::string> kKnownTickers = {
    "AAPL", "MSFT", "GOOGL", "TSLA", "AMZN", "NVDA", "META", "IBM", "ORCL", "NFLX"};

const std::array<std::pair<const char*, const char*>, 12> kNameToTicker = {{
    {"APPLE", "AAPL"},
    {"MICROSOFT", "MSFT"},
    {"TESLA", "TSLA"},
    {"AMAZON", "AMZN"},
    {"GOOGLE", "GOOGL"},
    {"ALPHABET", "GOOGL"},
    {"META", "META"},
    {"FACEBOOK", "META"},
    {"NVIDIA", "NVDA"},
    {"IBM", "IBM"},
    {"ORACLE", "ORCL"},
    {"NETFLIX", "NFLX"},
}};

bool wants_comparison(const std::string& prompt) {
    static const std::regex kCompareWords(R"(\b(compare|comparison|vs|versus)\b)",
                                          std::regex::icase);
    return std::regex_search(prompt, kCompareWords);
}

}  // namespace

std::vector<std::string> KeywordRouter::extract_symbols(const std::string& prompt) {
    const std::string upper = market::to_upper(prompt);

    std::vector<std::string> tickers;
    static const std::regex kTickerToken(R"(\b[A-Z]{1,5}\b)");
    for (auto it = std::sregex_iterator(upper.begin(), upper.end(), kTickerToken);
         it != std::sregex_iterator(); ++it) {
        const std::string token = it->str();
        if (kKnownTickers.count(token) != 0) {
            tickers.push_back(token);
        }
    }
    if (!tickers.empty()) {
        return tickers;
    }

    // Company names, ordered by where they first appear in the prompt.
    std::vector<std::pair<std::size_t, std::string>> name_hits;
    for (const auto& [name, ticker] : kNameToTicker) {
        const std::regex pattern(std::string(R"(\b)") + name + R"(\b)");
        std::smatch match;
        if (std::regex_search(upper, match, pattern)) {
            name_hits.emplace_back(static_cast<std::size_t>(match.position(0)), ticker);
        }
    }
    std::stable_sort(name_hits.begin(), name_hits.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    std::vector<std::string> ordered;
    std::unordered_set<std::string> seen;
    for (const auto& hit : name_hits) {
        if (seen.insert(hit.second).second) {
            ordered.push_back(hit.second);
        }
    }
    if (!ordered.empty()) {
        return ordered;
    }

    std::vector<std::string> cashtags;
    static const std::regex kCashtag(R"(\$([A-Za-z]{1,5})\b)");
    for (auto it = std::sregex_iterator(prompt.begin(), prompt.end(), kCashtag);
         it != std::sregex_iterator(); ++it) {
        cashtags.push_back(market::to_upper((*it)[1].str()));
    }
    return cashtags;
}

core::errors::Result<ToolCall> KeywordRouter::route(const std::string& prompt) const {
    const std::string cleaned = market::trim(prompt);
    if (cleaned.empty()) {
        return BridgeError{ErrorCategory::Input, "Query cannot be empty.", "empty_query"};
    }

    const auto symbols = extract_symbols(cleaned);
    if (wants_comparison(cleaned)) {
        if (symbols.size() < 2) {
            return BridgeError{ErrorCategory::Input,
                               "Could not determine two symbols to compare.",
                               "missing_symbols"};
        }
        return ToolCall{protocol::to_string(ToolKind::Compare),
                        {{"symbol_a", symbols[0]}, {"symbol_b", symbols[1]}}};
    }

    if (symbols.empty()) {
        return BridgeError{ErrorCategory::Input,
                           "Could not determine a stock symbol from the query.",
                           "missing_symbol"};
    }
    return ToolCall{protocol::to_string(ToolKind::GetPrice), {{"symbol", symbols[0]}}};
}

}  // namespace quotebridge::routing
