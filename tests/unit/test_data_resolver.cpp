#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <gtest/gtest.h>
#include "market/data_resolver.hpp"
#include "test_support.hpp"

namespace {

using quotebridge::core::errors::ErrorCategory;
using quotebridge::core::errors::get_error;
using quotebridge::core::errors::get_value;
using quotebridge::core::errors::is_error;
using quotebridge::market::DataResolver;
using quotebridge::market::FallbackTable;
using quotebridge::market::LivePriceSource;
using quotebridge::protocol::QuoteSource;
using quotebridge::testing::RecordingLogger;
using quotebridge::testing::StubPriceSource;

FallbackTable sample_table() {
    return FallbackTable(std::unordered_map<std::string, double>{
        {"AAPL", 150.25}, {"MSFT", 380.50}, {"TWIN", 150.25}});
}

class ThrowingPriceSource : public LivePriceSource {
public:
    std::optional<double> fetch(const std::string&) override {
        throw std::runtime_error("socket closed");
    }
};

class ForeignThrowingPriceSource : public LivePriceSource {
public:
    std::optional<double> fetch(const std::string&) override { throw 42; }
};

TEST(DataResolverTest, FallsBackToTableWithoutLiveSource) {
    RecordingLogger logger;
    DataResolver resolver(sample_table(), nullptr, logger);

    auto quote = resolver.get_price("AAPL");
    ASSERT_FALSE(is_error(quote));
    EXPECT_EQ(get_value(quote).symbol, "AAPL");
    EXPECT_DOUBLE_EQ(get_value(quote).price, 150.25);
    EXPECT_EQ(get_value(quote).source, QuoteSource::Fallback);
}

TEST(DataResolverTest, NormalizesSymbols) {
    RecordingLogger logger;
    DataResolver resolver(sample_table(), std::make_unique<StubPriceSource>(), logger);

    for (const std::string input : {"aapl", " aapl ", "AAPL", "\tAaPl\n"}) {
        auto quote = resolver.get_price(input);
        ASSERT_FALSE(is_error(quote)) << input;
        EXPECT_EQ(get_value(quote).symbol, "AAPL");
        EXPECT_DOUBLE_EQ(get_value(quote).price, 150.25);
    }
}

TEST(DataResolverTest, RejectsEmptySymbol) {
    RecordingLogger logger;
    DataResolver resolver(sample_table(), nullptr, logger);

    auto quote = resolver.get_price("   ");
    ASSERT_TRUE(is_error(quote));
    EXPECT_EQ(get_error(quote).category, ErrorCategory::NotFound);
    EXPECT_EQ(get_error(quote).code, "empty_symbol");
}

TEST(DataResolverTest, UnknownSymbolNamesTheSymbol) {
    RecordingLogger logger;
    DataResolver resolver(sample_table(), std::make_unique<StubPriceSource>(), logger);

    auto quote = resolver.get_price("zzzz");
    ASSERT_TRUE(is_error(quote));
    EXPECT_EQ(get_error(quote).code, "symbol_not_found");
    EXPECT_NE(get_error(quote).message.find("ZZZZ"), std::string::npos);
}

TEST(DataResolverTest, PrefersLivePrice) {
    RecordingLogger logger;
    auto live = std::make_unique<StubPriceSource>(
        std::unordered_map<std::string, double>{{"AAPL", 189.37}, {"NVDA", 900.0}});
    auto* live_ptr = live.get();
    DataResolver resolver(sample_table(), std::move(live), logger);

    auto apple = resolver.get_price("aapl");
    ASSERT_FALSE(is_error(apple));
    EXPECT_DOUBLE_EQ(get_value(apple).price, 189.37);
    EXPECT_EQ(get_value(apple).source, QuoteSource::Live);

    // Live-only symbols resolve even when the table lacks them.
    auto nvidia = resolver.get_price("NVDA");
    ASSERT_FALSE(is_error(nvidia));
    EXPECT_EQ(get_value(nvidia).source, QuoteSource::Live);

    auto microsoft = resolver.get_price("MSFT");
    ASSERT_FALSE(is_error(microsoft));
    EXPECT_EQ(get_value(microsoft).source, QuoteSource::Fallback);

    ASSERT_EQ(live_ptr->calls.size(), 3u);
    EXPECT_EQ(live_ptr->calls[0], "AAPL");
}

TEST(DataResolverTest, LiveSourceExceptionDegradesToFallback) {
    RecordingLogger logger;
    DataResolver resolver(sample_table(), std::make_unique<ThrowingPriceSource>(), logger);

    auto quote = resolver.get_price("MSFT");
    ASSERT_FALSE(is_error(quote));
    EXPECT_EQ(get_value(quote).source, QuoteSource::Fallback);
    EXPECT_TRUE(logger.contains("socket closed"));
}

TEST(DataResolverTest, NonStandardExceptionDegradesToFallback) {
    RecordingLogger logger;
    DataResolver resolver(sample_table(), std::make_unique<ForeignThrowingPriceSource>(),
                          logger);

    auto quote = resolver.get_price("aapl");
    ASSERT_FALSE(is_error(quote));
    EXPECT_DOUBLE_EQ(get_value(quote).price, 150.25);
    EXPECT_EQ(get_value(quote).source, QuoteSource::Fallback);
    EXPECT_TRUE(logger.contains("non-standard exception"));

    auto missing = resolver.get_price("ZZZZ");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "symbol_not_found");
}

TEST(DataResolverTest, CompareReportsOrderingBothWays) {
    RecordingLogger logger;
    DataResolver resolver(sample_table(), nullptr, logger);

    auto forward = resolver.compare("MSFT", "AAPL");
    ASSERT_FALSE(is_error(forward));
    EXPECT_EQ(get_value(forward).quote_a.symbol, "MSFT");
    EXPECT_EQ(get_value(forward).quote_b.symbol, "AAPL");
    EXPECT_EQ(get_value(forward).summary,
              "MSFT is trading higher than AAPL (380.50 vs 150.25).");

    auto reverse = resolver.compare("aapl", "msft");
    ASSERT_FALSE(is_error(reverse));
    EXPECT_EQ(get_value(reverse).summary,
              "AAPL is trading lower than MSFT (150.25 vs 380.50).");
}

TEST(DataResolverTest, CompareEqualPrices) {
    RecordingLogger logger;
    DataResolver resolver(sample_table(), nullptr, logger);

    auto same = resolver.compare("AAPL", "TWIN");
    ASSERT_FALSE(is_error(same));
    EXPECT_EQ(get_value(same).summary, "AAPL and TWIN have the same price at 150.25.");

    auto self = resolver.compare("AAPL", "aapl");
    ASSERT_FALSE(is_error(self));
    EXPECT_EQ(get_value(self).summary, "AAPL and AAPL have the same price at 150.25.");
}

TEST(DataResolverTest, CompareStopsAtFirstFailure) {
    RecordingLogger logger;
    auto live = std::make_unique<StubPriceSource>();
    auto* live_ptr = live.get();
    DataResolver resolver(sample_table(), std::move(live), logger);

    auto result = resolver.compare("ZZZZ", "AAPL");
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).message.find("ZZZZ"), std::string::npos);
    ASSERT_EQ(live_ptr->calls.size(), 1u);
    EXPECT_EQ(live_ptr->calls.front(), "ZZZZ");

    auto second = resolver.compare("AAPL", "YYYY");
    ASSERT_TRUE(is_error(second));
    EXPECT_NE(get_error(second).message.find("YYYY"), std::string::npos);
}

}  // namespace
