#include <catch2/catch_test_macros.hpp>
#include "../src/synthetic_series.hpp"
#include <algorithm>
#include <cmath>

namespace {
constexpr int64_t kDayMs = 86400000LL;
constexpr int64_t kNowMs = 1718000123456LL;
}

TEST_CASE("Synthetic price history", "[synthetic]") {
    SyntheticSeriesGenerator generator(42);
    auto history = generator.generate(100.0, 30, kNowMs);

    SECTION("Thirty daily candles ending today at the live price") {
        REQUIRE(history.source == DataSource::Synthetic);
        REQUIRE(history.size() == 30);
        REQUIRE(history.back().close == 100.0);
        REQUIRE(history.back().timestamp_ms == kNowMs - kNowMs % kDayMs);
        for (size_t i = 1; i < history.size(); ++i) {
            REQUIRE(history.points[i].timestamp_ms - history.points[i - 1].timestamp_ms == kDayMs);
        }
    }

    SECTION("Daily moves stay within five percent") {
        for (size_t i = 1; i < history.size(); ++i) {
            double ratio = history.points[i].close / history.points[i - 1].close;
            REQUIRE(ratio >= 0.9499);
            REQUIRE(ratio <= 1.0501);
        }
    }

    SECTION("Candles are internally consistent") {
        for (const auto& p : history.points) {
            REQUIRE(p.high >= std::max(p.open, p.close));
            REQUIRE(p.low <= std::min(p.open, p.close));
            REQUIRE(p.low > 0.0);
            REQUIRE(p.volume > 0.0);
            REQUIRE(std::abs(p.open / p.close - 1.0) <= 0.0101);
        }
    }

    SECTION("Same seed reproduces the series") {
        SyntheticSeriesGenerator twin(42);
        auto again = twin.generate(100.0, 30, kNowMs);
        REQUIRE(again.size() == history.size());
        for (size_t i = 0; i < history.size(); ++i) {
            REQUIRE(again.points[i].close == history.points[i].close);
            REQUIRE(again.points[i].high == history.points[i].high);
        }
    }

    SECTION("No days, no candles") {
        auto empty = generator.generate(100.0, 0, kNowMs);
        REQUIRE(empty.empty());
        REQUIRE(empty.source == DataSource::Synthetic);
    }
}

TEST_CASE("Volume estimate by price tier", "[synthetic]") {
    SyntheticSeriesGenerator generator(7);

    for (int i = 0; i < 20; ++i) {
        double btc_like = generator.estimate_volume(65000.0);
        REQUIRE(btc_like >= 500000.0);
        REQUIRE(btc_like <= 2500000.0);

        double mid = generator.estimate_volume(50.0);
        REQUIRE(mid >= 5000000.0);
        REQUIRE(mid <= 25000000.0);

        double small_cap = generator.estimate_volume(0.25);
        REQUIRE(small_cap >= 10000000.0);
        REQUIRE(small_cap <= 60000000.0);
    }
}
