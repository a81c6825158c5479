#include <catch2/catch_test_macros.hpp>
#include "../src/models.hpp"

TEST_CASE("Indicator set serialization", "[models]") {
    IndicatorSet set;
    set.asset_id = "bitcoin";
    set.analyzed_price = 65000.0;
    set.data_source = DataSource::Cached;
    set.stage = AnalysisStage::Done;
    set.rsi = 25.0;
    set.add_signal(EntrySignal(EntryTechnique::RsiOversold, SignalStrength::Strong,
                               "oversold", 68250.0, 61750.0, 0.75));

    SECTION("JSON carries enum names and the derived rating") {
        nlohmann::json j = set;
        REQUIRE(j["asset_id"] == "bitcoin");
        REQUIRE(j["data_source"] == "cached");
        REQUIRE(j["stage"] == "done");
        REQUIRE(j["trend"] == "neutral");
        REQUIRE(j["entry_quality"] == "good");
        REQUIRE(j["quality_score"] == 80.0);
        REQUIRE(j["volume_ratio"] == 1.0);
        REQUIRE(j["signals"].size() == 1);
        REQUIRE(j["signals"][0]["technique"] == "rsi_oversold");
        REQUIRE(j["signals"][0]["strength"] == "strong");
    }

    SECTION("Summary names the asset and its signals") {
        auto text = set.summary();
        REQUIRE(text.find("bitcoin") != std::string::npos);
        REQUIRE(text.find("(oversold)") != std::string::npos);
        REQUIRE(text.find("rsi_oversold") != std::string::npos);
    }
}

TEST_CASE("Price point and metrics JSON", "[models]") {
    PricePoint p{1700000000000LL, 1.0, 2.0, 0.5, 1.5, 1234.0};
    nlohmann::json j = p;
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 6);

    // Provider rows have no volume column
    auto parsed = nlohmann::json::parse("[1700000000000, 1.0, 2.0, 0.5, 1.5]").get<PricePoint>();
    REQUIRE(parsed.close == 1.5);
    REQUIRE(parsed.volume == 0.0);

    MarketMetrics m;
    m.pct_change_7d = -3.0;
    auto restored = nlohmann::json(m).get<MarketMetrics>();
    REQUIRE(restored.pct_change_7d == -3.0);
    REQUIRE_FALSE(restored.total_volume_usd.has_value());
}
