#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/market_data_fetcher.hpp"
#include "stub_http_client.hpp"
#include <memory>
#include <set>
#include <stdexcept>
#include <vector>

using Catch::Approx;
using namespace std::chrono_literals;

namespace {

std::vector<double> closes_ending_at(double last, size_t n) {
    std::vector<double> closes;
    for (size_t i = 0; i < n; ++i) {
        closes.push_back(last - static_cast<double>(n - 1 - i) * 0.5);
    }
    return closes;
}

struct FetcherFixture {
    RateGate gate{0ms, std::set<std::string>{"analysis"}};
    ResultCache cache;
    std::shared_ptr<StubHttpClient> http;
    std::unique_ptr<MarketDataFetcher> fetcher;

    explicit FetcherFixture(StubHttpClient::Handler handler, const std::string& caller = "analysis") {
        FetcherConfig config;
        config.base_url = "http://stub/api/v3";
        config.caller_id = caller;
        config.backoff_base = 1ms;
        config.backoff_max = 4ms;
        http = std::make_shared<StubHttpClient>(std::move(handler));
        fetcher = std::make_unique<MarketDataFetcher>(http, gate, cache, config,
                                                      std::make_shared<SyntheticSeriesGenerator>(42));
    }
};

} // namespace

TEST_CASE("History retries and fallback", "[fetcher]") {
    SECTION("Persistent rate limiting ends in a synthetic series") {
        FetcherFixture f([](const std::string&) { return http_status(429); });

        auto history = f.fetcher->fetch_history("bitcoin", 100.0);

        REQUIRE(f.http->call_count() == 3);
        REQUIRE(history.source == DataSource::Synthetic);
        REQUIRE(history.size() == 30);
        REQUIRE(history.back().close == Approx(100.0));
        REQUIRE_FALSE(f.cache.get_history("bitcoin").has_value());
    }

    SECTION("Rate limiting followed by success") {
        int calls = 0;
        FetcherFixture f([&calls](const std::string&) {
            return ++calls == 1 ? http_status(429) : http_status(200, ohlc_payload(closes_ending_at(100.0, 30)));
        });

        auto history = f.fetcher->fetch_history("bitcoin", 100.0);
        REQUIRE(f.http->call_count() == 2);
        REQUIRE(history.source == DataSource::Live);
    }

    SECTION("Unknown asset is not retried") {
        FetcherFixture f([](const std::string&) { return http_status(404); });

        auto history = f.fetcher->fetch_history("no-such-coin", 2.0);
        REQUIRE(f.http->call_count() == 1);
        REQUIRE(history.source == DataSource::Synthetic);
    }

    SECTION("Transport failures are retried") {
        FetcherFixture f([](const std::string&) { return http_transport_error("connection refused"); });

        auto history = f.fetcher->fetch_history("bitcoin", 100.0);
        REQUIRE(f.http->call_count() == 3);
        REQUIRE(history.source == DataSource::Synthetic);
    }

    SECTION("Client exceptions count as transport failures") {
        FetcherFixture f([](const std::string&) -> HttpResponse {
            throw std::runtime_error("socket closed");
        });

        auto history = f.fetcher->fetch_history("bitcoin", 100.0);
        REQUIRE(f.http->call_count() == 3);
        REQUIRE(history.source == DataSource::Synthetic);
    }

    SECTION("Malformed payload is not retried") {
        FetcherFixture f([](const std::string&) { return http_status(200, "<html>oops</html>"); });

        auto history = f.fetcher->fetch_history("bitcoin", 100.0);
        REQUIRE(f.http->call_count() == 1);
        REQUIRE(history.source == DataSource::Synthetic);
    }

    SECTION("Denied by another caller's intensive window") {
        FetcherFixture f([](const std::string&) { return http_status(200, "[]"); }, "portfolio");
        f.gate.begin_intensive("watchlist");

        auto history = f.fetcher->fetch_history("bitcoin", 100.0);
        REQUIRE(f.http->call_count() == 0);
        REQUIRE(history.source == DataSource::Synthetic);
        REQUIRE(history.size() == 30);
    }
}

TEST_CASE("Live history", "[fetcher]") {
    FetcherFixture f([](const std::string&) {
        return http_status(200, ohlc_payload(closes_ending_at(100.0, 31)));
    });

    SECTION("Parsed, cached and served from cache") {
        auto history = f.fetcher->fetch_history("BTC", 100.0);

        REQUIRE(history.source == DataSource::Live);
        REQUIRE(history.size() == 31);
        REQUIRE(history.back().close == Approx(100.0));
        for (size_t i = 1; i < history.size(); ++i) {
            REQUIRE(history.points[i].timestamp_ms > history.points[i - 1].timestamp_ms);
        }
        REQUIRE(history.points.front().volume > 0.0);

        REQUIRE(f.http->call_count() == 1);
        REQUIRE(f.http->urls().front() == "http://stub/api/v3/coins/bitcoin/ohlc?vs_currency=usd&days=30");
        REQUIRE(f.http->timeouts().front() == 15000);

        auto again = f.fetcher->fetch_history("bitcoin", 100.0);
        REQUIRE(f.http->call_count() == 1);
        REQUIRE(again.source == DataSource::Cached);
        REQUIRE(again.size() == 31);
    }

    SECTION("Final candle is pulled onto a diverging live price") {
        auto history = f.fetcher->fetch_history("bitcoin", 200.0);
        REQUIRE(history.back().close == 200.0);
        REQUIRE(history.back().high >= 200.0);
    }
}

TEST_CASE("OHLC parsing", "[fetcher]") {
    SyntheticSeriesGenerator volumes(7);
    nlohmann::json payload = nlohmann::json::array({
        {3000, 3.0, 3.5, 2.5, 3.2},
        {1000, 1.0, 1.5, 0.5, 1.2},
        {2000, 2.0, 2.5, 1.5, 2.2},
        {2000, 2.0, 2.6, 1.4, 2.4},
        {4000, 4.0}
    });

    auto points = MarketDataFetcher::parse_ohlc(payload, volumes);

    REQUIRE(points.size() == 3);
    REQUIRE(points[0].timestamp_ms == 1000);
    REQUIRE(points[1].timestamp_ms == 2000);
    REQUIRE(points[1].close == 2.4);
    REQUIRE(points[2].timestamp_ms == 3000);

    REQUIRE_THROWS_AS(MarketDataFetcher::parse_ohlc(nlohmann::json::object(), volumes),
                      std::invalid_argument);
}

TEST_CASE("Last candle reconciliation", "[fetcher]") {
    auto points = make_points({90.0, 100.0});

    SECTION("Within tolerance is left alone") {
        auto out = MarketDataFetcher::reconcile_last_candle(points, 105.0, 0.10);
        REQUIRE(out.back().close == 100.0);
    }

    SECTION("Beyond tolerance is replaced by the live price") {
        auto out = MarketDataFetcher::reconcile_last_candle(points, 150.0, 0.10);
        REQUIRE(out.back().close == 150.0);
        REQUIRE(out.back().high == 150.0);
        REQUIRE(out.back().low == 100.0);
        REQUIRE(out.back().open == 100.0);
        REQUIRE(out.back().timestamp_ms == points.back().timestamp_ms);
        REQUIRE(out.front().close == 90.0);
    }
}

TEST_CASE("Asset id normalization", "[fetcher]") {
    REQUIRE(MarketDataFetcher::normalize_id("btc") == "bitcoin");
    REQUIRE(MarketDataFetcher::normalize_id("ETH") == "ethereum");
    REQUIRE(MarketDataFetcher::normalize_id("avax") == "avalanche-2");
    REQUIRE(MarketDataFetcher::normalize_id("rndr") == "render-token");
    REQUIRE(MarketDataFetcher::normalize_id("pepe") == "pepe");
    REQUIRE(MarketDataFetcher::normalize_id("bitcoin") == "bitcoin");
}

TEST_CASE("Market metrics and volume", "[fetcher]") {
    SECTION("Parsed and shared with the volume cache") {
        FetcherFixture f([](const std::string&) {
            return http_status(200, market_payload(7.5, 1.2e12, 3.4e10));
        });

        auto metrics = f.fetcher->fetch_metrics("sol");
        REQUIRE(metrics.has_value());
        REQUIRE(metrics->pct_change_7d == 7.5);
        REQUIRE(metrics->pct_change_24h == 1.5);
        REQUIRE(metrics->market_cap_usd == 1.2e12);
        REQUIRE(metrics->total_volume_usd == std::optional<double>(3.4e10));

        auto url = f.http->urls().front();
        REQUIRE(url.find("/coins/solana?") != std::string::npos);
        REQUIRE(url.find("market_data=true") != std::string::npos);
        REQUIRE(f.http->timeouts().front() == 5000);

        REQUIRE(f.fetcher->fetch_volume("solana") == std::optional<double>(3.4e10));
        REQUIRE(f.fetcher->fetch_metrics("solana").has_value());
        REQUIRE(f.http->call_count() == 1);
    }

    SECTION("Volume fetch goes through the metrics endpoint") {
        FetcherFixture f([](const std::string&) {
            return http_status(200, market_payload(-2.0, 5e9, 1e8));
        });

        REQUIRE(f.fetcher->fetch_volume("cardano") == std::optional<double>(1e8));
        REQUIRE(f.http->calls_matching("/coins/cardano?") == 1);
    }

    SECTION("Unavailable metrics") {
        FetcherFixture f([](const std::string&) { return http_status(404); });

        REQUIRE_FALSE(f.fetcher->fetch_metrics("bitcoin").has_value());
        REQUIRE_FALSE(f.fetcher->fetch_volume("bitcoin").has_value());
    }
}

TEST_CASE("Spot price", "[fetcher]") {
    FetcherFixture f([](const std::string& url) {
        if (url.find("ids=bitcoin") != std::string::npos) {
            return http_status(200, R"({"bitcoin":{"usd":65000.5}})");
        }
        return http_status(200, "{}");
    });

    REQUIRE(f.fetcher->fetch_price("btc") == std::optional<double>(65000.5));
    REQUIRE(f.fetcher->fetch_price("bitcoin") == std::optional<double>(65000.5));
    REQUIRE(f.http->calls_matching("/simple/price?ids=bitcoin&vs_currencies=usd") == 1);

    REQUIRE_FALSE(f.fetcher->fetch_price("dogecoin").has_value());
}

TEST_CASE("Retry delay schedule", "[fetcher]") {
    RateGate gate(0ms);
    ResultCache cache;
    std::vector<std::chrono::milliseconds> sleeps;

    FetcherConfig config;
    config.base_url = "http://stub";
    config.max_attempts = 4;
    config.backoff_base = 100ms;
    config.backoff_max = 350ms;
    config.caller_id = "analysis";
    config.sleep = [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); };

    SECTION("Rate limiting doubles the delay up to the cap") {
        auto http = std::make_shared<StubHttpClient>([](const std::string&) { return http_status(429); });
        MarketDataFetcher fetcher(http, gate, cache, config, std::make_shared<SyntheticSeriesGenerator>(3));

        fetcher.fetch_history("bitcoin", 100.0);

        REQUIRE(http->call_count() == 4);
        REQUIRE(sleeps == std::vector<std::chrono::milliseconds>{100ms, 200ms, 350ms});
    }

    SECTION("Transport failures grow the delay linearly") {
        auto http = std::make_shared<StubHttpClient>([](const std::string&) {
            return http_transport_error("timeout");
        });
        MarketDataFetcher fetcher(http, gate, cache, config, std::make_shared<SyntheticSeriesGenerator>(3));

        fetcher.fetch_history("bitcoin", 100.0);

        REQUIRE(http->call_count() == 4);
        REQUIRE(sleeps == std::vector<std::chrono::milliseconds>{100ms, 200ms, 300ms});
    }

    SECTION("Permanent failures never sleep") {
        auto http = std::make_shared<StubHttpClient>([](const std::string&) { return http_status(404); });
        MarketDataFetcher fetcher(http, gate, cache, config, std::make_shared<SyntheticSeriesGenerator>(3));

        fetcher.fetch_history("bitcoin", 100.0);
        REQUIRE(sleeps.empty());
    }

    SECTION("Delay functions") {
        auto http = std::make_shared<StubHttpClient>([](const std::string&) { return http_status(404); });
        MarketDataFetcher fetcher(http, gate, cache, config);

        REQUIRE(fetcher.exponential_backoff(1) == 100ms);
        REQUIRE(fetcher.exponential_backoff(2) == 200ms);
        REQUIRE(fetcher.exponential_backoff(3) == 350ms);
        REQUIRE(fetcher.exponential_backoff(40) == 350ms);
        REQUIRE(fetcher.linear_backoff(1) == 100ms);
        REQUIRE(fetcher.linear_backoff(3) == 300ms);
        REQUIRE(fetcher.linear_backoff(4) == 350ms);
    }
}

TEST_CASE("Fetcher requires an HTTP client", "[fetcher]") {
    RateGate gate(0ms);
    ResultCache cache;
    REQUIRE_THROWS_AS(MarketDataFetcher(nullptr, gate, cache), std::invalid_argument);
}
