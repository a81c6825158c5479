#pragma once

#include "models.hpp"
#include "http_client.hpp"
#include "rate_gate.hpp"
#include "result_cache.hpp"
#include "synthetic_series.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <chrono>
#include <functional>

struct FetcherConfig {
    std::string base_url = "https://api.coingecko.com/api/v3";
    std::string caller_id = "analysis";   // Identity presented to the RateGate
    int history_days = 30;
    int history_timeout_ms = 15000;
    int metrics_timeout_ms = 5000;
    int max_attempts = 3;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_max{8000};
    double reconcile_tolerance = 0.10;    // Max last-close drift from the live price

    // Sleeps between retries; std::this_thread::sleep_for when empty
    std::function<void(std::chrono::milliseconds)> sleep;
};

// CoinGecko market data for one asset at a time, throttled through the shared
// RateGate and memoized in the shared ResultCache. History requests never fail:
// when the provider cannot deliver, a synthetic series is returned instead.
class MarketDataFetcher {
public:
    MarketDataFetcher(std::shared_ptr<HttpClient> http,
                      RateGate& gate,
                      ResultCache& cache,
                      FetcherConfig config = FetcherConfig(),
                      std::shared_ptr<SyntheticSeriesGenerator> synthetic = nullptr);

    // Ticker aliases ("btc" -> "bitcoin"); unknown ids pass through unchanged
    static std::string normalize_id(const std::string& asset_id);

    PriceHistory fetch_history(const std::string& asset_id, double current_price);
    std::optional<MarketMetrics> fetch_metrics(const std::string& asset_id);
    std::optional<double> fetch_volume(const std::string& asset_id);
    std::optional<double> fetch_price(const std::string& asset_id);

    // [[ts, o, h, l, c], ...] -> ascending candles with estimated volume.
    // Rows shorter than five fields are skipped; duplicate timestamps keep the last row.
    static std::vector<PricePoint> parse_ohlc(const nlohmann::json& payload,
                                              SyntheticSeriesGenerator& volumes);

    // Pull the final candle onto current_price when its close drifted more than
    // `tolerance` away; timestamp, open and volume are preserved.
    static std::vector<PricePoint> reconcile_last_candle(std::vector<PricePoint> points,
                                                         double current_price,
                                                         double tolerance);

    // Delay before retry number `attempt` (1-based), capped at backoff_max:
    // doubling after a 429, growing linearly after a transport failure
    std::chrono::milliseconds exponential_backoff(int attempt) const;
    std::chrono::milliseconds linear_backoff(int attempt) const;

    const FetcherConfig& config() const { return config_; }

private:
    std::shared_ptr<HttpClient> http_;
    RateGate& gate_;
    ResultCache& cache_;
    FetcherConfig config_;
    std::shared_ptr<SyntheticSeriesGenerator> synthetic_;

    // GET with rate gating and retries; nullopt when the payload is unusable
    std::optional<nlohmann::json> request_json(const std::string& url, int timeout_ms,
                                               const std::string& operation);

    void pause(std::chrono::milliseconds delay) const;

    PriceHistory synthetic_history(const std::string& id, double current_price);
};
