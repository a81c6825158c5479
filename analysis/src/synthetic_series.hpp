#pragma once

#include "models.hpp"
#include <random>
#include <mutex>
#include <cstdint>

// Plausible daily OHLC series used when the provider cannot be reached.
// The generator is seeded explicitly so tests can reproduce a series.
class SyntheticSeriesGenerator {
public:
    explicit SyntheticSeriesGenerator(uint64_t seed = std::random_device{}());

    // `days` daily candles ending today whose final close equals current_price.
    // Daily moves of up to +/-5% are compounded backward from today; each
    // candle's open is jittered +/-1% from its close and high/low extend 0-3%
    // beyond the body.
    PriceHistory generate(double current_price, int days, int64_t now_ms);

    // Volume estimate by price tier: higher unit prices trade lower volume
    double estimate_volume(double price);

private:
    std::mutex mutex_;
    std::mt19937_64 rng_;

    double uniform(double lo, double hi);
    double tier_volume(double price);  // Caller holds mutex_
};
