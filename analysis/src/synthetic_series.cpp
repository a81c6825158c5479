#include "synthetic_series.hpp"
#include <algorithm>

namespace {
constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;
}

SyntheticSeriesGenerator::SyntheticSeriesGenerator(uint64_t seed)
    : rng_(seed)
{}

double SyntheticSeriesGenerator::uniform(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

PriceHistory SyntheticSeriesGenerator::generate(double current_price, int days, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    PriceHistory history;
    history.source = DataSource::Synthetic;
    if (days <= 0) {
        return history;
    }
    history.points.resize(static_cast<size_t>(days));

    int64_t today = now_ms - (now_ms % kDayMs);
    double close = current_price;

    for (int i = days - 1; i >= 0; --i) {
        double open = close * (1.0 + uniform(-0.01, 0.01));
        double high = std::max(open, close) * (1.0 + uniform(0.0, 0.03));
        double low = std::min(open, close) * (1.0 - uniform(0.0, 0.03));

        PricePoint& p = history.points[static_cast<size_t>(i)];
        p.timestamp_ms = today - static_cast<int64_t>(days - 1 - i) * kDayMs;
        p.open = open;
        p.high = high;
        p.low = low;
        p.close = close;
        p.volume = tier_volume(close);

        // Previous day's close
        close = close / (1.0 + uniform(-0.05, 0.05));
    }

    return history;
}

double SyntheticSeriesGenerator::estimate_volume(double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tier_volume(price);
}

double SyntheticSeriesGenerator::tier_volume(double price) {
    double r = uniform(0.0, 1.0);

    if (price > 10000) {        // BTC-like
        return 500000 + r * 2000000;
    } else if (price > 1000) {  // ETH-like
        return 1000000 + r * 5000000;
    } else if (price > 100) {
        return 2000000 + r * 10000000;
    } else if (price > 1) {
        return 5000000 + r * 20000000;
    }
    return 10000000 + r * 50000000;  // Small caps
}
