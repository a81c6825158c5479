#include "indicator_engine.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>
#include <numeric>
#include <stdexcept>

namespace {

double mean_close(std::vector<PricePoint>::const_iterator first,
                  std::vector<PricePoint>::const_iterator last) {
    double sum = 0.0;
    size_t n = 0;
    for (auto it = first; it != last; ++it, ++n) {
        sum += it->close;
    }
    return n > 0 ? sum / n : 0.0;
}

} // namespace

void IndicatorEngine::validate(const std::vector<PricePoint>& points) {
    for (size_t i = 1; i < points.size(); ++i) {
        if (points[i].timestamp_ms < points[i - 1].timestamp_ms) {
            throw std::invalid_argument("price history timestamps are not ascending at index "
                                        + std::to_string(i));
        }
    }
}

double IndicatorEngine::rsi(const std::vector<PricePoint>& points, int period) {
    if (period <= 0 || points.size() < static_cast<size_t>(period) + 1) {
        return 50.0;
    }

    double gains = 0.0;
    double losses = 0.0;
    for (size_t i = points.size() - period; i < points.size(); ++i) {
        double change = points[i].close - points[i - 1].close;
        if (change > 0) {
            gains += change;
        } else {
            losses -= change;
        }
    }

    double avg_gain = gains / period;
    double avg_loss = losses / period;

    if (avg_loss == 0.0) {
        return 100.0;
    }

    double rs = avg_gain / avg_loss;
    return std::clamp(100.0 - (100.0 / (1.0 + rs)), 0.0, 100.0);
}

double IndicatorEngine::sma(const std::vector<PricePoint>& points, int period) {
    if (period <= 0 || points.size() < static_cast<size_t>(period)) {
        return 0.0;
    }
    return mean_close(points.end() - period, points.end());
}

double IndicatorEngine::ema(const std::vector<PricePoint>& points, int period) {
    if (period <= 0 || points.size() < static_cast<size_t>(period)) {
        return 0.0;
    }

    const double k = 2.0 / (period + 1.0);
    double value = mean_close(points.begin(), points.begin() + period);  // SMA seed

    for (size_t i = period; i < points.size(); ++i) {
        value = points[i].close * k + value * (1.0 - k);
    }
    return value;
}

MacdResult IndicatorEngine::macd(const std::vector<PricePoint>& points) {
    MacdResult result;
    if (points.size() < static_cast<size_t>(kMacdSlow)) {
        return result;
    }

    result.macd = ema(points, kMacdFast) - ema(points, kMacdSlow);
    // Approximated as 0.9 * MACD, not a 9-period EMA of the MACD line
    result.signal = result.macd * 0.9;
    return result;
}

SupportResistance IndicatorEngine::support_resistance(const std::vector<PricePoint>& points) {
    SupportResistance levels;
    if (points.empty()) {
        return levels;
    }

    std::vector<double> lows;
    std::vector<double> highs;
    lows.reserve(points.size());
    highs.reserve(points.size());
    for (const auto& p : points) {
        lows.push_back(p.low);
        highs.push_back(p.high);
    }

    size_t n = std::min(points.size(), static_cast<size_t>(kLevelSamples));

    std::partial_sort(lows.begin(), lows.begin() + n, lows.end());
    std::partial_sort(highs.begin(), highs.begin() + n, highs.end(), std::greater<double>());

    levels.support = std::accumulate(lows.begin(), lows.begin() + n, 0.0) / n;
    levels.resistance = std::accumulate(highs.begin(), highs.begin() + n, 0.0) / n;
    return levels;
}

FibonacciLevels IndicatorEngine::fibonacci(const std::vector<PricePoint>& points) {
    FibonacciLevels levels;
    if (points.empty()) {
        return levels;
    }

    double swing_high = points.front().high;
    double swing_low = points.front().low;
    for (const auto& p : points) {
        swing_high = std::max(swing_high, p.high);
        swing_low = std::min(swing_low, p.low);
    }

    double range = swing_high - swing_low;
    levels.fib_382 = swing_high - range * 0.382;
    levels.fib_500 = swing_high - range * 0.5;
    levels.fib_618 = swing_high - range * 0.618;
    return levels;
}

VolumeStats IndicatorEngine::volume(const std::vector<PricePoint>& points,
                                    std::optional<double> live_volume) {
    VolumeStats stats;

    if (live_volume && *live_volume > 0) {
        stats.current = *live_volume;
    } else if (!points.empty()) {
        stats.current = points.back().volume;
    }

    // Average and confirmation need a full window
    if (points.size() < static_cast<size_t>(kVolumePeriod)) {
        return stats;
    }

    double sum = 0.0;
    for (size_t i = points.size() - kVolumePeriod; i < points.size(); ++i) {
        sum += points[i].volume;
    }
    stats.average = sum / kVolumePeriod;
    stats.confirmed = stats.current > stats.average * 1.5;
    return stats;
}

Trend IndicatorEngine::trend(const std::vector<PricePoint>& points) {
    if (points.size() < static_cast<size_t>(2 * kTrendWindow)) {
        return Trend::Neutral;
    }

    auto recent_begin = points.end() - kTrendWindow;
    double recent = mean_close(recent_begin, points.end());
    double older = mean_close(recent_begin - kTrendWindow, recent_begin);

    if (recent >= older * 1.02) return Trend::Bullish;
    if (recent <= older * 0.98) return Trend::Bearish;
    return Trend::Neutral;
}

void IndicatorEngine::compute(const PriceHistory& history, std::optional<double> live_volume,
                              IndicatorSet& out) {
    const auto& points = history.points;
    validate(points);

    out.rsi = rsi(points);

    auto m = macd(points);
    out.macd = m.macd;
    out.macd_signal = m.signal;

    out.sma10 = sma(points, kShortPeriod);
    out.ema10 = ema(points, kShortPeriod);
    out.sma50 = sma(points, kLongPeriod);
    out.ema50 = ema(points, kLongPeriod);

    auto levels = support_resistance(points);
    out.support = levels.support;
    out.resistance = levels.resistance;

    auto fib = fibonacci(points);
    out.fib_382 = fib.fib_382;
    out.fib_500 = fib.fib_500;
    out.fib_618 = fib.fib_618;

    auto vol = volume(points, live_volume);
    out.average_volume_20 = vol.average;
    out.current_volume = vol.current;
    out.volume_confirmed = vol.confirmed;

    out.trend = trend(points);
    // Simplified trendlines derived from the level averages, only with a full trend window
    if (points.size() >= static_cast<size_t>(2 * kTrendWindow)) {
        out.trendline_support = out.support * 0.95;
        out.trendline_resistance = out.resistance * 1.05;
    }
}

bool IndicatorEngine::enhance_trend(IndicatorSet& set, const MarketMetrics& metrics) {
    if (set.trend != Trend::Neutral) {
        return false;
    }

    if (metrics.pct_change_7d > 5.0) {
        set.trend = Trend::Bullish;
    } else if (metrics.pct_change_7d < -5.0) {
        set.trend = Trend::Bearish;
    } else {
        return false;
    }

    spdlog::debug("Enhanced trend to {} based on 7d change {:.2f}%",
                  to_string(set.trend), metrics.pct_change_7d);
    return true;
}
