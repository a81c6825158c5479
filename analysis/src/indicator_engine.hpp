#pragma once

#include "models.hpp"
#include <vector>
#include <optional>

struct MacdResult {
    double macd = 0.0;
    double signal = 0.0;
};

struct SupportResistance {
    double support = 0.0;
    double resistance = 0.0;
};

struct FibonacciLevels {
    double fib_382 = 0.0;
    double fib_500 = 0.0;
    double fib_618 = 0.0;
};

struct VolumeStats {
    double average = 0.0;
    double current = 0.0;
    bool confirmed = false;
};

// Pure technical-analysis math over a price history. No I/O, no shared state.
class IndicatorEngine {
public:
    static constexpr int kRsiPeriod = 14;
    static constexpr int kMacdFast = 12;
    static constexpr int kMacdSlow = 26;
    static constexpr int kShortPeriod = 10;
    static constexpr int kLongPeriod = 50;
    static constexpr int kVolumePeriod = 20;
    static constexpr int kTrendWindow = 10;
    static constexpr int kLevelSamples = 5;

    // Throws std::invalid_argument when timestamps decrease
    static void validate(const std::vector<PricePoint>& points);

    // Simple-average RSI of the trailing `period` close-to-close changes.
    // 50 with fewer than period+1 points, 100 when there were no losses.
    static double rsi(const std::vector<PricePoint>& points, int period = kRsiPeriod);

    // Both return 0 when fewer than `period` points are available
    static double sma(const std::vector<PricePoint>& points, int period);
    static double ema(const std::vector<PricePoint>& points, int period);

    // MACD = EMA12 - EMA26; the signal line is approximated as 0.9 * MACD
    static MacdResult macd(const std::vector<PricePoint>& points);

    // Mean of the five lowest lows / five highest highs
    static SupportResistance support_resistance(const std::vector<PricePoint>& points);

    // 38.2/50/61.8% retracements down from the swing high
    static FibonacciLevels fibonacci(const std::vector<PricePoint>& points);

    // Trailing 20-point average; `live_volume` replaces the last candle's volume when positive
    static VolumeStats volume(const std::vector<PricePoint>& points, std::optional<double> live_volume);

    // Mean close of the last 10 points against the 10 before them
    static Trend trend(const std::vector<PricePoint>& points);

    // Fill every indicator field of `out` from `history`
    static void compute(const PriceHistory& history, std::optional<double> live_volume,
                        IndicatorSet& out);

    // Upgrade a neutral trend from the provider's 7-day change (beyond +/-5%).
    // Returns true when the trend changed.
    static bool enhance_trend(IndicatorSet& set, const MarketMetrics& metrics);
};
