#include "signal_generator.hpp"
#include <spdlog/spdlog.h>

size_t SignalGenerator::generate(IndicatorSet& set, double price) {
    size_t before = set.signals().size();

    rsi_oversold(set, price);
    macd_crossover(set, price);
    golden_cross(set, price);
    support_bounce(set, price);
    fibonacci_retracement(set, price);
    volume_breakout(set, price);
    trendline_bounce(set, price);

    size_t fired = set.signals().size() - before;
    spdlog::debug("{}: {} entry signal(s) at ${:.6f}", set.asset_id, fired, price);
    return fired;
}

void SignalGenerator::rsi_oversold(IndicatorSet& set, double price) {
    if (set.rsi >= 30) return;

    set.add_signal(EntrySignal(
        EntryTechnique::RsiOversold, SignalStrength::Strong,
        "RSI indicates oversold conditions - potential bounce",
        price * 1.05, price * 0.95, 0.75));
}

void SignalGenerator::macd_crossover(IndicatorSet& set, double price) {
    if (!(set.macd > set.macd_signal && set.macd > 0)) return;

    set.add_signal(EntrySignal(
        EntryTechnique::MacdBullishCrossover, SignalStrength::Moderate,
        "MACD line above signal line - bullish momentum",
        price * 1.08, price * 0.92, 0.70));
}

void SignalGenerator::golden_cross(IndicatorSet& set, double price) {
    // sma10 == 0 means too little history
    if (!(set.sma10 > set.sma50 && set.sma10 > 0)) return;

    set.add_signal(EntrySignal(
        EntryTechnique::MovingAverageCrossover, SignalStrength::Strong,
        "Golden cross - short moving average above long moving average",
        price * 1.10, price * 0.90, 0.80));
}

void SignalGenerator::support_bounce(IndicatorSet& set, double price) {
    if (price > set.support * 1.02) return;

    set.add_signal(EntrySignal(
        EntryTechnique::SupportResistance, SignalStrength::Moderate,
        "Price near support level - potential bounce opportunity",
        set.resistance, set.support * 0.95, 0.65));
}

void SignalGenerator::fibonacci_retracement(IndicatorSet& set, double price) {
    if (price > set.fib_618 * 1.01) return;

    set.add_signal(EntrySignal(
        EntryTechnique::FibonacciRetracement, SignalStrength::Moderate,
        "Price at 61.8% Fibonacci retracement - key support level",
        set.fib_382, set.fib_618 * 0.97, 0.70));
}

void SignalGenerator::volume_breakout(IndicatorSet& set, double price) {
    if (!(set.volume_confirmed && set.trend == Trend::Bullish)) return;

    set.add_signal(EntrySignal(
        EntryTechnique::VolumeBreakout, SignalStrength::VeryStrong,
        "High volume breakout with bullish trend confirmed",
        price * 1.15, price * 0.88, 0.85));
}

void SignalGenerator::trendline_bounce(IndicatorSet& set, double price) {
    if (!(price <= set.trendline_support * 1.01 && set.trend == Trend::Bullish)) return;

    set.add_signal(EntrySignal(
        EntryTechnique::TrendlineBounce, SignalStrength::Strong,
        "Price bouncing off ascending trendline support",
        set.trendline_resistance, set.trendline_support * 0.96, 0.78));
}
