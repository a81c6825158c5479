#pragma once

#include "models.hpp"

// Entry-signal rules. Each rule is evaluated independently, so a run can
// produce any number of signals.
class SignalGenerator {
public:
    // Appends every matching signal to `set`; returns how many fired
    static size_t generate(IndicatorSet& set, double price);

private:
    static void rsi_oversold(IndicatorSet& set, double price);
    static void macd_crossover(IndicatorSet& set, double price);
    static void golden_cross(IndicatorSet& set, double price);
    static void support_bounce(IndicatorSet& set, double price);
    static void fibonacci_retracement(IndicatorSet& set, double price);
    static void volume_breakout(IndicatorSet& set, double price);
    static void trendline_bounce(IndicatorSet& set, double price);
};
