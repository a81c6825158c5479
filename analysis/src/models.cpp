#include "models.hpp"
#include "quality_scorer.hpp"
#include <fmt/format.h>
#include <algorithm>

const char* to_string(DataSource source) {
    switch (source) {
        case DataSource::Live:      return "live";
        case DataSource::Cached:    return "cached";
        case DataSource::Synthetic: return "synthetic";
    }
    return "unknown";
}

const char* to_string(Trend trend) {
    switch (trend) {
        case Trend::Bullish: return "bullish";
        case Trend::Bearish: return "bearish";
        case Trend::Neutral: return "neutral";
    }
    return "unknown";
}

const char* to_string(EntryTechnique technique) {
    switch (technique) {
        case EntryTechnique::RsiOversold:            return "rsi_oversold";
        case EntryTechnique::MacdBullishCrossover:   return "macd_bullish_crossover";
        case EntryTechnique::MovingAverageCrossover: return "moving_average_crossover";
        case EntryTechnique::SupportResistance:      return "support_resistance";
        case EntryTechnique::FibonacciRetracement:   return "fibonacci_retracement";
        case EntryTechnique::VolumeBreakout:         return "volume_breakout";
        case EntryTechnique::TrendlineBounce:        return "trendline_bounce";
    }
    return "unknown";
}

const char* to_string(SignalStrength strength) {
    switch (strength) {
        case SignalStrength::VeryWeak:   return "very_weak";
        case SignalStrength::Weak:       return "weak";
        case SignalStrength::Moderate:   return "moderate";
        case SignalStrength::Strong:     return "strong";
        case SignalStrength::VeryStrong: return "very_strong";
    }
    return "unknown";
}

const char* to_string(EntryQuality quality) {
    switch (quality) {
        case EntryQuality::VeryPoor:  return "very_poor";
        case EntryQuality::Poor:      return "poor";
        case EntryQuality::Average:   return "average";
        case EntryQuality::Good:      return "good";
        case EntryQuality::Excellent: return "excellent";
    }
    return "unknown";
}

const char* to_string(AnalysisStage stage) {
    switch (stage) {
        case AnalysisStage::Start:               return "start";
        case AnalysisStage::Fetching:            return "fetching";
        case AnalysisStage::ComputingIndicators: return "computing_indicators";
        case AnalysisStage::Enhancing:           return "enhancing";
        case AnalysisStage::GeneratingSignals:   return "generating_signals";
        case AnalysisStage::Scoring:             return "scoring";
        case AnalysisStage::Done:                return "done";
        case AnalysisStage::Error:               return "error";
    }
    return "unknown";
}

EntrySignal::EntrySignal(EntryTechnique technique, SignalStrength strength, std::string rationale,
                         double target_price, double stop_price, double confidence)
    : technique(technique)
    , strength(strength)
    , rationale(std::move(rationale))
    , target_price(target_price)
    , stop_price(stop_price)
    , confidence(std::clamp(confidence, 0.0, 1.0))
{}

IndicatorSet::IndicatorSet()
    : quality_(QualityScorer::rate(signals_))
{}

void IndicatorSet::add_signal(EntrySignal signal) {
    signals_.push_back(std::move(signal));
    quality_ = QualityScorer::rate(signals_);
}

double IndicatorSet::quality_score() const {
    switch (quality_) {
        case EntryQuality::Excellent: return 95.0;
        case EntryQuality::Good:      return 80.0;
        case EntryQuality::Average:   return 60.0;
        case EntryQuality::Poor:      return 30.0;
        case EntryQuality::VeryPoor:  return 10.0;
    }
    return 0.0;
}

double IndicatorSet::volume_ratio() const {
    if (average_volume_20 > 0) {
        return current_volume / average_volume_20;
    }
    return 1.0;
}

std::string IndicatorSet::summary() const {
    std::string out = fmt::format(
        "Technical analysis: {} @ ${:.4f} ({} data)\n"
        "Entry quality: {} ({:.0f}/100)\n"
        "Trend: {}\n"
        "Support: ${:.2f}  Resistance: ${:.2f}\n"
        "RSI: {:.1f}{}\n"
        "MACD: {:.4f} ({})\n"
        "SMA10/50: ${:.2f}/${:.2f}\n",
        asset_id, analyzed_price, to_string(data_source),
        to_string(quality_), quality_score(),
        to_string(trend),
        support, resistance,
        rsi, rsi < 30 ? " (oversold)" : rsi > 70 ? " (overbought)" : "",
        macd, macd > macd_signal ? "bullish" : "bearish",
        sma10, sma50);

    if (!signals_.empty()) {
        out += "Entry signals:\n";
        for (const auto& s : signals_) {
            out += fmt::format("  - [{}] {}: {} (target ${:.2f}, stop ${:.2f}, conf {:.2f})\n",
                               to_string(s.strength), to_string(s.technique), s.rationale,
                               s.target_price, s.stop_price, s.confidence);
        }
    }

    return out;
}

void to_json(nlohmann::json& j, const PricePoint& p) {
    j = nlohmann::json::array({p.timestamp_ms, p.open, p.high, p.low, p.close, p.volume});
}

void from_json(const nlohmann::json& j, PricePoint& p) {
    p.timestamp_ms = j.at(0).get<int64_t>();
    p.open = j.at(1).get<double>();
    p.high = j.at(2).get<double>();
    p.low = j.at(3).get<double>();
    p.close = j.at(4).get<double>();
    p.volume = j.size() > 5 ? j.at(5).get<double>() : 0.0;
}

void to_json(nlohmann::json& j, const MarketMetrics& m) {
    j = {
        {"market_cap_usd", m.market_cap_usd},
        {"pct_change_7d", m.pct_change_7d},
        {"pct_change_24h", m.pct_change_24h}
    };
    if (m.total_volume_usd) {
        j["total_volume_usd"] = *m.total_volume_usd;
    }
}

void from_json(const nlohmann::json& j, MarketMetrics& m) {
    m.market_cap_usd = j.value("market_cap_usd", 0.0);
    m.pct_change_7d = j.value("pct_change_7d", 0.0);
    m.pct_change_24h = j.value("pct_change_24h", 0.0);
    if (j.contains("total_volume_usd")) {
        m.total_volume_usd = j["total_volume_usd"].get<double>();
    }
}

void to_json(nlohmann::json& j, const EntrySignal& s) {
    j = {
        {"technique", to_string(s.technique)},
        {"strength", to_string(s.strength)},
        {"rationale", s.rationale},
        {"target_price", s.target_price},
        {"stop_price", s.stop_price},
        {"confidence", s.confidence}
    };
}

void to_json(nlohmann::json& j, const IndicatorSet& set) {
    j = {
        {"asset_id", set.asset_id},
        {"price", set.analyzed_price},
        {"data_source", to_string(set.data_source)},
        {"stage", to_string(set.stage)},
        {"analyzed_at_ms", set.analyzed_at_ms},
        {"rsi", set.rsi},
        {"macd", set.macd},
        {"macd_signal", set.macd_signal},
        {"sma10", set.sma10},
        {"sma50", set.sma50},
        {"ema10", set.ema10},
        {"ema50", set.ema50},
        {"support", set.support},
        {"resistance", set.resistance},
        {"fib_382", set.fib_382},
        {"fib_500", set.fib_500},
        {"fib_618", set.fib_618},
        {"average_volume_20", set.average_volume_20},
        {"current_volume", set.current_volume},
        {"volume_confirmed", set.volume_confirmed},
        {"volume_ratio", set.volume_ratio()},
        {"trend", to_string(set.trend)},
        {"trendline_support", set.trendline_support},
        {"trendline_resistance", set.trendline_resistance},
        {"entry_quality", to_string(set.entry_quality())},
        {"quality_score", set.quality_score()},
        {"signals", set.signals()}
    };
}
