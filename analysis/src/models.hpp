#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

// One OHLC candle
struct PricePoint {
    int64_t timestamp_ms;
    double open;
    double high;
    double low;
    double close;
    double volume;
};

enum class DataSource {
    Live,       // Fetched from the provider during this run
    Cached,     // Served from ResultCache
    Synthetic   // Generated locally because the provider was unavailable
};

struct PriceHistory {
    std::vector<PricePoint> points;
    DataSource source = DataSource::Live;

    bool empty() const { return points.empty(); }
    size_t size() const { return points.size(); }
    const PricePoint& back() const { return points.back(); }
};

// Asset to analyse at a known live price
struct AssetQuote {
    std::string id;
    double price;
};

struct MarketMetrics {
    double market_cap_usd = 0.0;
    double pct_change_7d = 0.0;
    double pct_change_24h = 0.0;
    std::optional<double> total_volume_usd;
};

enum class Trend { Bullish, Bearish, Neutral };

enum class EntryTechnique {
    RsiOversold,
    MacdBullishCrossover,
    MovingAverageCrossover,
    SupportResistance,
    FibonacciRetracement,
    VolumeBreakout,
    TrendlineBounce
};

enum class SignalStrength { VeryWeak, Weak, Moderate, Strong, VeryStrong };

enum class EntryQuality { VeryPoor, Poor, Average, Good, Excellent };

// Pipeline stages of a single analysis run
enum class AnalysisStage {
    Start,
    Fetching,
    ComputingIndicators,
    Enhancing,
    GeneratingSignals,
    Scoring,
    Done,
    Error
};

const char* to_string(DataSource source);
const char* to_string(Trend trend);
const char* to_string(EntryTechnique technique);
const char* to_string(SignalStrength strength);
const char* to_string(EntryQuality quality);
const char* to_string(AnalysisStage stage);

struct EntrySignal {
    EntryTechnique technique;
    SignalStrength strength;
    std::string rationale;
    double target_price;
    double stop_price;
    double confidence;  // Clamped to [0, 1]

    EntrySignal(EntryTechnique technique, SignalStrength strength, std::string rationale,
                double target_price, double stop_price, double confidence);
};

// Computed per-asset state of one analysis run.
// The signal list is append-only and the entry quality is recomputed on every
// append, so the rating can never disagree with the signals it was derived from.
class IndicatorSet {
public:
    IndicatorSet();

    std::string asset_id;
    double analyzed_price = 0.0;
    DataSource data_source = DataSource::Live;
    AnalysisStage stage = AnalysisStage::Start;
    int64_t analyzed_at_ms = 0;

    double rsi = 50.0;
    double macd = 0.0;
    double macd_signal = 0.0;
    double sma10 = 0.0;
    double sma50 = 0.0;
    double ema10 = 0.0;
    double ema50 = 0.0;

    double support = 0.0;
    double resistance = 0.0;
    double fib_382 = 0.0;
    double fib_500 = 0.0;
    double fib_618 = 0.0;

    double average_volume_20 = 0.0;
    double current_volume = 0.0;
    bool volume_confirmed = false;

    Trend trend = Trend::Neutral;
    double trendline_support = 0.0;
    double trendline_resistance = 0.0;

    void add_signal(EntrySignal signal);
    const std::vector<EntrySignal>& signals() const { return signals_; }
    EntryQuality entry_quality() const { return quality_; }

    // 0-100 display score for the current rating
    double quality_score() const;
    double volume_ratio() const;
    std::string summary() const;

private:
    std::vector<EntrySignal> signals_;
    EntryQuality quality_;
};

void to_json(nlohmann::json& j, const PricePoint& p);
void from_json(const nlohmann::json& j, PricePoint& p);
void to_json(nlohmann::json& j, const MarketMetrics& m);
void from_json(const nlohmann::json& j, MarketMetrics& m);
void to_json(nlohmann::json& j, const EntrySignal& s);
void to_json(nlohmann::json& j, const IndicatorSet& set);
