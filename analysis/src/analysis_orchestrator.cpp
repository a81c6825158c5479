#include "analysis_orchestrator.hpp"
#include "indicator_engine.hpp"
#include "signal_generator.hpp"
#include "quality_scorer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

AnalysisOrchestrator::AnalysisOrchestrator(MarketDataFetcher& fetcher, RateGate& gate,
                                           WorkerPool& pool, std::string batch_caller_id)
    : fetcher_(fetcher)
    , gate_(gate)
    , pool_(pool)
    , batch_caller_id_(std::move(batch_caller_id))
{}

std::future<IndicatorSet> AnalysisOrchestrator::analyze(const std::string& asset_id,
                                                        double current_price) {
    return pool_.submit([this, asset_id, current_price]() {
        return run(asset_id, current_price);
    });
}

std::vector<IndicatorSet> AnalysisOrchestrator::analyze_batch(const std::vector<AssetQuote>& quotes) {
    IntensiveScope intensive(gate_, batch_caller_id_);

    std::vector<std::future<IndicatorSet>> pending;
    pending.reserve(quotes.size());
    for (const auto& quote : quotes) {
        pending.push_back(analyze(quote.id, quote.price));
    }

    std::vector<IndicatorSet> results;
    results.reserve(pending.size());
    for (auto& f : pending) {
        results.push_back(f.get());
    }

    spdlog::info("Completed analysis for all {} assets", results.size());
    return results;
}

IndicatorSet AnalysisOrchestrator::run(const std::string& asset_id, double current_price) {
    IndicatorSet set;
    set.asset_id = asset_id;
    set.analyzed_price = current_price;

    auto advance = [&](AnalysisStage next) {
        set.stage = next;
        spdlog::debug("{}: {}", asset_id, to_string(next));
    };

    try {
        spdlog::info("Starting technical analysis for {}", asset_id);
        if (!(current_price > 0)) {
            throw std::invalid_argument("current price must be positive");
        }

        advance(AnalysisStage::Fetching);
        PriceHistory history = fetcher_.fetch_history(asset_id, current_price);
        set.data_source = history.source;
        // One metrics lookup per run serves both the live volume and trend enhancement
        std::optional<MarketMetrics> metrics = fetcher_.fetch_metrics(asset_id);
        std::optional<double> live_volume;
        if (metrics) {
            live_volume = metrics->total_volume_usd;
        }

        advance(AnalysisStage::ComputingIndicators);
        IndicatorEngine::compute(history, live_volume, set);

        advance(AnalysisStage::Enhancing);
        if (metrics) {
            IndicatorEngine::enhance_trend(set, *metrics);
        }

        advance(AnalysisStage::GeneratingSignals);
        SignalGenerator::generate(set, current_price);

        advance(AnalysisStage::Scoring);
        double score = QualityScorer::score(set.signals());

        advance(AnalysisStage::Done);
        set.analyzed_at_ms = util::current_timestamp_ms();

        spdlog::info("Technical analysis completed for {} - quality: {} (score {:.2f}, {} signals, {} data)",
                     asset_id, to_string(set.entry_quality()), score, set.signals().size(),
                     to_string(set.data_source));
        return set;

    } catch (const std::exception& e) {
        spdlog::error("Technical analysis for {} failed during {}: {}",
                      asset_id, to_string(set.stage), e.what());
        return error_result(asset_id, current_price);
    }
}

IndicatorSet AnalysisOrchestrator::error_result(const std::string& asset_id, double current_price) {
    IndicatorSet set;
    set.asset_id = asset_id;
    set.analyzed_price = current_price;
    set.stage = AnalysisStage::Error;
    set.trend = Trend::Neutral;
    set.analyzed_at_ms = util::current_timestamp_ms();
    set.add_signal(EntrySignal(
        EntryTechnique::SupportResistance, SignalStrength::VeryWeak,
        "Technical analysis failed - manual review required",
        0.0, 0.0, 0.0));
    return set;
}
