#pragma once

#include "models.hpp"
#include "market_data_fetcher.hpp"
#include "rate_gate.hpp"
#include "worker_pool.hpp"
#include <future>
#include <string>
#include <vector>

// Per-asset pipeline:
//   start -> fetching -> computing_indicators -> enhancing -> generating_signals
//         -> scoring -> done
// Any exception moves the run to the error state, which yields a fixed
// very-poor result instead of propagating to the caller.
class AnalysisOrchestrator {
public:
    AnalysisOrchestrator(MarketDataFetcher& fetcher, RateGate& gate, WorkerPool& pool,
                         std::string batch_caller_id = "watchlist");

    // Queue one asset on the worker pool. Results of separate calls may
    // complete in any order.
    std::future<IndicatorSet> analyze(const std::string& asset_id, double current_price);

    // Analyse several assets while holding the RateGate intensive window under
    // the batch identity. Blocks until every run finished; results are in
    // request order.
    std::vector<IndicatorSet> analyze_batch(const std::vector<AssetQuote>& quotes);

    // Run the pipeline on the calling thread
    IndicatorSet run(const std::string& asset_id, double current_price);

    static IndicatorSet error_result(const std::string& asset_id, double current_price);

private:
    MarketDataFetcher& fetcher_;
    RateGate& gate_;
    WorkerPool& pool_;
    std::string batch_caller_id_;
};
