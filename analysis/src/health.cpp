#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(const RateGate& gate, const ResultCache& cache, const WorkerPool& pool)
    : gate_(gate), cache_(cache), pool_(pool) {}

void HealthCheck::record_analysis(const IndicatorSet& result) {
    analyses_++;
    if (result.stage == AnalysisStage::Error) {
        failures_++;
    }
    if (result.data_source == DataSource::Synthetic) {
        synthetic_++;
    }
    last_analysis_ms_ = result.analyzed_at_ms;
}

bool HealthCheck::is_healthy() const {
    // Unhealthy only when every analysis so far has failed
    uint64_t total = analyses_.load();
    return total == 0 || failures_.load() < total;
}

nlohmann::json HealthCheck::get_status() const {
    auto holder = gate_.intensive_holder();

    return {
        {"ok", is_healthy()},
        {"ts", util::current_iso8601()},
        {"workers", pool_.size()},
        {"queued", pool_.pending()},
        {"analyses", analyses_.load()},
        {"failures", failures_.load()},
        {"synthetic", synthetic_.load()},
        {"last_analysis_ms", last_analysis_ms_.load()},
        {"rate_gate", {
            {"next_slot_ms", gate_.time_until_next_slot().count()},
            {"intensive_holder", holder ? *holder : ""}
        }},
        {"cache", cache_.stats()}
    };
}
