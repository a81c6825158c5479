#pragma once

#include "models.hpp"
#include "rate_gate.hpp"
#include "result_cache.hpp"
#include "worker_pool.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>

class HealthCheck {
public:
    HealthCheck(const RateGate& gate, const ResultCache& cache, const WorkerPool& pool);

    void record_analysis(const IndicatorSet& result);

    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    const RateGate& gate_;
    const ResultCache& cache_;
    const WorkerPool& pool_;

    std::atomic<uint64_t> analyses_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> synthetic_{0};
    std::atomic<int64_t> last_analysis_ms_{0};
};
