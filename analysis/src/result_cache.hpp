#pragma once

#include "models.hpp"
#include "ttl_store.hpp"
#include <string>
#include <optional>
#include <functional>
#include <atomic>
#include <chrono>

enum class CacheKind { Ohlc, Metrics, Price, Volume };

const char* to_string(CacheKind kind);

struct CacheTtls {
    std::chrono::milliseconds ohlc = std::chrono::minutes(30);
    std::chrono::milliseconds metrics = std::chrono::minutes(15);
    std::chrono::milliseconds price = std::chrono::minutes(2);
    std::chrono::milliseconds volume = std::chrono::minutes(5);
};

struct CacheStats {
    uint64_t requests = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    size_t ohlc_entries = 0;
    size_t metrics_entries = 0;
    size_t price_entries = 0;
    size_t volume_entries = 0;

    double hit_rate() const { return requests > 0 ? static_cast<double>(hits) / requests : 0.0; }
};

void to_json(nlohmann::json& j, const CacheStats& stats);

// Time-bounded memoization of provider responses, keyed by canonical asset id.
// Each kind has its own TTL; there is no size bound.
class ResultCache {
public:
    // Wall-clock source in epoch milliseconds
    using Clock = std::function<int64_t()>;

    explicit ResultCache(const CacheTtls& ttls = CacheTtls(), Clock clock = Clock());

    std::optional<PriceHistory> get_history(const std::string& key);
    void put_history(const std::string& key, const PriceHistory& history);

    std::optional<MarketMetrics> get_metrics(const std::string& key);
    void put_metrics(const std::string& key, const MarketMetrics& metrics);

    std::optional<double> get_price(const std::string& key);
    void put_price(const std::string& key, double price);

    std::optional<double> get_volume(const std::string& key);
    void put_volume(const std::string& key, double volume);

    // Drop every kind cached for one asset
    void clear(const std::string& key);
    size_t purge_expired();
    CacheStats stats() const;

    // JSON snapshot with original insertion times; expired entries are skipped on load
    bool save_snapshot(const std::string& path) const;
    size_t load_snapshot(const std::string& path);

private:
    Clock clock_;
    TtlStore<PriceHistory> ohlc_;
    TtlStore<MarketMetrics> metrics_;
    TtlStore<double> price_;
    TtlStore<double> volume_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};

    template <typename T>
    std::optional<T> lookup(TtlStore<T>& store, CacheKind kind, const std::string& key);
};
