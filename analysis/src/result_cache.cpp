#include "result_cache.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

const char* to_string(CacheKind kind) {
    switch (kind) {
        case CacheKind::Ohlc:    return "ohlc";
        case CacheKind::Metrics: return "metrics";
        case CacheKind::Price:   return "price";
        case CacheKind::Volume:  return "volume";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const CacheStats& stats) {
    j = {
        {"requests", stats.requests},
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"hit_rate", stats.hit_rate()},
        {"entries", {
            {"ohlc", stats.ohlc_entries},
            {"metrics", stats.metrics_entries},
            {"price", stats.price_entries},
            {"volume", stats.volume_entries}
        }}
    };
}

ResultCache::ResultCache(const CacheTtls& ttls, Clock clock)
    : clock_(clock ? std::move(clock) : Clock(util::current_timestamp_ms))
    , ohlc_(ttls.ohlc.count())
    , metrics_(ttls.metrics.count())
    , price_(ttls.price.count())
    , volume_(ttls.volume.count())
{}

template <typename T>
std::optional<T> ResultCache::lookup(TtlStore<T>& store, CacheKind kind, const std::string& key) {
    requests_++;
    auto value = store.get(key, clock_());
    if (value) {
        hits_++;
        spdlog::debug("Cache hit: {} {}", to_string(kind), key);
    } else {
        misses_++;
    }
    return value;
}

std::optional<PriceHistory> ResultCache::get_history(const std::string& key) {
    auto history = lookup(ohlc_, CacheKind::Ohlc, key);
    if (history) {
        history->source = DataSource::Cached;
    }
    return history;
}

void ResultCache::put_history(const std::string& key, const PriceHistory& history) {
    ohlc_.put(key, history, clock_());
}

std::optional<MarketMetrics> ResultCache::get_metrics(const std::string& key) {
    return lookup(metrics_, CacheKind::Metrics, key);
}

void ResultCache::put_metrics(const std::string& key, const MarketMetrics& metrics) {
    metrics_.put(key, metrics, clock_());
}

std::optional<double> ResultCache::get_price(const std::string& key) {
    return lookup(price_, CacheKind::Price, key);
}

void ResultCache::put_price(const std::string& key, double price) {
    price_.put(key, price, clock_());
}

std::optional<double> ResultCache::get_volume(const std::string& key) {
    return lookup(volume_, CacheKind::Volume, key);
}

void ResultCache::put_volume(const std::string& key, double volume) {
    volume_.put(key, volume, clock_());
}

void ResultCache::clear(const std::string& key) {
    ohlc_.erase(key);
    metrics_.erase(key);
    price_.erase(key);
    volume_.erase(key);
    spdlog::info("Cleared all cached data for {}", key);
}

size_t ResultCache::purge_expired() {
    int64_t now = clock_();
    size_t removed = ohlc_.purge_expired(now)
                   + metrics_.purge_expired(now)
                   + price_.purge_expired(now)
                   + volume_.purge_expired(now);
    if (removed > 0) {
        spdlog::info("Purged {} expired cache entries", removed);
    }
    return removed;
}

CacheStats ResultCache::stats() const {
    CacheStats s;
    s.requests = requests_.load();
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.ohlc_entries = ohlc_.size();
    s.metrics_entries = metrics_.size();
    s.price_entries = price_.size();
    s.volume_entries = volume_.size();
    return s;
}

bool ResultCache::save_snapshot(const std::string& path) const {
    nlohmann::json snapshot;

    for (const auto& [key, entry] : ohlc_.entries()) {
        snapshot["ohlc"][key] = {
            {"inserted_at_ms", entry.inserted_at_ms},
            {"points", entry.value->points}
        };
    }
    for (const auto& [key, entry] : metrics_.entries()) {
        snapshot["metrics"][key] = {
            {"inserted_at_ms", entry.inserted_at_ms},
            {"value", *entry.value}
        };
    }
    for (const auto& [key, entry] : price_.entries()) {
        snapshot["price"][key] = {{"inserted_at_ms", entry.inserted_at_ms}, {"value", *entry.value}};
    }
    for (const auto& [key, entry] : volume_.entries()) {
        snapshot["volume"][key] = {{"inserted_at_ms", entry.inserted_at_ms}, {"value", *entry.value}};
    }

    std::ofstream out(path);
    if (!out) {
        spdlog::error("Failed to open cache snapshot {} for writing", path);
        return false;
    }
    out << snapshot.dump();
    if (!out) {
        spdlog::error("Failed to write cache snapshot {}", path);
        return false;
    }

    spdlog::info("Saved cache snapshot to {}", path);
    return true;
}

size_t ResultCache::load_snapshot(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::info("No cache snapshot at {}", path);
        return 0;
    }

    nlohmann::json snapshot;
    try {
        snapshot = nlohmann::json::parse(in);
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse cache snapshot {}: {}", path, e.what());
        return 0;
    }

    int64_t now = clock_();
    size_t loaded = 0;

    auto restore = [&](const char* section, auto& store, auto convert) {
        if (!snapshot.contains(section)) return;
        for (const auto& [key, item] : snapshot[section].items()) {
            try {
                int64_t inserted_at = item.at("inserted_at_ms").template get<int64_t>();
                if (now - inserted_at > store.ttl_ms()) continue;
                store.put(key, convert(item), inserted_at);
                ++loaded;
            } catch (const std::exception& e) {
                spdlog::warn("Skipping {} snapshot entry {}: {}", section, key, e.what());
            }
        }
    };

    restore("ohlc", ohlc_, [](const nlohmann::json& item) {
        PriceHistory history;
        history.points = item.at("points").get<std::vector<PricePoint>>();
        return history;
    });
    restore("metrics", metrics_, [](const nlohmann::json& item) {
        return item.at("value").get<MarketMetrics>();
    });
    restore("price", price_, [](const nlohmann::json& item) {
        return item.at("value").get<double>();
    });
    restore("volume", volume_, [](const nlohmann::json& item) {
        return item.at("value").get<double>();
    });

    spdlog::info("Loaded {} cache entries from {}", loaded, path);
    return loaded;
}
