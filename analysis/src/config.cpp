#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

std::vector<AssetQuote> Config::parse_assets(const std::string& spec) {
    std::vector<AssetQuote> quotes;

    for (const auto& entry : util::split(spec, ',')) {
        auto sep = entry.find(':');
        if (sep == std::string::npos || sep == 0) {
            spdlog::warn("Ignoring malformed asset entry '{}'", entry);
            continue;
        }

        try {
            double price = std::stod(entry.substr(sep + 1));
            if (price <= 0) {
                spdlog::warn("Ignoring asset '{}' with non-positive price", entry);
                continue;
            }
            quotes.push_back({entry.substr(0, sep), price});
        } catch (const std::exception&) {
            spdlog::warn("Ignoring asset '{}' with invalid price", entry);
        }
    }

    return quotes;
}

Config Config::from_env() {
    Config cfg;

    cfg.cg_base_url = get_env("CG_BASE_URL", "https://api.coingecko.com/api/v3");
    cfg.history_days = get_env_int("HISTORY_DAYS", 30);
    cfg.history_timeout_ms = get_env_int("HISTORY_TIMEOUT_MS", 15000);
    cfg.metrics_timeout_ms = get_env_int("METRICS_TIMEOUT_MS", 5000);
    cfg.fetch_max_attempts = get_env_int("FETCH_MAX_ATTEMPTS", 3);
    cfg.backoff_base_ms = get_env_int("BACKOFF_BASE_MS", 1000);
    cfg.backoff_max_ms = get_env_int("BACKOFF_MAX_MS", 8000);

    cfg.rate_gate_min_interval_ms = get_env_int("RATE_GATE_MIN_INTERVAL_MS", 1000);
    cfg.privileged_callers = util::split(get_env("PRIVILEGED_CALLERS", "analysis"), ',');

    cfg.cache_ttl_ohlc_s = get_env_int("CACHE_TTL_OHLC_S", 30 * 60);
    cfg.cache_ttl_metrics_s = get_env_int("CACHE_TTL_METRICS_S", 15 * 60);
    cfg.cache_ttl_price_s = get_env_int("CACHE_TTL_PRICE_S", 2 * 60);
    cfg.cache_ttl_volume_s = get_env_int("CACHE_TTL_VOLUME_S", 5 * 60);
    cfg.cache_snapshot_path = get_env("CACHE_SNAPSHOT_PATH");

    cfg.worker_threads = get_env_int("WORKER_THREADS", 4);
    cfg.assets = parse_assets(get_env("ASSETS"));

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "analysis");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (cg_base_url.empty()) {
        throw std::runtime_error("CG_BASE_URL must not be empty");
    }
    if (worker_threads <= 0) {
        throw std::runtime_error("WORKER_THREADS must be positive");
    }
    if (fetch_max_attempts <= 0) {
        throw std::runtime_error("FETCH_MAX_ATTEMPTS must be positive");
    }
    if (history_days <= 0) {
        throw std::runtime_error("HISTORY_DAYS must be positive");
    }
    if (rate_gate_min_interval_ms < 0) {
        throw std::runtime_error("RATE_GATE_MIN_INTERVAL_MS must not be negative");
    }
    // The fetcher presents SERVICE_NAME to the rate gate and must pass batch intensive windows
    if (std::find(privileged_callers.begin(), privileged_callers.end(), service_name)
            == privileged_callers.end()) {
        throw std::runtime_error("SERVICE_NAME '" + service_name
                                 + "' must be listed in PRIVILEGED_CALLERS");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Provider: {} ({} day history)", cg_base_url, history_days);
    spdlog::info("  Rate gate: {}ms, privileged: {}", rate_gate_min_interval_ms,
                 privileged_callers.size());
    spdlog::info("  Cache TTLs: ohlc={}s, metrics={}s, price={}s, volume={}s",
                 cache_ttl_ohlc_s, cache_ttl_metrics_s, cache_ttl_price_s, cache_ttl_volume_s);
    spdlog::info("  Workers: {}, start-up assets: {}", worker_threads, assets.size());
}
