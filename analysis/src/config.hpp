#pragma once

#include "models.hpp"
#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Market-data provider
    std::string cg_base_url;
    int history_days;
    int history_timeout_ms;
    int metrics_timeout_ms;
    int fetch_max_attempts;
    int backoff_base_ms;
    int backoff_max_ms;

    // Rate gate
    int rate_gate_min_interval_ms;
    std::vector<std::string> privileged_callers;

    // Result cache TTLs (seconds)
    int cache_ttl_ohlc_s;
    int cache_ttl_metrics_s;
    int cache_ttl_price_s;
    int cache_ttl_volume_s;
    std::string cache_snapshot_path;

    // Orchestrator
    int worker_threads;
    std::vector<AssetQuote> assets;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

    // "btc:65000,eth:3200" -> quotes; malformed entries are skipped with a warning
    static std::vector<AssetQuote> parse_assets(const std::string& spec);

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
