#include "config.hpp"
#include "http_client.hpp"
#include "rate_gate.hpp"
#include "result_cache.hpp"
#include "synthetic_series.hpp"
#include "market_data_fetcher.hpp"
#include "worker_pool.hpp"
#include "analysis_orchestrator.hpp"
#include "health.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <optional>
#include <set>
#include <thread>
#include <chrono>

namespace {

std::atomic<bool> shutdown_requested{false};

void request_shutdown(int) {
    shutdown_requested = true;
}

// Colour stdout logger "coinlens"; each line is tagged with the service name
void init_logger(const Config& config) {
    auto logger = std::make_shared<spdlog::logger>(
        "coinlens", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        level = spdlog::level::info;
    }
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [" + config.service_name + "] [%^%l%$] %v");

    spdlog::set_default_logger(logger);
    spdlog::info("Log level {}", spdlog::level::to_string_view(level));
}

} // namespace

FetcherConfig make_fetcher_config(const Config& config) {
    FetcherConfig fc;
    fc.base_url = config.cg_base_url;
    fc.caller_id = config.service_name;
    fc.history_days = config.history_days;
    fc.history_timeout_ms = config.history_timeout_ms;
    fc.metrics_timeout_ms = config.metrics_timeout_ms;
    fc.max_attempts = config.fetch_max_attempts;
    fc.backoff_base = std::chrono::milliseconds(config.backoff_base_ms);
    fc.backoff_max = std::chrono::milliseconds(config.backoff_max_ms);
    return fc;
}

CacheTtls make_cache_ttls(const Config& config) {
    CacheTtls ttls;
    ttls.ohlc = std::chrono::seconds(config.cache_ttl_ohlc_s);
    ttls.metrics = std::chrono::seconds(config.cache_ttl_metrics_s);
    ttls.price = std::chrono::seconds(config.cache_ttl_price_s);
    ttls.volume = std::chrono::seconds(config.cache_ttl_volume_s);
    return ttls;
}

int main() {
    try {
        Config config = Config::from_env();
        init_logger(config);
        config.validate();

        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("Failed to initialize libcurl");
            return 1;
        }

        // Initialize components
        RateGate gate(std::chrono::milliseconds(config.rate_gate_min_interval_ms),
                      std::set<std::string>(config.privileged_callers.begin(),
                                            config.privileged_callers.end()));
        ResultCache cache(make_cache_ttls(config));
        if (!config.cache_snapshot_path.empty()) {
            cache.load_snapshot(config.cache_snapshot_path);
        }

        MarketDataFetcher fetcher(std::make_shared<CurlHttpClient>(), gate, cache,
                                  make_fetcher_config(config));
        WorkerPool pool(static_cast<size_t>(config.worker_threads));
        AnalysisOrchestrator orchestrator(fetcher, gate, pool);
        HealthCheck health(gate, cache, pool);

        if (!config.assets.empty()) {
            for (const auto& result : orchestrator.analyze_batch(config.assets)) {
                health.record_analysis(result);
                spdlog::info("\n{}", result.summary());
            }
        }

        // Setup HTTP server
        httplib::Server http_server;

        http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
            res.set_content(health.get_status().dump(), "application/json");
            res.status = health.is_healthy() ? 200 : 503;
        });

        http_server.Get("/analyze", [&](const httplib::Request& req, httplib::Response& res) {
            if (!req.has_param("id")) {
                res.status = 400;
                res.set_content(R"({"error":"missing id"})", "application/json");
                return;
            }
            std::string id = req.get_param_value("id");

            std::optional<double> price;
            if (req.has_param("price")) {
                try {
                    price = std::stod(req.get_param_value("price"));
                } catch (const std::exception&) {
                    res.status = 400;
                    res.set_content(R"({"error":"invalid price"})", "application/json");
                    return;
                }
            } else {
                price = fetcher.fetch_price(id);
            }

            if (!price) {
                res.status = 502;
                res.set_content(R"({"error":"price unavailable"})", "application/json");
                return;
            }

            IndicatorSet result = orchestrator.analyze(id, *price).get();
            health.record_analysis(result);

            nlohmann::json body = result;
            res.set_content(body.dump(), "application/json");
        });

        std::thread http_thread([&]() {
            spdlog::info("HTTP server listening on {}:{}",
                         config.listen_addr, config.listen_port);
            if (!http_server.listen(config.listen_addr.c_str(), config.listen_port)) {
                spdlog::error("HTTP server failed to listen on {}:{}",
                              config.listen_addr, config.listen_port);
                shutdown_requested = true;
            }
        });

        signal(SIGTERM, request_shutdown);
        signal(SIGINT, request_shutdown);

        auto last_purge = std::chrono::steady_clock::now();
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            if (std::chrono::steady_clock::now() - last_purge > std::chrono::minutes(5)) {
                cache.purge_expired();
                last_purge = std::chrono::steady_clock::now();
            }
        }

        spdlog::info("Shutting down");
        http_server.stop();
        if (http_thread.joinable()) {
            http_thread.join();
        }
        gate.shutdown();

        if (!config.cache_snapshot_path.empty()) {
            cache.save_snapshot(config.cache_snapshot_path);
        }

        curl_global_cleanup();
        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
