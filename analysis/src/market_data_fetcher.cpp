#include "market_data_fetcher.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <thread>
#include <unordered_map>

namespace {

const std::unordered_map<std::string, std::string> kIdAliases = {
    {"btc", "bitcoin"},
    {"eth", "ethereum"},
    {"bnb", "binancecoin"},
    {"ada", "cardano"},
    {"sol", "solana"},
    {"avax", "avalanche-2"},
    {"link", "chainlink"},
    {"ltc", "litecoin"},
    {"arb", "arbitrum"},
    {"op", "optimism"},
    {"fet", "fetch-ai"},
    {"rndr", "render-token"},
    {"sui", "sui"},
    {"c", "celsius-degree-token"}
};

double json_double(const nlohmann::json& j) {
    if (j.is_number()) return j.get<double>();
    if (j.is_string()) return std::stod(j.get<std::string>());
    throw std::invalid_argument("expected a number");
}

} // namespace

MarketDataFetcher::MarketDataFetcher(std::shared_ptr<HttpClient> http,
                                     RateGate& gate,
                                     ResultCache& cache,
                                     FetcherConfig config,
                                     std::shared_ptr<SyntheticSeriesGenerator> synthetic)
    : http_(std::move(http))
    , gate_(gate)
    , cache_(cache)
    , config_(std::move(config))
    , synthetic_(synthetic ? std::move(synthetic) : std::make_shared<SyntheticSeriesGenerator>())
{
    if (!http_) {
        throw std::invalid_argument("MarketDataFetcher requires an HttpClient");
    }
}

std::string MarketDataFetcher::normalize_id(const std::string& asset_id) {
    auto it = kIdAliases.find(util::to_lower(asset_id));
    return it != kIdAliases.end() ? it->second : asset_id;
}

std::chrono::milliseconds MarketDataFetcher::exponential_backoff(int attempt) const {
    auto delay = config_.backoff_base * (1LL << std::min(attempt - 1, 20));
    return std::min(std::chrono::duration_cast<std::chrono::milliseconds>(delay), config_.backoff_max);
}

std::chrono::milliseconds MarketDataFetcher::linear_backoff(int attempt) const {
    return std::min(config_.backoff_base * attempt, config_.backoff_max);
}

void MarketDataFetcher::pause(std::chrono::milliseconds delay) const {
    if (config_.sleep) {
        config_.sleep(delay);
    } else {
        std::this_thread::sleep_for(delay);
    }
}

std::optional<nlohmann::json> MarketDataFetcher::request_json(const std::string& url,
                                                              int timeout_ms,
                                                              const std::string& operation) {
    for (int attempt = 1; attempt <= config_.max_attempts; ++attempt) {
        if (!gate_.acquire(config_.caller_id, operation)) {
            spdlog::warn("Rate gate denied {}", operation);
            return std::nullopt;
        }

        HttpResponse response;
        try {
            response = http_->get(url, timeout_ms);
        } catch (const std::exception& e) {
            response.status = 0;
            response.error = e.what();
        }

        if (response.status == 200) {
            try {
                return nlohmann::json::parse(response.body);
            } catch (const std::exception& e) {
                spdlog::error("Malformed payload for {}: {}", operation, e.what());
                return std::nullopt;
            }
        }

        bool last = attempt == config_.max_attempts;

        if (response.status == 429) {
            if (last) break;
            auto delay = exponential_backoff(attempt);
            spdlog::warn("Rate limited on {} (429), retry {}/{} in {}ms",
                         operation, attempt, config_.max_attempts - 1, delay.count());
            pause(delay);
            continue;
        }

        if (response.transport_failed()) {
            if (last) break;
            auto delay = linear_backoff(attempt);
            spdlog::error("Request for {} failed: {}, retry {}/{} in {}ms",
                          operation, response.error, attempt, config_.max_attempts - 1, delay.count());
            pause(delay);
            continue;
        }

        if (response.status == 404) {
            spdlog::warn("Asset not found for {} (404), check id mapping", operation);
        } else {
            spdlog::warn("Request for {} failed with status {}", operation, response.status);
        }
        return std::nullopt;
    }

    spdlog::warn("Giving up on {} after {} attempts", operation, config_.max_attempts);
    return std::nullopt;
}

std::vector<PricePoint> MarketDataFetcher::parse_ohlc(const nlohmann::json& payload,
                                                      SyntheticSeriesGenerator& volumes) {
    if (!payload.is_array()) {
        throw std::invalid_argument("OHLC payload is not an array");
    }

    // Keyed by timestamp: ascending order, later duplicates win
    std::map<int64_t, PricePoint> rows;
    for (const auto& row : payload) {
        if (!row.is_array() || row.size() < 5) {
            continue;
        }

        PricePoint p;
        p.timestamp_ms = row[0].get<int64_t>();
        p.open = json_double(row[1]);
        p.high = json_double(row[2]);
        p.low = json_double(row[3]);
        p.close = json_double(row[4]);
        // The OHLC endpoint carries no volume
        p.volume = volumes.estimate_volume(p.close);
        rows[p.timestamp_ms] = p;
    }

    std::vector<PricePoint> points;
    points.reserve(rows.size());
    for (const auto& [ts, p] : rows) {
        points.push_back(p);
    }
    return points;
}

std::vector<PricePoint> MarketDataFetcher::reconcile_last_candle(std::vector<PricePoint> points,
                                                                 double current_price,
                                                                 double tolerance) {
    if (points.empty() || current_price <= 0) {
        return points;
    }

    PricePoint& last = points.back();
    double drift = std::abs(last.close - current_price) / current_price;
    if (drift > tolerance) {
        spdlog::warn("Last close {:.6f} differs {:.1f}% from live price {:.6f}, adjusting",
                     last.close, drift * 100.0, current_price);
        last.high = std::max(last.high, current_price);
        last.low = std::min(last.low, current_price);
        last.close = current_price;
    }
    return points;
}

PriceHistory MarketDataFetcher::synthetic_history(const std::string& id, double current_price) {
    spdlog::warn("Using synthetic price history for {}", id);
    return synthetic_->generate(current_price, config_.history_days, util::current_timestamp_ms());
}

PriceHistory MarketDataFetcher::fetch_history(const std::string& asset_id, double current_price) {
    std::string id = normalize_id(asset_id);

    if (auto cached = cache_.get_history(id)) {
        return *cached;
    }

    spdlog::info("Fetching OHLC data for {}", id);
    std::string url = config_.base_url + "/coins/" + id + "/ohlc?vs_currency=usd&days="
                    + std::to_string(config_.history_days);

    auto payload = request_json(url, config_.history_timeout_ms, "ohlc " + id);
    if (!payload) {
        return synthetic_history(id, current_price);
    }

    try {
        auto points = parse_ohlc(*payload, *synthetic_);
        if (points.empty()) {
            spdlog::warn("Provider returned no OHLC rows for {}", id);
            return synthetic_history(id, current_price);
        }

        PriceHistory history;
        history.points = reconcile_last_candle(std::move(points), current_price,
                                               config_.reconcile_tolerance);
        history.source = DataSource::Live;

        spdlog::info("Parsed {} OHLC points for {}", history.size(), id);
        cache_.put_history(id, history);
        return history;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse OHLC payload for {}: {}", id, e.what());
        return synthetic_history(id, current_price);
    }
}

std::optional<MarketMetrics> MarketDataFetcher::fetch_metrics(const std::string& asset_id) {
    std::string id = normalize_id(asset_id);

    if (auto cached = cache_.get_metrics(id)) {
        return cached;
    }

    std::string url = config_.base_url + "/coins/" + id
                    + "?localization=false&tickers=false&market_data=true"
                      "&community_data=false&developer_data=false";

    auto payload = request_json(url, config_.metrics_timeout_ms, "market data " + id);
    if (!payload || !payload->is_object() || !payload->contains("market_data")) {
        return std::nullopt;
    }

    try {
        const auto& md = (*payload)["market_data"];
        MarketMetrics metrics;

        if (md.contains("price_change_percentage_7d") && !md["price_change_percentage_7d"].is_null()) {
            metrics.pct_change_7d = json_double(md["price_change_percentage_7d"]);
        }
        if (md.contains("price_change_percentage_24h") && !md["price_change_percentage_24h"].is_null()) {
            metrics.pct_change_24h = json_double(md["price_change_percentage_24h"]);
        }
        if (md.contains("market_cap") && md["market_cap"].contains("usd")) {
            metrics.market_cap_usd = json_double(md["market_cap"]["usd"]);
        }
        if (md.contains("total_volume") && md["total_volume"].contains("usd")) {
            metrics.total_volume_usd = json_double(md["total_volume"]["usd"]);
        }

        spdlog::debug("Market data for {}: cap ${:.0f}, 7d {:.2f}%, 24h {:.2f}%",
                      id, metrics.market_cap_usd, metrics.pct_change_7d, metrics.pct_change_24h);

        cache_.put_metrics(id, metrics);
        if (metrics.total_volume_usd) {
            cache_.put_volume(id, *metrics.total_volume_usd);
        }
        return metrics;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse market data for {}: {}", id, e.what());
        return std::nullopt;
    }
}

std::optional<double> MarketDataFetcher::fetch_volume(const std::string& asset_id) {
    std::string id = normalize_id(asset_id);

    if (auto cached = cache_.get_volume(id)) {
        return cached;
    }

    auto metrics = fetch_metrics(id);
    if (!metrics || !metrics->total_volume_usd) {
        return std::nullopt;
    }
    return metrics->total_volume_usd;
}

std::optional<double> MarketDataFetcher::fetch_price(const std::string& asset_id) {
    std::string id = normalize_id(asset_id);

    if (auto cached = cache_.get_price(id)) {
        return cached;
    }

    std::string url = config_.base_url + "/simple/price?ids=" + id + "&vs_currencies=usd";
    auto payload = request_json(url, config_.metrics_timeout_ms, "price " + id);
    if (!payload || !payload->contains(id) || !(*payload)[id].contains("usd")) {
        return std::nullopt;
    }

    try {
        double price = json_double((*payload)[id]["usd"]);
        cache_.put_price(id, price);
        return price;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse price for {}: {}", id, e.what());
        return std::nullopt;
    }
}
