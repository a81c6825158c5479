#include <catch2/catch_test_macros.hpp>
#include "../src/rate_gate.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using SteadyClock = std::chrono::steady_clock;

TEST_CASE("Rate gate spacing", "[rate_gate]") {
    RateGate gate(50ms);

    SECTION("First call is granted immediately") {
        auto start = SteadyClock::now();
        REQUIRE(gate.acquire("portfolio", "prices"));
        REQUIRE(SteadyClock::now() - start < 40ms);
    }

    SECTION("Next slot is reported after a grant") {
        REQUIRE(gate.time_until_next_slot() == 0ms);
        REQUIRE(gate.acquire("portfolio", "prices"));
        auto wait = gate.time_until_next_slot();
        REQUIRE(wait > 0ms);
        REQUIRE(wait <= 50ms);
    }

    SECTION("Back-to-back callers are spaced by the minimum interval") {
        const int callers = 4;
        std::vector<std::thread> threads;
        std::vector<SteadyClock::time_point> granted(callers);
        std::atomic<int> grants{0};

        auto start = SteadyClock::now();
        for (int i = 0; i < callers; ++i) {
            threads.emplace_back([&, i]() {
                if (gate.acquire("worker", "call")) {
                    granted[i] = SteadyClock::now();
                    grants++;
                }
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE(grants == callers);
        auto last = granted[0];
        for (const auto& t : granted) {
            if (t > last) last = t;
        }
        REQUIRE(last - start >= (callers - 1) * 50ms);
    }

    SECTION("try_acquire does not consume the slot") {
        REQUIRE(gate.try_acquire("portfolio", "probe"));
        REQUIRE(gate.try_acquire("portfolio", "probe"));
        auto start = SteadyClock::now();
        REQUIRE(gate.acquire("portfolio", "prices"));
        REQUIRE(SteadyClock::now() - start < 40ms);
        REQUIRE_FALSE(gate.try_acquire("portfolio", "probe"));
    }
}

TEST_CASE("Rate gate intensive window", "[rate_gate]") {
    RateGate gate(10ms, {"analysis"});
    gate.begin_intensive("watchlist");

    SECTION("Other callers are denied without blocking") {
        auto start = SteadyClock::now();
        REQUIRE_FALSE(gate.acquire("portfolio", "bulk update"));
        REQUIRE(SteadyClock::now() - start < 10ms);
        REQUIRE_FALSE(gate.try_acquire("portfolio", "bulk update"));
    }

    SECTION("Holder and privileged callers pass") {
        REQUIRE(gate.acquire("watchlist", "scan"));
        REQUIRE(gate.acquire("analysis", "ohlc"));
    }

    SECTION("Only the holder can end the window") {
        gate.end_intensive("portfolio");
        REQUIRE(gate.intensive_holder() == std::optional<std::string>("watchlist"));
        REQUIRE_FALSE(gate.acquire("portfolio", "bulk update"));

        gate.end_intensive("watchlist");
        REQUIRE_FALSE(gate.intensive_holder().has_value());
        REQUIRE(gate.acquire("portfolio", "bulk update"));
    }

    SECTION("Scoped window releases on exit") {
        gate.end_intensive("watchlist");
        {
            IntensiveScope scope(gate, "portfolio");
            REQUIRE_FALSE(gate.acquire("watchlist", "scan"));
        }
        REQUIRE(gate.acquire("watchlist", "scan"));
    }
}

TEST_CASE("Rate gate cancellation", "[rate_gate]") {
    RateGate gate(500ms);
    REQUIRE(gate.acquire("portfolio", "prices"));

    SECTION("Interrupted waiter is denied and leaves the slot untouched") {
        std::atomic<bool> cancelled{false};
        std::atomic<bool> result{true};
        auto start = SteadyClock::now();

        std::thread waiter([&]() {
            result = gate.acquire("watchlist", "scan", &cancelled);
        });

        std::this_thread::sleep_for(20ms);
        auto before = gate.time_until_next_slot();
        cancelled = true;
        gate.interrupt();
        waiter.join();

        REQUIRE_FALSE(result);
        REQUIRE(SteadyClock::now() - start < 400ms);
        REQUIRE(gate.time_until_next_slot() <= before);
    }

    SECTION("Shutdown denies every caller") {
        gate.shutdown();
        REQUIRE_FALSE(gate.acquire("portfolio", "prices"));
        REQUIRE_FALSE(gate.try_acquire("portfolio", "prices"));
    }
}
