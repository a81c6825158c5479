#pragma once

#include <string>
#include <set>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <optional>
#include <atomic>

// Process-wide throttle for calls to the shared market-data provider.
//
// Grants are spaced at least min_interval apart. A subsystem may claim an
// intensive window; while it is held every other caller is denied, except the
// callers named in privileged_callers, which are always let through.
class RateGate {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateGate(std::chrono::milliseconds min_interval,
                      std::set<std::string> privileged_callers = {});

    // Blocks until the next slot is free. Returns false without waiting when
    // another caller holds the intensive window, and false when the wait is
    // interrupted (cancelled flag set, or shutdown). The last-call time is only
    // updated on a grant.
    bool acquire(const std::string& caller, const std::string& operation,
                 const std::atomic<bool>* cancelled = nullptr);

    // Non-blocking: would acquire() grant right now? Does not consume the slot.
    bool try_acquire(const std::string& caller, const std::string& operation) const;

    std::chrono::milliseconds time_until_next_slot() const;

    void begin_intensive(const std::string& caller);
    void end_intensive(const std::string& caller);
    std::optional<std::string> intensive_holder() const;

    // Wake sleeping acquire() calls so they re-check their cancelled flags
    void interrupt();

    // Deny all current and future acquire() calls
    void shutdown();

    std::chrono::milliseconds min_interval() const { return min_interval_; }

private:
    const std::chrono::milliseconds min_interval_;
    const std::set<std::string> privileged_callers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Clock::time_point> last_call_;
    std::optional<std::string> intensive_holder_;
    bool shutdown_ = false;

    bool blocked_by_intensive(const std::string& caller) const;
    Clock::time_point next_slot() const;
};

// Holds a RateGate intensive window for the lifetime of the scope
class IntensiveScope {
public:
    IntensiveScope(RateGate& gate, std::string caller);
    ~IntensiveScope();

    IntensiveScope(const IntensiveScope&) = delete;
    IntensiveScope& operator=(const IntensiveScope&) = delete;

private:
    RateGate& gate_;
    std::string caller_;
};
