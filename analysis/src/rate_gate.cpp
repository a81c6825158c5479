#include "rate_gate.hpp"
#include <spdlog/spdlog.h>

RateGate::RateGate(std::chrono::milliseconds min_interval,
                   std::set<std::string> privileged_callers)
    : min_interval_(min_interval)
    , privileged_callers_(std::move(privileged_callers))
{}

bool RateGate::blocked_by_intensive(const std::string& caller) const {
    return intensive_holder_.has_value()
        && *intensive_holder_ != caller
        && privileged_callers_.count(caller) == 0;
}

RateGate::Clock::time_point RateGate::next_slot() const {
    if (!last_call_) {
        return Clock::time_point::min();
    }
    return *last_call_ + min_interval_;
}

bool RateGate::acquire(const std::string& caller, const std::string& operation,
                       const std::atomic<bool>* cancelled) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (shutdown_ || (cancelled && cancelled->load())) {
            spdlog::debug("[{}] Wait for {} interrupted", caller, operation);
            return false;
        }

        if (blocked_by_intensive(caller)) {
            spdlog::info("[{}] Deferring {} - intensive operation by {} in progress",
                         caller, operation, *intensive_holder_);
            return false;
        }

        auto now = Clock::now();
        auto slot = next_slot();
        if (now >= slot) {
            last_call_ = now;
            spdlog::debug("[{}] API call authorized for {}", caller, operation);
            return true;
        }

        spdlog::debug("[{}] Rate gate: waiting {}ms for {}", caller,
                      std::chrono::duration_cast<std::chrono::milliseconds>(slot - now).count(),
                      operation);

        // Releases the lock while sleeping; another caller may take the slot first
        cv_.wait_until(lock, slot);
    }
}

bool RateGate::try_acquire(const std::string& caller, const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_ || blocked_by_intensive(caller)) {
        spdlog::debug("[{}] {} would be denied", caller, operation);
        return false;
    }
    return Clock::now() >= next_slot();
}

std::chrono::milliseconds RateGate::time_until_next_slot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = Clock::now();
    auto slot = next_slot();
    if (now >= slot) {
        return std::chrono::milliseconds(0);
    }
    // Round up so a caller sleeping this long always lands on a free slot
    return std::chrono::ceil<std::chrono::milliseconds>(slot - now);
}

void RateGate::begin_intensive(const std::string& caller) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        intensive_holder_ = caller;
    }
    spdlog::info("System {} starting intensive API operations - others should defer", caller);
}

void RateGate::end_intensive(const std::string& caller) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!intensive_holder_ || *intensive_holder_ != caller) {
            return;
        }
        intensive_holder_.reset();
    }
    spdlog::info("System {} completed intensive API operations", caller);
}

std::optional<std::string> RateGate::intensive_holder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return intensive_holder_;
}

void RateGate::interrupt() {
    std::lock_guard<std::mutex> lock(mutex_);
    cv_.notify_all();
}

void RateGate::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    cv_.notify_all();
}

IntensiveScope::IntensiveScope(RateGate& gate, std::string caller)
    : gate_(gate)
    , caller_(std::move(caller))
{
    gate_.begin_intensive(caller_);
}

IntensiveScope::~IntensiveScope() {
    gate_.end_intensive(caller_);
}
