#pragma once

#include <string>
#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <optional>
#include <mutex>
#include <cstdint>

// Keyed store whose entries expire a fixed time after insertion.
// Values are held as shared_ptr<const T>; a put replaces the pointer, so a
// reader copying out a value never observes a half-written one.
template <typename T>
class TtlStore {
public:
    struct Entry {
        std::shared_ptr<const T> value;
        int64_t inserted_at_ms;
    };

    explicit TtlStore(int64_t ttl_ms) : ttl_ms_(ttl_ms) {}

    int64_t ttl_ms() const { return ttl_ms_; }

    // Expired entries are erased on lookup and reported absent
    std::optional<T> get(const std::string& key, int64_t now_ms) {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                return std::nullopt;
            }
            if (!is_expired(it->second, now_ms)) {
                return *it->second.value;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && is_expired(it->second, now_ms)) {
            entries_.erase(it);
        }
        return std::nullopt;
    }

    void put(const std::string& key, T value, int64_t inserted_at_ms) {
        auto ptr = std::make_shared<const T>(std::move(value));
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_[key] = Entry{std::move(ptr), inserted_at_ms};
    }

    void erase(const std::string& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.erase(key);
    }

    size_t purge_expired(int64_t now_ms) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (is_expired(it->second, now_ms)) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    // Copy of the live map, for snapshotting
    std::unordered_map<std::string, Entry> entries() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_;
    }

    bool is_expired(const Entry& entry, int64_t now_ms) const {
        return now_ms - entry.inserted_at_ms > ttl_ms_;
    }

private:
    int64_t ttl_ms_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};
