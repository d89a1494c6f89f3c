#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

// Per-device cache of the latest computed summary.
// An entry is served only while now - computed_at < ttl.
// Entries are replaced whole on put and removed only by invalidation.
// A writer that read generation(key) before computing passes it back to
// put; the write is dropped if the key was invalidated in between.
template <typename Value, typename Key = int64_t>
class TtlCache {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit TtlCache(std::chrono::seconds ttl) : ttl_(ttl) {}

    std::optional<Value> get(const Key& key, TimePoint now) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (now - it->second.computed_at >= ttl_) {
            return std::nullopt;
        }
        return it->second.value;
    }

    // Changes whenever `key` (or the whole cache) is invalidated
    uint64_t generation(const Key& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return generationLocked(key);
    }

    void put(const Key& key, Value value, TimePoint now) {
        Entry entry{std::move(value), now};
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.insert_or_assign(key, std::move(entry));
    }

    // Store only if no invalidation happened since `generation` was read.
    // Returns false when the value was dropped.
    bool put(const Key& key, Value value, TimePoint now, uint64_t generation) {
        Entry entry{std::move(value), now};
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (generationLocked(key) != generation) {
            return false;
        }
        entries_.insert_or_assign(key, std::move(entry));
        return true;
    }

    void invalidate(const Key& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.erase(key);
        key_generations_[key] = ++counter_;
    }

    void invalidateAll() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.clear();
        key_generations_.clear();
        all_generation_ = ++counter_;
    }

    // Entries held, fresh or not
    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    std::chrono::seconds ttl() const { return ttl_; }

private:
    struct Entry {
        Value value;
        TimePoint computed_at;
    };

    uint64_t generationLocked(const Key& key) const {
        auto it = key_generations_.find(key);
        if (it == key_generations_.end() || it->second < all_generation_) {
            return all_generation_;
        }
        return it->second;
    }

    std::chrono::seconds ttl_;
    std::unordered_map<Key, Entry> entries_;
    // counter_ only grows, so any invalidation raises the effective generation
    std::unordered_map<Key, uint64_t> key_generations_;
    uint64_t all_generation_ = 0;
    uint64_t counter_ = 0;
    mutable std::shared_mutex mutex_;
};
