#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

// Bounded LRU map whose entries also expire after a fixed TTL.
// Expiry is checked lazily on read; an expired entry is evicted at that point.
template <typename Key, typename Value>
class TtlLruCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    TtlLruCache(size_t max_size, std::chrono::milliseconds ttl, Clock clock)
        : max_size_(max_size > 0 ? max_size : 1)
        , ttl_(ttl)
        , clock_(std::move(clock))
    {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_.find(key);
        if (it == cache_.end()) {
            return std::nullopt;
        }

        if (is_expired(it->second)) {
            lru_list_.erase(it->second.lru_iterator);
            cache_.erase(it);
            return std::nullopt;
        }

        touch(it->second, key);
        return it->second.value;
    }

    void put(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_.find(key);
        if (it != cache_.end()) {
            it->second.value = std::move(value);
            it->second.stored_at = clock_();
            touch(it->second, key);
            return;
        }

        if (cache_.size() >= max_size_) {
            evict_lru();
        }

        lru_list_.push_front(key);
        Entry entry{std::move(value), clock_(), lru_list_.begin()};
        cache_.emplace(key, std::move(entry));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.clear();
        lru_list_.clear();
    }

    // Includes entries that have expired but not been read since.
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

    size_t capacity() const { return max_size_; }

private:
    struct Entry {
        Value value;
        std::chrono::steady_clock::time_point stored_at;
        typename std::list<Key>::iterator lru_iterator;
    };

    bool is_expired(const Entry& entry) const {
        return clock_() > entry.stored_at + ttl_;
    }

    void touch(Entry& entry, const Key& key) {
        lru_list_.erase(entry.lru_iterator);
        lru_list_.push_front(key);
        entry.lru_iterator = lru_list_.begin();
    }

    void evict_lru() {
        if (lru_list_.empty()) return;
        cache_.erase(lru_list_.back());
        lru_list_.pop_back();
    }

    size_t max_size_;
    std::chrono::milliseconds ttl_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::list<Key> lru_list_;
    std::unordered_map<Key, Entry> cache_;
};
