#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace h2bridge::pool {

/// Thread-safe bounded map with least-recently-used eviction.
///
/// Every successful `get` marks the entry as most recently used. When an
/// insert pushes the size past capacity the least recently used entry is
/// removed and handed to the dispose callback. The callback always runs
/// after the entry left the map and outside the internal lock, so it may
/// block (closing sockets) without stalling other lookups. Destruction
/// drops the remaining values without disposing them; call `clear()` first
/// to release them explicitly.
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class lru_cache {
public:
    using dispose_fn = std::function<void(Value&)>;

    explicit lru_cache(size_t capacity, dispose_fn dispose = {})
        : capacity_(capacity), dispose_(std::move(dispose)) {
        if (capacity_ == 0) {
            throw std::invalid_argument("lru_cache: capacity must be at least 1");
        }
    }

    lru_cache(const lru_cache&) = delete;
    lru_cache& operator=(const lru_cache&) = delete;

    /// Look up `key`, marking it most recently used
    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second);
        return it->second->second;
    }

    /// Insert or replace `key`. A replaced value is disposed, as is any
    /// entry evicted to make room.
    void insert(const Key& key, Value value) {
        std::vector<Value> disposed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = index_.find(key);
            if (it != index_.end()) {
                disposed.push_back(std::move(it->second->second));
                it->second->second = std::move(value);
                order_.splice(order_.begin(), order_, it->second);
            } else {
                order_.emplace_front(key, std::move(value));
                index_.emplace(key, order_.begin());
            }

            while (order_.size() > capacity_) {
                auto& victim = order_.back();
                index_.erase(victim.first);
                disposed.push_back(std::move(victim.second));
                order_.pop_back();
            }
        }
        dispose_all(disposed);
    }

    /// Remove `key` without disposing its value; returns it if present
    std::optional<Value> erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        Value value = std::move(it->second->second);
        order_.erase(it->second);
        index_.erase(it);
        return value;
    }

    /// Dispose every entry
    void clear() {
        std::vector<Value> disposed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            disposed.reserve(order_.size());
            for (auto& entry : order_) {
                disposed.push_back(std::move(entry.second));
            }
            order_.clear();
            index_.clear();
        }
        dispose_all(disposed);
    }

    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.find(key) != index_.end();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_.size();
    }

    size_t capacity() const noexcept { return capacity_; }

    /// Keys from least to most recently used
    std::vector<Key> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Key> result;
        result.reserve(order_.size());
        for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
            result.push_back(it->first);
        }
        return result;
    }

private:
    void dispose_all(std::vector<Value>& values) {
        if (!dispose_) return;
        for (auto& v : values) {
            dispose_(v);
        }
    }

    using entry = std::pair<Key, Value>;

    size_t capacity_;
    dispose_fn dispose_;
    mutable std::mutex mutex_;
    std::list<entry> order_;  // front = most recently used
    std::unordered_map<Key, typename std::list<entry>::iterator, Hash> index_;
};

} // namespace h2bridge::pool
