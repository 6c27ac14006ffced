// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace rubicid {

//! \brief Bounded least-recently-used map safe for concurrent access
//! \details Both put and successful get move the entry to the most-recently-used position. When the capacity is
//! exceeded the least-recently-used entry is evicted. There is no expiry: values are expected to never change.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
  public:
    using KeyValuePair = std::pair<Key, Value>;

    struct Stats {
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
    };

    explicit LruCache(size_t max_size) : max_size_{max_size} {
        if (max_size_ == 0) {
            throw std::invalid_argument{"LruCache: max_size must be positive"};
        }
    }

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    void put(const Key& key, Value value) {
        std::scoped_lock lock{access_};
        auto it = items_map_.find(key);
        if (it != items_map_.end()) {
            it->second->second = std::move(value);
            items_list_.splice(items_list_.begin(), items_list_, it->second);
            return;
        }
        items_list_.emplace_front(key, std::move(value));
        items_map_.emplace(key, items_list_.begin());

        if (items_map_.size() > max_size_) {
            const auto& last = items_list_.back();
            items_map_.erase(last.first);
            items_list_.pop_back();
            ++stats_.evictions;
        }
    }

    std::optional<Value> get_as_copy(const Key& key) {
        std::scoped_lock lock{access_};
        auto it = items_map_.find(key);
        if (it == items_map_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }
        ++stats_.hits;
        items_list_.splice(items_list_.begin(), items_list_, it->second);
        return it->second->second;
    }

    //! Lookup without touching the recency order
    bool contains(const Key& key) const {
        std::scoped_lock lock{access_};
        return items_map_.contains(key);
    }

    size_t size() const {
        std::scoped_lock lock{access_};
        return items_map_.size();
    }

    size_t max_size() const noexcept { return max_size_; }

    Stats stats() const {
        std::scoped_lock lock{access_};
        return stats_;
    }

    void clear() {
        std::scoped_lock lock{access_};
        items_map_.clear();
        items_list_.clear();
    }

  private:
    using ListIterator = typename std::list<KeyValuePair>::iterator;

    std::list<KeyValuePair> items_list_;
    std::unordered_map<Key, ListIterator, Hash> items_map_;
    const size_t max_size_;
    Stats stats_;
    mutable std::mutex access_;
};

}  // namespace rubicid
