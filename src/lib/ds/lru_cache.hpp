#pragma once
#include <cassert>
#include <functional>
#include <list>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cache_stats.hpp"

namespace memocache {

template <class Key, class T, class Hash = std::hash<Key>,
          class KeyEqual = std::equal_to<Key>>
class LruCache {
   public:
    explicit LruCache(size_t capacity) : capacity_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument{"capacity should be > 0"};
        }
        hash_.reserve(capacity + 1);
    }

    // Inserts or overwrites k and makes it the most recently used entry.
    // Evicts the least recently used entry if the insertion overflowed.
    void put(const Key& k, const T& v) {
        assert(list_.size() <= capacity_);
        assert(list_.size() == hash_.size());

        const auto hash_it = hash_.find(k);
        if (hash_it != hash_.end()) {
            hash_it->second->second = v;
            list_.splice(list_.end(), list_, hash_it->second);
            return;
        }

        auto list_it = list_.emplace(list_.end(), k, v);
        try {
            hash_.emplace(k, list_it);
        } catch (...) {
            list_.erase(list_it);
            throw;
        }
        if (list_.size() > capacity_) drop_one();

        assert(list_.size() <= capacity_);
        assert(hash_.find(k)->second->first == k);
    }

    std::optional<T> get(const Key& k) {
        assert(list_.size() <= capacity_);
        assert(list_.size() == hash_.size());

        const auto hash_it = hash_.find(k);
        if (hash_it != hash_.end()) {
            list_.splice(list_.end(), list_, hash_it->second);
            ++stats_.hits;

            assert(hash_it->second->first == k);

            return hash_it->second->second;
        } else {
            ++stats_.misses;
            return std::nullopt;
        }
    }

    // Removes every entry whose key satisfies pred. Either all matching entries
    // are removed or, if pred throws, none are.
    template <class Pred>
    size_t invalidate(Pred pred) {
        std::vector<ListIterator> doomed;
        for (auto it = list_.begin(); it != list_.end(); ++it) {
            if (pred(static_cast<const Key&>(it->first))) {
                doomed.push_back(it);
            }
        }

        for (const auto& it : doomed) {
            hash_.erase(it->first);
            list_.erase(it);
        }
        stats_.invalidations += doomed.size();

        assert(list_.size() == hash_.size());
        return doomed.size();
    }

    void clear() {
        hash_.clear();
        list_.clear();
    }

    size_t size() const { return list_.size(); }

    size_t capacity() const { return capacity_; }

    bool empty() const { return list_.empty(); }

    const CacheStats& stats() const { return stats_; }

    void reset_stats() { stats_ = {}; }

   private:
    using List = std::list<std::pair<Key, T>>;
    using ListIterator = typename List::iterator;

    size_t capacity_;
    List list_;
    std::unordered_map<Key, ListIterator, Hash, KeyEqual> hash_;
    CacheStats stats_;

    void drop_one() {
        assert(list_.size() > 0);
        assert(list_.size() == hash_.size());

        const auto it = list_.begin();

        assert(hash_.find(it->first) != hash_.end());
        assert(hash_.find(it->first)->second == it);

        hash_.erase(it->first);
        list_.erase(it);
        ++stats_.evictions;
    }
};

}  // namespace memocache
