#pragma once
#include <cstddef>
#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>

#include "lru_cache.hpp"

namespace memocache {

// Memoizes range aggregates of Base in an LRU cache keyed by (l, r).
// Writes go through Update(), which drops every cached range covering the
// written index, so a stale aggregate is never returned. Base is inherited
// protected so its non-invalidating Set() is unreachable from outside.
template <typename Base>
class RangeQueryCache : protected Base {
   public:
    typedef typename Base::group_type group_type;
    typedef typename group_type::value_type value_type;
    typedef std::pair<size_t, size_t> range_type;

    struct RangeHash {
        std::size_t operator()(const range_type& p) const noexcept {
            std::size_t seed = std::hash<size_t>{}(p.first);
            seed ^= std::hash<size_t>{}(p.second) + 0x9e3779b97f4a7c15ull + (seed << 6) +
                    (seed >> 2);
            return seed;
        }
    };

    typedef LruCache<range_type, value_type, RangeHash> cache_type;

    using Base::At;
    using Base::Size;

    explicit RangeQueryCache(size_t cache_size) : Base(), cache_(cache_size) {}

    template <typename I,
              std::enable_if_t<std::is_same<typename std::iterator_traits<I>::value_type,
                                            typename group_type::value_type>::value,
                               bool> = true>
    RangeQueryCache(size_t cache_size, I begin, I end) : Base(begin, end), cache_(cache_size) {}

    value_type Query(size_t l, size_t r) const {
        Base::CheckRange(l, r);

        if (auto res = cache_.get({l, r})) {
            return res.value();
        }

        auto res = Base::QueryImpl(l, r);
        cache_.put({l, r}, res);
        return res;
    }

    // Returns the number of cached ranges dropped by the write.
    size_t Update(size_t index, const value_type& value) {
        Base::Set(index, value);
        return cache_.invalidate([index](const range_type& range) {
            return range.first <= index && index <= range.second;
        });
    }

    void Set(size_t index, const value_type& value) { Update(index, value); }

    const cache_type& Cache() const { return cache_; }

   private:
    mutable cache_type cache_;
};

}  // namespace memocache
