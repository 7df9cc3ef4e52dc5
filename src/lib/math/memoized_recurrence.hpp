#pragma once
#include <cstdint>

#include <ds/splay_cache.hpp>

namespace memocache {

// Fibonacci numbers memoized in a caller-owned SplayCache. Several instances
// may share one cache.
class MemoizedRecurrence {
   public:
    typedef SplayCache<int64_t, uint64_t> cache_type;

    explicit MemoizedRecurrence(cache_type& cache) : cache_(cache) {}

    // Throws std::invalid_argument for n < 0 and std::overflow_error when the
    // result does not fit in 64 bits (n >= 94).
    uint64_t Evaluate(int64_t n);

    cache_type& Cache() { return cache_; }

   private:
    cache_type& cache_;
};

// Uncached iterative evaluation, same domain and errors as Evaluate().
uint64_t FibonacciIterative(int64_t n);

}  // namespace memocache
