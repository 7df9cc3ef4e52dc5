#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>

namespace memocache {

struct RangeSumBenchConfig {
    size_t array_size{100'000};
    size_t queries{50'000};
    size_t cache_capacity{1000};
    int64_t min_value{1};
    int64_t max_value{1000};
    double update_ratio{.5};
    uint32_t seed{42};
};

// F(93) is the largest Fibonacci number that fits in 64 bits.
struct FibonacciBenchConfig {
    static constexpr int64_t kMaxN = 93;

    int64_t n_begin{0};
    int64_t n_end{90};
    int64_t n_step{5};
    int repeat{200};
};

struct BenchConfig {
    RangeSumBenchConfig range_sum;
    FibonacciBenchConfig fibonacci;
};

// Reads a JSON document of the form
//   {"range_sum": {...}, "fibonacci": {...}}
// Absent keys keep their defaults. Throws std::runtime_error on a key of the
// wrong type or a value outside its domain.
std::istream& operator>>(std::istream& s, BenchConfig& config);

}  // namespace memocache
