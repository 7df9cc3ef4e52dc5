#include "bench_config.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace memocache {

namespace {

template <class T>
void ReadNumber(const nlohmann::json& section, const char* key, T& out) {
    if (!section.contains(key)) return;

    const auto& value = section.at(key);
    if (!value.is_number()) {
        throw std::runtime_error{std::string{key} + " should be a number"};
    }

    if constexpr (std::is_integral<T>::value) {
        if (!value.is_number_integer()) {
            throw std::runtime_error{std::string{key} + " should be an integer"};
        }
        // Unsigned json values may exceed int64_t, so they are compared unsigned.
        if (value.is_number_unsigned()) {
            const uint64_t v = value.get<uint64_t>();
            if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                throw std::runtime_error{std::string{key} + " is too large"};
            }
        } else {
            const int64_t v = value.get<int64_t>();
            if (std::is_unsigned<T>::value && v < 0) {
                throw std::runtime_error{std::string{key} + " should not be negative"};
            }
            if (std::is_signed<T>::value &&
                (v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
                 v > static_cast<int64_t>(std::numeric_limits<T>::max()))) {
                throw std::runtime_error{std::string{key} + " is out of range"};
            }
        }
    }
    out = value.get<T>();
}

const nlohmann::json* Section(const nlohmann::json& json, const char* key) {
    if (!json.contains(key)) return nullptr;
    const auto& section = json.at(key);
    if (!section.is_object()) {
        throw std::runtime_error{std::string{key} + " should be an object"};
    }
    return &section;
}

}  // namespace

std::istream& operator>>(std::istream& s, BenchConfig& config) {
    nlohmann::json json;
    s >> json;

    if (!json.is_object()) {
        throw std::runtime_error{"config should be a json object"};
    }

    RangeSumBenchConfig range_sum = config.range_sum;
    if (auto section = Section(json, "range_sum")) {
        ReadNumber(*section, "array_size", range_sum.array_size);
        ReadNumber(*section, "queries", range_sum.queries);
        ReadNumber(*section, "cache_capacity", range_sum.cache_capacity);
        ReadNumber(*section, "min_value", range_sum.min_value);
        ReadNumber(*section, "max_value", range_sum.max_value);
        ReadNumber(*section, "update_ratio", range_sum.update_ratio);
        ReadNumber(*section, "seed", range_sum.seed);
    }

    if (range_sum.array_size == 0) {
        throw std::runtime_error{"array_size should be positive"};
    }
    if (range_sum.cache_capacity == 0) {
        throw std::runtime_error{"cache_capacity should be positive"};
    }
    if (range_sum.min_value > range_sum.max_value) {
        throw std::runtime_error{"min_value should not exceed max_value"};
    }
    if (range_sum.update_ratio < 0. || range_sum.update_ratio > 1.) {
        throw std::runtime_error{"update_ratio should be within [0, 1]"};
    }

    FibonacciBenchConfig fibonacci = config.fibonacci;
    if (auto section = Section(json, "fibonacci")) {
        ReadNumber(*section, "n_begin", fibonacci.n_begin);
        ReadNumber(*section, "n_end", fibonacci.n_end);
        ReadNumber(*section, "n_step", fibonacci.n_step);
        ReadNumber(*section, "repeat", fibonacci.repeat);
    }

    if (fibonacci.n_begin < 0 || fibonacci.n_end < fibonacci.n_begin) {
        throw std::runtime_error{"fibonacci range should satisfy 0 <= n_begin <= n_end"};
    }
    if (fibonacci.n_end > FibonacciBenchConfig::kMaxN) {
        throw std::runtime_error{"n_end should not exceed 93"};
    }
    if (fibonacci.n_step <= 0 || fibonacci.n_step > FibonacciBenchConfig::kMaxN) {
        throw std::runtime_error{"n_step should be within [1, 93]"};
    }
    if (fibonacci.repeat <= 0) {
        throw std::runtime_error{"repeat should be positive"};
    }

    config.range_sum = range_sum;
    config.fibonacci = fibonacci;
    return s;
}

}  // namespace memocache
