#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "bench_config.hpp"

namespace memocache {

struct Operation {
    enum class Kind { kQuery, kUpdate };

    Kind kind;
    size_t l;  // query start, or the written index
    size_t r;
    int64_t value;
};

std::vector<int64_t> GenerateArray(const RangeSumBenchConfig& config, std::mt19937& rng);

std::vector<Operation> GenerateWorkload(const RangeSumBenchConfig& config, std::mt19937& rng);

// Applies ops to store in order and returns the answers of the queries.
// Store is anything with Query(l, r) and Set(index, value).
template <class Store>
std::vector<int64_t> Replay(Store& store, const std::vector<Operation>& ops) {
    std::vector<int64_t> answers;
    for (const auto& op : ops) {
        if (op.kind == Operation::Kind::kQuery) {
            answers.push_back(store.Query(op.l, op.r));
        } else {
            store.Set(op.l, op.value);
        }
    }
    return answers;
}

}  // namespace memocache
