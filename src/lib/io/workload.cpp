#include "workload.hpp"

namespace memocache {

std::vector<int64_t> GenerateArray(const RangeSumBenchConfig& config, std::mt19937& rng) {
    std::uniform_int_distribution<int64_t> value(config.min_value, config.max_value);

    std::vector<int64_t> data(config.array_size);
    for (auto& x : data) {
        x = value(rng);
    }
    return data;
}

std::vector<Operation> GenerateWorkload(const RangeSumBenchConfig& config, std::mt19937& rng) {
    std::bernoulli_distribution is_update(config.update_ratio);
    std::uniform_int_distribution<size_t> index(0, config.array_size - 1);
    std::uniform_int_distribution<int64_t> value(config.min_value, config.max_value);

    std::vector<Operation> ops;
    ops.reserve(config.queries);
    for (size_t i = 0; i < config.queries; ++i) {
        if (is_update(rng)) {
            ops.push_back({Operation::Kind::kUpdate, index(rng), 0, value(rng)});
        } else {
            const size_t l = index(rng);
            std::uniform_int_distribution<size_t> end(l, config.array_size - 1);
            ops.push_back({Operation::Kind::kQuery, l, end(rng), 0});
        }
    }
    return ops;
}

}  // namespace memocache
