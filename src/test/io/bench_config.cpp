#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

#include <ds/array_store.hpp>
#include <ds/range_query_cache.hpp>
#include <io/bench_config.hpp>
#include <io/workload.hpp>
#include <math/default_group.hpp>

using namespace memocache;

static BenchConfig Parse(const std::string& text) {
    BenchConfig config;
    std::istringstream s(text);
    s >> config;
    return config;
}

TEST_CASE("BenchConfig parsing") {
    SECTION("Empty object keeps the defaults") {
        auto config = Parse("{}");
        REQUIRE(config.range_sum.array_size == 100'000);
        REQUIRE(config.range_sum.queries == 50'000);
        REQUIRE(config.range_sum.cache_capacity == 1000);
        REQUIRE(config.fibonacci.n_end == 90);
        REQUIRE(config.fibonacci.repeat == 200);
    }

    SECTION("Present keys override the defaults") {
        auto config = Parse(R"({"range_sum": {"array_size": 10, "cache_capacity": 3,
                                               "update_ratio": 0.25, "seed": 7},
                                "fibonacci": {"n_begin": 10, "n_end": 20, "n_step": 2}})");
        REQUIRE(config.range_sum.array_size == 10);
        REQUIRE(config.range_sum.cache_capacity == 3);
        REQUIRE(config.range_sum.update_ratio == Approx(.25));
        REQUIRE(config.range_sum.seed == 7);
        REQUIRE(config.range_sum.queries == 50'000);
        REQUIRE(config.fibonacci.n_begin == 10);
        REQUIRE(config.fibonacci.n_end == 20);
        REQUIRE(config.fibonacci.n_step == 2);
    }

    SECTION("Wrong types and domains throw") {
        REQUIRE_THROWS_AS(Parse("[]"), std::runtime_error);
        REQUIRE_THROWS_AS(Parse(R"({"range_sum": 5})"), std::runtime_error);
        REQUIRE_THROWS_AS(Parse(R"({"range_sum": {"array_size": "big"}})"), std::runtime_error);
        REQUIRE_THROWS_AS(Parse(R"({"range_sum": {"array_size": 1.5}})"), std::runtime_error);
        REQUIRE_THROWS_AS(Parse(R"({"range_sum": {"queries": -1}})"), std::runtime_error);
        REQUIRE_THROWS_AS(Parse(R"({"range_sum": {"cache_capacity": 0}})"), std::runtime_error);
        REQUIRE_THROWS_AS(Parse(R"({"range_sum": {"min_value": 5, "max_value": 1}})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(Parse(R"({"fibonacci": {"n_end": 100}})"), std::runtime_error);
        REQUIRE_THROWS_AS(Parse(R"({"fibonacci": {"n_step": 0}})"), std::runtime_error);
    }

    SECTION("Numbers that do not fit their field throw instead of wrapping") {
        REQUIRE_THROWS_AS(Parse(R"({"fibonacci": {"repeat": 4294967297}})"), std::runtime_error);
        REQUIRE_THROWS_AS(Parse(R"({"fibonacci": {"repeat": -4294967297}})"), std::runtime_error);
        REQUIRE_THROWS_AS(Parse(R"({"range_sum": {"seed": 4294967301}})"), std::runtime_error);
        REQUIRE_THROWS_AS(Parse(R"({"fibonacci": {"n_begin": 9223372036854775808}})"),
                          std::runtime_error);
        REQUIRE_THROWS_WITH(Parse(R"({"range_sum": {"min_value": 18446744073709551615}})"),
                            Catch::Matchers::Contains("too large"));

        auto config = Parse(R"({"range_sum": {"seed": 4294967295}})");
        REQUIRE(config.range_sum.seed == 4294967295u);
    }

    SECTION("The fibonacci step is bounded") {
        REQUIRE_THROWS_AS(
            Parse(R"({"fibonacci": {"n_begin": 1, "n_end": 93, "n_step": 9223372036854775807}})"),
            std::runtime_error);
        REQUIRE_THROWS_AS(Parse(R"({"fibonacci": {"n_step": 94}})"), std::runtime_error);

        auto config = Parse(R"({"fibonacci": {"n_step": 93}})");
        REQUIRE(config.fibonacci.n_step == 93);
    }

    SECTION("A failed parse leaves the config untouched") {
        BenchConfig config;
        config.range_sum.queries = 3;
        std::istringstream s(R"({"range_sum": {"queries": 10, "cache_capacity": 0}})");
        REQUIRE_THROWS(s >> config);
        REQUIRE(config.range_sum.queries == 3);
    }
}

TEST_CASE("Generated workloads stay in bounds and replay identically") {
    auto config = Parse(R"({"range_sum": {"array_size": 200, "queries": 2000,
                                           "cache_capacity": 16}})");
    std::mt19937 rng(config.range_sum.seed);
    const auto data = GenerateArray(config.range_sum, rng);
    const auto ops = GenerateWorkload(config.range_sum, rng);

    REQUIRE(data.size() == 200);
    REQUIRE(ops.size() == 2000);
    for (const auto& op : ops) {
        if (op.kind == Operation::Kind::kQuery) {
            REQUIRE(op.l <= op.r);
            REQUIRE(op.r < data.size());
        } else {
            REQUIRE(op.l < data.size());
            REQUIRE(op.value >= config.range_sum.min_value);
            REQUIRE(op.value <= config.range_sum.max_value);
        }
    }

    ArrayStore<DefaultGroup<int64_t>> plain(data.begin(), data.end());
    RangeQueryCache<ArrayStore<DefaultGroup<int64_t>>> cached(16, data.begin(), data.end());
    REQUIRE(Replay(plain, ops) == Replay(cached, ops));
}
