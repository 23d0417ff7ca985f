#include <chunkwise/engine/chunk_executor.hpp>
#include <chunkwise/engine/split.hpp>
#include <chunkwise/expr/builder.hpp>
#include <chunkwise/storage/memory_source.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ex = chunkwise::expr;
using chunkwise::Column;
using chunkwise::ErrorKind;
using chunkwise::make_error;
using namespace chunkwise::runtime;
using namespace chunkwise::engine;

namespace {

auto iota_source(std::int64_t n) -> chunkwise::storage::MemorySource {
    Column<std::int64_t> values;
    for (std::int64_t i = 1; i <= n; ++i) {
        values.push_back(i);
    }
    return chunkwise::storage::MemorySource{Value{ColumnValue{std::move(values)}}};
}

auto chunk_sums(const std::vector<Value>& values) -> std::vector<std::int64_t> {
    std::vector<std::int64_t> out;
    for (const auto& value : values) {
        out.push_back(std::get<Column<std::int64_t>>(std::get<ColumnValue>(value))[0]);
    }
    return out;
}

}  // namespace

TEST_CASE("Sequential and parallel maps agree", "[engine][executor]") {
    auto source = iota_source(100);
    auto x = ex::symbol("x", source.shape());
    auto parts = split(x, ex::sum(x), 7);
    REQUIRE(parts.has_value());
    const PartitionPlan plan(source.length(), 7);

    auto sequential = execute_chunks(*parts, source, plan, sequential_map());
    REQUIRE(sequential.has_value());
    REQUIRE(sequential->size() == plan.size());

    for (std::size_t threads : {1U, 3U, 0U}) {
        auto parallel = execute_chunks(*parts, source, plan, parallel_map(threads));
        REQUIRE(parallel.has_value());
        REQUIRE(chunk_sums(*parallel) == chunk_sums(*sequential));
    }

    // First chunk is 1..7, last is 99..100.
    auto sums = chunk_sums(*sequential);
    REQUIRE(sums.front() == 28);
    REQUIRE(sums.back() == 199);
}

TEST_CASE("Every partition runs exactly once", "[engine][executor]") {
    const PartitionPlan plan(1000, 10);
    std::vector<std::atomic<int>> seen(plan.size());
    ChunkTask task = [&](const Partition& part) -> chunkwise::Result<Value> {
        seen[part.index].fetch_add(1);
        return Value{ScalarValue{static_cast<std::int64_t>(part.start)}};
    };

    auto results = parallel_map(4)(plan, task);
    REQUIRE(results.size() == plan.size());
    for (const auto& count : seen) {
        REQUIRE(count.load() == 1);
    }
}

TEST_CASE("A failing partition aborts the run with its error", "[engine][executor]") {
    Column<std::int64_t> values{1, 2, 3, 4, 5, 6};
    Table t;
    t.add_column("v", values);
    chunkwise::storage::MemorySource source{Value{t}};
    auto x = ex::symbol("x", source.shape());
    auto parts = split(x, ex::count(x), 2);
    REQUIRE(parts.has_value());
    const PartitionPlan plan(source.length(), 2);

    MapStrategy failing = [](const PartitionPlan& p, const ChunkTask& task) {
        std::vector<ChunkResult> results;
        for (const auto& part : p) {
            if (part.index == 1) {
                results.push_back(ChunkResult{
                    .index = part.index,
                    .value = make_error(ErrorKind::Domain, "injected")});
                continue;
            }
            results.push_back(ChunkResult{.index = part.index, .value = task(part)});
        }
        return results;
    };

    auto result = execute_chunks(*parts, source, plan, failing);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Domain);
    REQUIRE(result.error().message == "injected");
}

TEST_CASE("Evaluation errors inside a chunk come back unchanged", "[engine][executor]") {
    Table t;
    t.add_column("v", Column<std::int64_t>{1, 0, 3, 4});
    chunkwise::storage::MemorySource source{Value{t}};
    auto x = ex::symbol("x", source.shape());
    auto by_zero = ex::filter(
        x, ex::filter_cmp(ex::CompareOp::Eq,
                          ex::filter_arith(ex::ArithmeticOp::Mod, ex::filter_int(12),
                                           ex::filter_col("v")),
                          ex::filter_int(0)));
    auto parts = split(x, ex::count(by_zero), 2);
    REQUIRE(parts.has_value());
    const PartitionPlan plan(source.length(), 2);

    for (const auto& strategy : {sequential_map(), parallel_map(2)}) {
        auto result = execute_chunks(*parts, source, plan, strategy);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Domain);
    }
}

TEST_CASE("A strategy that drops partitions is caught", "[engine][executor]") {
    auto source = iota_source(10);
    auto x = ex::symbol("x", source.shape());
    auto parts = split(x, ex::sum(x), 3);
    REQUIRE(parts.has_value());

    MapStrategy lossy = [](const PartitionPlan&, const ChunkTask&) {
        return std::vector<ChunkResult>{};
    };
    auto result = execute_chunks(*parts, source, PartitionPlan(10, 3), lossy);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Evaluation);
}

TEST_CASE("A throwing task fails its partition instead of the process", "[engine][executor]") {
    const PartitionPlan plan(100, 10);
    ChunkTask task = [](const Partition& part) -> chunkwise::Result<Value> {
        if (part.index == 3) {
            throw std::runtime_error("disk went away");
        }
        return Value{ScalarValue{static_cast<std::int64_t>(part.start)}};
    };

    SECTION("parallel") {
        auto results = parallel_map(4)(plan, task);
        bool saw_failure = false;
        for (const auto& result : results) {
            if (result.index == 3) {
                REQUIRE_FALSE(result.value.has_value());
                REQUIRE(result.value.error().kind == ErrorKind::Evaluation);
                REQUIRE(result.value.error().message.find("disk went away") !=
                        std::string::npos);
                saw_failure = true;
            }
        }
        REQUIRE(saw_failure);
    }

    SECTION("sequential") {
        auto results = sequential_map()(plan, task);
        REQUIRE(results.size() == 4);
        REQUIRE_FALSE(results.back().value.has_value());
        REQUIRE(results.back().value.error().kind == ErrorKind::Evaluation);
    }
}
