#include <chunkwise/chunkwise.hpp>

#include <fmt/core.h>

auto main() -> int {
    namespace ex = chunkwise::expr;
    using chunkwise::runtime::ColumnValue;

    // Create a column of prices
    chunkwise::Column<double> prices{100.5, 200.3, 50.0, 175.8, 320.1, 99.9, 410.0};

    fmt::print("=== Column operations ===\n");
    fmt::print("prices: {} elements\n", prices.size());

    auto expensive = prices.filter([](double p) { return p > 100.0; });
    fmt::print("prices > 100: {} elements\n", expensive.size());

    // Build an expression over a symbol standing for the data
    fmt::print("\n=== Expressions ===\n");

    const chunkwise::storage::MemorySource source(ColumnValue{prices});
    auto data = ex::symbol("prices", source.shape());
    auto above = ex::filter(data, ex::filter_cmp(ex::CompareOp::Gt, ex::filter_elem(),
                                                 ex::filter_dbl(100.0)));
    auto spread = ex::stddev(above, true);
    fmt::print("expr: {}\n", ex::to_string(*spread));

    // Force the chunked path with a tiny memory budget and small partitions
    chunkwise::engine::EngineConfig config;
    config.chunk_size = 3;
    config.memory.available = chunkwise::engine::fixed_memory(0);

    auto parts = chunkwise::engine::split(data, spread, config.chunk_size);
    if (!parts) {
        fmt::print("split failed: {}\n", parts.error().format());
        return 1;
    }
    fmt::print("chunk: {}\n", ex::to_string(*parts->chunk_expr));
    fmt::print("aggregate: {}\n", ex::to_string(*parts->agg_expr));

    auto result = chunkwise::engine::execute(spread, source, config);
    if (!result) {
        fmt::print("execute failed: {}\n", result.error().format());
        return 1;
    }
    fmt::print("std(prices > 100) = ");
    chunkwise::runtime::print(*result);

    return 0;
}
