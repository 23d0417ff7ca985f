#include <chunkwise/engine/execute.hpp>
#include <chunkwise/engine/merge.hpp>
#include <chunkwise/engine/optimize.hpp>
#include <chunkwise/engine/partition.hpp>
#include <chunkwise/engine/split.hpp>
#include <chunkwise/expr/traverse.hpp>
#include <chunkwise/runtime/evaluator.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <utility>

namespace chunkwise::engine {

namespace {

using storage::Capability;

enum class Fit : std::uint8_t {
    Yes,
    Any,
};

struct Rule {
    OpClass op;
    Capability needs;
    Fit fit;
    Strategy strategy;
};

// First match wins.
constexpr std::array<Rule, 8> kRules{{
    {OpClass::Cheap, Capability::Slice, Fit::Yes, Strategy::InMemory},
    {OpClass::Cheap, Capability::Iterate, Fit::Any, Strategy::Streamed},
    {OpClass::Reduction, Capability::Slice, Fit::Yes, Strategy::InMemory},
    {OpClass::Reduction, Capability::Slice, Fit::Any, Strategy::Chunked},
    {OpClass::Reduction, Capability::Iterate, Fit::Any, Strategy::Streamed},
    {OpClass::Grouping, Capability::Slice, Fit::Yes, Strategy::InMemory},
    {OpClass::Grouping, Capability::Slice, Fit::Any, Strategy::Chunked},
    {OpClass::Grouping, Capability::Iterate, Fit::Yes, Strategy::Streamed},
}};

auto run_in_memory(const expr::ExprPtr& expr, const expr::ExprPtr& leaf,
                   const storage::DataSource& source, const runtime::EvalOptions& options)
    -> Result<runtime::Value> {
    auto data = source.slice(0, source.length());
    if (!data) {
        return std::unexpected(std::move(data.error()));
    }
    return runtime::evaluate(*expr, *leaf, std::move(*data), options);
}

auto run_streamed(const expr::ExprPtr& expr, const expr::ExprPtr& leaf,
                  const storage::DataSource& source, const runtime::EvalOptions& options)
    -> Result<runtime::Value> {
    auto stream = source.iterate();
    if (!stream) {
        return std::unexpected(std::move(stream.error()));
    }
    runtime::Bindings bindings;
    bindings.emplace(leaf->id(), std::move(*stream));
    return runtime::evaluate(*expr, bindings, options);
}

auto run_chunked(const expr::ExprPtr& expr, const expr::ExprPtr& leaf,
                 const storage::DataSource& source, const EngineConfig& config,
                 const runtime::EvalOptions& options) -> Result<runtime::Value> {
    auto parts = split(leaf, expr, config.chunk_size, config.variance);
    if (!parts) {
        return std::unexpected(std::move(parts.error()));
    }
    spdlog::debug("chunked: chunk {} | aggregate {}", expr::to_string(*parts->chunk_expr),
                  expr::to_string(*parts->agg_expr));

    // Slices and heads directly above the leaf only need their row range.
    const std::size_t stop = std::min(parts->row_stop, source.length());
    const std::size_t start = std::min(parts->row_start, stop);
    const PartitionPlan plan(start, stop, config.chunk_size);
    auto results = execute_chunks(*parts, source, plan, config.map, options);
    if (!results) {
        return std::unexpected(std::move(results.error()));
    }
    auto merged = merge(std::move(*results), parts->agg_symbol->shape());
    if (!merged) {
        return std::unexpected(std::move(merged.error()));
    }
    return runtime::evaluate(*parts->agg_expr, *parts->agg_symbol, std::move(*merged), options);
}

}  // namespace

auto to_string(Strategy strategy) -> std::string_view {
    switch (strategy) {
        case Strategy::InMemory:
            return "in-memory";
        case Strategy::Streamed:
            return "streamed";
        case Strategy::Chunked:
            return "chunked";
    }
    return "unknown";
}

auto choose_strategy(OpClass op, Capability capabilities, bool fits) -> Result<Strategy> {
    for (const auto& rule : kRules) {
        if (rule.op != op || !storage::has(capabilities, rule.needs)) {
            continue;
        }
        if (rule.fit == Fit::Yes && !fits) {
            continue;
        }
        return rule.strategy;
    }
    return make_error(ErrorKind::Unsupported,
                      fmt::format("no execution strategy for a {} expression over this source",
                                  to_string(op)));
}

auto plan_strategy(const expr::ExprPtr& expr, const storage::DataSource& source,
                   const EngineConfig& config) -> Result<Strategy> {
    auto op = classify(expr);
    if (!op) {
        return std::unexpected(std::move(op.error()));
    }
    const bool fits = config.memory.fits_in_memory(source.byte_size());
    spdlog::debug("dispatch: {} expression, {} bytes, fits in memory: {}", to_string(*op),
                  source.byte_size(), fits);
    return choose_strategy(*op, source.capabilities(), fits);
}

auto execute(const expr::ExprPtr& expr, const storage::DataSource& source,
             const EngineConfig& config) -> Result<runtime::Value> {
    if (config.chunk_size == 0) {
        return make_error(ErrorKind::InvalidArgument, "chunk size must be positive");
    }

    // Read only the fields the expression uses when the source can narrow.
    auto lean = lean_projection(expr);
    storage::DataSourcePtr projected;
    if (!lean.columns.empty()) {
        auto narrowed = source.project(lean.columns);
        if (narrowed) {
            projected = std::move(*narrowed);
            spdlog::debug("projection: reading [{}]", fmt::join(lean.columns, ", "));
        } else if (narrowed.error().kind == ErrorKind::Unsupported) {
            spdlog::debug("projection: {}", narrowed.error().message);
        } else {
            return std::unexpected(std::move(narrowed.error()));
        }
    }
    const auto& plan_expr = projected ? lean.expr : expr;
    const auto& target = projected ? *projected : source;

    auto strategy = plan_strategy(plan_expr, target, config);
    if (!strategy) {
        spdlog::debug("dispatch: {}", strategy.error().message);
        return std::unexpected(std::move(strategy.error()));
    }
    spdlog::debug("dispatch: {} strategy for {}", to_string(*strategy),
                  expr::to_string(*plan_expr));

    const auto leaf = expr::leaves(plan_expr).front();
    const runtime::EvalOptions options{.variance = config.variance};
    switch (*strategy) {
        case Strategy::InMemory:
            return run_in_memory(plan_expr, leaf, target, options);
        case Strategy::Streamed:
            return run_streamed(plan_expr, leaf, target, options);
        case Strategy::Chunked:
            return run_chunked(plan_expr, leaf, target, config, options);
    }
    return make_error(ErrorKind::Unsupported, "unknown strategy");
}

}  // namespace chunkwise::engine
