#include <chunkwise/engine/split.hpp>
#include <chunkwise/expr/builder.hpp>
#include <chunkwise/expr/traverse.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <vector>

namespace chunkwise::engine {

namespace {

namespace ex = chunkwise::expr;
using ex::NodeKind;

// Chunk-side aggregations of a decomposable By: a mean becomes a sum under
// its alias plus a row count beside it.
auto partial_aggregations(const std::vector<ex::AggSpec>& aggregations)
    -> std::vector<ex::AggSpec> {
    std::vector<ex::AggSpec> out;
    out.reserve(aggregations.size());
    for (const auto& agg : aggregations) {
        if (agg.func == ex::AggFunc::Mean) {
            out.push_back(ex::make_agg(ex::AggFunc::Sum, agg.column, agg.alias));
            out.push_back(
                ex::make_agg(ex::AggFunc::Count, "", agg.alias + ex::kGroupCountSuffix));
        } else {
            out.push_back(agg);
        }
    }
    return out;
}

auto has_mean(const std::vector<ex::AggSpec>& aggregations) -> bool {
    for (const auto& agg : aggregations) {
        if (agg.func == ex::AggFunc::Mean) {
            return true;
        }
    }
    return false;
}

// The count column of each mean must not shadow a key or another alias.
auto count_names_free(const ex::ByNode& node) -> bool {
    for (const auto& agg : node.aggregations()) {
        if (agg.func != ex::AggFunc::Mean) {
            continue;
        }
        const auto name = agg.alias + ex::kGroupCountSuffix;
        if (std::ranges::find(node.keys(), name) != node.keys().end()) {
            return false;
        }
        for (const auto& other : node.aggregations()) {
            if (other.alias == name) {
                return false;
            }
        }
    }
    return true;
}

// Re-aggregation of per-chunk group results: counts are summed, the rest
// reapply their own function to the per-chunk column.
auto reaggregate(const std::vector<ex::AggSpec>& aggregations) -> std::vector<ex::AggSpec> {
    std::vector<ex::AggSpec> out;
    out.reserve(aggregations.size());
    for (const auto& agg : aggregations) {
        auto func = agg.func == ex::AggFunc::Count ? ex::AggFunc::Sum : agg.func;
        out.push_back(ex::make_agg(func, agg.alias, agg.alias));
    }
    return out;
}

struct Halves {
    ex::ExprPtr chunk;
    // Builds the aggregate-side node over the aggregate symbol.
    std::function<ex::ExprPtr(ex::ExprPtr)> combine;
};

// Nodes that keep row i of their input as row i of their output.
auto is_row_preserving(NodeKind kind) noexcept -> bool {
    switch (kind) {
        case NodeKind::Field:
        case NodeKind::Project:
        case NodeKind::Relabel:
        case NodeKind::Map:
            return true;
        default:
            return false;
    }
}

// NOLINTBEGIN cppcoreguidelines-pro-type-static-cast-downcast

// Fold every Slice or Head reached from `leaf` through row-preserving nodes
// into the source row range, removing it from `expr`. Such a node selects
// source rows directly, so only those rows need to be read.
auto narrow_rows(ex::ExprPtr expr, const ex::Node& leaf, std::size_t& start, std::size_t& stop)
    -> ex::ExprPtr {
    while (true) {
        auto nodes = ex::path(expr, leaf);
        ex::ExprPtr window;
        for (auto it = nodes.rbegin() + 1; it != nodes.rend(); ++it) {
            if (!is_row_preserving((*it)->kind())) {
                window = *it;
                break;
            }
        }
        if (!window) {
            return expr;
        }
        std::size_t lo = 0;
        std::size_t hi = 0;
        if (window->kind() == NodeKind::Slice) {
            const auto& s = static_cast<const ex::SliceNode&>(*window);
            lo = s.start();
            hi = s.stop();
        } else if (window->kind() == NodeKind::Head) {
            hi = static_cast<const ex::HeadNode&>(*window).n();
        } else {
            return expr;
        }
        const std::size_t width = stop - start;
        stop = start + std::min(hi, width);
        start = start + std::min(lo, width);
        expr = ex::substitute(expr, *window, window->child());
    }
}

auto split_node(const ex::Node& node, ex::ExprPtr c, ex::VarianceMethod method) -> Halves {
    switch (node.kind()) {
        case NodeKind::Sum:
        case NodeKind::Min:
        case NodeKind::Max: {
            const auto& r = static_cast<const ex::ReductionNode&>(node);
            auto kind = node.kind();
            bool keepdims = r.keepdims();
            return {ex::reduce(kind, std::move(c), true),
                    [kind, keepdims](ex::ExprPtr agg) {
                        return ex::reduce(kind, std::move(agg), keepdims);
                    }};
        }
        case NodeKind::Count: {
            bool keepdims = static_cast<const ex::ReductionNode&>(node).keepdims();
            return {ex::count(std::move(c), true), [keepdims](ex::ExprPtr agg) {
                        return ex::sum(std::move(agg), keepdims);
                    }};
        }
        case NodeKind::NUnique: {
            bool keepdims = static_cast<const ex::ReductionNode&>(node).keepdims();
            return {ex::distinct(std::move(c)), [keepdims](ex::ExprPtr agg) {
                        return ex::nunique(std::move(agg), keepdims);
                    }};
        }
        case NodeKind::Mean:
        case NodeKind::Var:
        case NodeKind::Std: {
            const auto& r = static_cast<const ex::ReductionNode&>(node);
            auto target = node.kind();
            bool unbiased = r.unbiased();
            bool keepdims = r.keepdims();
            return {ex::partial(std::move(c), target, method),
                    [target, method, unbiased, keepdims](ex::ExprPtr agg) {
                        return ex::finalize(std::move(agg), target, method, unbiased, keepdims);
                    }};
        }
        case NodeKind::Distinct:
            return {ex::distinct(std::move(c)),
                    [](ex::ExprPtr agg) { return ex::distinct(std::move(agg)); }};
        case NodeKind::Head: {
            auto n = static_cast<const ex::HeadNode&>(node).n();
            return {ex::head(std::move(c), n),
                    [n](ex::ExprPtr agg) { return ex::head(std::move(agg), n); }};
        }
        case NodeKind::Slice: {
            // Rows [start, stop) of the whole lie within the first `stop`
            // rows of every chunk's contribution.
            const auto& s = static_cast<const ex::SliceNode&>(node);
            auto start = s.start();
            auto stop = s.stop();
            return {ex::head(std::move(c), stop), [start, stop](ex::ExprPtr agg) {
                        return ex::slice(std::move(agg), start, stop);
                    }};
        }
        case NodeKind::By: {
            const auto& b = static_cast<const ex::ByNode&>(node);
            if (is_decomposable(b) && count_names_free(b)) {
                auto keys = b.keys();
                auto original = b.aggregations();
                auto partials = partial_aggregations(original);
                auto again = reaggregate(partials);
                const bool means = has_mean(original);
                return {ex::by(std::move(c), keys, partials),
                        [keys, original, again, means](ex::ExprPtr agg) {
                            auto grouped = ex::by(std::move(agg), keys, again);
                            if (!means) {
                                return grouped;
                            }
                            return ex::group_finalize(std::move(grouped), keys, original);
                        }};
            }
            auto keys = b.keys();
            auto aggregations = b.aggregations();
            return {std::move(c), [keys, aggregations](ex::ExprPtr agg) {
                        return ex::by(std::move(agg), keys, aggregations);
                    }};
        }
        default:
            break;
    }
    throw std::invalid_argument("split: no chunked form for " + ex::to_string(node.kind()));
}
// NOLINTEND cppcoreguidelines-pro-type-static-cast-downcast

}  // namespace

auto is_elementwise(NodeKind kind) noexcept -> bool {
    switch (kind) {
        case NodeKind::Field:
        case NodeKind::Project:
        case NodeKind::Relabel:
        case NodeKind::Filter:
        case NodeKind::Map:
            return true;
        default:
            return false;
    }
}

auto is_decomposable(const ex::ByNode& node) noexcept -> bool {
    for (const auto& agg : node.aggregations()) {
        switch (agg.func) {
            case ex::AggFunc::Sum:
            case ex::AggFunc::Count:
            case ex::AggFunc::Min:
            case ex::AggFunc::Max:
            case ex::AggFunc::Mean:
                break;
            default:
                return false;
        }
    }
    return true;
}

auto split(const ex::ExprPtr& leaf, const ex::ExprPtr& expr, std::size_t chunk_size,
           ex::VarianceMethod method) -> Result<SplitExpr> {
    if (chunk_size == 0) {
        return make_error(ErrorKind::InvalidArgument, "split: chunk size must be positive");
    }
    if (leaf->kind() != NodeKind::Symbol) {
        return make_error(ErrorKind::InvalidArgument, "split: leaf is not a symbol");
    }
    auto nodes = ex::path(expr, *leaf);
    if (nodes.empty()) {
        return make_error(ErrorKind::InvalidArgument,
                          fmt::format("split: {} does not occur in {}",
                                      ex::to_string(*leaf), ex::to_string(*expr)));
    }

    const auto& leaf_name = static_cast<const ex::SymbolNode&>(*leaf).name();  // NOLINT
    auto chunk_symbol =
        ex::symbol(leaf_name, DataShape::fixed(chunk_size, leaf->shape().dtype));

    try {
        std::size_t row_start = 0;
        std::size_t row_stop = kAllRows;
        const auto narrowed = narrow_rows(expr, *leaf, row_start, row_stop);
        if (narrowed != expr) {
            nodes = ex::path(narrowed, *leaf);
        }

        // Walk up from the leaf to the first node that is not elementwise.
        ex::ExprPtr split_at;
        for (auto it = nodes.rbegin() + 1; it != nodes.rend(); ++it) {
            if (!is_elementwise((*it)->kind())) {
                split_at = *it;
                break;
            }
        }

        if (!split_at) {
            auto chunk_expr = ex::substitute(narrowed, *leaf, chunk_symbol);
            auto agg_symbol = ex::symbol("aggregate", DataShape::var(chunk_expr->shape().dtype));
            return SplitExpr{.chunk_symbol = std::move(chunk_symbol),
                             .chunk_expr = std::move(chunk_expr),
                             .agg_symbol = agg_symbol,
                             .agg_expr = agg_symbol,
                             .row_start = row_start,
                             .row_stop = row_stop};
        }
        auto below = ex::substitute(split_at->child(), *leaf, chunk_symbol);
        auto halves = split_node(*split_at, std::move(below), method);
        auto agg_symbol =
            ex::symbol("aggregate", DataShape::var(halves.chunk->shape().dtype));
        auto agg_expr = ex::substitute(narrowed, *split_at, halves.combine(agg_symbol));
        return SplitExpr{.chunk_symbol = std::move(chunk_symbol),
                         .chunk_expr = std::move(halves.chunk),
                         .agg_symbol = std::move(agg_symbol),
                         .agg_expr = std::move(agg_expr),
                         .row_start = row_start,
                         .row_stop = row_stop};
    } catch (const std::invalid_argument& e) {
        return make_error(ErrorKind::Unsupported, fmt::format("split: {}", e.what()));
    }
}

}  // namespace chunkwise::engine
