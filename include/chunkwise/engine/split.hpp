#pragma once

#include <chunkwise/core/error.hpp>
#include <chunkwise/expr/node.hpp>

#include <cstddef>
#include <limits>

namespace chunkwise::engine {

/// Open upper bound of SplitExpr::row_stop: every row of the source.
inline constexpr std::size_t kAllRows = std::numeric_limits<std::size_t>::max();

/// Decomposition of an expression into a per-chunk part and a combining
/// part.
///
/// Evaluating `chunk_expr` on every partition (with `chunk_symbol` bound to
/// the partition's data), merging the results in partition order, and
/// evaluating `agg_expr` with `agg_symbol` bound to the merged value gives
/// the same result as evaluating the original expression on all the data.
///
/// Only source rows [row_start, min(row_stop, length)) are partitioned; a
/// slice or head applied to the rows themselves narrows that range instead
/// of appearing in either expression.
struct SplitExpr {
    expr::ExprPtr chunk_symbol;
    expr::ExprPtr chunk_expr;
    expr::ExprPtr agg_symbol;
    expr::ExprPtr agg_expr;
    std::size_t row_start = 0;
    std::size_t row_stop = kAllRows;
};

/// Split `expr` at the lowest node above `leaf` that cannot run independently
/// per chunk. Mean, var and std become a partial/finalize pair using
/// `method`; a grouped mean becomes per-group sums and counts completed by
/// a group_finalize node. InvalidArgument when `leaf` is not in `expr` or
/// `chunk_size` is zero.
[[nodiscard]] auto split(const expr::ExprPtr& leaf, const expr::ExprPtr& expr,
                         std::size_t chunk_size,
                         expr::VarianceMethod method = expr::VarianceMethod::Welford)
    -> Result<SplitExpr>;

/// Field, Project, Relabel, Filter and Map: nodes that apply to each chunk
/// independently and whose chunk results simply concatenate.
[[nodiscard]] auto is_elementwise(expr::NodeKind kind) noexcept -> bool;

/// By nodes whose aggregations are all sum, count, min, max or mean can be
/// evaluated per chunk and re-aggregated. NUnique groups the concatenated
/// rows instead.
[[nodiscard]] auto is_decomposable(const expr::ByNode& node) noexcept -> bool;

}  // namespace chunkwise::engine
