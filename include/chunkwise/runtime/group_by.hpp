#pragma once

#include <chunkwise/core/error.hpp>
#include <chunkwise/expr/node.hpp>
#include <chunkwise/runtime/value.hpp>

#include <string>
#include <vector>

namespace chunkwise::runtime {

/// Group `input` by the `keys` columns and apply each aggregation per group.
///
/// Output columns are the keys followed by one column per aggregation alias;
/// groups appear in order of first occurrence.
[[nodiscard]] auto aggregate_table(const Table& input, const std::vector<std::string>& keys,
                                   const std::vector<expr::AggSpec>& aggregations)
    -> Result<Table>;

/// Complete grouped means from per-group partials: each mean's alias column
/// holds the summed values and "<alias>.count" the row count. Keys and
/// non-mean aggregation columns are shared with `partials`.
[[nodiscard]] auto finalize_groups(const Table& partials, const std::vector<std::string>& keys,
                                   const std::vector<expr::AggSpec>& aggregations)
    -> Result<Table>;

[[nodiscard]] auto to_node_kind(expr::AggFunc func) noexcept -> expr::NodeKind;

}  // namespace chunkwise::runtime
