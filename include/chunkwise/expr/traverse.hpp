#pragma once

#include <chunkwise/expr/node.hpp>

#include <string>
#include <vector>

namespace chunkwise::expr {

/// Distinct leaf symbols of `expr`, in first-visit order.
[[nodiscard]] auto leaves(const ExprPtr& expr) -> std::vector<ExprPtr>;

/// Nodes on the path from `expr` down to `leaf`, root first, leaf last.
/// Empty when `leaf` is not reachable.
[[nodiscard]] auto path(const ExprPtr& expr, const Node& leaf) -> std::vector<ExprPtr>;

/// Copy of `expr` with every occurrence of `from` (by identity) replaced by
/// `to`. Subtrees that do not contain `from` are shared, not copied.
[[nodiscard]] auto substitute(const ExprPtr& expr, const Node& from, const ExprPtr& to)
    -> ExprPtr;

/// Rebuild a single-child node over `child`, keeping its parameters and
/// re-deriving its declared shape.
[[nodiscard]] auto with_child(const Node& node, ExprPtr child) -> ExprPtr;

/// Compact textual form for logs, e.g. "sum(field(t, amount))".
[[nodiscard]] auto to_string(const Node& expr) -> std::string;

}  // namespace chunkwise::expr
