#pragma once

#include <chunkwise/expr/node.hpp>

#include <string>
#include <vector>

namespace chunkwise::engine {

/// An expression rewritten to read fewer fields of its leaf.
struct LeanExpr {
    expr::ExprPtr expr;
    /// Leaf symbol of `expr`; declares only the fields in `columns`.
    expr::ExprPtr leaf;
    /// Fields of the original leaf that are read, in leaf order. Empty when
    /// nothing can be pruned, in which case `expr` and `leaf` are the
    /// originals.
    std::vector<std::string> columns;
};

/// Fields of the record-typed `leaf` that `expr` reads, in leaf order.
/// Every field when the leaf is not a record or when a node needs whole
/// rows (distinct, nunique of records). At least one field is kept so the
/// row count survives.
[[nodiscard]] auto required_columns(const expr::ExprPtr& expr, const expr::Node& leaf)
    -> std::vector<std::string>;

/// Rebuild the single-leaf `expr` over a leaf that declares only its
/// required columns; bind that leaf to `source.project(columns)`.
[[nodiscard]] auto lean_projection(const expr::ExprPtr& expr) -> LeanExpr;

}  // namespace chunkwise::engine
