#pragma once

#include <chunkwise/expr/node.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace chunkwise::expr {

// ─── Node factories ───────────────────────────────────────────────────────────
//  Each factory derives the declared shape of the new node from its child and
//  assigns a process-unique id. Malformed trees (unknown field, arithmetic on
//  strings, sum over records) throw std::invalid_argument.

/// Next process-unique node id (thread-safe).
[[nodiscard]] auto next_node_id() -> NodeId;

[[nodiscard]] auto symbol(std::string name, DataShape shape) -> ExprPtr;
[[nodiscard]] auto field(ExprPtr child, std::string name) -> ExprPtr;
[[nodiscard]] auto project(ExprPtr child, std::vector<std::string> columns) -> ExprPtr;
[[nodiscard]] auto relabel(ExprPtr child, RelabelNode::Renames renames) -> ExprPtr;
[[nodiscard]] auto filter(ExprPtr child, FilterExprPtr predicate) -> ExprPtr;
[[nodiscard]] auto filter(ExprPtr child, std::shared_ptr<const FilterExpr> predicate) -> ExprPtr;
[[nodiscard]] auto map(ExprPtr child, MapExprPtr body) -> ExprPtr;
[[nodiscard]] auto head(ExprPtr child, std::size_t n) -> ExprPtr;
[[nodiscard]] auto slice(ExprPtr child, std::size_t start, std::size_t stop) -> ExprPtr;
[[nodiscard]] auto distinct(ExprPtr child) -> ExprPtr;

/// Generic reduction factory; `kind` must satisfy is_reduction().
[[nodiscard]] auto reduce(NodeKind kind, ExprPtr child, bool keepdims = false,
                          bool unbiased = false) -> ExprPtr;
[[nodiscard]] auto sum(ExprPtr child, bool keepdims = false) -> ExprPtr;
[[nodiscard]] auto count(ExprPtr child, bool keepdims = false) -> ExprPtr;
[[nodiscard]] auto mean(ExprPtr child, bool keepdims = false) -> ExprPtr;
[[nodiscard]] auto var(ExprPtr child, bool unbiased = false, bool keepdims = false) -> ExprPtr;
[[nodiscard]] auto stddev(ExprPtr child, bool unbiased = false, bool keepdims = false)
    -> ExprPtr;
[[nodiscard]] auto nunique(ExprPtr child, bool keepdims = false) -> ExprPtr;
[[nodiscard]] auto min(ExprPtr child, bool keepdims = false) -> ExprPtr;
[[nodiscard]] auto max(ExprPtr child, bool keepdims = false) -> ExprPtr;

[[nodiscard]] auto by(ExprPtr child, std::vector<std::string> keys,
                      std::vector<AggSpec> aggregations) -> ExprPtr;

[[nodiscard]] auto partial(ExprPtr child, NodeKind target, VarianceMethod method) -> ExprPtr;
[[nodiscard]] auto finalize(ExprPtr child, NodeKind target, VarianceMethod method,
                            bool unbiased, bool keepdims) -> ExprPtr;

/// Completes a grouped mean over per-group sums and counts; `aggregations`
/// are the grouping's original ones.
[[nodiscard]] auto group_finalize(ExprPtr child, std::vector<std::string> keys,
                                  std::vector<AggSpec> aggregations) -> ExprPtr;

/// Field layout of the partial-state table for `target` (Mean, Var or Std).
[[nodiscard]] auto partial_fields(NodeKind target, VarianceMethod method)
    -> std::vector<FieldType>;

// ─── Map body builders ────────────────────────────────────────────────────────

[[nodiscard]] auto col_ref(std::string name) -> MapExprPtr;
/// The current element of a scalar-typed input.
[[nodiscard]] auto element() -> MapExprPtr;
[[nodiscard]] auto int_lit(std::int64_t v) -> MapExprPtr;
[[nodiscard]] auto dbl_lit(double v) -> MapExprPtr;
[[nodiscard]] auto binop(ArithmeticOp op, MapExprPtr lhs, MapExprPtr rhs) -> MapExprPtr;
[[nodiscard]] auto fn_call(std::string callee, std::vector<MapExprPtr> args) -> MapExprPtr;

// ─── FilterExpr builders ──────────────────────────────────────────────────────

[[nodiscard]] auto filter_col(std::string name) -> FilterExprPtr;
[[nodiscard]] auto filter_elem() -> FilterExprPtr;
[[nodiscard]] auto filter_int(std::int64_t v) -> FilterExprPtr;
[[nodiscard]] auto filter_dbl(double v) -> FilterExprPtr;
[[nodiscard]] auto filter_str(std::string v) -> FilterExprPtr;
[[nodiscard]] auto filter_arith(ArithmeticOp op, FilterExprPtr l, FilterExprPtr r)
    -> FilterExprPtr;
[[nodiscard]] auto filter_cmp(CompareOp op, FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr;
[[nodiscard]] auto filter_and(FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr;
[[nodiscard]] auto filter_or(FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr;
[[nodiscard]] auto filter_not(FilterExprPtr operand) -> FilterExprPtr;
[[nodiscard]] auto filter_like(FilterExprPtr operand, std::string pattern) -> FilterExprPtr;

[[nodiscard]] auto make_agg(AggFunc func, std::string column, std::string alias) -> AggSpec;

}  // namespace chunkwise::expr
