#pragma once

#include <chunkwise/core/error.hpp>
#include <chunkwise/expr/node.hpp>
#include <chunkwise/runtime/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chunkwise::runtime {

using Mask = std::vector<std::uint8_t>;

// ─── Vectorized path ──────────────────────────────────────────────────────────
//
// The predicate tree is walked once, producing a uint8_t[N] mask through
// tight typed loops. Column-vs-literal comparisons keep the literal as a
// hoisted scalar rather than broadcasting it.
//
// Not every predicate compiles: `like`, comparisons between strings and
// numbers and arithmetic on strings are rejected. Callers fall back to the
// row-at-a-time functions below, which accept every predicate.

/// Compile `predicate` against an array or table and evaluate it.
[[nodiscard]] auto compute_mask(const expr::FilterExpr& predicate, const Value& data)
    -> Result<Mask>;

/// Keep the elements (array) or rows (table) whose mask byte is set.
[[nodiscard]] auto gather(const Value& data, const Mask& mask) -> Result<Value>;

/// Evaluate a map body over every element of an array or table.
[[nodiscard]] auto eval_map_vec(const expr::MapExpr& body, const Value& data)
    -> Result<ColumnValue>;

// ─── Row-at-a-time path ───────────────────────────────────────────────────────

/// `names` are the row's field names; empty for bare elements, which are
/// addressed as "_".
[[nodiscard]] auto eval_predicate_row(const expr::FilterExpr& predicate,
                                      const std::vector<std::string>& names, const Row& row)
    -> Result<bool>;

[[nodiscard]] auto eval_map_row(const expr::MapExpr& body, const std::vector<std::string>& names,
                                const Row& row) -> Result<ScalarValue>;

/// Glob match supporting `*` (any run) and `?` (any one character).
[[nodiscard]] auto glob_match(std::string_view text, std::string_view pattern) noexcept -> bool;

}  // namespace chunkwise::runtime
