#pragma once

#include <chunkwise/core/error.hpp>
#include <chunkwise/expr/node.hpp>

#include <cstdint>
#include <string_view>

namespace chunkwise::engine {

/// Operation class of a whole expression, the first key of the dispatch table.
enum class OpClass : std::uint8_t {
    /// Every node from root to leaf is cheap.
    Cheap,
    /// Contains a reduction-like node and no grouping.
    Reduction,
    /// A By node lies on the path.
    Grouping,
};

[[nodiscard]] auto to_string(OpClass op) -> std::string_view;

/// Symbol, Field, Project, Relabel, Filter, Map, Head and Distinct.
[[nodiscard]] auto is_cheap(expr::NodeKind kind) noexcept -> bool;

/// True when every node from `expr` down to its leaf is cheap.
[[nodiscard]] auto path_is_cheap(const expr::ExprPtr& expr) -> bool;

/// Unsupported unless `expr` has exactly one leaf symbol.
[[nodiscard]] auto classify(const expr::ExprPtr& expr) -> Result<OpClass>;

}  // namespace chunkwise::engine
