#pragma once

#include <chunkwise/core/error.hpp>
#include <chunkwise/expr/node.hpp>
#include <chunkwise/runtime/stream.hpp>
#include <chunkwise/runtime/value.hpp>

#include <unordered_map>
#include <variant>

namespace chunkwise::runtime {

/// Data bound to a symbol: a materialized value or a lazy row stream.
using Binding = std::variant<Value, RowStreamPtr>;

/// Symbol identity -> data. Evaluation consumes the bindings it reads.
using Bindings = std::unordered_map<expr::NodeId, Binding>;

struct EvalOptions {
    /// Scheme used by var/std nodes. Partial and Finalize nodes carry their own.
    expr::VarianceMethod variance = expr::VarianceMethod::Welford;
};

/// Evaluate `expr` against `bindings`.
///
/// Materialized inputs run through the columnar kernels; stream inputs run
/// row-at-a-time and reductions over them are folded without materializing.
/// A result that is still a stream at the root is drained into a Sequence.
[[nodiscard]] auto evaluate(const expr::Node& expr, Bindings& bindings,
                            const EvalOptions& options = {}) -> Result<Value>;

/// As evaluate(), but the root result stays lazy. Materialized results are
/// wrapped with stream_value().
[[nodiscard]] auto evaluate_stream(const expr::Node& expr, Bindings& bindings,
                                   const EvalOptions& options = {}) -> Result<RowStreamPtr>;

/// Evaluate with `symbol` bound to `data`.
[[nodiscard]] auto evaluate(const expr::Node& expr, const expr::Node& symbol, Value data,
                            const EvalOptions& options = {}) -> Result<Value>;

}  // namespace chunkwise::runtime
