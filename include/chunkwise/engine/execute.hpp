#pragma once

#include <chunkwise/core/error.hpp>
#include <chunkwise/engine/chunk_executor.hpp>
#include <chunkwise/engine/classifier.hpp>
#include <chunkwise/engine/memory_policy.hpp>
#include <chunkwise/expr/node.hpp>
#include <chunkwise/runtime/value.hpp>
#include <chunkwise/storage/data_source.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace chunkwise::engine {

inline constexpr std::size_t kDefaultChunkSize = std::size_t{1} << 20U;

/// Engine settings. Everything the engine decides at run time reads from
/// here; nothing is global.
struct EngineConfig {
    /// Elements per partition on the chunked path.
    std::size_t chunk_size = kDefaultChunkSize;
    MemoryPolicy memory;
    MapStrategy map = sequential_map();
    expr::VarianceMethod variance = expr::VarianceMethod::Welford;
};

enum class Strategy : std::uint8_t {
    /// Materialize the whole source and evaluate directly.
    InMemory,
    /// Evaluate row by row over source.iterate().
    Streamed,
    /// Split, evaluate per partition, merge, aggregate.
    Chunked,
};

[[nodiscard]] auto to_string(Strategy strategy) -> std::string_view;

/// First matching rule of the dispatch table; Unsupported when none applies.
[[nodiscard]] auto choose_strategy(OpClass op, storage::Capability capabilities, bool fits)
    -> Result<Strategy>;

/// Classify `expr` and pick its strategy against `source`.
[[nodiscard]] auto plan_strategy(const expr::ExprPtr& expr, const storage::DataSource& source,
                                 const EngineConfig& config) -> Result<Strategy>;

/// Evaluate `expr`, whose single leaf symbol stands for `source`.
///
/// The result has the expression's declared shape; keepdims reductions come
/// back as one-element arrays and streamed cheap results as a Sequence.
[[nodiscard]] auto execute(const expr::ExprPtr& expr, const storage::DataSource& source,
                           const EngineConfig& config = {}) -> Result<runtime::Value>;

}  // namespace chunkwise::engine
