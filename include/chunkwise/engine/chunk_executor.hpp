#pragma once

#include <chunkwise/core/error.hpp>
#include <chunkwise/engine/partition.hpp>
#include <chunkwise/engine/split.hpp>
#include <chunkwise/runtime/evaluator.hpp>
#include <chunkwise/storage/data_source.hpp>

#include <cstddef>
#include <functional>
#include <vector>

namespace chunkwise::engine {

/// Outcome of evaluating one partition, tagged with its index.
struct ChunkResult {
    std::size_t index = 0;
    Result<runtime::Value> value;
};

/// Work for one partition; must be safe to call concurrently.
using ChunkTask = std::function<Result<runtime::Value>(const Partition&)>;

/// Runs a task over every partition of a plan. Results may come back in any
/// order; a strategy may stop early after a failure but must include it.
using MapStrategy = std::function<std::vector<ChunkResult>(const PartitionPlan&, const ChunkTask&)>;

/// Partitions one after another on the calling thread, stopping at the first
/// failure. A std::exception thrown by the task fails its partition with an
/// Evaluation error, here and in parallel_map.
[[nodiscard]] auto sequential_map() -> MapStrategy;

/// Partitions spread over `threads` workers (0 picks the hardware
/// concurrency). Workers stop taking new partitions once one has failed.
/// Runs on the calling thread when no worker can start.
[[nodiscard]] auto parallel_map(std::size_t threads = 0) -> MapStrategy;

/// Evaluate `split.chunk_expr` on every partition of `source`.
///
/// Results come back in partition order. The first failing partition (by
/// index) aborts the run and its error is returned unchanged.
[[nodiscard]] auto execute_chunks(const SplitExpr& split, const storage::DataSource& source,
                                  const PartitionPlan& plan, const MapStrategy& strategy,
                                  const runtime::EvalOptions& options = {})
    -> Result<std::vector<runtime::Value>>;

}  // namespace chunkwise::engine
