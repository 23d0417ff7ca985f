#pragma once

// Convenience header pulling in the public chunkwise API.

#include <chunkwise/core/column.hpp>
#include <chunkwise/core/datashape.hpp>
#include <chunkwise/core/error.hpp>
#include <chunkwise/engine/chunk_executor.hpp>
#include <chunkwise/engine/classifier.hpp>
#include <chunkwise/engine/execute.hpp>
#include <chunkwise/engine/memory_policy.hpp>
#include <chunkwise/engine/merge.hpp>
#include <chunkwise/engine/optimize.hpp>
#include <chunkwise/engine/partition.hpp>
#include <chunkwise/engine/split.hpp>
#include <chunkwise/expr/builder.hpp>
#include <chunkwise/expr/node.hpp>
#include <chunkwise/expr/traverse.hpp>
#include <chunkwise/runtime/evaluator.hpp>
#include <chunkwise/runtime/print.hpp>
#include <chunkwise/runtime/reductions.hpp>
#include <chunkwise/runtime/value.hpp>
#include <chunkwise/storage/column_file.hpp>
#include <chunkwise/storage/csv.hpp>
#include <chunkwise/storage/data_source.hpp>
#include <chunkwise/storage/memory_source.hpp>
