#pragma once

#include <chunkwise/core/datashape.hpp>
#include <chunkwise/core/error.hpp>
#include <chunkwise/runtime/value.hpp>

#include <vector>

namespace chunkwise::engine {

/// Combine per-chunk results, in partition order, into one value.
///
/// The first part decides the form: arrays concatenate, tables concatenate
/// rows, sequences flatten and scalars become a sequence of one-element
/// rows. Parts that disagree in element type or column layout are a Type
/// error. A single part is returned as is; no parts give an empty value of
/// `expected`.
[[nodiscard]] auto merge(std::vector<runtime::Value> parts, const DataShape& expected)
    -> Result<runtime::Value>;

/// Empty array, table or sequence matching `shape`.
[[nodiscard]] auto empty_value(const DataShape& shape) -> runtime::Value;

}  // namespace chunkwise::engine
