#pragma once

#include <chunkwise/runtime/value.hpp>

#include <iostream>
#include <string>

namespace chunkwise::runtime {

/// Render one scalar: doubles use `{:g}` with explicit nan/inf.
[[nodiscard]] auto format_scalar(const ScalarValue& value) -> std::string;

/// Pretty-print a value: scalars on one line, arrays as a bracketed list,
/// tables and sequences as aligned columns under a dashed separator.
void print(const Value& value, std::ostream& out = std::cout);

void print(const Table& table, std::ostream& out = std::cout);

}  // namespace chunkwise::runtime
