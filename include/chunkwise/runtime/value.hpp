#pragma once

#include <chunkwise/core/column.hpp>
#include <chunkwise/core/datashape.hpp>
#include <chunkwise/core/error.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace chunkwise::runtime {

using ScalarValue = std::variant<std::int64_t, double, std::string>;
using ColumnValue = std::variant<Column<std::int64_t>, Column<double>, Column<std::string>>;

struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
};

/// Named-column record batch. All columns have equal length.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    void add_column(std::string name, ColumnValue column);
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
};

/// One element of a lazily produced sequence: a single value for scalar-typed
/// data, or one value per field for records.
using Row = std::vector<ScalarValue>;

/// General ordered sequence of rows, the materialized form of a stream.
/// `names` is empty when every row holds a single bare element.
struct Sequence {
    std::vector<std::string> names;
    std::vector<Row> rows;
};

/// Any materialized value the evaluator produces or consumes.
using Value = std::variant<ScalarValue, ColumnValue, Table, Sequence>;

enum class ValueShape : std::uint8_t {
    Scalar,
    Array,
    Table,
    Sequence,
};

[[nodiscard]] auto shape_of(const Value& value) noexcept -> ValueShape;
[[nodiscard]] auto to_string(ValueShape shape) -> std::string;

[[nodiscard]] auto scalar_kind(const ScalarValue& value) noexcept -> ScalarKind;
[[nodiscard]] auto column_kind(const ColumnValue& column) noexcept -> ScalarKind;
[[nodiscard]] auto column_size(const ColumnValue& column) noexcept -> std::size_t;
[[nodiscard]] auto make_empty_column(ScalarKind kind) -> ColumnValue;
[[nodiscard]] auto scalar_at(const ColumnValue& column, std::size_t row) -> ScalarValue;
[[nodiscard]] auto as_double(const ScalarValue& value) -> Result<double>;

/// Append `value` to `column`; int64 values widen into double columns.
[[nodiscard]] auto append_scalar(ColumnValue& column, const ScalarValue& value) -> Result<void>;

/// Wrap a scalar as a one-element array (the keepdims presentation).
[[nodiscard]] auto wrap_scalar(const ScalarValue& value) -> ColumnValue;

/// Copy rows [start, stop) of an array or table.
[[nodiscard]] auto slice_value(const Value& value, std::size_t start, std::size_t stop)
    -> Result<Value>;

/// Number of elements along the primary axis (1 for scalars).
[[nodiscard]] auto value_length(const Value& value) noexcept -> std::size_t;

/// Build a row for record `row` of a table.
[[nodiscard]] auto table_row(const Table& table, std::size_t row) -> Row;
[[nodiscard]] auto column_names(const Table& table) -> std::vector<std::string>;

/// Convert a sequence into a columnar value: an array for bare elements, a
/// table for records. Column types come from the first row (int64 widens to
/// double when later rows hold doubles).
[[nodiscard]] auto sequence_to_columnar(const Sequence& sequence) -> Result<Value>;

/// Approximate in-memory footprint of a value, in bytes.
[[nodiscard]] auto value_byte_size(const Value& value) noexcept -> std::size_t;

struct RowHash {
    auto operator()(const Row& row) const noexcept -> std::size_t;
};

struct RowEq {
    auto operator()(const Row& a, const Row& b) const -> bool { return a == b; }
};

}  // namespace chunkwise::runtime
