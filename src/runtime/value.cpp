#include <chunkwise/runtime/value.hpp>

#include <fmt/format.h>

#include <functional>
#include <type_traits>

namespace chunkwise::runtime {

namespace {

auto widen_to_double(const Column<std::int64_t>& src) -> Column<double> {
    Column<double> out;
    out.reserve(src.size());
    for (auto v : src) {
        out.push_back(static_cast<double>(v));
    }
    return out;
}

}  // namespace

void Table::add_column(std::string name, ColumnValue column) {
    if (auto it = index.find(name); it != index.end()) {
        // Reseat the shared_ptr rather than mutating shared data.
        columns[it->second].column = std::make_shared<ColumnValue>(std::move(column));
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name),
                                  .column = std::make_shared<ColumnValue>(std::move(column))});
    index[columns.back().name] = pos;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

auto shape_of(const Value& value) noexcept -> ValueShape {
    switch (value.index()) {
        case 0:
            return ValueShape::Scalar;
        case 1:
            return ValueShape::Array;
        case 2:
            return ValueShape::Table;
        default:
            return ValueShape::Sequence;
    }
}

auto to_string(ValueShape shape) -> std::string {
    switch (shape) {
        case ValueShape::Scalar:
            return "scalar";
        case ValueShape::Array:
            return "array";
        case ValueShape::Table:
            return "table";
        case ValueShape::Sequence:
            return "sequence";
    }
    return "unknown";
}

auto scalar_kind(const ScalarValue& value) noexcept -> ScalarKind {
    if (std::holds_alternative<std::int64_t>(value)) {
        return ScalarKind::Int;
    }
    if (std::holds_alternative<double>(value)) {
        return ScalarKind::Double;
    }
    return ScalarKind::String;
}

auto column_kind(const ColumnValue& column) noexcept -> ScalarKind {
    if (std::holds_alternative<Column<std::int64_t>>(column)) {
        return ScalarKind::Int;
    }
    if (std::holds_alternative<Column<double>>(column)) {
        return ScalarKind::Double;
    }
    return ScalarKind::String;
}

auto column_size(const ColumnValue& column) noexcept -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto make_empty_column(ScalarKind kind) -> ColumnValue {
    switch (kind) {
        case ScalarKind::Int:
            return Column<std::int64_t>{};
        case ScalarKind::Double:
            return Column<double>{};
        case ScalarKind::String:
            return Column<std::string>{};
    }
    return Column<double>{};
}

auto scalar_at(const ColumnValue& column, std::size_t row) -> ScalarValue {
    return std::visit([row](const auto& col) -> ScalarValue { return col[row]; }, column);
}

auto as_double(const ScalarValue& value) -> Result<double> {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    return make_error(ErrorKind::Type, "expected a numeric value, got string");
}

auto append_scalar(ColumnValue& column, const ScalarValue& value) -> Result<void> {
    if (auto* ints = std::get_if<Column<std::int64_t>>(&column)) {
        if (const auto* v = std::get_if<std::int64_t>(&value)) {
            ints->push_back(*v);
            return {};
        }
        if (const auto* d = std::get_if<double>(&value)) {
            auto widened = widen_to_double(*ints);
            widened.push_back(*d);
            column = std::move(widened);
            return {};
        }
    } else if (auto* dbls = std::get_if<Column<double>>(&column)) {
        if (const auto* v = std::get_if<double>(&value)) {
            dbls->push_back(*v);
            return {};
        }
        if (const auto* i = std::get_if<std::int64_t>(&value)) {
            dbls->push_back(static_cast<double>(*i));
            return {};
        }
    } else if (auto* strs = std::get_if<Column<std::string>>(&column)) {
        if (const auto* s = std::get_if<std::string>(&value)) {
            strs->push_back(*s);
            return {};
        }
    }
    return make_error(ErrorKind::Type,
                      fmt::format("cannot append {} value to {} column",
                                  to_string(scalar_kind(value)), to_string(column_kind(column))));
}

auto wrap_scalar(const ScalarValue& value) -> ColumnValue {
    return std::visit([](const auto& v) -> ColumnValue {
        using T = std::decay_t<decltype(v)>;
        return Column<T>{v};
    },
                      value);
}

auto slice_value(const Value& value, std::size_t start, std::size_t stop) -> Result<Value> {
    std::size_t length = value_length(value);
    if (stop > length) {
        stop = length;
    }
    if (start > stop) {
        start = stop;
    }
    if (const auto* column = std::get_if<ColumnValue>(&value)) {
        return Value{std::visit(
            [&](const auto& col) -> ColumnValue { return col.slice(start, stop); }, *column)};
    }
    if (const auto* table = std::get_if<Table>(&value)) {
        Table out;
        for (const auto& entry : table->columns) {
            out.add_column(entry.name, std::visit(
                                           [&](const auto& col) -> ColumnValue {
                                               return col.slice(start, stop);
                                           },
                                           *entry.column));
        }
        return Value{std::move(out)};
    }
    if (const auto* sequence = std::get_if<Sequence>(&value)) {
        Sequence out;
        out.names = sequence->names;
        out.rows.assign(sequence->rows.begin() + static_cast<std::ptrdiff_t>(start),
                        sequence->rows.begin() + static_cast<std::ptrdiff_t>(stop));
        return Value{std::move(out)};
    }
    return make_error(ErrorKind::Type, "cannot slice a scalar");
}

auto value_length(const Value& value) noexcept -> std::size_t {
    if (const auto* column = std::get_if<ColumnValue>(&value)) {
        return column_size(*column);
    }
    if (const auto* table = std::get_if<Table>(&value)) {
        return table->rows();
    }
    if (const auto* sequence = std::get_if<Sequence>(&value)) {
        return sequence->rows.size();
    }
    return 1;
}

auto table_row(const Table& table, std::size_t row) -> Row {
    Row out;
    out.reserve(table.columns.size());
    for (const auto& entry : table.columns) {
        out.push_back(scalar_at(*entry.column, row));
    }
    return out;
}

auto column_names(const Table& table) -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(table.columns.size());
    for (const auto& entry : table.columns) {
        names.push_back(entry.name);
    }
    return names;
}

auto sequence_to_columnar(const Sequence& sequence) -> Result<Value> {
    std::size_t width = sequence.names.empty() ? 1 : sequence.names.size();
    std::vector<ColumnValue> columns;
    columns.reserve(width);
    for (std::size_t c = 0; c < width; ++c) {
        ScalarKind kind = ScalarKind::Double;
        if (!sequence.rows.empty() && sequence.rows.front().size() > c) {
            kind = scalar_kind(sequence.rows.front()[c]);
        }
        columns.push_back(make_empty_column(kind));
        std::visit([&](auto& col) { col.reserve(sequence.rows.size()); }, columns.back());
    }
    for (const auto& row : sequence.rows) {
        if (row.size() != width) {
            return make_error(ErrorKind::Type,
                              fmt::format("sequence row has {} values, expected {}", row.size(),
                                          width));
        }
        for (std::size_t c = 0; c < width; ++c) {
            auto appended = append_scalar(columns[c], row[c]);
            if (!appended) {
                return std::unexpected(appended.error());
            }
        }
    }
    if (sequence.names.empty()) {
        return Value{std::move(columns.front())};
    }
    Table table;
    for (std::size_t c = 0; c < width; ++c) {
        table.add_column(sequence.names[c], std::move(columns[c]));
    }
    return Value{std::move(table)};
}

auto value_byte_size(const Value& value) noexcept -> std::size_t {
    auto column_bytes = [](const ColumnValue& column) -> std::size_t {
        return column_size(column) * byte_width(column_kind(column));
    };
    if (const auto* column = std::get_if<ColumnValue>(&value)) {
        return column_bytes(*column);
    }
    if (const auto* table = std::get_if<Table>(&value)) {
        std::size_t total = 0;
        for (const auto& entry : table->columns) {
            total += column_bytes(*entry.column);
        }
        return total;
    }
    if (const auto* sequence = std::get_if<Sequence>(&value)) {
        std::size_t width = sequence->names.empty() ? 1 : sequence->names.size();
        return sequence->rows.size() * width * sizeof(ScalarValue);
    }
    return sizeof(ScalarValue);
}

auto RowHash::operator()(const Row& row) const noexcept -> std::size_t {
    std::size_t seed = 0;
    auto hash_combine = [&](std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    for (const auto& value : row) {
        hash_combine(std::visit(
            [](const auto& v) { return std::hash<std::decay_t<decltype(v)>>{}(v); }, value));
    }
    return seed;
}

}  // namespace chunkwise::runtime
