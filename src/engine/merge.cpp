#include <chunkwise/engine/merge.hpp>

#include <fmt/format.h>

#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace chunkwise::engine {

namespace {

using runtime::ColumnValue;
using runtime::ScalarValue;
using runtime::Sequence;
using runtime::Table;
using runtime::Value;

auto mismatch(std::size_t index, const std::string& what) -> std::unexpected<Error> {
    return make_error(ErrorKind::Type, fmt::format("merge: part {} {}", index, what));
}

// Append `src` to `dst`; both must hold the same element type.
auto append_column(ColumnValue& dst, const ColumnValue& src) -> bool {
    return std::visit(
        [&](auto& out) {
            using ColT = std::decay_t<decltype(out)>;
            const auto* in = std::get_if<ColT>(&src);
            if (in == nullptr) {
                return false;
            }
            out.append(*in);
            return true;
        },
        dst);
}

auto merge_arrays(std::vector<Value>& parts) -> Result<Value> {
    auto out = std::get<ColumnValue>(std::move(parts.front()));
    const auto kind = runtime::column_kind(out);
    for (std::size_t i = 1; i < parts.size(); ++i) {
        const auto* column = std::get_if<ColumnValue>(&parts[i]);
        if (column == nullptr) {
            return mismatch(i, "is a " + runtime::to_string(runtime::shape_of(parts[i])) +
                                   ", expected an array");
        }
        if (!append_column(out, *column)) {
            return mismatch(i, fmt::format("has element type {}, expected {}",
                                           to_string(runtime::column_kind(*column)),
                                           to_string(kind)));
        }
    }
    return Value{std::move(out)};
}

auto merge_tables(std::vector<Value>& parts) -> Result<Value> {
    const auto& first = std::get<Table>(parts.front());
    // Fresh columns: the parts may share column storage with their inputs.
    Table out;
    for (const auto& entry : first.columns) {
        out.add_column(entry.name, *entry.column);
    }
    for (std::size_t i = 1; i < parts.size(); ++i) {
        const auto* table = std::get_if<Table>(&parts[i]);
        if (table == nullptr) {
            return mismatch(i, "is a " + runtime::to_string(runtime::shape_of(parts[i])) +
                                   ", expected a table");
        }
        if (table->columns.size() != out.columns.size()) {
            return mismatch(i, fmt::format("has {} columns, expected {}", table->columns.size(),
                                           out.columns.size()));
        }
        for (std::size_t c = 0; c < out.columns.size(); ++c) {
            auto& dst = out.columns[c];
            const auto& src = table->columns[c];
            if (src.name != dst.name) {
                return mismatch(i, fmt::format("has column '{}' where '{}' was expected",
                                               src.name, dst.name));
            }
            if (!append_column(*dst.column, *src.column)) {
                return mismatch(i, fmt::format("column '{}' has a different element type",
                                               src.name));
            }
        }
    }
    return Value{std::move(out)};
}

auto merge_sequences(std::vector<Value>& parts) -> Result<Value> {
    auto out = std::get<Sequence>(std::move(parts.front()));
    for (std::size_t i = 1; i < parts.size(); ++i) {
        auto* seq = std::get_if<Sequence>(&parts[i]);
        if (seq == nullptr) {
            return mismatch(i, "is a " + runtime::to_string(runtime::shape_of(parts[i])) +
                                   ", expected a sequence");
        }
        if (seq->names != out.names) {
            return mismatch(i, "has different field names");
        }
        out.rows.insert(out.rows.end(), std::make_move_iterator(seq->rows.begin()),
                        std::make_move_iterator(seq->rows.end()));
    }
    return Value{std::move(out)};
}

auto merge_scalars(std::vector<Value>& parts) -> Result<Value> {
    Sequence out;
    out.rows.reserve(parts.size());
    for (std::size_t i = 0; i < parts.size(); ++i) {
        auto* scalar = std::get_if<ScalarValue>(&parts[i]);
        if (scalar == nullptr) {
            return mismatch(i, "is a " + runtime::to_string(runtime::shape_of(parts[i])) +
                                   ", expected a scalar");
        }
        out.rows.push_back(runtime::Row{std::move(*scalar)});
    }
    return Value{std::move(out)};
}

}  // namespace

auto empty_value(const DataShape& shape) -> Value {
    if (shape.is_scalar()) {
        return Sequence{};
    }
    if (shape.dtype.is_record()) {
        Table table;
        for (const auto& field : shape.dtype.fields) {
            table.add_column(field.name, runtime::make_empty_column(field.kind));
        }
        return table;
    }
    return runtime::make_empty_column(shape.dtype.kind);
}

auto merge(std::vector<Value> parts, const DataShape& expected) -> Result<Value> {
    if (parts.empty()) {
        return empty_value(expected);
    }
    if (parts.size() == 1) {
        return std::move(parts.front());
    }
    switch (runtime::shape_of(parts.front())) {
        case runtime::ValueShape::Array:
            return merge_arrays(parts);
        case runtime::ValueShape::Table:
            return merge_tables(parts);
        case runtime::ValueShape::Sequence:
            return merge_sequences(parts);
        case runtime::ValueShape::Scalar:
            return merge_scalars(parts);
    }
    return make_error(ErrorKind::Type, "merge: unknown part shape");
}

}  // namespace chunkwise::engine
