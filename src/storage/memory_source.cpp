#include <chunkwise/storage/memory_source.hpp>

#include <fmt/format.h>

#include <memory>
#include <stdexcept>
#include <utility>

namespace chunkwise::storage {

auto infer_shape(const runtime::Value& value) -> DataShape {
    if (const auto* column = std::get_if<runtime::ColumnValue>(&value)) {
        return DataShape::fixed(runtime::column_size(*column),
                                scalar_dtype(runtime::column_kind(*column)));
    }
    if (const auto* table = std::get_if<runtime::Table>(&value)) {
        std::vector<FieldType> fields;
        fields.reserve(table->columns.size());
        for (const auto& entry : table->columns) {
            fields.push_back(
                FieldType{.name = entry.name, .kind = runtime::column_kind(*entry.column)});
        }
        return DataShape::fixed(table->rows(), record_dtype(std::move(fields)));
    }
    throw std::invalid_argument("infer_shape: expected an array or table, got " +
                                runtime::to_string(runtime::shape_of(value)));
}

MemorySource::MemorySource(runtime::Value data)
    : data_(std::move(data)), shape_(infer_shape(data_)) {}

auto MemorySource::length() const noexcept -> std::size_t {
    return runtime::value_length(data_);
}

auto MemorySource::byte_size() const noexcept -> std::size_t {
    return runtime::value_byte_size(data_);
}

auto MemorySource::slice(std::size_t start, std::size_t stop) const -> Result<runtime::Value> {
    auto range = check_range(start, stop, length());
    if (!range) {
        return std::unexpected(range.error());
    }
    return runtime::slice_value(data_, start, stop);
}

auto MemorySource::iterate() const -> Result<runtime::RowStreamPtr> {
    return runtime::stream_value(data_);
}

auto MemorySource::project(const std::vector<std::string>& columns) const
    -> Result<DataSourcePtr> {
    const auto* table = std::get_if<runtime::Table>(&data_);
    if (table == nullptr) {
        return make_error(ErrorKind::InvalidArgument, "cannot project an array source");
    }
    runtime::Table out;
    for (const auto& name : columns) {
        auto it = table->index.find(name);
        if (it == table->index.end()) {
            return make_error(ErrorKind::InvalidArgument,
                              fmt::format("project: unknown column '{}'", name));
        }
        out.index[name] = out.columns.size();
        out.columns.push_back(table->columns[it->second]);
    }
    return std::make_shared<const MemorySource>(runtime::Value{std::move(out)});
}

}  // namespace chunkwise::storage
