#pragma once

#include <chunkwise/storage/data_source.hpp>

namespace chunkwise::storage {

/// Declared shape of a materialized array or table: Fixed(length) of its
/// element type. Throws std::invalid_argument for scalars and sequences.
[[nodiscard]] auto infer_shape(const runtime::Value& value) -> DataShape;

/// An array or table held in memory. Supports Slice and Iterate.
class MemorySource final : public DataSource {
   public:
    /// Throws std::invalid_argument unless `data` is an array or table.
    explicit MemorySource(runtime::Value data);

    [[nodiscard]] auto capabilities() const noexcept -> Capability override {
        return Capability::Slice | Capability::Iterate;
    }
    [[nodiscard]] auto length() const noexcept -> std::size_t override;
    [[nodiscard]] auto byte_size() const noexcept -> std::size_t override;
    [[nodiscard]] auto shape() const -> const DataShape& override { return shape_; }

    [[nodiscard]] auto slice(std::size_t start, std::size_t stop) const
        -> Result<runtime::Value> override;
    [[nodiscard]] auto iterate() const -> Result<runtime::RowStreamPtr> override;
    /// Tables only; the projected source shares the selected columns.
    [[nodiscard]] auto project(const std::vector<std::string>& columns) const
        -> Result<DataSourcePtr> override;

    [[nodiscard]] auto data() const noexcept -> const runtime::Value& { return data_; }

   private:
    runtime::Value data_;
    DataShape shape_;
};

}  // namespace chunkwise::storage
