#pragma once

#include <chunkwise/storage/data_source.hpp>

#include <filesystem>
#include <memory>

namespace chunkwise::storage {

/// A single int64 or double column stored as a flat array of 8-byte
/// little-endian values, with no header.
///
/// Nothing is held in memory between calls: each `slice` opens its own
/// stream, seeks and reads exactly the requested range, so slices may be
/// requested concurrently. `iterate` reads buffered blocks.
class ColumnFileSource final : public DataSource {
    struct Token {
        explicit Token() = default;
    };

   public:
    /// Elements read per block when iterating.
    static constexpr std::size_t kBlockElements = 1U << 16U;

    /// Io error when the file is missing or its size is not a multiple of
    /// 8 bytes; InvalidArgument for string columns.
    [[nodiscard]] static auto open(std::filesystem::path path, ScalarKind kind)
        -> Result<std::shared_ptr<ColumnFileSource>>;

    /// Use open().
    ColumnFileSource(Token, std::filesystem::path path, ScalarKind kind, std::size_t length);

    [[nodiscard]] auto capabilities() const noexcept -> Capability override {
        return Capability::Slice | Capability::Iterate;
    }
    [[nodiscard]] auto length() const noexcept -> std::size_t override { return length_; }
    [[nodiscard]] auto byte_size() const noexcept -> std::size_t override {
        return length_ * kElementBytes;
    }
    [[nodiscard]] auto shape() const -> const DataShape& override { return shape_; }

    [[nodiscard]] auto slice(std::size_t start, std::size_t stop) const
        -> Result<runtime::Value> override;
    [[nodiscard]] auto iterate() const -> Result<runtime::RowStreamPtr> override;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return path_; }

   private:
    static constexpr std::size_t kElementBytes = 8;

    std::filesystem::path path_;
    ScalarKind kind_;
    std::size_t length_;
    DataShape shape_;
};

/// Write an int64 or double column in the ColumnFileSource layout.
[[nodiscard]] auto write_column_file(const std::filesystem::path& path,
                                     const runtime::ColumnValue& column) -> Result<void>;

}  // namespace chunkwise::storage
