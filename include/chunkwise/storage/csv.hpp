#pragma once

#include <chunkwise/storage/data_source.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chunkwise::storage {

/// Read a comma-separated file with a header line into a table.
///
/// Each column becomes int64 when every field parses as an integer, double
/// when every field parses as a number, and string otherwise. A non-empty
/// `columns` keeps only those columns, in that order; other fields are
/// checked for count but never stored. InvalidArgument for unknown names.
[[nodiscard]] auto read_csv(std::string_view path, const std::vector<std::string>& columns = {})
    -> Result<runtime::Table>;

/// Forward-only CSV source.
///
/// `open` scans the file once to count rows and infer column types;
/// `iterate` then parses lines lazily. Offers Iterate only.
class CsvStreamSource final : public DataSource {
    struct Token {
        explicit Token() = default;
    };

   public:
    [[nodiscard]] static auto open(std::filesystem::path path)
        -> Result<std::shared_ptr<CsvStreamSource>>;

    /// Use open() or project(). `selected` indexes the file's fields and
    /// lines up with `headers` and `kinds`; `width` is the field count of
    /// every line.
    CsvStreamSource(Token, std::filesystem::path path, std::vector<std::string> headers,
                    std::vector<ScalarKind> kinds, std::vector<std::size_t> selected,
                    std::size_t width, std::size_t rows);

    [[nodiscard]] auto capabilities() const noexcept -> Capability override {
        return Capability::Iterate;
    }
    [[nodiscard]] auto length() const noexcept -> std::size_t override { return rows_; }
    [[nodiscard]] auto byte_size() const noexcept -> std::size_t override;
    [[nodiscard]] auto shape() const -> const DataShape& override { return shape_; }

    [[nodiscard]] auto iterate() const -> Result<runtime::RowStreamPtr> override;
    /// Lines are still read whole; unselected fields are skipped unparsed.
    [[nodiscard]] auto project(const std::vector<std::string>& columns) const
        -> Result<DataSourcePtr> override;

   private:
    std::filesystem::path path_;
    std::vector<std::string> headers_;
    std::vector<ScalarKind> kinds_;
    std::vector<std::size_t> selected_;
    std::size_t width_;
    std::size_t rows_;
    DataShape shape_;
};

}  // namespace chunkwise::storage
