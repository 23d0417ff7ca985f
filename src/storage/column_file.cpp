#include <chunkwise/storage/column_file.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <system_error>
#include <type_traits>
#include <utility>

namespace chunkwise::storage {

namespace {

auto io_error(const std::filesystem::path& path, std::string_view what) -> std::unexpected<Error> {
    return make_error(ErrorKind::Io, fmt::format("{}: {}", path.string(), what));
}

template <typename T>
auto read_range(std::ifstream& in, std::size_t count) -> std::optional<Column<T>> {
    Column<T> out;
    out.resize(count);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    in.read(reinterpret_cast<char*>(out.data()),
            static_cast<std::streamsize>(count * sizeof(T)));
    if (!in) {
        return std::nullopt;
    }
    return out;
}

auto read_block(std::ifstream& in, ScalarKind kind, std::size_t count)
    -> std::optional<runtime::ColumnValue> {
    if (kind == ScalarKind::Int) {
        auto col = read_range<std::int64_t>(in, count);
        if (!col) {
            return std::nullopt;
        }
        return runtime::ColumnValue{std::move(*col)};
    }
    auto col = read_range<double>(in, count);
    if (!col) {
        return std::nullopt;
    }
    return runtime::ColumnValue{std::move(*col)};
}

// Reads the file front to back in blocks of kBlockElements.
class BlockStream final : public runtime::RowStream {
   public:
    BlockStream(std::ifstream in, std::filesystem::path path, ScalarKind kind,
                std::size_t length)
        : in_(std::move(in)), path_(std::move(path)), kind_(kind), remaining_(length) {}

    [[nodiscard]] auto names() const -> const std::vector<std::string>& override {
        return names_;
    }

    auto next() -> Result<std::optional<runtime::Row>> override {
        if (!block_ || pos_ >= runtime::column_size(*block_)) {
            if (remaining_ == 0) {
                return std::nullopt;
            }
            std::size_t count = std::min(remaining_, ColumnFileSource::kBlockElements);
            block_ = read_block(in_, kind_, count);
            if (!block_) {
                return io_error(path_, "short read");
            }
            remaining_ -= count;
            pos_ = 0;
        }
        return runtime::Row{runtime::scalar_at(*block_, pos_++)};
    }

   private:
    std::ifstream in_;
    std::filesystem::path path_;
    ScalarKind kind_;
    std::size_t remaining_;
    std::optional<runtime::ColumnValue> block_;
    std::size_t pos_ = 0;
    std::vector<std::string> names_;
};

}  // namespace

ColumnFileSource::ColumnFileSource(Token /*token*/, std::filesystem::path path,
                                   ScalarKind kind, std::size_t length)
    : path_(std::move(path)),
      kind_(kind),
      length_(length),
      shape_(DataShape::fixed(length, scalar_dtype(kind))) {}

auto ColumnFileSource::open(std::filesystem::path path, ScalarKind kind)
    -> Result<std::shared_ptr<ColumnFileSource>> {
    if (kind == ScalarKind::String) {
        return make_error(ErrorKind::InvalidArgument,
                          "column files hold int64 or double values only");
    }
    std::error_code ec;
    auto bytes = std::filesystem::file_size(path, ec);
    if (ec) {
        return io_error(path, ec.message());
    }
    if (bytes % kElementBytes != 0) {
        return io_error(path, fmt::format("size {} is not a multiple of {}", bytes,
                                          kElementBytes));
    }
    auto length = static_cast<std::size_t>(bytes / kElementBytes);
    return std::make_shared<ColumnFileSource>(Token{}, std::move(path), kind, length);
}

auto ColumnFileSource::slice(std::size_t start, std::size_t stop) const
    -> Result<runtime::Value> {
    auto range = check_range(start, stop, length_);
    if (!range) {
        return std::unexpected(range.error());
    }
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return io_error(path_, "failed to open");
    }
    in.seekg(static_cast<std::streamoff>(start * kElementBytes));
    auto block = read_block(in, kind_, stop - start);
    if (!block) {
        return io_error(path_, fmt::format("short read of [{}, {})", start, stop));
    }
    return runtime::Value{std::move(*block)};
}

auto ColumnFileSource::iterate() const -> Result<runtime::RowStreamPtr> {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return io_error(path_, "failed to open");
    }
    return std::make_unique<BlockStream>(std::move(in), path_, kind_, length_);
}

auto write_column_file(const std::filesystem::path& path, const runtime::ColumnValue& column)
    -> Result<void> {
    if (std::holds_alternative<Column<std::string>>(column)) {
        return make_error(ErrorKind::InvalidArgument,
                          "column files hold int64 or double values only");
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return io_error(path, "failed to open for writing");
    }
    std::visit(
        [&out](const auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (!std::is_same_v<T, std::string>) {
                // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
                out.write(reinterpret_cast<const char*>(col.data()),
                          static_cast<std::streamsize>(col.size() * sizeof(T)));
            }
        },
        column);
    if (!out) {
        return io_error(path, "write failed");
    }
    return {};
}

}  // namespace chunkwise::storage
