#pragma once

#include <chunkwise/core/datashape.hpp>
#include <chunkwise/core/error.hpp>
#include <chunkwise/runtime/stream.hpp>
#include <chunkwise/runtime/value.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chunkwise::storage {

/// Access modes a data source offers. Flags combine with `|`.
enum class Capability : std::uint8_t {
    None = 0,
    /// Random-access `slice(start, stop)`.
    Slice = 1U << 0U,
    /// Forward-only `iterate()`.
    Iterate = 1U << 1U,
};

[[nodiscard]] constexpr auto operator|(Capability a, Capability b) noexcept -> Capability {
    return static_cast<Capability>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

[[nodiscard]] constexpr auto has(Capability set, Capability flag) noexcept -> bool {
    return (static_cast<std::uint8_t>(set) & static_cast<std::uint8_t>(flag)) != 0;
}

class DataSource;
using DataSourcePtr = std::shared_ptr<const DataSource>;

/// Columnar data the engine executes against.
///
/// `slice` must be safe to call concurrently from several threads.
class DataSource {
   public:
    DataSource() = default;
    virtual ~DataSource() = default;

    DataSource(const DataSource&) = delete;
    auto operator=(const DataSource&) -> DataSource& = delete;

    [[nodiscard]] virtual auto capabilities() const noexcept -> Capability = 0;
    /// Number of elements (rows).
    [[nodiscard]] virtual auto length() const noexcept -> std::size_t = 0;
    /// Total in-memory footprint if fully materialized.
    [[nodiscard]] virtual auto byte_size() const noexcept -> std::size_t = 0;
    /// Declared schema: Fixed(length) of the element type.
    [[nodiscard]] virtual auto shape() const -> const DataShape& = 0;

    /// Materialize elements [start, stop). Unsupported unless the source
    /// reports Capability::Slice.
    [[nodiscard]] virtual auto slice(std::size_t start, std::size_t stop) const
        -> Result<runtime::Value>;

    /// Open a fresh forward-only stream over every element. Unsupported
    /// unless the source reports Capability::Iterate.
    [[nodiscard]] virtual auto iterate() const -> Result<runtime::RowStreamPtr>;

    /// The same rows restricted to `columns` of a record-typed source, in
    /// the order given. Only the named columns are materialized afterwards.
    /// Unsupported unless the source can skip columns; InvalidArgument for
    /// unknown names.
    [[nodiscard]] virtual auto project(const std::vector<std::string>& columns) const
        -> Result<DataSourcePtr>;
};

/// InvalidArgument unless start <= stop <= length.
[[nodiscard]] auto check_range(std::size_t start, std::size_t stop, std::size_t length)
    -> Result<void>;

}  // namespace chunkwise::storage
