#pragma once

#include <chunkwise/core/error.hpp>
#include <chunkwise/expr/node.hpp>
#include <chunkwise/runtime/value.hpp>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chunkwise::runtime {

/// Forward-only, single-pass producer of rows.
///
/// Streams are pulled: `next()` yields the next row, `std::nullopt` at the
/// end, or an error. A stream is not restartable.
class RowStream {
   public:
    RowStream() = default;
    virtual ~RowStream() = default;

    RowStream(const RowStream&) = delete;
    auto operator=(const RowStream&) -> RowStream& = delete;

    /// Field names of each row; empty when rows hold one bare element.
    [[nodiscard]] virtual auto names() const -> const std::vector<std::string>& = 0;
    [[nodiscard]] virtual auto next() -> Result<std::optional<Row>> = 0;
};

using RowStreamPtr = std::unique_ptr<RowStream>;

/// Stream over the rows of an array, table or sequence. Scalars yield one row.
[[nodiscard]] auto stream_value(Value value) -> RowStreamPtr;

/// Drain a stream into a sequence.
[[nodiscard]] auto collect(RowStream& stream) -> Result<Sequence>;

// ─── Lazy operators ───────────────────────────────────────────────────────────
//  Each wraps its input and does work only as rows are pulled. Name lookups
//  happen up front, so an unknown field fails at construction.

[[nodiscard]] auto stream_field(RowStreamPtr input, const std::string& name)
    -> Result<RowStreamPtr>;
[[nodiscard]] auto stream_project(RowStreamPtr input, const std::vector<std::string>& columns)
    -> Result<RowStreamPtr>;
[[nodiscard]] auto stream_relabel(RowStreamPtr input,
                                  const std::vector<std::pair<std::string, std::string>>& renames)
    -> Result<RowStreamPtr>;
[[nodiscard]] auto stream_filter(RowStreamPtr input,
                                 std::shared_ptr<const expr::FilterExpr> predicate)
    -> RowStreamPtr;
[[nodiscard]] auto stream_map(RowStreamPtr input, expr::MapExprPtr body) -> RowStreamPtr;
/// Stops pulling from `input` once `n` rows have been produced.
[[nodiscard]] auto stream_head(RowStreamPtr input, std::size_t n) -> RowStreamPtr;
[[nodiscard]] auto stream_slice(RowStreamPtr input, std::size_t start, std::size_t stop)
    -> RowStreamPtr;
/// First occurrence of each row, in input order.
[[nodiscard]] auto stream_distinct(RowStreamPtr input) -> RowStreamPtr;

}  // namespace chunkwise::runtime
