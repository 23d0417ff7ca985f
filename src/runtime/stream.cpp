#include <chunkwise/runtime/predicate.hpp>
#include <chunkwise/runtime/stream.hpp>

#include <fmt/format.h>

#include <robin_hood.h>
#include <type_traits>
#include <utility>
#include <variant>

namespace chunkwise::runtime {

namespace {

const std::vector<std::string> kNoNames;

auto index_of(const std::vector<std::string>& names, const std::string& name)
    -> Result<std::size_t> {
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) {
            return i;
        }
    }
    if (names.empty()) {
        return make_error(ErrorKind::Type,
                          fmt::format("field '{}' of a stream of bare elements", name));
    }
    return make_error(ErrorKind::Evaluation, fmt::format("unknown field '{}'", name));
}

// Rows of a materialized value, produced on demand.
class ValueStream final : public RowStream {
   public:
    explicit ValueStream(Value value) : value_(std::move(value)) {
        if (const auto* table = std::get_if<Table>(&value_)) {
            names_ = column_names(*table);
        } else if (const auto* sequence = std::get_if<Sequence>(&value_)) {
            names_ = sequence->names;
        }
        length_ = value_length(value_);
    }

    [[nodiscard]] auto names() const -> const std::vector<std::string>& override {
        return names_;
    }

    auto next() -> Result<std::optional<Row>> override {
        if (pos_ >= length_) {
            return std::nullopt;
        }
        std::size_t row = pos_++;
        return std::visit(
            [row](const auto& v) -> std::optional<Row> {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, ScalarValue>) {
                    return Row{v};
                } else if constexpr (std::is_same_v<T, ColumnValue>) {
                    return Row{scalar_at(v, row)};
                } else if constexpr (std::is_same_v<T, Table>) {
                    return table_row(v, row);
                } else {
                    return v.rows[row];
                }
            },
            value_);
    }

   private:
    Value value_;
    std::vector<std::string> names_;
    std::size_t length_ = 0;
    std::size_t pos_ = 0;
};

// Picks and reorders fields. An empty `out_names` yields bare elements.
class SelectStream final : public RowStream {
   public:
    SelectStream(RowStreamPtr input, std::vector<std::size_t> indices,
                 std::vector<std::string> out_names)
        : input_(std::move(input)), indices_(std::move(indices)), names_(std::move(out_names)) {}

    [[nodiscard]] auto names() const -> const std::vector<std::string>& override {
        return names_;
    }

    auto next() -> Result<std::optional<Row>> override {
        auto row = input_->next();
        if (!row || !*row) {
            return row;
        }
        Row out;
        out.reserve(indices_.size());
        for (auto idx : indices_) {
            out.push_back(std::move((**row)[idx]));
        }
        return out;
    }

   private:
    RowStreamPtr input_;
    std::vector<std::size_t> indices_;
    std::vector<std::string> names_;
};

class RenameStream final : public RowStream {
   public:
    RenameStream(RowStreamPtr input, std::vector<std::string> names)
        : input_(std::move(input)), names_(std::move(names)) {}

    [[nodiscard]] auto names() const -> const std::vector<std::string>& override {
        return names_;
    }
    auto next() -> Result<std::optional<Row>> override { return input_->next(); }

   private:
    RowStreamPtr input_;
    std::vector<std::string> names_;
};

class FilterStream final : public RowStream {
   public:
    FilterStream(RowStreamPtr input, std::shared_ptr<const expr::FilterExpr> predicate)
        : input_(std::move(input)), predicate_(std::move(predicate)) {}

    [[nodiscard]] auto names() const -> const std::vector<std::string>& override {
        return input_->names();
    }

    auto next() -> Result<std::optional<Row>> override {
        while (true) {
            auto row = input_->next();
            if (!row || !*row) {
                return row;
            }
            auto keep = eval_predicate_row(*predicate_, input_->names(), **row);
            if (!keep) {
                return std::unexpected(keep.error());
            }
            if (*keep) {
                return row;
            }
        }
    }

   private:
    RowStreamPtr input_;
    std::shared_ptr<const expr::FilterExpr> predicate_;
};

class MapStream final : public RowStream {
   public:
    MapStream(RowStreamPtr input, expr::MapExprPtr body)
        : input_(std::move(input)), body_(std::move(body)) {}

    [[nodiscard]] auto names() const -> const std::vector<std::string>& override {
        return kNoNames;
    }

    auto next() -> Result<std::optional<Row>> override {
        auto row = input_->next();
        if (!row || !*row) {
            return row;
        }
        auto value = eval_map_row(*body_, input_->names(), **row);
        if (!value) {
            return std::unexpected(value.error());
        }
        return Row{std::move(*value)};
    }

   private:
    RowStreamPtr input_;
    expr::MapExprPtr body_;
};

// Skips `start` rows, then yields rows until `stop`.
class RangeStream final : public RowStream {
   public:
    RangeStream(RowStreamPtr input, std::size_t start, std::size_t stop)
        : input_(std::move(input)), start_(start), stop_(stop) {}

    [[nodiscard]] auto names() const -> const std::vector<std::string>& override {
        return input_->names();
    }

    auto next() -> Result<std::optional<Row>> override {
        while (pos_ < start_) {
            auto skipped = input_->next();
            if (!skipped || !*skipped) {
                pos_ = stop_;
                return skipped;
            }
            ++pos_;
        }
        if (pos_ >= stop_) {
            return std::nullopt;
        }
        ++pos_;
        return input_->next();
    }

   private:
    RowStreamPtr input_;
    std::size_t start_;
    std::size_t stop_;
    std::size_t pos_ = 0;
};

class DistinctStream final : public RowStream {
   public:
    explicit DistinctStream(RowStreamPtr input) : input_(std::move(input)) {}

    [[nodiscard]] auto names() const -> const std::vector<std::string>& override {
        return input_->names();
    }

    auto next() -> Result<std::optional<Row>> override {
        while (true) {
            auto row = input_->next();
            if (!row || !*row) {
                return row;
            }
            if (seen_.insert(**row).second) {
                return row;
            }
        }
    }

   private:
    RowStreamPtr input_;
    robin_hood::unordered_flat_set<Row, RowHash, RowEq> seen_;
};

}  // namespace

auto stream_value(Value value) -> RowStreamPtr {
    return std::make_unique<ValueStream>(std::move(value));
}

auto collect(RowStream& stream) -> Result<Sequence> {
    Sequence out;
    out.names = stream.names();
    while (true) {
        auto row = stream.next();
        if (!row) {
            return std::unexpected(row.error());
        }
        if (!*row) {
            break;
        }
        out.rows.push_back(std::move(**row));
    }
    return out;
}

auto stream_field(RowStreamPtr input, const std::string& name) -> Result<RowStreamPtr> {
    auto idx = index_of(input->names(), name);
    if (!idx) {
        return std::unexpected(idx.error());
    }
    return std::make_unique<SelectStream>(std::move(input), std::vector<std::size_t>{*idx},
                                          std::vector<std::string>{});
}

auto stream_project(RowStreamPtr input, const std::vector<std::string>& columns)
    -> Result<RowStreamPtr> {
    std::vector<std::size_t> indices;
    indices.reserve(columns.size());
    for (const auto& name : columns) {
        auto idx = index_of(input->names(), name);
        if (!idx) {
            return std::unexpected(idx.error());
        }
        indices.push_back(*idx);
    }
    return std::make_unique<SelectStream>(std::move(input), std::move(indices), columns);
}

auto stream_relabel(RowStreamPtr input,
                    const std::vector<std::pair<std::string, std::string>>& renames)
    -> Result<RowStreamPtr> {
    auto names = input->names();
    for (const auto& [from, to] : renames) {
        auto idx = index_of(names, from);
        if (!idx) {
            return std::unexpected(idx.error());
        }
        names[*idx] = to;
    }
    return std::make_unique<RenameStream>(std::move(input), std::move(names));
}

auto stream_filter(RowStreamPtr input, std::shared_ptr<const expr::FilterExpr> predicate)
    -> RowStreamPtr {
    return std::make_unique<FilterStream>(std::move(input), std::move(predicate));
}

auto stream_map(RowStreamPtr input, expr::MapExprPtr body) -> RowStreamPtr {
    return std::make_unique<MapStream>(std::move(input), std::move(body));
}

auto stream_head(RowStreamPtr input, std::size_t n) -> RowStreamPtr {
    return std::make_unique<RangeStream>(std::move(input), 0, n);
}

auto stream_slice(RowStreamPtr input, std::size_t start, std::size_t stop) -> RowStreamPtr {
    return std::make_unique<RangeStream>(std::move(input), start, stop);
}

auto stream_distinct(RowStreamPtr input) -> RowStreamPtr {
    return std::make_unique<DistinctStream>(std::move(input));
}

}  // namespace chunkwise::runtime
