#include <chunkwise/runtime/group_by.hpp>
#include <chunkwise/runtime/reductions.hpp>

#include <fmt/format.h>

#include <robin_hood.h>

#include <cstdint>
#include <utility>

namespace chunkwise::runtime {

namespace {

auto format_columns(const Table& table) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < table.columns.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(table.columns[i].name);
    }
    return out;
}

auto result_kind(expr::AggFunc func, ScalarKind input) -> ScalarKind {
    switch (func) {
        case expr::AggFunc::Count:
        case expr::AggFunc::NUnique:
            return ScalarKind::Int;
        case expr::AggFunc::Mean:
            return ScalarKind::Double;
        default:
            return input;
    }
}

}  // namespace

auto to_node_kind(expr::AggFunc func) noexcept -> expr::NodeKind {
    switch (func) {
        case expr::AggFunc::Sum:
            return expr::NodeKind::Sum;
        case expr::AggFunc::Mean:
            return expr::NodeKind::Mean;
        case expr::AggFunc::Min:
            return expr::NodeKind::Min;
        case expr::AggFunc::Max:
            return expr::NodeKind::Max;
        case expr::AggFunc::Count:
            return expr::NodeKind::Count;
        case expr::AggFunc::NUnique:
            return expr::NodeKind::NUnique;
    }
    return expr::NodeKind::Count;
}

auto aggregate_table(const Table& input, const std::vector<std::string>& keys,
                     const std::vector<expr::AggSpec>& aggregations) -> Result<Table> {
    std::vector<const ColumnValue*> group_columns;
    group_columns.reserve(keys.size());
    for (const auto& key : keys) {
        const auto* column = input.find(key);
        if (column == nullptr) {
            return make_error(ErrorKind::Evaluation,
                              fmt::format("group-by column not found: {} (available: {})", key,
                                          format_columns(input)));
        }
        group_columns.push_back(column);
    }

    std::vector<const ColumnValue*> agg_columns;
    std::vector<ScalarKind> agg_inputs;
    agg_columns.reserve(aggregations.size());
    agg_inputs.reserve(aggregations.size());
    for (const auto& agg : aggregations) {
        if (agg.func == expr::AggFunc::Count) {
            agg_columns.push_back(nullptr);
            agg_inputs.push_back(ScalarKind::Int);
            continue;
        }
        const auto* column = input.find(agg.column);
        if (column == nullptr) {
            return make_error(ErrorKind::Evaluation,
                              fmt::format("aggregate column not found: {} (available: {})",
                                          agg.column, format_columns(input)));
        }
        agg_columns.push_back(column);
        agg_inputs.push_back(column_kind(*column));
    }

    robin_hood::unordered_flat_map<Row, std::size_t, RowHash, RowEq> group_index;
    std::vector<Row> group_keys;
    std::vector<std::vector<Reducer>> states;

    const std::size_t rows = input.rows();
    Row key;
    key.reserve(group_columns.size());
    for (std::size_t r = 0; r < rows; ++r) {
        key.clear();
        for (const auto* column : group_columns) {
            key.push_back(scalar_at(*column, r));
        }
        auto [it, inserted] = group_index.try_emplace(key, group_keys.size());
        if (inserted) {
            group_keys.push_back(key);
            std::vector<Reducer> slots;
            slots.reserve(aggregations.size());
            for (std::size_t a = 0; a < aggregations.size(); ++a) {
                slots.emplace_back(to_node_kind(aggregations[a].func), agg_inputs[a]);
            }
            states.push_back(std::move(slots));
        }
        auto& slots = states[it->second];
        for (std::size_t a = 0; a < aggregations.size(); ++a) {
            Result<void> updated;
            if (agg_columns[a] == nullptr) {
                updated = slots[a].update(ScalarValue{std::int64_t{1}});
            } else {
                updated = slots[a].update(scalar_at(*agg_columns[a], r));
            }
            if (!updated) {
                return std::unexpected(updated.error());
            }
        }
    }

    std::vector<ColumnValue> out_keys;
    out_keys.reserve(group_columns.size());
    for (const auto* column : group_columns) {
        out_keys.push_back(make_empty_column(column_kind(*column)));
    }
    std::vector<ColumnValue> out_aggs;
    out_aggs.reserve(aggregations.size());
    for (std::size_t a = 0; a < aggregations.size(); ++a) {
        out_aggs.push_back(make_empty_column(result_kind(aggregations[a].func, agg_inputs[a])));
    }

    for (std::size_t g = 0; g < group_keys.size(); ++g) {
        for (std::size_t k = 0; k < group_keys[g].size(); ++k) {
            auto appended = append_scalar(out_keys[k], group_keys[g][k]);
            if (!appended) {
                return std::unexpected(appended.error());
            }
        }
        for (std::size_t a = 0; a < aggregations.size(); ++a) {
            auto value = states[g][a].finish();
            if (!value) {
                return std::unexpected(value.error());
            }
            auto appended = append_scalar(out_aggs[a], *value);
            if (!appended) {
                return std::unexpected(appended.error());
            }
        }
    }

    Table out;
    for (std::size_t k = 0; k < keys.size(); ++k) {
        out.add_column(keys[k], std::move(out_keys[k]));
    }
    for (std::size_t a = 0; a < aggregations.size(); ++a) {
        out.add_column(aggregations[a].alias, std::move(out_aggs[a]));
    }
    return out;
}

auto finalize_groups(const Table& partials, const std::vector<std::string>& keys,
                     const std::vector<expr::AggSpec>& aggregations) -> Result<Table> {
    auto shared = [&](const std::string& name) -> Result<ColumnEntry> {
        auto it = partials.index.find(name);
        if (it == partials.index.end()) {
            return make_error(ErrorKind::Evaluation,
                              fmt::format("partial column not found: {} (available: {})", name,
                                          format_columns(partials)));
        }
        return partials.columns[it->second];
    };

    Table out;
    auto append = [&out](ColumnEntry entry) {
        out.index[entry.name] = out.columns.size();
        out.columns.push_back(std::move(entry));
    };
    for (const auto& key : keys) {
        auto entry = shared(key);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        append(std::move(*entry));
    }

    const std::size_t groups = partials.rows();
    for (const auto& agg : aggregations) {
        auto sums = shared(agg.alias);
        if (!sums) {
            return std::unexpected(sums.error());
        }
        if (agg.func != expr::AggFunc::Mean) {
            append(std::move(*sums));
            continue;
        }
        auto counts = shared(agg.alias + expr::kGroupCountSuffix);
        if (!counts) {
            return std::unexpected(counts.error());
        }
        const auto* n = std::get_if<Column<std::int64_t>>(counts->column.get());
        if (n == nullptr) {
            return make_error(ErrorKind::Type,
                              fmt::format("row count of {} is not an int column", agg.alias));
        }
        Column<double> means;
        means.reserve(groups);
        for (std::size_t g = 0; g < groups; ++g) {
            if ((*n)[g] == 0) {
                return make_error(ErrorKind::Domain,
                                  fmt::format("mean of empty group in {}", agg.alias));
            }
            auto total = as_double(scalar_at(*sums->column, g));
            if (!total) {
                return std::unexpected(total.error());
            }
            means.push_back(*total / static_cast<double>((*n)[g]));
        }
        out.add_column(agg.alias, ColumnValue{std::move(means)});
    }
    return out;
}

}  // namespace chunkwise::runtime
