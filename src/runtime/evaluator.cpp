#include <chunkwise/runtime/evaluator.hpp>
#include <chunkwise/runtime/group_by.hpp>
#include <chunkwise/runtime/predicate.hpp>
#include <chunkwise/runtime/reductions.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <robin_hood.h>
#include <type_traits>
#include <utility>

namespace chunkwise::runtime {

namespace {

using expr::NodeKind;
using Operand = std::variant<Value, RowStreamPtr>;

auto type_error(const expr::Node& node, const Value& input) -> std::unexpected<Error> {
    return make_error(ErrorKind::Type, fmt::format("{} of a {}", expr::to_string(node.kind()),
                                                   to_string(shape_of(input))));
}

auto keep_dims(ScalarValue value, bool keepdims) -> Value {
    if (keepdims) {
        return Value{wrap_scalar(value)};
    }
    return Value{std::move(value)};
}

auto as_table(const Value& input) -> const Table* {
    return std::get_if<Table>(&input);
}

// ─── Materialized kernels ─────────────────────────────────────────────────────

auto field_value(const Value& input, const std::string& name) -> Result<Value> {
    const auto* table = as_table(input);
    if (table == nullptr) {
        return make_error(ErrorKind::Type, fmt::format("field '{}' of a {}", name,
                                                       to_string(shape_of(input))));
    }
    const auto* column = table->find(name);
    if (column == nullptr) {
        return make_error(ErrorKind::Evaluation, fmt::format("unknown column '{}'", name));
    }
    return Value{*column};
}

auto project_value(const Value& input, const std::vector<std::string>& columns)
    -> Result<Value> {
    const auto* table = as_table(input);
    if (table == nullptr) {
        return make_error(ErrorKind::Type,
                          fmt::format("project of a {}", to_string(shape_of(input))));
    }
    Table out;
    for (const auto& name : columns) {
        auto it = table->index.find(name);
        if (it == table->index.end()) {
            return make_error(ErrorKind::Evaluation, fmt::format("unknown column '{}'", name));
        }
        // Columns are shared, not copied.
        out.index[name] = out.columns.size();
        out.columns.push_back(table->columns[it->second]);
    }
    return Value{std::move(out)};
}

auto relabel_value(const Value& input, const expr::RelabelNode::Renames& renames)
    -> Result<Value> {
    const auto* table = as_table(input);
    if (table == nullptr) {
        return make_error(ErrorKind::Type,
                          fmt::format("relabel of a {}", to_string(shape_of(input))));
    }
    Table out;
    for (const auto& entry : table->columns) {
        std::string name = entry.name;
        for (const auto& [from, to] : renames) {
            if (name == from) {
                name = to;
                break;
            }
        }
        out.index[name] = out.columns.size();
        out.columns.push_back(ColumnEntry{.name = std::move(name), .column = entry.column});
    }
    return Value{std::move(out)};
}

// Row-at-a-time mask for predicates the vectorized path rejects.
auto row_mask(const expr::FilterExpr& predicate, const Value& input) -> Result<Mask> {
    const std::size_t n = value_length(input);
    Mask mask(n);
    if (const auto* column = std::get_if<ColumnValue>(&input)) {
        const std::vector<std::string> names;
        for (std::size_t i = 0; i < n; ++i) {
            auto keep = eval_predicate_row(predicate, names, Row{scalar_at(*column, i)});
            if (!keep) {
                return std::unexpected(keep.error());
            }
            mask[i] = *keep ? 1 : 0;
        }
        return mask;
    }
    const auto& table = std::get<Table>(input);
    const auto names = column_names(table);
    for (std::size_t i = 0; i < n; ++i) {
        auto keep = eval_predicate_row(predicate, names, table_row(table, i));
        if (!keep) {
            return std::unexpected(keep.error());
        }
        mask[i] = *keep ? 1 : 0;
    }
    return mask;
}

auto filter_value(const Value& input, const expr::FilterExpr& predicate) -> Result<Value> {
    auto mask = compute_mask(predicate, input);
    if (!mask && mask.error().kind == ErrorKind::Unsupported) {
        spdlog::debug("filter: {}; falling back to row-at-a-time evaluation",
                      mask.error().message);
        mask = row_mask(predicate, input);
    }
    if (!mask) {
        return std::unexpected(mask.error());
    }
    return gather(input, *mask);
}

auto distinct_value(const Value& input) -> Result<Value> {
    const std::size_t n = value_length(input);
    Mask mask(n);
    if (const auto* column = std::get_if<ColumnValue>(&input)) {
        std::visit(
            [&](const auto& col) {
                using T = typename std::decay_t<decltype(col)>::value_type;
                robin_hood::unordered_flat_set<T> seen;
                seen.reserve(n);
                for (std::size_t i = 0; i < n; ++i) {
                    mask[i] = seen.insert(col[i]).second ? 1 : 0;
                }
            },
            *column);
        return gather(input, mask);
    }
    const auto& table = std::get<Table>(input);
    RowSet seen;
    for (std::size_t i = 0; i < n; ++i) {
        mask[i] = seen.insert(table_row(table, i)).second ? 1 : 0;
    }
    return gather(input, mask);
}

// Element kind fed to a reducer reading rows of `node`'s child.
auto input_kind(const expr::Node& node) -> ScalarKind {
    const auto& dtype = node.child()->shape().dtype;
    return dtype.is_record() ? ScalarKind::Int : dtype.kind;
}

// NOLINTBEGIN cppcoreguidelines-pro-type-static-cast-downcast
auto apply_value(const expr::Node& node, Value input, const EvalOptions& options)
    -> Result<Value> {
    const bool columnar = shape_of(input) == ValueShape::Array ||
                          shape_of(input) == ValueShape::Table;
    switch (node.kind()) {
        case NodeKind::Field:
            return field_value(input, static_cast<const expr::FieldNode&>(node).name());
        case NodeKind::Project:
            return project_value(input, static_cast<const expr::ProjectNode&>(node).columns());
        case NodeKind::Relabel:
            return relabel_value(input, static_cast<const expr::RelabelNode&>(node).renames());
        case NodeKind::Filter:
            if (!columnar) {
                return type_error(node, input);
            }
            return filter_value(input, static_cast<const expr::FilterNode&>(node).predicate());
        case NodeKind::Map: {
            if (!columnar) {
                return type_error(node, input);
            }
            auto mapped = eval_map_vec(static_cast<const expr::MapNode&>(node).body(), input);
            if (!mapped) {
                return std::unexpected(mapped.error());
            }
            return Value{std::move(*mapped)};
        }
        case NodeKind::Head:
            if (!columnar) {
                return type_error(node, input);
            }
            return slice_value(input, 0, static_cast<const expr::HeadNode&>(node).n());
        case NodeKind::Slice: {
            if (!columnar) {
                return type_error(node, input);
            }
            const auto& s = static_cast<const expr::SliceNode&>(node);
            return slice_value(input, s.start(), s.stop());
        }
        case NodeKind::Distinct:
            if (!columnar) {
                return type_error(node, input);
            }
            return distinct_value(input);
        case NodeKind::Sum:
        case NodeKind::Count:
        case NodeKind::Mean:
        case NodeKind::Var:
        case NodeKind::Std:
        case NodeKind::NUnique:
        case NodeKind::Min:
        case NodeKind::Max: {
            const auto& r = static_cast<const expr::ReductionNode&>(node);
            auto result = reduce_value(
                node.kind(), input, ReduceOptions{.method = options.variance,
                                                  .unbiased = r.unbiased()});
            if (!result) {
                return std::unexpected(result.error());
            }
            return keep_dims(std::move(*result), r.keepdims());
        }
        case NodeKind::By: {
            const auto* table = as_table(input);
            if (table == nullptr) {
                return type_error(node, input);
            }
            const auto& b = static_cast<const expr::ByNode&>(node);
            auto grouped = aggregate_table(*table, b.keys(), b.aggregations());
            if (!grouped) {
                return std::unexpected(grouped.error());
            }
            return Value{std::move(*grouped)};
        }
        case NodeKind::GroupFinalize: {
            const auto* table = as_table(input);
            if (table == nullptr) {
                return type_error(node, input);
            }
            const auto& g = static_cast<const expr::GroupFinalizeNode&>(node);
            auto finished = finalize_groups(*table, g.keys(), g.aggregations());
            if (!finished) {
                return std::unexpected(finished.error());
            }
            return Value{std::move(*finished)};
        }
        case NodeKind::Partial: {
            const auto& p = static_cast<const expr::PartialNode&>(node);
            Reducer reducer(p.target(), input_kind(node), ReduceOptions{.method = p.method()});
            Result<void> updated;
            if (const auto* column = std::get_if<ColumnValue>(&input)) {
                updated = reducer.update(*column);
            } else if (const auto* scalar = std::get_if<ScalarValue>(&input)) {
                updated = reducer.update(*scalar);
            } else {
                return type_error(node, input);
            }
            if (!updated) {
                return std::unexpected(updated.error());
            }
            auto state = reducer.partial_state();
            if (!state) {
                return std::unexpected(state.error());
            }
            return Value{std::move(*state)};
        }
        case NodeKind::Finalize: {
            const auto* table = as_table(input);
            if (table == nullptr) {
                return type_error(node, input);
            }
            const auto& f = static_cast<const expr::FinalizeNode&>(node);
            Reducer reducer(f.target(), ScalarKind::Double,
                            ReduceOptions{.method = f.method(), .unbiased = f.unbiased()});
            auto merged = reducer.merge_partial_state(*table);
            if (!merged) {
                return std::unexpected(merged.error());
            }
            auto result = reducer.finish();
            if (!result) {
                return std::unexpected(result.error());
            }
            return keep_dims(std::move(*result), f.keepdims());
        }
        case NodeKind::Symbol:
            break;
    }
    return make_error(ErrorKind::Evaluation,
                      fmt::format("cannot evaluate {}", expr::to_string(node.kind())));
}

// Fold a stream through a reducer without materializing it.
auto reduce_stream(RowStream& stream, Reducer& reducer) -> Result<void> {
    while (true) {
        auto row = stream.next();
        if (!row) {
            return std::unexpected(row.error());
        }
        if (!*row) {
            return {};
        }
        auto updated = reducer.update(**row);
        if (!updated) {
            return updated;
        }
    }
}

auto materialize(RowStream& stream) -> Result<Value> {
    auto sequence = collect(stream);
    if (!sequence) {
        return std::unexpected(sequence.error());
    }
    return sequence_to_columnar(*sequence);
}

auto apply_stream(const expr::Node& node, RowStreamPtr input, const EvalOptions& options)
    -> Result<Operand> {
    auto lift = [](Result<RowStreamPtr> stream) -> Result<Operand> {
        if (!stream) {
            return std::unexpected(stream.error());
        }
        return Operand{std::move(*stream)};
    };
    switch (node.kind()) {
        case NodeKind::Field:
            return lift(
                stream_field(std::move(input), static_cast<const expr::FieldNode&>(node).name()));
        case NodeKind::Project:
            return lift(stream_project(std::move(input),
                                       static_cast<const expr::ProjectNode&>(node).columns()));
        case NodeKind::Relabel:
            return lift(stream_relabel(std::move(input),
                                       static_cast<const expr::RelabelNode&>(node).renames()));
        case NodeKind::Filter:
            return Operand{stream_filter(
                std::move(input), static_cast<const expr::FilterNode&>(node).predicate_ptr())};
        case NodeKind::Map:
            return Operand{
                stream_map(std::move(input), static_cast<const expr::MapNode&>(node).body_ptr())};
        case NodeKind::Head:
            return Operand{
                stream_head(std::move(input), static_cast<const expr::HeadNode&>(node).n())};
        case NodeKind::Slice: {
            const auto& s = static_cast<const expr::SliceNode&>(node);
            return Operand{stream_slice(std::move(input), s.start(), s.stop())};
        }
        case NodeKind::Distinct:
            return Operand{stream_distinct(std::move(input))};
        case NodeKind::Sum:
        case NodeKind::Count:
        case NodeKind::Mean:
        case NodeKind::Var:
        case NodeKind::Std:
        case NodeKind::NUnique:
        case NodeKind::Min:
        case NodeKind::Max: {
            const auto& r = static_cast<const expr::ReductionNode&>(node);
            Reducer reducer(node.kind(), input_kind(node),
                            ReduceOptions{.method = options.variance, .unbiased = r.unbiased()});
            auto folded = reduce_stream(*input, reducer);
            if (!folded) {
                return std::unexpected(folded.error());
            }
            auto result = reducer.finish();
            if (!result) {
                return std::unexpected(result.error());
            }
            return Operand{keep_dims(std::move(*result), r.keepdims())};
        }
        case NodeKind::Partial: {
            const auto& p = static_cast<const expr::PartialNode&>(node);
            Reducer reducer(p.target(), input_kind(node), ReduceOptions{.method = p.method()});
            auto folded = reduce_stream(*input, reducer);
            if (!folded) {
                return std::unexpected(folded.error());
            }
            auto state = reducer.partial_state();
            if (!state) {
                return std::unexpected(state.error());
            }
            return Operand{Value{std::move(*state)}};
        }
        case NodeKind::By:
        case NodeKind::Finalize:
        case NodeKind::GroupFinalize: {
            // Grouping needs every row; materialize and use the columnar kernel.
            auto value = materialize(*input);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto result = apply_value(node, std::move(*value), options);
            if (!result) {
                return std::unexpected(result.error());
            }
            return Operand{std::move(*result)};
        }
        case NodeKind::Symbol:
            break;
    }
    return make_error(ErrorKind::Evaluation,
                      fmt::format("cannot stream {}", expr::to_string(node.kind())));
}

auto eval_node(const expr::Node& node, Bindings& bindings, const EvalOptions& options)
    -> Result<Operand> {
    if (node.kind() == NodeKind::Symbol) {
        auto it = bindings.find(node.id());
        if (it == bindings.end()) {
            return make_error(
                ErrorKind::Evaluation,
                fmt::format("unbound symbol '{}'",
                            static_cast<const expr::SymbolNode&>(node).name()));
        }
        Operand bound = std::move(it->second);
        bindings.erase(it);
        return bound;
    }

    auto child = eval_node(*node.child(), bindings, options);
    if (!child) {
        return std::unexpected(child.error());
    }
    if (auto* stream = std::get_if<RowStreamPtr>(&*child)) {
        return apply_stream(node, std::move(*stream), options);
    }
    auto& input = std::get<Value>(*child);
    if (shape_of(input) == ValueShape::Sequence) {
        return apply_stream(node, stream_value(std::move(input)), options);
    }
    auto result = apply_value(node, std::move(input), options);
    if (!result) {
        return std::unexpected(result.error());
    }
    return Operand{std::move(*result)};
}
// NOLINTEND cppcoreguidelines-pro-type-static-cast-downcast

}  // namespace

auto evaluate(const expr::Node& expr, Bindings& bindings, const EvalOptions& options)
    -> Result<Value> {
    auto result = eval_node(expr, bindings, options);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (auto* stream = std::get_if<RowStreamPtr>(&*result)) {
        auto sequence = collect(**stream);
        if (!sequence) {
            return std::unexpected(sequence.error());
        }
        return Value{std::move(*sequence)};
    }
    return std::move(std::get<Value>(*result));
}

auto evaluate_stream(const expr::Node& expr, Bindings& bindings, const EvalOptions& options)
    -> Result<RowStreamPtr> {
    auto result = eval_node(expr, bindings, options);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (auto* stream = std::get_if<RowStreamPtr>(&*result)) {
        return std::move(*stream);
    }
    return stream_value(std::move(std::get<Value>(*result)));
}

auto evaluate(const expr::Node& expr, const expr::Node& symbol, Value data,
              const EvalOptions& options) -> Result<Value> {
    Bindings bindings;
    bindings.emplace(symbol.id(), Binding{std::move(data)});
    return evaluate(expr, bindings, options);
}

}  // namespace chunkwise::runtime
