#include <chunkwise/engine/optimize.hpp>
#include <chunkwise/expr/builder.hpp>
#include <chunkwise/expr/traverse.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace chunkwise::engine {

namespace {

namespace ex = chunkwise::expr;
using ex::NodeKind;

// Field names a node needs from its input; nullopt means every field.
using Demand = std::optional<std::vector<std::string>>;

void add_name(std::vector<std::string>& names, const std::string& name) {
    if (name == "_") {
        return;
    }
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

void collect_filter_columns(const ex::FilterExpr& predicate, std::vector<std::string>& out) {
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ex::FilterColumn>) {
                add_name(out, node.name);
            } else if constexpr (std::is_same_v<T, ex::FilterArith> ||
                                 std::is_same_v<T, ex::FilterCmp> ||
                                 std::is_same_v<T, ex::FilterAnd> ||
                                 std::is_same_v<T, ex::FilterOr>) {
                collect_filter_columns(*node.left, out);
                collect_filter_columns(*node.right, out);
            } else if constexpr (std::is_same_v<T, ex::FilterNot> ||
                                 std::is_same_v<T, ex::FilterLike>) {
                collect_filter_columns(*node.operand, out);
            }
        },
        predicate.node);
}

void collect_map_columns(const ex::MapExpr& body, std::vector<std::string>& out) {
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ex::ColumnRef>) {
                add_name(out, node.name);
            } else if constexpr (std::is_same_v<T, ex::BinaryExpr>) {
                collect_map_columns(*node.left, out);
                collect_map_columns(*node.right, out);
            } else if constexpr (std::is_same_v<T, ex::CallExpr>) {
                for (const auto& arg : node.args) {
                    collect_map_columns(*arg, out);
                }
            }
        },
        body.node);
}

// NOLINTBEGIN cppcoreguidelines-pro-type-static-cast-downcast
auto child_demand(const ex::Node& node, Demand demand) -> Demand {
    switch (node.kind()) {
        case NodeKind::Field:
            return std::vector<std::string>{static_cast<const ex::FieldNode&>(node).name()};
        case NodeKind::Project:
            // Every projected column must exist below the projection.
            return static_cast<const ex::ProjectNode&>(node).columns();
        case NodeKind::Relabel: {
            if (!demand) {
                return std::nullopt;
            }
            const auto& renames = static_cast<const ex::RelabelNode&>(node).renames();
            std::vector<std::string> names;
            for (const auto& name : *demand) {
                auto it = std::find_if(renames.begin(), renames.end(),
                                       [&](const auto& r) { return r.second == name; });
                add_name(names, it == renames.end() ? name : it->first);
            }
            // Every renamed field must exist below the relabel.
            for (const auto& [from, to] : renames) {
                add_name(names, from);
            }
            return names;
        }
        case NodeKind::Filter: {
            if (!demand) {
                return std::nullopt;
            }
            collect_filter_columns(static_cast<const ex::FilterNode&>(node).predicate(),
                                   *demand);
            return demand;
        }
        case NodeKind::Map: {
            std::vector<std::string> names;
            collect_map_columns(static_cast<const ex::MapNode&>(node).body(), names);
            return names;
        }
        case NodeKind::Head:
        case NodeKind::Slice:
            return demand;
        case NodeKind::Count: {
            // Any one field carries the row count.
            const auto& dtype = node.child()->shape().dtype;
            if (dtype.is_record() && !dtype.fields.empty()) {
                return std::vector<std::string>{dtype.fields.front().name};
            }
            return std::nullopt;
        }
        case NodeKind::By: {
            const auto& b = static_cast<const ex::ByNode&>(node);
            std::vector<std::string> names;
            for (const auto& key : b.keys()) {
                add_name(names, key);
            }
            for (const auto& agg : b.aggregations()) {
                if (agg.func != ex::AggFunc::Count) {
                    add_name(names, agg.column);
                }
            }
            return names;
        }
        default:
            return std::nullopt;
    }
}
// NOLINTEND cppcoreguidelines-pro-type-static-cast-downcast

}  // namespace

auto required_columns(const ex::ExprPtr& expr, const ex::Node& leaf)
    -> std::vector<std::string> {
    const auto& fields = leaf.shape().dtype.fields;
    std::vector<std::string> all;
    all.reserve(fields.size());
    for (const auto& f : fields) {
        all.push_back(f.name);
    }
    if (!leaf.shape().dtype.is_record()) {
        return all;
    }

    auto nodes = ex::path(expr, leaf);
    Demand demand;
    for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
        demand = child_demand(*nodes[i], std::move(demand));
    }
    if (!demand) {
        return all;
    }

    std::vector<std::string> out;
    for (const auto& name : all) {
        if (std::find(demand->begin(), demand->end(), name) != demand->end()) {
            out.push_back(name);
        }
    }
    if (out.empty() && !all.empty()) {
        out.push_back(all.front());
    }
    return out;
}

auto lean_projection(const ex::ExprPtr& expr) -> LeanExpr {
    auto found = ex::leaves(expr);
    LeanExpr unchanged{.expr = expr, .leaf = found.empty() ? nullptr : found.front(),
                       .columns = {}};
    if (found.size() != 1 || !found.front()->shape().dtype.is_record()) {
        return unchanged;
    }
    const auto& leaf = found.front();
    auto columns = required_columns(expr, *leaf);
    const auto& shape = leaf->shape();
    if (columns.size() == shape.dtype.fields.size()) {
        return unchanged;
    }

    std::vector<FieldType> fields;
    fields.reserve(columns.size());
    for (const auto& name : columns) {
        fields.push_back(*shape.dtype.find(name));
    }
    const auto& name = static_cast<const ex::SymbolNode&>(*leaf).name();  // NOLINT
    auto lean_leaf = ex::symbol(
        name, DataShape{.dim = shape.dim, .length = shape.length,
                        .dtype = record_dtype(std::move(fields))});
    try {
        auto lean = ex::substitute(expr, *leaf, lean_leaf);
        return LeanExpr{.expr = std::move(lean), .leaf = std::move(lean_leaf),
                        .columns = std::move(columns)};
    } catch (const std::invalid_argument& e) {
        spdlog::debug("projection: keeping every column of {}: {}", name, e.what());
        return unchanged;
    }
}

}  // namespace chunkwise::engine
