#include <chunkwise/expr/builder.hpp>
#include <chunkwise/expr/traverse.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <unordered_set>

namespace chunkwise::expr {

namespace {

void collect_leaves(const ExprPtr& expr, std::unordered_set<NodeId>& seen,
                    std::vector<ExprPtr>& out) {
    if (expr->kind() == NodeKind::Symbol) {
        if (seen.insert(expr->id()).second) {
            out.push_back(expr);
        }
        return;
    }
    for (const auto& child : expr->children()) {
        collect_leaves(child, seen, out);
    }
}

auto find_path(const ExprPtr& expr, const Node& leaf, std::vector<ExprPtr>& out) -> bool {
    out.push_back(expr);
    if (expr.get() == &leaf) {
        return true;
    }
    for (const auto& child : expr->children()) {
        if (find_path(child, leaf, out)) {
            return true;
        }
    }
    out.pop_back();
    return false;
}

auto join(const std::vector<std::string>& names) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(names[i]);
    }
    return out;
}

}  // namespace

auto leaves(const ExprPtr& expr) -> std::vector<ExprPtr> {
    std::unordered_set<NodeId> seen;
    std::vector<ExprPtr> out;
    collect_leaves(expr, seen, out);
    return out;
}

auto path(const ExprPtr& expr, const Node& leaf) -> std::vector<ExprPtr> {
    std::vector<ExprPtr> out;
    if (!find_path(expr, leaf, out)) {
        out.clear();
    }
    return out;
}

auto substitute(const ExprPtr& expr, const Node& from, const ExprPtr& to) -> ExprPtr {
    if (expr.get() == &from) {
        return to;
    }
    if (expr->children().empty()) {
        return expr;
    }
    auto child = substitute(expr->child(), from, to);
    if (child == expr->child()) {
        return expr;
    }
    return with_child(*expr, std::move(child));
}

// NOLINTBEGIN cppcoreguidelines-pro-type-static-cast-downcast
auto with_child(const Node& node, ExprPtr child) -> ExprPtr {
    switch (node.kind()) {
        case NodeKind::Symbol:
            throw std::invalid_argument("with_child: symbols have no children");
        case NodeKind::Field:
            return field(std::move(child), static_cast<const FieldNode&>(node).name());
        case NodeKind::Project:
            return project(std::move(child), static_cast<const ProjectNode&>(node).columns());
        case NodeKind::Relabel:
            return relabel(std::move(child), static_cast<const RelabelNode&>(node).renames());
        case NodeKind::Filter:
            return filter(std::move(child), static_cast<const FilterNode&>(node).predicate_ptr());
        case NodeKind::Map:
            return map(std::move(child), static_cast<const MapNode&>(node).body_ptr());
        case NodeKind::Head:
            return head(std::move(child), static_cast<const HeadNode&>(node).n());
        case NodeKind::Slice: {
            const auto& s = static_cast<const SliceNode&>(node);
            return slice(std::move(child), s.start(), s.stop());
        }
        case NodeKind::Distinct:
            return distinct(std::move(child));
        case NodeKind::Sum:
        case NodeKind::Count:
        case NodeKind::Mean:
        case NodeKind::Var:
        case NodeKind::Std:
        case NodeKind::NUnique:
        case NodeKind::Min:
        case NodeKind::Max: {
            const auto& r = static_cast<const ReductionNode&>(node);
            return reduce(node.kind(), std::move(child), r.keepdims(), r.unbiased());
        }
        case NodeKind::By: {
            const auto& b = static_cast<const ByNode&>(node);
            return by(std::move(child), b.keys(), b.aggregations());
        }
        case NodeKind::Partial: {
            const auto& p = static_cast<const PartialNode&>(node);
            return partial(std::move(child), p.target(), p.method());
        }
        case NodeKind::Finalize: {
            const auto& f = static_cast<const FinalizeNode&>(node);
            return finalize(std::move(child), f.target(), f.method(), f.unbiased(),
                            f.keepdims());
        }
        case NodeKind::GroupFinalize: {
            const auto& g = static_cast<const GroupFinalizeNode&>(node);
            return group_finalize(std::move(child), g.keys(), g.aggregations());
        }
    }
    throw std::invalid_argument("with_child: unknown node kind");
}

auto to_string(const Node& expr) -> std::string {
    switch (expr.kind()) {
        case NodeKind::Symbol:
            return static_cast<const SymbolNode&>(expr).name();
        case NodeKind::Field:
            return fmt::format("field({}, {})", to_string(*expr.child()),
                               static_cast<const FieldNode&>(expr).name());
        case NodeKind::Project:
            return fmt::format("project({}, [{}])", to_string(*expr.child()),
                               join(static_cast<const ProjectNode&>(expr).columns()));
        case NodeKind::Head:
            return fmt::format("head({}, {})", to_string(*expr.child()),
                               static_cast<const HeadNode&>(expr).n());
        case NodeKind::Slice: {
            const auto& s = static_cast<const SliceNode&>(expr);
            return fmt::format("slice({}, {}, {})", to_string(*expr.child()), s.start(),
                               s.stop());
        }
        case NodeKind::By: {
            const auto& b = static_cast<const ByNode&>(expr);
            return fmt::format("by({}, [{}])", to_string(*expr.child()), join(b.keys()));
        }
        case NodeKind::GroupFinalize:
            return fmt::format("group_finalize({}, [{}])", to_string(*expr.child()),
                               join(static_cast<const GroupFinalizeNode&>(expr).keys()));
        case NodeKind::Partial:
            return fmt::format(
                "partial({}, {})", to_string(*expr.child()),
                to_string(static_cast<const PartialNode&>(expr).target()));
        case NodeKind::Finalize:
            return fmt::format(
                "finalize({}, {})", to_string(*expr.child()),
                to_string(static_cast<const FinalizeNode&>(expr).target()));
        default:
            return fmt::format("{}({})", to_string(expr.kind()), to_string(*expr.child()));
    }
}
// NOLINTEND cppcoreguidelines-pro-type-static-cast-downcast

}  // namespace chunkwise::expr
