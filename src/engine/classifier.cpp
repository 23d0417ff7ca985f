#include <chunkwise/engine/classifier.hpp>
#include <chunkwise/expr/traverse.hpp>

#include <fmt/format.h>

namespace chunkwise::engine {

using expr::NodeKind;

auto to_string(OpClass op) -> std::string_view {
    switch (op) {
        case OpClass::Cheap:
            return "cheap";
        case OpClass::Reduction:
            return "reduction";
        case OpClass::Grouping:
            return "grouping";
    }
    return "unknown";
}

auto is_cheap(NodeKind kind) noexcept -> bool {
    switch (kind) {
        case NodeKind::Symbol:
        case NodeKind::Field:
        case NodeKind::Project:
        case NodeKind::Relabel:
        case NodeKind::Filter:
        case NodeKind::Map:
        case NodeKind::Head:
        case NodeKind::Distinct:
            return true;
        default:
            return false;
    }
}

auto path_is_cheap(const expr::ExprPtr& expr) -> bool {
    const expr::Node* node = expr.get();
    while (true) {
        if (!is_cheap(node->kind())) {
            return false;
        }
        if (node->children().empty()) {
            return true;
        }
        node = node->child().get();
    }
}

auto classify(const expr::ExprPtr& expr) -> Result<OpClass> {
    auto found = expr::leaves(expr);
    if (found.size() != 1) {
        return make_error(ErrorKind::Unsupported,
                          fmt::format("expression has {} leaf symbols, expected 1",
                                      found.size()));
    }
    if (path_is_cheap(expr)) {
        return OpClass::Cheap;
    }
    for (const auto& node : expr::path(expr, *found.front())) {
        if (node->kind() == NodeKind::By) {
            return OpClass::Grouping;
        }
    }
    return OpClass::Reduction;
}

}  // namespace chunkwise::engine
