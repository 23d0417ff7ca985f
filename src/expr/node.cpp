#include <chunkwise/expr/node.hpp>

namespace chunkwise::expr {

auto to_string(NodeKind kind) -> std::string {
    switch (kind) {
        case NodeKind::Symbol:
            return "symbol";
        case NodeKind::Field:
            return "field";
        case NodeKind::Project:
            return "project";
        case NodeKind::Relabel:
            return "relabel";
        case NodeKind::Filter:
            return "filter";
        case NodeKind::Map:
            return "map";
        case NodeKind::Head:
            return "head";
        case NodeKind::Slice:
            return "slice";
        case NodeKind::Distinct:
            return "distinct";
        case NodeKind::Sum:
            return "sum";
        case NodeKind::Count:
            return "count";
        case NodeKind::Mean:
            return "mean";
        case NodeKind::Var:
            return "var";
        case NodeKind::Std:
            return "std";
        case NodeKind::NUnique:
            return "nunique";
        case NodeKind::Min:
            return "min";
        case NodeKind::Max:
            return "max";
        case NodeKind::By:
            return "by";
        case NodeKind::Partial:
            return "partial";
        case NodeKind::Finalize:
            return "finalize";
        case NodeKind::GroupFinalize:
            return "group_finalize";
    }
    return "unknown";
}

auto is_reduction(NodeKind kind) noexcept -> bool {
    switch (kind) {
        case NodeKind::Sum:
        case NodeKind::Count:
        case NodeKind::Mean:
        case NodeKind::Var:
        case NodeKind::Std:
        case NodeKind::NUnique:
        case NodeKind::Min:
        case NodeKind::Max:
            return true;
        default:
            return false;
    }
}

}  // namespace chunkwise::expr
