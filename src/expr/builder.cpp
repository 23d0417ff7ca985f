#include <chunkwise/expr/builder.hpp>

#include <fmt/format.h>

#include <atomic>
#include <stdexcept>
#include <type_traits>

namespace chunkwise::expr {

namespace {

std::atomic<NodeId> g_next_id{1};

auto element_kind(const DataShape& shape, const char* op) -> ScalarKind {
    if (shape.dtype.is_record()) {
        throw std::invalid_argument(
            fmt::format("{}: expected scalar elements, got {}", op, shape.to_string()));
    }
    return shape.dtype.kind;
}

auto collection_dim(const DataShape& shape) -> DataShape {
    return DataShape::var(shape.dtype);
}

auto literal_kind(const LiteralValue& value) -> ScalarKind {
    if (std::holds_alternative<std::int64_t>(value)) {
        return ScalarKind::Int;
    }
    if (std::holds_alternative<double>(value)) {
        return ScalarKind::Double;
    }
    return ScalarKind::String;
}

auto infer_map_kind(const MapExpr& body, const DType& dtype) -> ScalarKind {
    return std::visit(
        [&](const auto& node) -> ScalarKind {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ColumnRef>) {
                if (node.name == "_") {
                    if (dtype.is_record()) {
                        throw std::invalid_argument("map: '_' used on record elements");
                    }
                    return dtype.kind;
                }
                auto found = dtype.find(node.name);
                if (!found) {
                    throw std::invalid_argument("map: unknown field " + node.name);
                }
                return found->kind;
            } else if constexpr (std::is_same_v<T, Literal>) {
                return literal_kind(node.value);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                auto lhs = infer_map_kind(*node.left, dtype);
                auto rhs = infer_map_kind(*node.right, dtype);
                if (lhs == ScalarKind::String || rhs == ScalarKind::String) {
                    throw std::invalid_argument("map: arithmetic on string values");
                }
                if (node.op == ArithmeticOp::Div) {
                    return ScalarKind::Double;
                }
                return (lhs == ScalarKind::Int && rhs == ScalarKind::Int) ? ScalarKind::Int
                                                                          : ScalarKind::Double;
            } else {
                if (node.args.size() != 1) {
                    throw std::invalid_argument("map: " + node.callee + " expects 1 argument");
                }
                auto arg = infer_map_kind(*node.args.front(), dtype);
                if (arg == ScalarKind::String) {
                    throw std::invalid_argument("map: " + node.callee + " of a string value");
                }
                if (node.callee == "abs" || node.callee == "neg") {
                    return arg;
                }
                if (node.callee == "sqrt" || node.callee == "exp" || node.callee == "log") {
                    return ScalarKind::Double;
                }
                throw std::invalid_argument("map: unknown function " + node.callee);
            }
        },
        body.node);
}

auto reduction_kind(NodeKind kind, const DataShape& input) -> ScalarKind {
    switch (kind) {
        case NodeKind::Count:
        case NodeKind::NUnique:
            return ScalarKind::Int;
        case NodeKind::Sum: {
            auto k = element_kind(input, "sum");
            if (k == ScalarKind::String) {
                throw std::invalid_argument("sum: string elements");
            }
            return k;
        }
        case NodeKind::Mean:
        case NodeKind::Var:
        case NodeKind::Std: {
            auto k = element_kind(input, to_string(kind).c_str());
            if (k == ScalarKind::String) {
                throw std::invalid_argument(to_string(kind) + ": string elements");
            }
            return ScalarKind::Double;
        }
        case NodeKind::Min:
        case NodeKind::Max:
            return element_kind(input, to_string(kind).c_str());
        default:
            throw std::invalid_argument("reduce: not a reduction: " + to_string(kind));
    }
}

auto reduced_shape(ScalarKind kind, bool keepdims) -> DataShape {
    if (keepdims) {
        return DataShape::fixed(1, scalar_dtype(kind));
    }
    return DataShape::scalar(kind);
}

auto agg_result_kind(AggFunc func, ScalarKind input) -> ScalarKind {
    switch (func) {
        case AggFunc::Count:
        case AggFunc::NUnique:
            return ScalarKind::Int;
        case AggFunc::Mean:
            if (input == ScalarKind::String) {
                throw std::invalid_argument("by: mean of string column");
            }
            return ScalarKind::Double;
        case AggFunc::Sum:
            if (input == ScalarKind::String) {
                throw std::invalid_argument("by: sum of string column");
            }
            return input;
        case AggFunc::Min:
        case AggFunc::Max:
            return input;
    }
    return input;
}

}  // namespace

auto next_node_id() -> NodeId {
    return g_next_id.fetch_add(1, std::memory_order_relaxed);
}

auto symbol(std::string name, DataShape shape) -> ExprPtr {
    return std::make_shared<SymbolNode>(next_node_id(), std::move(name), std::move(shape));
}

auto field(ExprPtr child, std::string name) -> ExprPtr {
    const auto& in = child->shape();
    auto found = in.dtype.find(name);
    if (!found) {
        throw std::invalid_argument(
            fmt::format("field: {} not found in {}", name, in.to_string()));
    }
    DataShape shape{.dim = in.dim, .length = in.length, .dtype = scalar_dtype(found->kind)};
    return std::make_shared<FieldNode>(next_node_id(), std::move(shape), std::move(child),
                                       std::move(name));
}

auto project(ExprPtr child, std::vector<std::string> columns) -> ExprPtr {
    const auto& in = child->shape();
    std::vector<FieldType> fields;
    fields.reserve(columns.size());
    for (const auto& name : columns) {
        auto found = in.dtype.find(name);
        if (!found) {
            throw std::invalid_argument(
                fmt::format("project: {} not found in {}", name, in.to_string()));
        }
        fields.push_back(*found);
    }
    DataShape shape{.dim = in.dim, .length = in.length, .dtype = record_dtype(std::move(fields))};
    return std::make_shared<ProjectNode>(next_node_id(), std::move(shape), std::move(child),
                                         std::move(columns));
}

auto relabel(ExprPtr child, RelabelNode::Renames renames) -> ExprPtr {
    const auto& in = child->shape();
    if (!in.dtype.is_record()) {
        throw std::invalid_argument("relabel: expected record elements");
    }
    auto fields = in.dtype.fields;
    for (const auto& [from, to] : renames) {
        bool found = false;
        for (auto& f : fields) {
            if (f.name == from) {
                f.name = to;
                found = true;
            }
        }
        if (!found) {
            throw std::invalid_argument("relabel: unknown field " + from);
        }
    }
    DataShape shape{.dim = in.dim, .length = in.length, .dtype = record_dtype(std::move(fields))};
    return std::make_shared<RelabelNode>(next_node_id(), std::move(shape), std::move(child),
                                         std::move(renames));
}

auto filter(ExprPtr child, FilterExprPtr predicate) -> ExprPtr {
    return filter(std::move(child), std::shared_ptr<const FilterExpr>(std::move(predicate)));
}

auto filter(ExprPtr child, std::shared_ptr<const FilterExpr> predicate) -> ExprPtr {
    auto shape = collection_dim(child->shape());
    return std::make_shared<FilterNode>(next_node_id(), std::move(shape), std::move(child),
                                        std::move(predicate));
}

auto map(ExprPtr child, MapExprPtr body) -> ExprPtr {
    const auto& in = child->shape();
    auto kind = infer_map_kind(*body, in.dtype);
    DataShape shape{.dim = in.dim, .length = in.length, .dtype = scalar_dtype(kind)};
    return std::make_shared<MapNode>(next_node_id(), std::move(shape), std::move(child),
                                     std::move(body));
}

auto head(ExprPtr child, std::size_t n) -> ExprPtr {
    auto shape = collection_dim(child->shape());
    return std::make_shared<HeadNode>(next_node_id(), std::move(shape), std::move(child), n);
}

auto slice(ExprPtr child, std::size_t start, std::size_t stop) -> ExprPtr {
    if (start > stop) {
        throw std::invalid_argument("slice: start after stop");
    }
    auto shape = collection_dim(child->shape());
    return std::make_shared<SliceNode>(next_node_id(), std::move(shape), std::move(child), start,
                                       stop);
}

auto distinct(ExprPtr child) -> ExprPtr {
    auto shape = collection_dim(child->shape());
    return std::make_shared<DistinctNode>(next_node_id(), std::move(shape), std::move(child));
}

auto reduce(NodeKind kind, ExprPtr child, bool keepdims, bool unbiased) -> ExprPtr {
    auto shape = reduced_shape(reduction_kind(kind, child->shape()), keepdims);
    return std::make_shared<ReductionNode>(kind, next_node_id(), std::move(shape),
                                           std::move(child), keepdims, unbiased);
}

auto sum(ExprPtr child, bool keepdims) -> ExprPtr {
    return reduce(NodeKind::Sum, std::move(child), keepdims);
}

auto count(ExprPtr child, bool keepdims) -> ExprPtr {
    return reduce(NodeKind::Count, std::move(child), keepdims);
}

auto mean(ExprPtr child, bool keepdims) -> ExprPtr {
    return reduce(NodeKind::Mean, std::move(child), keepdims);
}

auto var(ExprPtr child, bool unbiased, bool keepdims) -> ExprPtr {
    return reduce(NodeKind::Var, std::move(child), keepdims, unbiased);
}

auto stddev(ExprPtr child, bool unbiased, bool keepdims) -> ExprPtr {
    return reduce(NodeKind::Std, std::move(child), keepdims, unbiased);
}

auto nunique(ExprPtr child, bool keepdims) -> ExprPtr {
    return reduce(NodeKind::NUnique, std::move(child), keepdims);
}

auto min(ExprPtr child, bool keepdims) -> ExprPtr {
    return reduce(NodeKind::Min, std::move(child), keepdims);
}

auto max(ExprPtr child, bool keepdims) -> ExprPtr {
    return reduce(NodeKind::Max, std::move(child), keepdims);
}

auto by(ExprPtr child, std::vector<std::string> keys, std::vector<AggSpec> aggregations)
    -> ExprPtr {
    const auto& in = child->shape();
    if (!in.dtype.is_record()) {
        throw std::invalid_argument("by: expected record elements");
    }
    if (keys.empty()) {
        throw std::invalid_argument("by: no grouping keys");
    }
    std::vector<FieldType> fields;
    for (const auto& key : keys) {
        auto found = in.dtype.find(key);
        if (!found) {
            throw std::invalid_argument("by: unknown key " + key);
        }
        fields.push_back(*found);
    }
    for (const auto& agg : aggregations) {
        ScalarKind input = ScalarKind::Int;
        if (agg.func != AggFunc::Count) {
            auto found = in.dtype.find(agg.column);
            if (!found) {
                throw std::invalid_argument("by: unknown aggregate column " + agg.column);
            }
            input = found->kind;
        }
        fields.push_back(FieldType{.name = agg.alias, .kind = agg_result_kind(agg.func, input)});
    }
    auto shape = DataShape::var(record_dtype(std::move(fields)));
    return std::make_shared<ByNode>(next_node_id(), std::move(shape), std::move(child),
                                    std::move(keys), std::move(aggregations));
}

auto partial_fields(NodeKind target, VarianceMethod method) -> std::vector<FieldType> {
    if (target == NodeKind::Mean) {
        return {{.name = kPartialSum, .kind = ScalarKind::Double},
                {.name = kPartialCount, .kind = ScalarKind::Int}};
    }
    if (method == VarianceMethod::Welford) {
        return {{.name = kPartialCount, .kind = ScalarKind::Int},
                {.name = kPartialMean, .kind = ScalarKind::Double},
                {.name = kPartialM2, .kind = ScalarKind::Double}};
    }
    return {{.name = kPartialCount, .kind = ScalarKind::Int},
            {.name = kPartialSum, .kind = ScalarKind::Double},
            {.name = kPartialSumSq, .kind = ScalarKind::Double}};
}

auto partial(ExprPtr child, NodeKind target, VarianceMethod method) -> ExprPtr {
    if (target != NodeKind::Mean && target != NodeKind::Var && target != NodeKind::Std) {
        throw std::invalid_argument("partial: unsupported target " + to_string(target));
    }
    (void)reduction_kind(target, child->shape());
    auto shape = DataShape::fixed(1, record_dtype(partial_fields(target, method)));
    return std::make_shared<PartialNode>(next_node_id(), std::move(shape), std::move(child),
                                         target, method);
}

auto finalize(ExprPtr child, NodeKind target, VarianceMethod method, bool unbiased,
              bool keepdims) -> ExprPtr {
    auto shape = reduced_shape(ScalarKind::Double, keepdims);
    return std::make_shared<FinalizeNode>(next_node_id(), std::move(shape), std::move(child),
                                          target, method, unbiased, keepdims);
}

auto group_finalize(ExprPtr child, std::vector<std::string> keys,
                    std::vector<AggSpec> aggregations) -> ExprPtr {
    const auto& in = child->shape();
    if (!in.dtype.is_record()) {
        throw std::invalid_argument("group_finalize: expected record elements");
    }
    std::vector<FieldType> fields;
    for (const auto& key : keys) {
        auto found = in.dtype.find(key);
        if (!found) {
            throw std::invalid_argument("group_finalize: unknown key " + key);
        }
        fields.push_back(*found);
    }
    for (const auto& agg : aggregations) {
        auto found = in.dtype.find(agg.alias);
        if (!found) {
            throw std::invalid_argument("group_finalize: unknown column " + agg.alias);
        }
        if (agg.func == AggFunc::Mean) {
            if (!in.dtype.find(agg.alias + kGroupCountSuffix)) {
                throw std::invalid_argument("group_finalize: no row count for " + agg.alias);
            }
            fields.push_back(FieldType{.name = agg.alias, .kind = ScalarKind::Double});
        } else {
            fields.push_back(*found);
        }
    }
    auto shape = DataShape::var(record_dtype(std::move(fields)));
    return std::make_shared<GroupFinalizeNode>(next_node_id(), std::move(shape),
                                               std::move(child), std::move(keys),
                                               std::move(aggregations));
}

// ─── Map body builders ────────────────────────────────────────────────────────

auto col_ref(std::string name) -> MapExprPtr {
    return std::make_shared<MapExpr>(MapExpr{ColumnRef{.name = std::move(name)}});
}

auto element() -> MapExprPtr {
    return col_ref("_");
}

auto int_lit(std::int64_t v) -> MapExprPtr {
    return std::make_shared<MapExpr>(MapExpr{Literal{v}});
}

auto dbl_lit(double v) -> MapExprPtr {
    return std::make_shared<MapExpr>(MapExpr{Literal{v}});
}

auto binop(ArithmeticOp op, MapExprPtr lhs, MapExprPtr rhs) -> MapExprPtr {
    return std::make_shared<MapExpr>(MapExpr{BinaryExpr{
        .op = op,
        .left = std::move(lhs),
        .right = std::move(rhs),
    }});
}

auto fn_call(std::string callee, std::vector<MapExprPtr> args) -> MapExprPtr {
    return std::make_shared<MapExpr>(
        MapExpr{CallExpr{.callee = std::move(callee), .args = std::move(args)}});
}

// ─── FilterExpr builders ──────────────────────────────────────────────────────

auto filter_col(std::string name) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterColumn{std::move(name)}});
}

auto filter_elem() -> FilterExprPtr {
    return filter_col("_");
}

auto filter_int(std::int64_t v) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterLiteral{LiteralValue{v}}});
}

auto filter_dbl(double v) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterLiteral{LiteralValue{v}}});
}

auto filter_str(std::string v) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterLiteral{LiteralValue{std::move(v)}}});
}

auto filter_arith(ArithmeticOp op, FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(
        FilterExpr{FilterArith{.op = op, .left = std::move(l), .right = std::move(r)}});
}

auto filter_cmp(CompareOp op, FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(
        FilterExpr{FilterCmp{.op = op, .left = std::move(l), .right = std::move(r)}});
}

auto filter_and(FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(
        FilterExpr{FilterAnd{.left = std::move(l), .right = std::move(r)}});
}

auto filter_or(FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(
        FilterExpr{FilterOr{.left = std::move(l), .right = std::move(r)}});
}

auto filter_not(FilterExprPtr operand) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterNot{std::move(operand)}});
}

auto filter_like(FilterExprPtr operand, std::string pattern) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(
        FilterExpr{FilterLike{.operand = std::move(operand), .pattern = std::move(pattern)}});
}

auto make_agg(AggFunc func, std::string column, std::string alias) -> AggSpec {
    return AggSpec{.func = func, .column = std::move(column), .alias = std::move(alias)};
}

}  // namespace chunkwise::expr
