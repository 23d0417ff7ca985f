#include <chunkwise/core/int_math.hpp>
#include <chunkwise/runtime/predicate.hpp>

#include <fmt/format.h>

#include <cmath>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace chunkwise::runtime {

namespace {

using expr::ArithmeticOp;
using expr::CompareOp;
using expr::LiteralValue;

// ─── Shared scalar semantics ──────────────────────────────────────────────────

auto flip_cmp(CompareOp op) -> CompareOp {
    switch (op) {
        case CompareOp::Lt:
            return CompareOp::Gt;
        case CompareOp::Le:
            return CompareOp::Ge;
        case CompareOp::Gt:
            return CompareOp::Lt;
        case CompareOp::Ge:
            return CompareOp::Le;
        default:
            return op;
    }
}

template <typename L, typename R>
auto apply_cmp(CompareOp op, const L& lhs, const R& rhs) -> bool {
    switch (op) {
        case CompareOp::Eq:
            return lhs == rhs;
        case CompareOp::Ne:
            return lhs != rhs;
        case CompareOp::Lt:
            return lhs < rhs;
        case CompareOp::Le:
            return lhs <= rhs;
        case CompareOp::Gt:
            return lhs > rhs;
        case CompareOp::Ge:
            return lhs >= rhs;
    }
    return false;
}

auto int_arith(ArithmeticOp op, std::int64_t lhs, std::int64_t rhs) -> ScalarValue {
    switch (op) {
        case ArithmeticOp::Add:
            return wrapping_add(lhs, rhs);
        case ArithmeticOp::Sub:
            return wrapping_sub(lhs, rhs);
        case ArithmeticOp::Mul:
            return wrapping_mul(lhs, rhs);
        case ArithmeticOp::Div:
            return static_cast<double>(lhs) / static_cast<double>(rhs);
        case ArithmeticOp::Mod:
            return wrapping_mod(lhs, rhs);
    }
    return std::int64_t{0};
}

auto dbl_arith(ArithmeticOp op, double lhs, double rhs) -> double {
    switch (op) {
        case ArithmeticOp::Add:
            return lhs + rhs;
        case ArithmeticOp::Sub:
            return lhs - rhs;
        case ArithmeticOp::Mul:
            return lhs * rhs;
        case ArithmeticOp::Div:
            return lhs / rhs;
        case ArithmeticOp::Mod:
            return std::fmod(lhs, rhs);
    }
    return 0.0;
}

auto scalar_arith(ArithmeticOp op, const ScalarValue& lhs, const ScalarValue& rhs)
    -> Result<ScalarValue> {
    if (std::holds_alternative<std::string>(lhs) || std::holds_alternative<std::string>(rhs)) {
        return make_error(ErrorKind::Type, "arithmetic on a string value");
    }
    const auto* li = std::get_if<std::int64_t>(&lhs);
    const auto* ri = std::get_if<std::int64_t>(&rhs);
    if (li != nullptr && ri != nullptr) {
        if (op == ArithmeticOp::Mod && *ri == 0) {
            return make_error(ErrorKind::Domain, "integer modulo by zero");
        }
        return int_arith(op, *li, *ri);
    }
    return dbl_arith(op, *as_double(lhs), *as_double(rhs));
}

auto scalar_cmp(CompareOp op, const ScalarValue& lhs, const ScalarValue& rhs) -> Result<bool> {
    const auto* ls = std::get_if<std::string>(&lhs);
    const auto* rs = std::get_if<std::string>(&rhs);
    if (ls != nullptr && rs != nullptr) {
        return apply_cmp(op, std::string_view(*ls), std::string_view(*rs));
    }
    if (ls != nullptr || rs != nullptr) {
        return make_error(ErrorKind::Type, "cannot compare string and numeric values");
    }
    const auto* li = std::get_if<std::int64_t>(&lhs);
    const auto* ri = std::get_if<std::int64_t>(&rhs);
    if (li != nullptr && ri != nullptr) {
        return apply_cmp(op, *li, *ri);
    }
    return apply_cmp(op, *as_double(lhs), *as_double(rhs));
}

auto math_call(const std::string& callee, const ScalarValue& arg) -> Result<ScalarValue> {
    if (std::holds_alternative<std::string>(arg)) {
        return make_error(ErrorKind::Type, fmt::format("{} of a string value", callee));
    }
    if (const auto* i = std::get_if<std::int64_t>(&arg)) {
        if (callee == "abs") {
            return *i < 0 ? wrapping_neg(*i) : *i;
        }
        if (callee == "neg") {
            return wrapping_neg(*i);
        }
    }
    double x = *as_double(arg);
    if (callee == "abs") {
        return std::fabs(x);
    }
    if (callee == "neg") {
        return -x;
    }
    if (callee == "sqrt") {
        return std::sqrt(x);
    }
    if (callee == "exp") {
        return std::exp(x);
    }
    if (callee == "log") {
        return std::log(x);
    }
    return make_error(ErrorKind::InvalidArgument, fmt::format("unknown function {}", callee));
}

auto resolve_field(const std::vector<std::string>& names, const Row& row,
                   const std::string& name) -> Result<const ScalarValue*> {
    if (names.empty()) {
        if (name == "_" && !row.empty()) {
            return &row.front();
        }
        return make_error(ErrorKind::Evaluation,
                          fmt::format("unknown field '{}' on a bare element", name));
    }
    for (std::size_t i = 0; i < names.size() && i < row.size(); ++i) {
        if (names[i] == name) {
            return &row[i];
        }
    }
    return make_error(ErrorKind::Evaluation, fmt::format("unknown field '{}'", name));
}

// ─── Row-at-a-time evaluation ─────────────────────────────────────────────────

auto eval_value_row(const expr::FilterExpr& expr, const std::vector<std::string>& names,
                    const Row& row) -> Result<ScalarValue> {
    return std::visit(
        [&](const auto& node) -> Result<ScalarValue> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, expr::FilterColumn>) {
                auto found = resolve_field(names, row, node.name);
                if (!found) {
                    return std::unexpected(found.error());
                }
                return **found;
            } else if constexpr (std::is_same_v<T, expr::FilterLiteral>) {
                return std::visit([](const auto& v) -> ScalarValue { return v; }, node.value);
            } else if constexpr (std::is_same_v<T, expr::FilterArith>) {
                auto lhs = eval_value_row(*node.left, names, row);
                if (!lhs) {
                    return std::unexpected(lhs.error());
                }
                auto rhs = eval_value_row(*node.right, names, row);
                if (!rhs) {
                    return std::unexpected(rhs.error());
                }
                return scalar_arith(node.op, *lhs, *rhs);
            } else {
                return make_error(ErrorKind::Type, "filter: not a value expression");
            }
        },
        expr.node);
}

// ─── Vectorized evaluation ────────────────────────────────────────────────────

// Either a borrowed column of the input or an owned intermediate.
using ColResult = std::variant<const ColumnValue*, ColumnValue>;

auto deref_col(const ColResult& r) -> const ColumnValue& {
    if (const auto* ptr = std::get_if<const ColumnValue*>(&r)) {
        return **ptr;
    }
    return std::get<ColumnValue>(r);
}

auto not_vectorizable(std::string what) -> std::unexpected<Error> {
    return make_error(ErrorKind::Unsupported, "vectorized filter: " + std::move(what));
}

// Look up a column of an array ("_") or a table.
auto find_column(const Value& data, const std::string& name) -> Result<const ColumnValue*> {
    if (const auto* column = std::get_if<ColumnValue>(&data)) {
        if (name == "_") {
            return column;
        }
        return make_error(ErrorKind::Evaluation,
                          fmt::format("unknown field '{}' on a bare element", name));
    }
    if (const auto* table = std::get_if<Table>(&data)) {
        if (const auto* col = table->find(name)) {
            return col;
        }
        return make_error(ErrorKind::Evaluation, fmt::format("unknown field '{}'", name));
    }
    return make_error(ErrorKind::Type,
                      fmt::format("cannot evaluate columns of a {}", to_string(shape_of(data))));
}

auto broadcast(const LiteralValue& value, std::size_t n) -> ColumnValue {
    return std::visit(
        [n](const auto& v) -> ColumnValue {
            using U = std::decay_t<decltype(v)>;
            return Column<U>(std::vector<U>(n, v));
        },
        value);
}

// Element-wise comparison of a column against a hoisted scalar.
template <typename T, typename S>
void cmp_col_scalar_into(CompareOp op, const T* __restrict__ lp, S rhs,
                         std::uint8_t* __restrict__ mp, std::size_t n) {
    using Common = std::common_type_t<T, S>;
    const auto r = static_cast<Common>(rhs);
    switch (op) {
        case CompareOp::Eq:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = static_cast<Common>(lp[i]) == r;
            break;
        case CompareOp::Ne:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = static_cast<Common>(lp[i]) != r;
            break;
        case CompareOp::Lt:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = static_cast<Common>(lp[i]) < r;
            break;
        case CompareOp::Le:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = static_cast<Common>(lp[i]) <= r;
            break;
        case CompareOp::Gt:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = static_cast<Common>(lp[i]) > r;
            break;
        case CompareOp::Ge:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = static_cast<Common>(lp[i]) >= r;
            break;
    }
}

auto compare_col_scalar(CompareOp op, const ColumnValue& lhs, const LiteralValue& lit,
                        std::size_t n) -> Result<Mask> {
    Mask mask(n);
    std::uint8_t* mp = mask.data();
    if (const auto* s = std::get_if<std::string>(&lit)) {
        const auto* col = std::get_if<Column<std::string>>(&lhs);
        if (col == nullptr) {
            return not_vectorizable("string literal compared with a numeric column");
        }
        const std::string_view rhs(*s);
        for (std::size_t i = 0; i < n; ++i) {
            mp[i] = apply_cmp(op, std::string_view((*col)[i]), rhs);
        }
        return mask;
    }
    return std::visit(
        [&](const auto& col) -> Result<Mask> {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, std::string>) {
                return not_vectorizable("numeric literal compared with a string column");
            } else {
                if (const auto* i = std::get_if<std::int64_t>(&lit)) {
                    cmp_col_scalar_into(op, col.data(), *i, mp, n);
                } else {
                    cmp_col_scalar_into(op, col.data(), std::get<double>(lit), mp, n);
                }
                return mask;
            }
        },
        lhs);
}

// Element-wise comparison between two full columns.
template <typename L, typename R>
void cmp_into(CompareOp op, const L* __restrict__ lp, const R* __restrict__ rp,
              std::uint8_t* __restrict__ mp, std::size_t n) {
    using Common = std::common_type_t<L, R>;
    switch (op) {
        case CompareOp::Eq:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = static_cast<Common>(lp[i]) == static_cast<Common>(rp[i]);
            break;
        case CompareOp::Ne:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = static_cast<Common>(lp[i]) != static_cast<Common>(rp[i]);
            break;
        case CompareOp::Lt:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = static_cast<Common>(lp[i]) < static_cast<Common>(rp[i]);
            break;
        case CompareOp::Le:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = static_cast<Common>(lp[i]) <= static_cast<Common>(rp[i]);
            break;
        case CompareOp::Gt:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = static_cast<Common>(lp[i]) > static_cast<Common>(rp[i]);
            break;
        case CompareOp::Ge:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = static_cast<Common>(lp[i]) >= static_cast<Common>(rp[i]);
            break;
    }
}

auto compare_vec(CompareOp op, const ColumnValue& lhs, const ColumnValue& rhs, std::size_t n)
    -> Result<Mask> {
    Mask mask(n);
    std::uint8_t* mp = mask.data();
    return std::visit(
        [&](const auto& l, const auto& r) -> Result<Mask> {
            using L = typename std::decay_t<decltype(l)>::value_type;
            using R = typename std::decay_t<decltype(r)>::value_type;
            if constexpr (std::is_same_v<L, std::string> && std::is_same_v<R, std::string>) {
                for (std::size_t i = 0; i < n; ++i) {
                    mp[i] = apply_cmp(op, std::string_view(l[i]), std::string_view(r[i]));
                }
                return mask;
            } else if constexpr (std::is_same_v<L, std::string> ||
                                 std::is_same_v<R, std::string>) {
                return not_vectorizable("string column compared with a numeric column");
            } else {
                cmp_into(op, l.data(), r.data(), mp, n);
                return mask;
            }
        },
        lhs, rhs);
}

template <typename L, typename R, typename Out>
void arith_into(ArithmeticOp op, const L* __restrict__ lp, const R* __restrict__ rp,
                Out* __restrict__ out, std::size_t n) {
    switch (op) {
        case ArithmeticOp::Add:
            if constexpr (std::is_integral_v<Out>) {
                for (std::size_t i = 0; i < n; ++i)
                    out[i] = wrapping_add(lp[i], rp[i]);
            } else {
                for (std::size_t i = 0; i < n; ++i)
                    out[i] = static_cast<Out>(lp[i]) + static_cast<Out>(rp[i]);
            }
            break;
        case ArithmeticOp::Sub:
            if constexpr (std::is_integral_v<Out>) {
                for (std::size_t i = 0; i < n; ++i)
                    out[i] = wrapping_sub(lp[i], rp[i]);
            } else {
                for (std::size_t i = 0; i < n; ++i)
                    out[i] = static_cast<Out>(lp[i]) - static_cast<Out>(rp[i]);
            }
            break;
        case ArithmeticOp::Mul:
            if constexpr (std::is_integral_v<Out>) {
                for (std::size_t i = 0; i < n; ++i)
                    out[i] = wrapping_mul(lp[i], rp[i]);
            } else {
                for (std::size_t i = 0; i < n; ++i)
                    out[i] = static_cast<Out>(lp[i]) * static_cast<Out>(rp[i]);
            }
            break;
        case ArithmeticOp::Div:
            for (std::size_t i = 0; i < n; ++i)
                out[i] = static_cast<Out>(lp[i]) / static_cast<Out>(rp[i]);
            break;
        case ArithmeticOp::Mod:
            if constexpr (std::is_integral_v<Out>) {
                for (std::size_t i = 0; i < n; ++i)
                    out[i] = wrapping_mod(lp[i], rp[i]);
            } else {
                for (std::size_t i = 0; i < n; ++i)
                    out[i] = std::fmod(static_cast<Out>(lp[i]), static_cast<Out>(rp[i]));
            }
            break;
    }
}

// Column arithmetic with the same typing rules as the row path: int op int
// stays int except for division, anything touching a double is double.
auto arith_vec(ArithmeticOp op, const ColumnValue& lhs, const ColumnValue& rhs, std::size_t n)
    -> Result<ColumnValue> {
    return std::visit(
        [&](const auto& l, const auto& r) -> Result<ColumnValue> {
            using L = typename std::decay_t<decltype(l)>::value_type;
            using R = typename std::decay_t<decltype(r)>::value_type;
            if constexpr (std::is_same_v<L, std::string> || std::is_same_v<R, std::string>) {
                return make_error(ErrorKind::Unsupported, "arithmetic on a string column");
            } else if constexpr (std::is_same_v<L, std::int64_t> &&
                                 std::is_same_v<R, std::int64_t>) {
                if (op == ArithmeticOp::Div) {
                    Column<double> out;
                    out.resize(n);
                    arith_into(op, l.data(), r.data(), out.data(), n);
                    return ColumnValue{std::move(out)};
                }
                if (op == ArithmeticOp::Mod) {
                    for (std::size_t i = 0; i < n; ++i) {
                        if (r[i] == 0) {
                            return make_error(ErrorKind::Domain, "integer modulo by zero");
                        }
                    }
                }
                Column<std::int64_t> out;
                out.resize(n);
                arith_into(op, l.data(), r.data(), out.data(), n);
                return ColumnValue{std::move(out)};
            } else {
                Column<double> out;
                out.resize(n);
                arith_into(op, l.data(), r.data(), out.data(), n);
                return ColumnValue{std::move(out)};
            }
        },
        lhs, rhs);
}

auto eval_value_vec(const expr::FilterExpr& expr, const Value& data, std::size_t n)
    -> Result<ColResult> {
    return std::visit(
        [&](const auto& node) -> Result<ColResult> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, expr::FilterColumn>) {
                auto col = find_column(data, node.name);
                if (!col) {
                    return std::unexpected(col.error());
                }
                return ColResult{*col};
            } else if constexpr (std::is_same_v<T, expr::FilterLiteral>) {
                // Broadcast literal into a full column (the comparison fast
                // path avoids this).
                return ColResult{broadcast(node.value, n)};
            } else if constexpr (std::is_same_v<T, expr::FilterArith>) {
                auto lhs = eval_value_vec(*node.left, data, n);
                if (!lhs) {
                    return std::unexpected(lhs.error());
                }
                auto rhs = eval_value_vec(*node.right, data, n);
                if (!rhs) {
                    return std::unexpected(rhs.error());
                }
                auto result = arith_vec(node.op, deref_col(*lhs), deref_col(*rhs), n);
                if (!result) {
                    return std::unexpected(result.error());
                }
                return ColResult{std::move(*result)};
            } else {
                return make_error(ErrorKind::Type, "filter: not a value expression");
            }
        },
        expr.node);
}

auto compute_mask_n(const expr::FilterExpr& expr, const Value& data, std::size_t n)
    -> Result<Mask> {
    return std::visit(
        [&](const auto& node) -> Result<Mask> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, expr::FilterCmp>) {
                // Fast path: column/expr op literal (no broadcast needed).
                if (const auto* lit = std::get_if<expr::FilterLiteral>(&node.right->node)) {
                    auto lhs = eval_value_vec(*node.left, data, n);
                    if (!lhs) {
                        return std::unexpected(lhs.error());
                    }
                    return compare_col_scalar(node.op, deref_col(*lhs), lit->value, n);
                }
                // Fast path: literal op column/expr (flip the operator).
                if (const auto* lit = std::get_if<expr::FilterLiteral>(&node.left->node)) {
                    auto rhs = eval_value_vec(*node.right, data, n);
                    if (!rhs) {
                        return std::unexpected(rhs.error());
                    }
                    return compare_col_scalar(flip_cmp(node.op), deref_col(*rhs), lit->value, n);
                }
                auto lhs = eval_value_vec(*node.left, data, n);
                if (!lhs) {
                    return std::unexpected(lhs.error());
                }
                auto rhs = eval_value_vec(*node.right, data, n);
                if (!rhs) {
                    return std::unexpected(rhs.error());
                }
                return compare_vec(node.op, deref_col(*lhs), deref_col(*rhs), n);
            } else if constexpr (std::is_same_v<T, expr::FilterAnd>) {
                auto left = compute_mask_n(*node.left, data, n);
                if (!left) {
                    return std::unexpected(left.error());
                }
                auto right = compute_mask_n(*node.right, data, n);
                if (!right) {
                    return std::unexpected(right.error());
                }
                std::uint8_t* lp = left->data();
                const std::uint8_t* rp = right->data();
                for (std::size_t i = 0; i < n; ++i)
                    lp[i] &= rp[i];
                return std::move(*left);
            } else if constexpr (std::is_same_v<T, expr::FilterOr>) {
                auto left = compute_mask_n(*node.left, data, n);
                if (!left) {
                    return std::unexpected(left.error());
                }
                auto right = compute_mask_n(*node.right, data, n);
                if (!right) {
                    return std::unexpected(right.error());
                }
                std::uint8_t* lp = left->data();
                const std::uint8_t* rp = right->data();
                for (std::size_t i = 0; i < n; ++i)
                    lp[i] |= rp[i];
                return std::move(*left);
            } else if constexpr (std::is_same_v<T, expr::FilterNot>) {
                auto mask = compute_mask_n(*node.operand, data, n);
                if (!mask) {
                    return std::unexpected(mask.error());
                }
                for (auto& v : *mask)
                    v ^= 1;
                return std::move(*mask);
            } else if constexpr (std::is_same_v<T, expr::FilterLike>) {
                return not_vectorizable("pattern match");
            } else {
                return make_error(ErrorKind::Type, "filter: not a boolean expression");
            }
        },
        expr.node);
}

// ─── Vectorized map ───────────────────────────────────────────────────────────

auto call_vec(const std::string& callee, const ColumnValue& arg) -> Result<ColumnValue> {
    return std::visit(
        [&](const auto& col) -> Result<ColumnValue> {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, std::string>) {
                return make_error(ErrorKind::Type, fmt::format("{} of a string value", callee));
            } else {
                if (callee == "abs") {
                    if constexpr (std::is_integral_v<T>) {
                        return ColumnValue{
                            col.transform([](T v) -> T { return v < 0 ? wrapping_neg(v) : v; })};
                    } else {
                        return ColumnValue{col.transform([](T v) -> T { return std::fabs(v); })};
                    }
                }
                if (callee == "neg") {
                    if constexpr (std::is_integral_v<T>) {
                        return ColumnValue{col.transform([](T v) -> T { return wrapping_neg(v); })};
                    } else {
                        return ColumnValue{col.transform([](T v) -> T { return -v; })};
                    }
                }
                if (callee == "sqrt") {
                    return ColumnValue{col.transform(
                        [](T v) -> double { return std::sqrt(static_cast<double>(v)); })};
                }
                if (callee == "exp") {
                    return ColumnValue{col.transform(
                        [](T v) -> double { return std::exp(static_cast<double>(v)); })};
                }
                if (callee == "log") {
                    return ColumnValue{col.transform(
                        [](T v) -> double { return std::log(static_cast<double>(v)); })};
                }
                return make_error(ErrorKind::InvalidArgument,
                                  fmt::format("unknown function {}", callee));
            }
        },
        arg);
}

auto eval_map_col(const expr::MapExpr& body, const Value& data, std::size_t n)
    -> Result<ColResult> {
    return std::visit(
        [&](const auto& node) -> Result<ColResult> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, expr::ColumnRef>) {
                auto col = find_column(data, node.name);
                if (!col) {
                    return std::unexpected(col.error());
                }
                return ColResult{*col};
            } else if constexpr (std::is_same_v<T, expr::Literal>) {
                return ColResult{broadcast(node.value, n)};
            } else if constexpr (std::is_same_v<T, expr::BinaryExpr>) {
                auto lhs = eval_map_col(*node.left, data, n);
                if (!lhs) {
                    return std::unexpected(lhs.error());
                }
                auto rhs = eval_map_col(*node.right, data, n);
                if (!rhs) {
                    return std::unexpected(rhs.error());
                }
                auto result = arith_vec(node.op, deref_col(*lhs), deref_col(*rhs), n);
                if (!result) {
                    if (result.error().kind == ErrorKind::Unsupported) {
                        return make_error(ErrorKind::Type, "map: arithmetic on a string value");
                    }
                    return std::unexpected(result.error());
                }
                return ColResult{std::move(*result)};
            } else {
                if (node.args.size() != 1) {
                    return make_error(ErrorKind::InvalidArgument,
                                      fmt::format("map: {} expects 1 argument", node.callee));
                }
                auto arg = eval_map_col(*node.args.front(), data, n);
                if (!arg) {
                    return std::unexpected(arg.error());
                }
                auto result = call_vec(node.callee, deref_col(*arg));
                if (!result) {
                    return std::unexpected(result.error());
                }
                return ColResult{std::move(*result)};
            }
        },
        body.node);
}

template <typename T>
auto gather_column(const Column<T>& src, const Mask& mask, std::size_t selected) -> Column<T> {
    Column<T> out;
    out.reserve(selected);
    for (std::size_t i = 0; i < mask.size(); ++i) {
        if (mask[i] != 0) {
            out.push_back(src[i]);
        }
    }
    return out;
}

}  // namespace

auto compute_mask(const expr::FilterExpr& predicate, const Value& data) -> Result<Mask> {
    if (shape_of(data) != ValueShape::Array && shape_of(data) != ValueShape::Table) {
        return make_error(ErrorKind::Type, fmt::format("vectorized filter over a {}",
                                                       to_string(shape_of(data))));
    }
    return compute_mask_n(predicate, data, value_length(data));
}

auto gather(const Value& data, const Mask& mask) -> Result<Value> {
    if (mask.size() != value_length(data)) {
        return make_error(ErrorKind::InvalidArgument,
                          fmt::format("mask has {} entries for {} rows", mask.size(),
                                      value_length(data)));
    }
    std::size_t selected = 0;
    for (auto v : mask) {
        selected += v;
    }
    if (const auto* column = std::get_if<ColumnValue>(&data)) {
        return Value{std::visit(
            [&](const auto& col) -> ColumnValue { return gather_column(col, mask, selected); },
            *column)};
    }
    if (const auto* table = std::get_if<Table>(&data)) {
        Table out;
        for (const auto& entry : table->columns) {
            out.add_column(entry.name, std::visit(
                                           [&](const auto& col) -> ColumnValue {
                                               return gather_column(col, mask, selected);
                                           },
                                           *entry.column));
        }
        return Value{std::move(out)};
    }
    return make_error(ErrorKind::Type,
                      fmt::format("cannot gather rows of a {}", to_string(shape_of(data))));
}

auto eval_map_vec(const expr::MapExpr& body, const Value& data) -> Result<ColumnValue> {
    if (shape_of(data) != ValueShape::Array && shape_of(data) != ValueShape::Table) {
        return make_error(ErrorKind::Type,
                          fmt::format("vectorized map over a {}", to_string(shape_of(data))));
    }
    auto result = eval_map_col(body, data, value_length(data));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (auto* owned = std::get_if<ColumnValue>(&*result)) {
        return std::move(*owned);
    }
    return *std::get<const ColumnValue*>(*result);
}

auto eval_predicate_row(const expr::FilterExpr& predicate, const std::vector<std::string>& names,
                        const Row& row) -> Result<bool> {
    return std::visit(
        [&](const auto& node) -> Result<bool> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, expr::FilterCmp>) {
                auto lhs = eval_value_row(*node.left, names, row);
                if (!lhs) {
                    return std::unexpected(lhs.error());
                }
                auto rhs = eval_value_row(*node.right, names, row);
                if (!rhs) {
                    return std::unexpected(rhs.error());
                }
                return scalar_cmp(node.op, *lhs, *rhs);
            } else if constexpr (std::is_same_v<T, expr::FilterAnd>) {
                auto left = eval_predicate_row(*node.left, names, row);
                if (!left || !*left) {
                    return left;
                }
                return eval_predicate_row(*node.right, names, row);
            } else if constexpr (std::is_same_v<T, expr::FilterOr>) {
                auto left = eval_predicate_row(*node.left, names, row);
                if (!left || *left) {
                    return left;
                }
                return eval_predicate_row(*node.right, names, row);
            } else if constexpr (std::is_same_v<T, expr::FilterNot>) {
                auto inner = eval_predicate_row(*node.operand, names, row);
                if (!inner) {
                    return inner;
                }
                return !*inner;
            } else if constexpr (std::is_same_v<T, expr::FilterLike>) {
                auto operand = eval_value_row(*node.operand, names, row);
                if (!operand) {
                    return std::unexpected(operand.error());
                }
                const auto* text = std::get_if<std::string>(&*operand);
                if (text == nullptr) {
                    return make_error(ErrorKind::Type, "like: operand is not a string");
                }
                return glob_match(*text, node.pattern);
            } else {
                return make_error(ErrorKind::Type, "filter: not a boolean expression");
            }
        },
        predicate.node);
}

auto eval_map_row(const expr::MapExpr& body, const std::vector<std::string>& names,
                  const Row& row) -> Result<ScalarValue> {
    return std::visit(
        [&](const auto& node) -> Result<ScalarValue> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, expr::ColumnRef>) {
                auto found = resolve_field(names, row, node.name);
                if (!found) {
                    return std::unexpected(found.error());
                }
                return **found;
            } else if constexpr (std::is_same_v<T, expr::Literal>) {
                return std::visit([](const auto& v) -> ScalarValue { return v; }, node.value);
            } else if constexpr (std::is_same_v<T, expr::BinaryExpr>) {
                auto lhs = eval_map_row(*node.left, names, row);
                if (!lhs) {
                    return lhs;
                }
                auto rhs = eval_map_row(*node.right, names, row);
                if (!rhs) {
                    return rhs;
                }
                return scalar_arith(node.op, *lhs, *rhs);
            } else {
                if (node.args.size() != 1) {
                    return make_error(ErrorKind::InvalidArgument,
                                      fmt::format("map: {} expects 1 argument", node.callee));
                }
                auto arg = eval_map_row(*node.args.front(), names, row);
                if (!arg) {
                    return arg;
                }
                return math_call(node.callee, *arg);
            }
        },
        body.node);
}

auto glob_match(std::string_view text, std::string_view pattern) noexcept -> bool {
    std::size_t t = 0;
    std::size_t p = 0;
    std::size_t star = std::string_view::npos;
    std::size_t resume = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++t;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

}  // namespace chunkwise::runtime
