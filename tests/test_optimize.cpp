#include <chunkwise/engine/optimize.hpp>
#include <chunkwise/expr/builder.hpp>
#include <chunkwise/expr/traverse.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace ex = chunkwise::expr;
using chunkwise::DataShape;
using chunkwise::FieldType;
using chunkwise::ScalarKind;
using namespace chunkwise::engine;

namespace {

using Names = std::vector<std::string>;

auto trades() -> ex::ExprPtr {
    return ex::symbol("t", DataShape::fixed(
                               1000, chunkwise::record_dtype({
                                         FieldType{.name = "symbol", .kind = ScalarKind::String},
                                         FieldType{.name = "qty", .kind = ScalarKind::Int},
                                         FieldType{.name = "price", .kind = ScalarKind::Double},
                                         FieldType{.name = "venue", .kind = ScalarKind::String},
                                     })));
}

auto big_qty() -> ex::FilterExprPtr {
    return ex::filter_cmp(ex::CompareOp::Gt, ex::filter_col("qty"), ex::filter_int(10));
}

}  // namespace

TEST_CASE("Required columns follow the path to the leaf", "[engine][optimize]") {
    auto t = trades();

    REQUIRE(required_columns(ex::sum(ex::field(t, "qty")), *t) == Names{"qty"});

    auto big = ex::filter(t, big_qty());
    REQUIRE(required_columns(ex::mean(ex::field(big, "price")), *t) == Names{"qty", "price"});

    auto value = ex::map(t, ex::binop(ex::ArithmeticOp::Mul, ex::col_ref("price"),
                                      ex::col_ref("qty")));
    REQUIRE(required_columns(ex::sum(value), *t) == Names{"qty", "price"});

    auto renamed = ex::relabel(t, {{"price", "px"}});
    REQUIRE(required_columns(ex::max(ex::field(renamed, "px")), *t) == Names{"price"});

    auto narrow = ex::project(t, {"venue", "symbol"});
    REQUIRE(required_columns(ex::head(narrow, 5), *t) == Names{"symbol", "venue"});
    REQUIRE(required_columns(ex::field(ex::slice(narrow, 1, 4), "venue"), *t) ==
            Names{"symbol", "venue"});

    auto grouped = ex::by(big, {"venue"},
                          {ex::make_agg(ex::AggFunc::Sum, "price", "total"),
                           ex::make_agg(ex::AggFunc::Count, "", "n")});
    REQUIRE(required_columns(grouped, *t) == Names{"qty", "price", "venue"});

    // Counting rows needs a single column.
    REQUIRE(required_columns(ex::count(t), *t) == Names{"symbol"});
}

TEST_CASE("Whole rows keep every column", "[engine][optimize]") {
    auto t = trades();
    const Names all{"symbol", "qty", "price", "venue"};

    REQUIRE(required_columns(t, *t) == all);
    REQUIRE(required_columns(ex::head(t, 3), *t) == all);
    REQUIRE(required_columns(ex::count(ex::distinct(t)), *t) == all);
    REQUIRE(required_columns(ex::filter(t, big_qty()), *t) == all);

    auto lean = lean_projection(ex::distinct(t));
    REQUIRE(lean.columns.empty());
    REQUIRE(lean.leaf == t);
}

TEST_CASE("Lean projection rebuilds the expression over a narrower leaf",
          "[engine][optimize]") {
    auto t = trades();
    auto big = ex::filter(t, big_qty());
    auto expr = ex::sum(ex::field(big, "price"));

    auto lean = lean_projection(expr);
    REQUIRE(lean.columns == Names{"qty", "price"});
    REQUIRE(lean.leaf != t);
    REQUIRE(ex::leaves(lean.expr).front() == lean.leaf);
    REQUIRE(ex::to_string(*lean.expr) == ex::to_string(*expr));
    REQUIRE(lean.expr->shape() == expr->shape());

    const auto& shape = lean.leaf->shape();
    REQUIRE(shape.length == 1000);
    REQUIRE(shape.dtype.fields.size() == 2);
    REQUIRE(shape.dtype.fields[1].kind == ScalarKind::Double);

    // Array leaves have nothing to prune.
    auto x = ex::symbol("x", DataShape::fixed(10, chunkwise::scalar_dtype(ScalarKind::Int)));
    auto total = ex::sum(x);
    auto flat = lean_projection(total);
    REQUIRE(flat.columns.empty());
    REQUIRE(flat.expr == total);
    REQUIRE(flat.leaf == x);
}
