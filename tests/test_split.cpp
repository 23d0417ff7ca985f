#include <chunkwise/engine/split.hpp>
#include <chunkwise/expr/builder.hpp>
#include <chunkwise/expr/traverse.hpp>

#include <catch2/catch_test_macros.hpp>

namespace ex = chunkwise::expr;
using chunkwise::DataShape;
using chunkwise::DimKind;
using chunkwise::ErrorKind;
using chunkwise::FieldType;
using chunkwise::ScalarKind;
using namespace chunkwise::engine;

namespace {

auto trades() -> ex::ExprPtr {
    return ex::symbol("t", DataShape::fixed(
                               1000, chunkwise::record_dtype({
                                         FieldType{.name = "symbol", .kind = ScalarKind::String},
                                         FieldType{.name = "qty", .kind = ScalarKind::Int},
                                         FieldType{.name = "price", .kind = ScalarKind::Double},
                                     })));
}

auto split_ok(const ex::ExprPtr& leaf, const ex::ExprPtr& expr, std::size_t chunk = 100)
    -> SplitExpr {
    auto parts = split(leaf, expr, chunk);
    REQUIRE(parts.has_value());
    return *parts;
}

}  // namespace

TEST_CASE("Chunk symbol mirrors the leaf at chunk length", "[engine][split]") {
    auto t = trades();
    auto parts = split_ok(t, ex::sum(ex::field(t, "qty")), 64);
    const auto& shape = parts.chunk_symbol->shape();
    REQUIRE(shape.dim == DimKind::Fixed);
    REQUIRE(shape.length == 64);
    REQUIRE(shape.dtype == t->shape().dtype);
    REQUIRE(ex::to_string(*parts.chunk_symbol) == "t");
    REQUIRE(parts.chunk_symbol->id() != t->id());
    REQUIRE(ex::leaves(parts.chunk_expr).front() == parts.chunk_symbol);
    REQUIRE(ex::leaves(parts.agg_expr).front() == parts.agg_symbol);
}

TEST_CASE("Sum keeps per-chunk results as arrays", "[engine][split]") {
    auto t = trades();
    auto parts = split_ok(t, ex::sum(ex::field(t, "qty")));
    REQUIRE(ex::to_string(*parts.chunk_expr) == "sum(field(t, qty))");
    const auto& chunk = static_cast<const ex::ReductionNode&>(*parts.chunk_expr);  // NOLINT
    REQUIRE(chunk.keepdims());
    REQUIRE(parts.agg_symbol->shape().dim == DimKind::Var);
    REQUIRE(parts.agg_symbol->shape().dtype.kind == ScalarKind::Int);
    REQUIRE(ex::to_string(*parts.agg_expr) == "sum(aggregate)");
    REQUIRE(parts.agg_expr->shape() == DataShape::scalar(ScalarKind::Int));
}

TEST_CASE("Count re-aggregates with a sum", "[engine][split]") {
    auto t = trades();
    auto parts = split_ok(t, ex::count(t));
    REQUIRE(ex::to_string(*parts.chunk_expr) == "count(t)");
    REQUIRE(ex::to_string(*parts.agg_expr) == "sum(aggregate)");
}

TEST_CASE("Mean and variance split into partial and finalize", "[engine][split]") {
    auto t = trades();
    auto parts = split_ok(t, ex::var(ex::field(t, "price"), true));
    REQUIRE(ex::to_string(*parts.chunk_expr) == "partial(field(t, price), var)");
    REQUIRE(ex::to_string(*parts.agg_expr) == "finalize(aggregate, var)");
    REQUIRE(parts.agg_symbol->shape().dtype.fields ==
            ex::partial_fields(ex::NodeKind::Var, ex::VarianceMethod::Welford));

    auto naive = split(t, ex::mean(ex::field(t, "qty")), 100, ex::VarianceMethod::SumOfSquares);
    REQUIRE(naive.has_value());
    REQUIRE(naive->agg_symbol->shape().dtype.fields ==
            ex::partial_fields(ex::NodeKind::Mean, ex::VarianceMethod::SumOfSquares));
}

TEST_CASE("NUnique ships distinct values", "[engine][split]") {
    auto t = trades();
    auto parts = split_ok(t, ex::nunique(ex::field(t, "symbol")));
    REQUIRE(ex::to_string(*parts.chunk_expr) == "distinct(field(t, symbol))");
    REQUIRE(ex::to_string(*parts.agg_expr) == "nunique(aggregate)");
}

TEST_CASE("Nodes above the split point move to the aggregate side", "[engine][split]") {
    auto t = trades();
    auto top = ex::head(ex::distinct(ex::field(t, "symbol")), 3);
    auto parts = split_ok(t, top);
    REQUIRE(ex::to_string(*parts.chunk_expr) == "distinct(field(t, symbol))");
    REQUIRE(ex::to_string(*parts.agg_expr) == "head(distinct(aggregate), 3)");
}

TEST_CASE("Elementwise-only expressions concatenate", "[engine][split]") {
    auto t = trades();
    auto big = ex::filter(t, ex::filter_cmp(ex::CompareOp::Gt, ex::filter_col("qty"),
                                            ex::filter_int(10)));
    auto parts = split_ok(t, ex::field(big, "price"));
    REQUIRE(ex::to_string(*parts.chunk_expr) == "field(filter(t), price)");
    REQUIRE(parts.agg_expr == parts.agg_symbol);
    REQUIRE(parts.agg_symbol->shape().dtype.kind == ScalarKind::Double);
}

TEST_CASE("Slices of the rows narrow the source range", "[engine][split]") {
    auto t = trades();

    SECTION("a slice becomes the row range") {
        auto parts = split_ok(t, ex::slice(ex::field(t, "qty"), 10, 20));
        REQUIRE(ex::to_string(*parts.chunk_expr) == "field(t, qty)");
        REQUIRE(parts.agg_expr == parts.agg_symbol);
        REQUIRE(parts.row_start == 10);
        REQUIRE(parts.row_stop == 20);
    }

    SECTION("nested windows compose") {
        auto inner = ex::slice(t, 100, 200);
        auto parts = split_ok(t, ex::sum(ex::head(ex::field(inner, "qty"), 30)));
        REQUIRE(ex::to_string(*parts.chunk_expr) == "sum(field(t, qty))");
        REQUIRE(ex::to_string(*parts.agg_expr) == "sum(aggregate)");
        REQUIRE(parts.row_start == 100);
        REQUIRE(parts.row_stop == 130);
    }

    SECTION("a slice past a filter keeps a head per chunk") {
        auto big = ex::filter(t, ex::filter_cmp(ex::CompareOp::Gt, ex::filter_col("qty"),
                                                ex::filter_int(10)));
        auto parts = split_ok(t, ex::slice(ex::field(big, "price"), 5, 8));
        REQUIRE(ex::to_string(*parts.chunk_expr) == "head(field(filter(t), price), 8)");
        REQUIRE(ex::to_string(*parts.agg_expr) == "slice(aggregate, 5, 8)");
        REQUIRE(parts.row_start == 0);
        REQUIRE(parts.row_stop == kAllRows);
    }
}

TEST_CASE("By splits by decomposability", "[engine][split]") {
    auto t = trades();

    SECTION("sum and count re-aggregate") {
        auto grouped = ex::by(t, {"symbol"},
                              {ex::make_agg(ex::AggFunc::Sum, "qty", "total"),
                               ex::make_agg(ex::AggFunc::Count, "", "n")});
        REQUIRE(is_decomposable(static_cast<const ex::ByNode&>(*grouped)));  // NOLINT
        auto parts = split_ok(t, grouped);
        REQUIRE(ex::to_string(*parts.chunk_expr) == "by(t, [symbol])");
        const auto& again = static_cast<const ex::ByNode&>(*parts.agg_expr);  // NOLINT
        REQUIRE(again.aggregations()[0].func == ex::AggFunc::Sum);
        REQUIRE(again.aggregations()[0].column == "total");
        REQUIRE(again.aggregations()[1].func == ex::AggFunc::Sum);
        REQUIRE(again.aggregations()[1].column == "n");
        REQUIRE(again.shape().dtype == grouped->shape().dtype);
    }

    SECTION("mean ships per-group sums and counts") {
        auto grouped =
            ex::by(t, {"symbol"}, {ex::make_agg(ex::AggFunc::Mean, "price", "avg")});
        REQUIRE(is_decomposable(static_cast<const ex::ByNode&>(*grouped)));  // NOLINT
        auto parts = split_ok(t, grouped);
        REQUIRE(ex::to_string(*parts.chunk_expr) == "by(t, [symbol])");
        const auto& chunk = static_cast<const ex::ByNode&>(*parts.chunk_expr);  // NOLINT
        REQUIRE(chunk.aggregations().size() == 2);
        REQUIRE(chunk.aggregations()[0].func == ex::AggFunc::Sum);
        REQUIRE(chunk.aggregations()[0].alias == "avg");
        REQUIRE(chunk.aggregations()[1].func == ex::AggFunc::Count);
        REQUIRE(chunk.aggregations()[1].alias == "avg.count");
        REQUIRE(ex::to_string(*parts.agg_expr) ==
                "group_finalize(by(aggregate, [symbol]), [symbol])");
        REQUIRE(parts.agg_expr->shape().dtype == grouped->shape().dtype);
    }

    SECTION("a taken count name falls back to the concatenated rows") {
        auto grouped = ex::by(t, {"symbol"},
                              {ex::make_agg(ex::AggFunc::Mean, "price", "avg"),
                               ex::make_agg(ex::AggFunc::Count, "", "avg.count")});
        auto parts = split_ok(t, grouped);
        REQUIRE(parts.chunk_expr == parts.chunk_symbol);
        REQUIRE(ex::to_string(*parts.agg_expr) == "by(aggregate, [symbol])");
    }

    SECTION("nunique groups the concatenated rows") {
        auto grouped =
            ex::by(t, {"symbol"}, {ex::make_agg(ex::AggFunc::NUnique, "qty", "kinds")});
        REQUIRE_FALSE(is_decomposable(static_cast<const ex::ByNode&>(*grouped)));  // NOLINT
        auto parts = split_ok(t, grouped);
        REQUIRE(parts.chunk_expr == parts.chunk_symbol);
        REQUIRE(ex::to_string(*parts.agg_expr) == "by(aggregate, [symbol])");
    }
}

TEST_CASE("Split rejects bad arguments", "[engine][split]") {
    auto t = trades();
    auto expr = ex::sum(ex::field(t, "qty"));

    auto zero = split(t, expr, 0);
    REQUIRE_FALSE(zero.has_value());
    REQUIRE(zero.error().kind == ErrorKind::InvalidArgument);

    auto stranger = split(trades(), expr, 10);
    REQUIRE_FALSE(stranger.has_value());
    REQUIRE(stranger.error().kind == ErrorKind::InvalidArgument);

    auto not_symbol = split(ex::field(t, "qty"), expr, 10);
    REQUIRE_FALSE(not_symbol.has_value());
    REQUIRE(not_symbol.error().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("Elementwise kinds", "[engine][split]") {
    REQUIRE(is_elementwise(ex::NodeKind::Map));
    REQUIRE(is_elementwise(ex::NodeKind::Relabel));
    REQUIRE_FALSE(is_elementwise(ex::NodeKind::Head));
    REQUIRE_FALSE(is_elementwise(ex::NodeKind::Symbol));
}
