#include <chunkwise/runtime/group_by.hpp>
#include <chunkwise/runtime/reductions.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace ex = chunkwise::expr;
using chunkwise::Column;
using chunkwise::ErrorKind;
using chunkwise::ScalarKind;
using ex::NodeKind;
using namespace chunkwise::runtime;

namespace {

auto one_to_ten() -> Value {
    return ColumnValue{Column<std::int64_t>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}};
}

auto reduce_double(NodeKind kind, const Value& value, ReduceOptions options = {}) -> double {
    auto result = reduce_value(kind, value, options);
    REQUIRE(result.has_value());
    auto as = as_double(*result);
    REQUIRE(as.has_value());
    return *as;
}

}  // namespace

TEST_CASE("Reductions over 1..10", "[runtime][reductions]") {
    auto data = one_to_ten();

    auto sum = reduce_value(NodeKind::Sum, data);
    REQUIRE(sum.has_value());
    REQUIRE(std::get<std::int64_t>(*sum) == 55);

    auto count = reduce_value(NodeKind::Count, data);
    REQUIRE(count.has_value());
    REQUIRE(std::get<std::int64_t>(*count) == 10);

    REQUIRE(reduce_double(NodeKind::Mean, data) == Catch::Approx(5.5));
    REQUIRE(reduce_double(NodeKind::Var, data) == Catch::Approx(8.25));
    REQUIRE(reduce_double(NodeKind::Var, data, {.unbiased = true}) ==
            Catch::Approx(9.1666666667));
    REQUIRE(reduce_double(NodeKind::Std, data, {.unbiased = true}) ==
            Catch::Approx(3.0276503541));

    auto lo = reduce_value(NodeKind::Min, data);
    auto hi = reduce_value(NodeKind::Max, data);
    REQUIRE(std::get<std::int64_t>(*lo) == 1);
    REQUIRE(std::get<std::int64_t>(*hi) == 10);
}

TEST_CASE("Reductions over empty data", "[runtime][reductions]") {
    Value empty{ColumnValue{Column<double>{}}};

    auto count = reduce_value(NodeKind::Count, empty);
    REQUIRE(std::get<std::int64_t>(*count) == 0);

    auto sum = reduce_value(NodeKind::Sum, empty);
    REQUIRE(std::get<double>(*sum) == 0.0);

    for (auto kind : {NodeKind::Mean, NodeKind::Var, NodeKind::Std, NodeKind::Min,
                      NodeKind::Max}) {
        auto result = reduce_value(kind, empty);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Domain);
    }
}

TEST_CASE("Integer sums wrap like int64", "[runtime][reductions]") {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();

    auto sum = reduce_value(NodeKind::Sum, Value{ColumnValue{Column<std::int64_t>{kMax, 1}}});
    REQUIRE(sum.has_value());
    REQUIRE(std::get<std::int64_t>(*sum) == kMin);

    Reducer left(NodeKind::Sum, ScalarKind::Int);
    Reducer right(NodeKind::Sum, ScalarKind::Int);
    REQUIRE(left.update(ColumnValue{Column<std::int64_t>{kMin}}).has_value());
    REQUIRE(right.update(ScalarValue{std::int64_t{-1}}).has_value());
    REQUIRE(left.merge(right).has_value());
    auto merged = left.finish();
    REQUIRE(merged.has_value());
    REQUIRE(std::get<std::int64_t>(*merged) == kMax);
}

TEST_CASE("Unbiased variance needs two elements", "[runtime][reductions]") {
    Value single{ColumnValue{Column<double>{4.0}}};
    REQUIRE(reduce_double(NodeKind::Var, single) == 0.0);

    auto result = reduce_value(NodeKind::Var, single, {.unbiased = true});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Domain);
}

TEST_CASE("NUnique counts exact distinct values", "[runtime][reductions]") {
    Value data{ColumnValue{Column<std::int64_t>{1, 1, 2, 2, 3}}};
    auto n = reduce_value(NodeKind::NUnique, data);
    REQUIRE(std::get<std::int64_t>(*n) == 3);

    Table t;
    t.add_column("a", Column<std::int64_t>{1, 1, 2});
    t.add_column("b", Column<std::string>{"x", "x", "x"});
    auto rows = reduce_value(NodeKind::NUnique, Value{t});
    REQUIRE(std::get<std::int64_t>(*rows) == 2);
}

TEST_CASE("Min and max of strings", "[runtime][reductions]") {
    Value data{ColumnValue{Column<std::string>{"pear", "apple", "zucchini"}}};
    auto lo = reduce_value(NodeKind::Min, data);
    auto hi = reduce_value(NodeKind::Max, data);
    REQUIRE(std::get<std::string>(*lo) == "apple");
    REQUIRE(std::get<std::string>(*hi) == "zucchini");
}

TEST_CASE("Sum of strings is a type error", "[runtime][reductions]") {
    Value data{ColumnValue{Column<std::string>{"a"}}};
    auto result = reduce_value(NodeKind::Sum, data);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Type);
}

TEST_CASE("Moments merge pairwise", "[runtime][reductions]") {
    Moments all;
    Moments left;
    Moments right;
    for (int i = 1; i <= 10; ++i) {
        all.update(i);
        (i <= 3 ? left : right).update(i);
    }
    left.merge(right);
    REQUIRE(left.count() == 10);
    REQUIRE(left.mean() == Catch::Approx(all.mean()));
    REQUIRE(left.m2() == Catch::Approx(all.m2()));
    REQUIRE(*left.variance(true) == Catch::Approx(9.1666666667));

    Moments empty;
    empty.merge(left);
    REQUIRE(empty.mean() == Catch::Approx(5.5));
}

TEST_CASE("Sum of squares loses precision that Welford keeps", "[runtime][reductions]") {
    // Large offset, tiny spread: the single-pass formula cancels badly.
    constexpr double kOffset = 1e9;
    Moments welford;
    SumSquares naive;
    for (double x : {4.0, 7.0, 13.0, 16.0}) {
        welford.update(kOffset + x);
        naive.update(kOffset + x);
    }
    REQUIRE(*welford.variance(true) == Catch::Approx(30.0));
    // Whatever rounding does, the clamp keeps the result non-negative.
    REQUIRE(*naive.variance(true) >= 0.0);
}

TEST_CASE("Variance is never negative", "[runtime][reductions]") {
    auto naive = SumSquares::from_state(2, 2.0, 1.9999999);
    auto var = naive.variance(false);
    REQUIRE(var.has_value());
    REQUIRE(*var == 0.0);

    auto moments = Moments::from_state(3, 1.0, -1e-12);
    REQUIRE(*moments.variance(false) == 0.0);
}

TEST_CASE("Partial state round-trips through a reducer", "[runtime][reductions]") {
    for (auto method : {ex::VarianceMethod::Welford, ex::VarianceMethod::SumOfSquares}) {
        const ReduceOptions options{.method = method, .unbiased = true};
        Reducer combined(NodeKind::Var, ScalarKind::Double, options);

        for (const auto& chunk : {Column<double>{1, 2, 3}, Column<double>{4, 5, 6},
                                  Column<double>{7, 8, 9}, Column<double>{10}}) {
            Reducer part(NodeKind::Var, ScalarKind::Double, options);
            REQUIRE(part.update(ColumnValue{chunk}).has_value());
            auto state = part.partial_state();
            REQUIRE(state.has_value());
            REQUIRE(state->rows() == 1);
            REQUIRE(combined.merge_partial_state(*state).has_value());
        }
        auto result = combined.finish();
        REQUIRE(result.has_value());
        REQUIRE(std::get<double>(*result) == Catch::Approx(9.1666666667));
    }
}

TEST_CASE("Reducers merge", "[runtime][reductions]") {
    Reducer left(NodeKind::Max, ScalarKind::Int);
    Reducer right(NodeKind::Max, ScalarKind::Int);
    REQUIRE(left.update(ColumnValue{Column<std::int64_t>{3, 9}}).has_value());
    REQUIRE(right.update(ColumnValue{Column<std::int64_t>{12, 1}}).has_value());
    REQUIRE(left.merge(right).has_value());
    REQUIRE(std::get<std::int64_t>(*left.finish()) == 12);

    Reducer other(NodeKind::Sum, ScalarKind::Int);
    auto mismatch = left.merge(other);
    REQUIRE_FALSE(mismatch.has_value());
    REQUIRE(mismatch.error().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("Group-by aggregates in first-occurrence order", "[runtime][group_by]") {
    Table t;
    t.add_column("symbol", Column<std::string>{"B", "A", "B", "A", "C"});
    t.add_column("qty", Column<std::int64_t>{1, 2, 3, 4, 5});
    t.add_column("price", Column<double>{1.0, 2.0, 3.0, 4.0, 5.0});

    auto grouped = aggregate_table(t, {"symbol"},
                                   {ex::make_agg(ex::AggFunc::Sum, "qty", "total"),
                                    ex::make_agg(ex::AggFunc::Count, "", "n"),
                                    ex::make_agg(ex::AggFunc::Mean, "price", "avg")});
    REQUIRE(grouped.has_value());
    REQUIRE(grouped->rows() == 3);
    REQUIRE(column_names(*grouped) == std::vector<std::string>{"symbol", "total", "n", "avg"});

    const auto& symbols = std::get<Column<std::string>>(*grouped->find("symbol"));
    const auto& totals = std::get<Column<std::int64_t>>(*grouped->find("total"));
    const auto& counts = std::get<Column<std::int64_t>>(*grouped->find("n"));
    const auto& avgs = std::get<Column<double>>(*grouped->find("avg"));
    REQUIRE(symbols[0] == "B");
    REQUIRE(symbols[1] == "A");
    REQUIRE(symbols[2] == "C");
    REQUIRE(totals[0] == 4);
    REQUIRE(totals[1] == 6);
    REQUIRE(counts[2] == 1);
    REQUIRE(avgs[1] == Catch::Approx(3.0));

    auto missing = aggregate_table(t, {"venue"}, {});
    REQUIRE_FALSE(missing.has_value());
}
