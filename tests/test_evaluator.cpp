#include <chunkwise/expr/builder.hpp>
#include <chunkwise/runtime/evaluator.hpp>
#include <chunkwise/runtime/print.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ex = chunkwise::expr;
using chunkwise::Column;
using chunkwise::DataShape;
using chunkwise::ErrorKind;
using chunkwise::FieldType;
using chunkwise::ScalarKind;
using namespace chunkwise::runtime;

namespace {

auto make_trades() -> Table {
    Table t;
    t.add_column("symbol", Column<std::string>{"AAPL", "MSFT", "AMZN", "AAPL", "GOOG"});
    t.add_column("qty", Column<std::int64_t>{10, 5, 20, 15, 0});
    t.add_column("price", Column<double>{1.5, 2.0, 0.5, 3.0, 4.0});
    return t;
}

auto trades_shape() -> DataShape {
    return DataShape::fixed(5, chunkwise::record_dtype({
                                   FieldType{.name = "symbol", .kind = ScalarKind::String},
                                   FieldType{.name = "qty", .kind = ScalarKind::Int},
                                   FieldType{.name = "price", .kind = ScalarKind::Double},
                               }));
}

auto run(const ex::ExprPtr& expr, const ex::ExprPtr& leaf, Value data) -> Value {
    auto result = evaluate(*expr, *leaf, std::move(data));
    REQUIRE(result.has_value());
    return std::move(*result);
}

}  // namespace

TEST_CASE("Evaluate field and reductions over a table", "[runtime][evaluator]") {
    auto t = ex::symbol("t", trades_shape());

    auto total = run(ex::sum(ex::field(t, "qty")), t, make_trades());
    REQUIRE(std::get<std::int64_t>(std::get<ScalarValue>(total)) == 50);

    auto avg = run(ex::mean(ex::field(t, "price")), t, make_trades());
    REQUIRE(std::get<double>(std::get<ScalarValue>(avg)) == Catch::Approx(2.2));

    auto rows = run(ex::count(t), t, make_trades());
    REQUIRE(std::get<std::int64_t>(std::get<ScalarValue>(rows)) == 5);
}

TEST_CASE("keepdims returns a one-element array", "[runtime][evaluator]") {
    auto t = ex::symbol("t", trades_shape());
    auto total = run(ex::sum(ex::field(t, "qty"), true), t, make_trades());
    const auto& column = std::get<ColumnValue>(total);
    REQUIRE(column_size(column) == 1);
    REQUIRE(std::get<Column<std::int64_t>>(column)[0] == 50);
}

TEST_CASE("Project and relabel share columns", "[runtime][evaluator]") {
    auto t = ex::symbol("t", trades_shape());
    auto expr = ex::relabel(ex::project(t, {"price", "symbol"}), {{"price", "px"}});
    auto out = run(expr, t, make_trades());
    const auto& table = std::get<Table>(out);
    REQUIRE(column_names(table) == std::vector<std::string>{"px", "symbol"});
    REQUIRE(table.rows() == 5);
}

TEST_CASE("Filter uses the vectorized path when it can", "[runtime][evaluator]") {
    auto t = ex::symbol("t", trades_shape());
    auto big = ex::filter(t, ex::filter_cmp(ex::CompareOp::Ge, ex::filter_col("qty"),
                                            ex::filter_int(10)));
    auto out = run(ex::field(big, "symbol"), t, make_trades());
    const auto& symbols = std::get<Column<std::string>>(std::get<ColumnValue>(out));
    REQUIRE(symbols == Column<std::string>{"AAPL", "AMZN", "AAPL"});
}

TEST_CASE("Filter falls back to row evaluation for like", "[runtime][evaluator]") {
    auto t = ex::symbol("t", trades_shape());

    auto by_like = ex::filter(t, ex::filter_like(ex::filter_col("symbol"), "A*"));
    auto by_cmp = ex::filter(
        t, ex::filter_or(ex::filter_cmp(ex::CompareOp::Eq, ex::filter_col("symbol"),
                                        ex::filter_str("AAPL")),
                         ex::filter_cmp(ex::CompareOp::Eq, ex::filter_col("symbol"),
                                        ex::filter_str("AMZN"))));

    auto liked = run(ex::field(by_like, "qty"), t, make_trades());
    auto compared = run(ex::field(by_cmp, "qty"), t, make_trades());
    REQUIRE(std::get<ColumnValue>(liked) == std::get<ColumnValue>(compared));
    REQUIRE(column_size(std::get<ColumnValue>(liked)) == 3);
}

TEST_CASE("Row-path errors surface from filters", "[runtime][evaluator]") {
    auto t = ex::symbol("t", trades_shape());
    auto mixed = ex::filter(t, ex::filter_cmp(ex::CompareOp::Eq, ex::filter_col("symbol"),
                                              ex::filter_int(3)));
    auto result = evaluate(*mixed, *t, Value{make_trades()});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Type);
}

TEST_CASE("Map, head, slice and distinct", "[runtime][evaluator]") {
    auto t = ex::symbol("t", trades_shape());

    auto notional = ex::map(t, ex::binop(ex::ArithmeticOp::Mul, ex::col_ref("qty"),
                                         ex::col_ref("price")));
    auto mapped = run(notional, t, make_trades());
    REQUIRE(std::get<Column<double>>(std::get<ColumnValue>(mapped))[2] == Catch::Approx(10.0));

    auto first = run(ex::head(t, 2), t, make_trades());
    REQUIRE(std::get<Table>(first).rows() == 2);

    // Ranges past the end are clamped.
    auto tail = run(ex::slice(t, 3, 99), t, make_trades());
    REQUIRE(std::get<Table>(tail).rows() == 2);

    auto symbols = run(ex::distinct(ex::field(t, "symbol")), t, make_trades());
    REQUIRE(std::get<Column<std::string>>(std::get<ColumnValue>(symbols)) ==
            Column<std::string>{"AAPL", "MSFT", "AMZN", "GOOG"});
}

TEST_CASE("By over a table", "[runtime][evaluator]") {
    auto t = ex::symbol("t", trades_shape());
    auto grouped = ex::by(t, {"symbol"}, {ex::make_agg(ex::AggFunc::Sum, "qty", "qty")});
    auto out = run(grouped, t, make_trades());
    const auto& table = std::get<Table>(out);
    REQUIRE(table.rows() == 4);
    REQUIRE(std::get<Column<std::int64_t>>(*table.find("qty"))[0] == 25);
}

TEST_CASE("Partial and finalize compose to the direct result", "[runtime][evaluator]") {
    auto x = ex::symbol("x", DataShape::fixed(10, chunkwise::scalar_dtype(ScalarKind::Int)));
    const Value data{ColumnValue{Column<std::int64_t>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}}};

    for (auto target : {ex::NodeKind::Mean, ex::NodeKind::Var, ex::NodeKind::Std}) {
        auto state = run(ex::partial(x, target, ex::VarianceMethod::Welford), x, data);
        REQUIRE(std::get<Table>(state).rows() == 1);

        auto states = ex::symbol(
            "s", DataShape::var(chunkwise::record_dtype(
                     ex::partial_fields(target, ex::VarianceMethod::Welford))));
        auto final = run(ex::finalize(states, target, ex::VarianceMethod::Welford, true, false),
                         states, state);
        auto direct = run(ex::reduce(target, x, false, true), x, data);
        REQUIRE(std::get<double>(std::get<ScalarValue>(final)) ==
                Catch::Approx(std::get<double>(std::get<ScalarValue>(direct))));
    }
}

TEST_CASE("Stream bindings fold without materializing", "[runtime][evaluator]") {
    auto t = ex::symbol("t", trades_shape());
    auto expr = ex::sum(ex::field(
        ex::filter(t, ex::filter_cmp(ex::CompareOp::Gt, ex::filter_col("price"),
                                     ex::filter_dbl(1.0))),
        "qty"));

    Bindings bindings;
    bindings.emplace(t->id(), stream_value(Value{make_trades()}));
    auto result = evaluate(*expr, bindings);
    REQUIRE(result.has_value());
    REQUIRE(std::get<std::int64_t>(std::get<ScalarValue>(*result)) == 30);

    // The binding was consumed.
    REQUIRE(bindings.empty());
}

TEST_CASE("A stream left at the root comes back as a sequence", "[runtime][evaluator]") {
    auto t = ex::symbol("t", trades_shape());
    Bindings bindings;
    bindings.emplace(t->id(), stream_value(Value{make_trades()}));

    auto result = evaluate(*ex::head(ex::field(t, "symbol"), 2), bindings);
    REQUIRE(result.has_value());
    const auto& seq = std::get<Sequence>(*result);
    REQUIRE(seq.names.empty());
    REQUIRE(seq.rows.size() == 2);
    REQUIRE(std::get<std::string>(seq.rows[1].front()) == "MSFT");
}

TEST_CASE("evaluate_stream keeps the root lazy", "[runtime][evaluator]") {
    auto t = ex::symbol("t", trades_shape());
    Bindings bindings;
    bindings.emplace(t->id(), stream_value(Value{make_trades()}));

    auto stream = evaluate_stream(*ex::project(t, {"qty"}), bindings);
    REQUIRE(stream.has_value());
    REQUIRE((*stream)->names() == std::vector<std::string>{"qty"});
    auto row = (*stream)->next();
    REQUIRE(row.has_value());
    REQUIRE(row->has_value());
    REQUIRE(std::get<std::int64_t>((**row).front()) == 10);
}

TEST_CASE("Unbound symbols and shape errors", "[runtime][evaluator]") {
    auto t = ex::symbol("t", trades_shape());
    Bindings none;
    auto unbound = evaluate(*ex::count(t), none);
    REQUIRE_FALSE(unbound.has_value());
    REQUIRE(unbound.error().kind == ErrorKind::Evaluation);

    // A bare array bound where a table was declared.
    auto wrong = evaluate(*ex::field(t, "qty"), *t,
                          Value{ColumnValue{Column<double>{1.0, 2.0}}});
    REQUIRE_FALSE(wrong.has_value());
    REQUIRE(wrong.error().kind == ErrorKind::Type);
}

TEST_CASE("Values print", "[runtime][print]") {
    std::ostringstream out;
    print(Value{ScalarValue{2.5}}, out);
    REQUIRE(out.str().find("2.5") != std::string::npos);

    std::ostringstream grid;
    print(make_trades(), grid);
    const auto text = grid.str();
    REQUIRE(text.find("symbol") != std::string::npos);
    REQUIRE(text.find("MSFT") != std::string::npos);
    REQUIRE(text.find("---") != std::string::npos);

    REQUIRE(format_scalar(ScalarValue{std::int64_t{42}}) == "42");
}
