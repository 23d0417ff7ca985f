#include <chunkwise/engine/merge.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using chunkwise::Column;
using chunkwise::DataShape;
using chunkwise::ErrorKind;
using chunkwise::FieldType;
using chunkwise::ScalarKind;
using namespace chunkwise::runtime;
using namespace chunkwise::engine;

TEST_CASE("Arrays concatenate in part order", "[engine][merge]") {
    std::vector<Value> parts{ColumnValue{Column<std::int64_t>{1, 2}},
                             ColumnValue{Column<std::int64_t>{}},
                             ColumnValue{Column<std::int64_t>{3}}};
    auto merged = merge(std::move(parts), DataShape::var(chunkwise::scalar_dtype(ScalarKind::Int)));
    REQUIRE(merged.has_value());
    REQUIRE(std::get<Column<std::int64_t>>(std::get<ColumnValue>(*merged)) ==
            Column<std::int64_t>{1, 2, 3});
}

TEST_CASE("Tables concatenate rows without touching their inputs", "[engine][merge]") {
    Table a;
    a.add_column("k", Column<std::string>{"x"});
    a.add_column("v", Column<double>{1.0});
    Table b;
    b.add_column("k", Column<std::string>{"y", "z"});
    b.add_column("v", Column<double>{2.0, 3.0});
    const auto shared = a.columns[0].column;

    auto merged = merge({Value{a}, Value{b}}, DataShape::var(chunkwise::record_dtype({
                                                  FieldType{.name = "k", .kind = ScalarKind::String},
                                                  FieldType{.name = "v", .kind = ScalarKind::Double},
                                              })));
    REQUIRE(merged.has_value());
    const auto& table = std::get<Table>(*merged);
    REQUIRE(table.rows() == 3);
    REQUIRE(std::get<Column<std::string>>(*table.find("k"))[2] == "z");
    REQUIRE(column_size(*shared) == 1);
}

TEST_CASE("Sequences flatten and scalars become rows", "[engine][merge]") {
    const auto shape = DataShape::var(chunkwise::scalar_dtype(ScalarKind::Int));

    Sequence first{.names = {}, .rows = {Row{std::int64_t{1}}}};
    Sequence second{.names = {}, .rows = {Row{std::int64_t{2}}, Row{std::int64_t{3}}}};
    auto merged = merge({Value{first}, Value{second}}, shape);
    REQUIRE(merged.has_value());
    REQUIRE(std::get<Sequence>(*merged).rows.size() == 3);

    auto scalars = merge({Value{ScalarValue{std::int64_t{4}}}, Value{ScalarValue{std::int64_t{5}}}},
                         DataShape::scalar(ScalarKind::Int));
    REQUIRE(scalars.has_value());
    const auto& rows = std::get<Sequence>(*scalars).rows;
    REQUIRE(rows.size() == 2);
    REQUIRE(std::get<std::int64_t>(rows[1].front()) == 5);
}

TEST_CASE("Parts that disagree are a type error", "[engine][merge]") {
    const auto shape = DataShape::var(chunkwise::scalar_dtype(ScalarKind::Int));

    auto kinds = merge({Value{ColumnValue{Column<std::int64_t>{1}}},
                        Value{ColumnValue{Column<double>{2.0}}}},
                       shape);
    REQUIRE_FALSE(kinds.has_value());
    REQUIRE(kinds.error().kind == ErrorKind::Type);

    auto forms = merge({Value{ColumnValue{Column<std::int64_t>{1}}}, Value{Table{}}}, shape);
    REQUIRE_FALSE(forms.has_value());
    REQUIRE(forms.error().kind == ErrorKind::Type);

    Table a;
    a.add_column("k", Column<std::int64_t>{1});
    Table b;
    b.add_column("j", Column<std::int64_t>{2});
    auto names = merge({Value{a}, Value{b}}, shape);
    REQUIRE_FALSE(names.has_value());
    REQUIRE(names.error().kind == ErrorKind::Type);
}

TEST_CASE("No parts give an empty value of the expected shape", "[engine][merge]") {
    auto array = merge({}, DataShape::var(chunkwise::scalar_dtype(ScalarKind::Double)));
    REQUIRE(array.has_value());
    REQUIRE(column_kind(std::get<ColumnValue>(*array)) == ScalarKind::Double);
    REQUIRE(value_length(*array) == 0);

    auto table = merge({}, DataShape::var(chunkwise::record_dtype({
                               FieldType{.name = "n", .kind = ScalarKind::Int},
                           })));
    REQUIRE(table.has_value());
    REQUIRE(column_names(std::get<Table>(*table)) == std::vector<std::string>{"n"});
    REQUIRE(std::get<Table>(*table).rows() == 0);

    auto scalar = merge({}, DataShape::scalar(ScalarKind::Int));
    REQUIRE(scalar.has_value());
    REQUIRE(std::get<Sequence>(*scalar).rows.empty());
}

TEST_CASE("A single part is returned as is", "[engine][merge]") {
    auto merged = merge({Value{ScalarValue{2.5}}}, DataShape::scalar(ScalarKind::Double));
    REQUIRE(merged.has_value());
    REQUIRE(std::get<double>(std::get<ScalarValue>(*merged)) == 2.5);
}
