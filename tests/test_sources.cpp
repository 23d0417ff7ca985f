#include <chunkwise/storage/column_file.hpp>
#include <chunkwise/storage/csv.hpp>
#include <chunkwise/storage/memory_source.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using chunkwise::Column;
using chunkwise::DimKind;
using chunkwise::ErrorKind;
using chunkwise::ScalarKind;
using namespace chunkwise::runtime;
using namespace chunkwise::storage;

namespace {

auto temp_path(const std::string& name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / ("chunkwise_" + name);
}

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

auto drain(RowStream& stream) -> Sequence {
    auto seq = collect(stream);
    REQUIRE(seq.has_value());
    return std::move(*seq);
}

}  // namespace

TEST_CASE("Memory source slices and iterates", "[storage][memory]") {
    Table t;
    t.add_column("id", Column<std::int64_t>{1, 2, 3, 4});
    t.add_column("name", Column<std::string>{"a", "b", "c", "d"});
    MemorySource source{Value{t}};

    REQUIRE(has(source.capabilities(), Capability::Slice));
    REQUIRE(has(source.capabilities(), Capability::Iterate));
    REQUIRE(source.length() == 4);
    REQUIRE(source.shape().dim == DimKind::Fixed);
    REQUIRE(source.shape().length == 4);
    REQUIRE(source.shape().dtype.fields.size() == 2);
    REQUIRE(source.byte_size() > 0);

    auto middle = source.slice(1, 3);
    REQUIRE(middle.has_value());
    const auto& part = std::get<Table>(*middle);
    REQUIRE(part.rows() == 2);
    REQUIRE(std::get<Column<std::string>>(*part.find("name"))[0] == "b");

    auto stream = source.iterate();
    REQUIRE(stream.has_value());
    auto rows = drain(**stream);
    REQUIRE(rows.names == std::vector<std::string>{"id", "name"});
    REQUIRE(rows.rows.size() == 4);

    // A second iteration starts over.
    auto again = source.iterate();
    REQUIRE(again.has_value());
    REQUIRE(drain(**again).rows.size() == 4);
}

TEST_CASE("Slice ranges are checked", "[storage][memory]") {
    MemorySource source{Value{ColumnValue{Column<double>{1.0, 2.0, 3.0}}}};

    auto empty = source.slice(3, 3);
    REQUIRE(empty.has_value());
    REQUIRE(value_length(*empty) == 0);

    auto past = source.slice(2, 4);
    REQUIRE_FALSE(past.has_value());
    REQUIRE(past.error().kind == ErrorKind::InvalidArgument);

    auto backwards = source.slice(2, 1);
    REQUIRE_FALSE(backwards.has_value());
    REQUIRE(backwards.error().kind == ErrorKind::InvalidArgument);

    REQUIRE(check_range(0, 0, 0).has_value());
}

TEST_CASE("Memory source rejects scalars", "[storage][memory]") {
    REQUIRE_THROWS_AS(MemorySource{Value{ScalarValue{1.0}}}, std::invalid_argument);
}

TEST_CASE("Memory source projects tables", "[storage][memory]") {
    Table t;
    t.add_column("a", Column<std::int64_t>{1, 2, 3});
    t.add_column("b", Column<double>{0.5, 1.5, 2.5});
    t.add_column("c", Column<std::string>{"x", "y", "z"});
    MemorySource source{Value{t}};

    auto narrowed = source.project({"c", "a"});
    REQUIRE(narrowed.has_value());
    REQUIRE((*narrowed)->length() == 3);
    REQUIRE((*narrowed)->byte_size() < source.byte_size());
    const auto& fields = (*narrowed)->shape().dtype.fields;
    REQUIRE(fields.size() == 2);
    REQUIRE(fields[0].name == "c");
    REQUIRE(fields[1].name == "a");

    auto rows = (*narrowed)->slice(1, 3);
    REQUIRE(rows.has_value());
    const auto& table = std::get<Table>(*rows);
    REQUIRE(column_names(table) == std::vector<std::string>{"c", "a"});
    REQUIRE(std::get<Column<std::int64_t>>(*table.find("a")) == Column<std::int64_t>{2, 3});

    auto unknown = source.project({"d"});
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().kind == ErrorKind::InvalidArgument);

    MemorySource array{Value{ColumnValue{Column<std::int64_t>{1}}}};
    auto flat = array.project({"a"});
    REQUIRE_FALSE(flat.has_value());
    REQUIRE(flat.error().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("Column files round-trip", "[storage][column_file]") {
    const auto path = temp_path("ints.bin");
    Column<std::int64_t> values;
    for (std::int64_t i = 0; i < 100; ++i) {
        values.push_back(i * 3);
    }
    REQUIRE(write_column_file(path, ColumnValue{values}).has_value());
    REQUIRE(std::filesystem::file_size(path) == 800);

    auto source = ColumnFileSource::open(path, ScalarKind::Int);
    REQUIRE(source.has_value());
    REQUIRE((*source)->length() == 100);
    REQUIRE((*source)->byte_size() == 800);
    REQUIRE((*source)->shape().dtype.kind == ScalarKind::Int);

    auto tail = (*source)->slice(97, 100);
    REQUIRE(tail.has_value());
    const auto& column = std::get<Column<std::int64_t>>(std::get<ColumnValue>(*tail));
    REQUIRE(column == Column<std::int64_t>{291, 294, 297});

    auto stream = (*source)->iterate();
    REQUIRE(stream.has_value());
    auto rows = drain(**stream);
    REQUIRE(rows.rows.size() == 100);
    REQUIRE(std::get<std::int64_t>(rows.rows[10].front()) == 30);

    std::filesystem::remove(path);
}

TEST_CASE("Column file errors", "[storage][column_file]") {
    auto missing = ColumnFileSource::open(temp_path("does_not_exist.bin"), ScalarKind::Double);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == ErrorKind::Io);

    const auto odd = temp_path("odd.bin");
    write_text(odd, "12345");
    auto truncated = ColumnFileSource::open(odd, ScalarKind::Double);
    REQUIRE_FALSE(truncated.has_value());
    REQUIRE(truncated.error().kind == ErrorKind::Io);
    std::filesystem::remove(odd);

    auto strings = write_column_file(temp_path("strings.bin"),
                                     ColumnValue{Column<std::string>{"x"}});
    REQUIRE_FALSE(strings.has_value());
    REQUIRE(strings.error().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("read_csv infers column types", "[storage][csv]") {
    const auto path = temp_path("trades.csv");
    write_text(path,
               "symbol,qty,price\n"
               "AAPL,10,1.5\n"
               "MSFT,5,2\n"
               "\n"
               "AMZN,20,0.5\n");

    auto table = read_csv(path.string());
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 3);
    REQUIRE(column_kind(*table->find("symbol")) == ScalarKind::String);
    REQUIRE(column_kind(*table->find("qty")) == ScalarKind::Int);
    REQUIRE(column_kind(*table->find("price")) == ScalarKind::Double);
    REQUIRE(std::get<Column<double>>(*table->find("price"))[1] == Catch::Approx(2.0));

    std::filesystem::remove(path);
}

TEST_CASE("read_csv keeps only the requested columns", "[storage][csv]") {
    const auto path = temp_path("narrow.csv");
    write_text(path, "symbol,qty,price\nAAPL,10,1.5\nMSFT,5,2\n");

    auto table = read_csv(path.string(), {"price", "symbol"});
    REQUIRE(table.has_value());
    REQUIRE(column_names(*table) == std::vector<std::string>{"price", "symbol"});
    REQUIRE(table->find("qty") == nullptr);
    REQUIRE(std::get<Column<std::string>>(*table->find("symbol"))[1] == "MSFT");

    auto unknown = read_csv(path.string(), {"volume"});
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().kind == ErrorKind::InvalidArgument);

    std::filesystem::remove(path);
}

TEST_CASE("read_csv reports malformed input", "[storage][csv]") {
    auto missing = read_csv(temp_path("nope.csv").string());
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == ErrorKind::Io);

    const auto path = temp_path("ragged.csv");
    write_text(path, "a,b\n1,2\n3\n");
    auto ragged = read_csv(path.string());
    REQUIRE_FALSE(ragged.has_value());
    REQUIRE(ragged.error().kind == ErrorKind::Io);
    std::filesystem::remove(path);
}

TEST_CASE("CSV stream source is iterate-only", "[storage][csv]") {
    const auto path = temp_path("stream.csv");
    write_text(path, "k,v\nx,1\ny,2\nx,3\n");

    auto source = CsvStreamSource::open(path);
    REQUIRE(source.has_value());
    REQUIRE((*source)->capabilities() == Capability::Iterate);
    REQUIRE((*source)->length() == 3);
    REQUIRE((*source)->shape().dtype.fields[1].kind == ScalarKind::Int);

    auto sliced = (*source)->slice(0, 1);
    REQUIRE_FALSE(sliced.has_value());
    REQUIRE(sliced.error().kind == ErrorKind::Unsupported);

    auto stream = (*source)->iterate();
    REQUIRE(stream.has_value());
    auto rows = drain(**stream);
    REQUIRE(rows.names == std::vector<std::string>{"k", "v"});
    REQUIRE(rows.rows.size() == 3);
    REQUIRE(std::get<std::string>(rows.rows[2][0]) == "x");
    REQUIRE(std::get<std::int64_t>(rows.rows[2][1]) == 3);

    std::filesystem::remove(path);
}

TEST_CASE("CSV stream source projects columns", "[storage][csv]") {
    const auto path = temp_path("project.csv");
    write_text(path, "k,v,w\nx,1,0.5\ny,2,1.5\n");

    auto source = CsvStreamSource::open(path);
    REQUIRE(source.has_value());

    auto narrowed = (*source)->project({"w", "k"});
    REQUIRE(narrowed.has_value());
    REQUIRE((*narrowed)->capabilities() == Capability::Iterate);
    REQUIRE((*narrowed)->length() == 2);
    REQUIRE((*narrowed)->shape().dtype.fields[0].kind == ScalarKind::Double);

    auto stream = (*narrowed)->iterate();
    REQUIRE(stream.has_value());
    auto rows = drain(**stream);
    REQUIRE(rows.names == std::vector<std::string>{"w", "k"});
    REQUIRE(rows.rows[1].size() == 2);
    REQUIRE(std::get<double>(rows.rows[1][0]) == Catch::Approx(1.5));
    REQUIRE(std::get<std::string>(rows.rows[1][1]) == "y");

    // Projections compose against the file's own columns.
    auto again = (*narrowed)->project({"k"});
    REQUIRE(again.has_value());
    auto keys = (*again)->iterate();
    REQUIRE(keys.has_value());
    auto only = drain(**keys);
    REQUIRE(only.names == std::vector<std::string>{"k"});
    REQUIRE(std::get<std::string>(only.rows[0][0]) == "x");

    auto unknown = (*source)->project({"z"});
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().kind == ErrorKind::InvalidArgument);

    std::filesystem::remove(path);
}
