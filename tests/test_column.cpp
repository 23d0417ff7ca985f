#include <chunkwise/core/column.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

TEST_CASE("Column<int64> basic operations", "[core][column]") {
    chunkwise::Column<std::int64_t> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("push_back grows the column") {
        col.push_back(6);
        REQUIRE(col.size() == 6);
        REQUIRE(col.at(5) == 6);
    }

    SECTION("span provides zero-copy view") {
        auto view = col.span();
        REQUIRE(view.size() == 5);
        REQUIRE(view[2] == 3);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }
}

TEST_CASE("Column slice copies a half-open range", "[core][column]") {
    chunkwise::Column<std::int64_t> col{10, 20, 30, 40};

    auto mid = col.slice(1, 3);
    REQUIRE(mid.size() == 2);
    REQUIRE(mid[0] == 20);
    REQUIRE(mid[1] == 30);

    REQUIRE(col.slice(2, 2).empty());
    REQUIRE_THROWS_AS(col.slice(3, 5), std::out_of_range);
    REQUIRE_THROWS_AS(col.slice(3, 2), std::out_of_range);
}

TEST_CASE("Column append preserves order", "[core][column]") {
    chunkwise::Column<std::string> left{"a", "b"};
    chunkwise::Column<std::string> right{"c"};

    left.append(right);
    REQUIRE(left == chunkwise::Column<std::string>{"a", "b", "c"});
}

TEST_CASE("Column<int64> filter", "[core][column]") {
    chunkwise::Column<std::int64_t> col{1, 2, 3, 4, 5, 6};

    auto evens = col.filter([](std::int64_t x) { return x % 2 == 0; });

    REQUIRE(evens.size() == 3);
    REQUIRE(evens[0] == 2);
    REQUIRE(evens[1] == 4);
    REQUIRE(evens[2] == 6);
}

TEST_CASE("Column transform changes element type", "[core][column]") {
    chunkwise::Column<std::int64_t> col{1, 2, 3};

    auto halves = col.transform([](std::int64_t x) { return static_cast<double>(x) / 2.0; });

    REQUIRE(halves.size() == 3);
    REQUIRE(halves[0] == 0.5);
    REQUIRE(halves[2] == 1.5);
}

TEST_CASE("Column default-constructs empty", "[core][column]") {
    chunkwise::Column<double> col;

    REQUIRE(col.empty());
    REQUIRE(col.size() == 0);
}

TEST_CASE("Column range-for iteration", "[core][column]") {
    chunkwise::Column<std::int64_t> col{10, 20, 30};

    std::int64_t sum = 0;
    for (auto val : col) {
        sum += val;
    }
    REQUIRE(sum == 60);
}
