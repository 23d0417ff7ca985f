#include <chunkwise/engine/memory_policy.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace chunkwise::engine;

TEST_CASE("Fixed readings report what they were given", "[engine][memory]") {
    REQUIRE(fixed_memory(1024)() == 1024);
    REQUIRE(fixed_memory(0)() == 0);
}

TEST_CASE("Data fits below a fraction of available memory", "[engine][memory]") {
    MemoryPolicy policy{.available = fixed_memory(1000), .divisor = 4};
    REQUIRE(policy.fits_in_memory(0));
    REQUIRE(policy.fits_in_memory(249));
    REQUIRE_FALSE(policy.fits_in_memory(250));
    REQUIRE_FALSE(policy.fits_in_memory(1000));

    policy.divisor = 1;
    REQUIRE(policy.fits_in_memory(999));
}

TEST_CASE("Nothing fits when no memory is available", "[engine][memory]") {
    MemoryPolicy policy{.available = fixed_memory(0)};
    REQUIRE_FALSE(policy.fits_in_memory(0));
    REQUIRE_FALSE(policy.fits_in_memory(1));
}

TEST_CASE("Available memory is read on every decision", "[engine][memory]") {
    std::size_t available = 100;
    int calls = 0;
    MemoryPolicy policy{.available =
                            [&]() {
                                ++calls;
                                return available;
                            },
                        .divisor = 1};
    REQUIRE(policy.fits_in_memory(50));
    available = 10;
    REQUIRE_FALSE(policy.fits_in_memory(50));
    REQUIRE(calls == 2);
}

TEST_CASE("The host reports its available memory", "[engine][memory]") {
    // Only the call itself is checked; the amount depends on the machine.
    [[maybe_unused]] auto bytes = system_available_memory();
    SUCCEED();
}
