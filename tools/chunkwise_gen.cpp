// chunkwise_gen: synthetic binary column files for out-of-core experiments.
//
//   chunkwise_gen data.bin --rows 100000000 --kind double --offset 1e9
//   chunkwise_run data.bin -s column -o var --memory 0 -v

#include <chunkwise/core/column.hpp>
#include <chunkwise/storage/column_file.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <utility>

auto main(int argc, char** argv) -> int {
    CLI::App app{"chunkwise: write a synthetic column file"};

    std::string path;
    std::size_t rows = 1'000'000;
    std::string kind = "double";
    double offset = 0.0;
    std::uint64_t seed = 42;
    bool verbose = false;

    app.add_option("output", path, "Output file")->required();
    app.add_option("-n,--rows", rows, "Number of elements");
    app.add_option("--kind", kind, "Element type")->check(CLI::IsMember({"int", "double"}));
    app.add_option("--offset", offset,
                   "Constant added to every double; large offsets stress variance "
                   "cancellation");
    app.add_option("--seed", seed, "Random seed");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    std::mt19937_64 rng(seed);
    chunkwise::runtime::ColumnValue column;
    if (kind == "int") {
        std::uniform_int_distribution<std::int64_t> dist(0, 999);
        chunkwise::Column<std::int64_t> values;
        values.reserve(rows);
        for (std::size_t i = 0; i < rows; ++i) {
            values.push_back(dist(rng));
        }
        column = std::move(values);
    } else {
        std::normal_distribution<double> dist(100.0, 15.0);
        chunkwise::Column<double> values;
        values.reserve(rows);
        for (std::size_t i = 0; i < rows; ++i) {
            values.push_back(offset + dist(rng));
        }
        column = std::move(values);
    }

    auto written = chunkwise::storage::write_column_file(path, column);
    if (!written) {
        fmt::print(stderr, "error: {}\n", written.error().format());
        return 1;
    }
    spdlog::info("wrote {} {} values to {}", rows, kind, path);
    return 0;
}
