#include <chunkwise/engine/execute.hpp>
#include <chunkwise/expr/builder.hpp>
#include <chunkwise/runtime/print.hpp>
#include <chunkwise/storage/column_file.hpp>
#include <chunkwise/storage/csv.hpp>
#include <chunkwise/storage/memory_source.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

namespace ex = chunkwise::expr;

enum class SourceKind {
    Table,
    Stream,
    Column,
};

auto open_source(SourceKind kind, const std::string& path, chunkwise::ScalarKind element)
    -> chunkwise::Result<chunkwise::storage::DataSourcePtr> {
    using namespace chunkwise::storage;
    switch (kind) {
        case SourceKind::Table: {
            auto table = read_csv(path);
            if (!table) {
                return std::unexpected(std::move(table.error()));
            }
            return std::make_shared<const MemorySource>(std::move(*table));
        }
        case SourceKind::Stream: {
            auto source = CsvStreamSource::open(path);
            if (!source) {
                return std::unexpected(std::move(source.error()));
            }
            return *source;
        }
        case SourceKind::Column: {
            auto source = ColumnFileSource::open(path, element);
            if (!source) {
                return std::unexpected(std::move(source.error()));
            }
            return *source;
        }
    }
    return chunkwise::make_error(chunkwise::ErrorKind::InvalidArgument, "unknown source kind");
}

struct Query {
    std::string field;
    std::string op = "sum";
    std::optional<double> greater_than;
    std::size_t head = 10;
    bool unbiased = false;
};

// Throws std::invalid_argument for malformed queries (unknown field, sum of
// strings).
auto build_query(const Query& query, const chunkwise::DataShape& shape) -> ex::ExprPtr {
    auto node = ex::symbol("data", shape);
    if (!query.field.empty()) {
        node = ex::field(node, query.field);
    }
    if (query.greater_than) {
        node = ex::filter(node, ex::filter_cmp(ex::CompareOp::Gt, ex::filter_elem(),
                                               ex::filter_dbl(*query.greater_than)));
    }
    const auto& op = query.op;
    if (op == "sum") return ex::sum(node);
    if (op == "count") return ex::count(node);
    if (op == "mean") return ex::mean(node);
    if (op == "var") return ex::var(node, query.unbiased);
    if (op == "std") return ex::stddev(node, query.unbiased);
    if (op == "nunique") return ex::nunique(node);
    if (op == "min") return ex::min(node);
    if (op == "max") return ex::max(node);
    if (op == "distinct") return ex::distinct(node);
    if (op == "head") return ex::head(node, query.head);
    throw std::invalid_argument("unknown operation: " + op);
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"chunkwise: run one reduction over a data source"};

    bool verbose = false;
    std::string path;
    SourceKind source_kind = SourceKind::Table;
    std::string element_name = "double";
    Query query;
    std::size_t chunk_size = chunkwise::engine::kDefaultChunkSize;
    std::optional<std::size_t> available_memory;
    std::size_t threads = 1;
    std::string variance = "welford";

    const std::map<std::string, SourceKind> source_kinds{
        {"table", SourceKind::Table},
        {"stream", SourceKind::Stream},
        {"column", SourceKind::Column},
    };

    app.add_option("input", path, "CSV file or binary column file")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-s,--source", source_kind,
                   "table: load the CSV; stream: iterate the CSV; column: binary column file")
        ->transform(CLI::CheckedTransformer(source_kinds, CLI::ignore_case));
    app.add_option("--kind", element_name, "Element type of a column file")
        ->check(CLI::IsMember({"int", "double"}));
    app.add_option("-f,--field", query.field, "Field of the CSV to reduce");
    app.add_option("-o,--op", query.op, "Operation to run")
        ->check(CLI::IsMember(
            {"sum", "count", "mean", "var", "std", "nunique", "min", "max", "distinct", "head"}));
    app.add_option("--gt", query.greater_than, "Keep only elements greater than this value");
    app.add_option("-n,--head", query.head, "Element count for --op head");
    app.add_flag("--unbiased", query.unbiased, "Divide var/std by n - 1");
    app.add_option("--chunk-size", chunk_size, "Elements per partition")
        ->envname("CHUNKWISE_CHUNK_SIZE")
        ->check(CLI::PositiveNumber);
    app.add_option("--memory", available_memory,
                   "Available memory in bytes (default: ask the host)")
        ->envname("CHUNKWISE_AVAILABLE_MEMORY");
    app.add_option("-j,--threads", threads, "Worker threads for chunked execution (0: all cores)")
        ->envname("CHUNKWISE_THREADS");
    app.add_option("--variance", variance, "Variance accumulation scheme")
        ->check(CLI::IsMember({"welford", "sumsq"}));
    app.add_flag("-v,--verbose", verbose, "Log execution decisions");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    const auto element =
        element_name == "int" ? chunkwise::ScalarKind::Int : chunkwise::ScalarKind::Double;
    auto source = open_source(source_kind, path, element);
    if (!source) {
        fmt::print(stderr, "error: {}\n", source.error().format());
        return 1;
    }

    chunkwise::engine::EngineConfig config;
    config.chunk_size = chunk_size;
    if (available_memory) {
        config.memory.available = chunkwise::engine::fixed_memory(*available_memory);
    }
    if (threads != 1) {
        config.map = chunkwise::engine::parallel_map(threads);
    }
    config.variance = variance == "sumsq" ? ex::VarianceMethod::SumOfSquares
                                          : ex::VarianceMethod::Welford;

    ex::ExprPtr expr;
    try {
        expr = build_query(query, (*source)->shape());
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }

    auto result = chunkwise::engine::execute(expr, **source, config);
    if (!result) {
        fmt::print(stderr, "error: {}\n", result.error().format());
        return 1;
    }
    chunkwise::runtime::print(*result);
    return 0;
}
