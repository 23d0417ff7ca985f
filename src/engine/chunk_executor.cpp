#include <chunkwise/engine/chunk_executor.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

namespace chunkwise::engine {

namespace {

// A throwing task fails its partition.
auto run_task(const ChunkTask& task, const Partition& part) -> Result<runtime::Value> {
    try {
        return task(part);
    } catch (const std::exception& e) {
        return make_error(ErrorKind::Evaluation,
                          fmt::format("partition {} threw: {}", part.index, e.what()));
    }
}

// Joins every started worker when the strategy returns or unwinds.
struct JoinAll {
    std::vector<std::thread>& threads;

    ~JoinAll() {
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    }
};

}  // namespace

auto sequential_map() -> MapStrategy {
    return [](const PartitionPlan& plan, const ChunkTask& task) {
        std::vector<ChunkResult> results;
        results.reserve(plan.size());
        for (const auto& part : plan) {
            results.push_back(ChunkResult{.index = part.index, .value = run_task(task, part)});
            if (!results.back().value) {
                break;
            }
        }
        return results;
    };
}

auto parallel_map(std::size_t threads) -> MapStrategy {
    return [threads](const PartitionPlan& plan, const ChunkTask& task) {
        const std::size_t hw = std::max<unsigned>(1, std::thread::hardware_concurrency());
        const std::size_t wanted = threads == 0 ? hw : threads;
        const std::size_t workers_n = std::max<std::size_t>(1, std::min(wanted, plan.size()));

        std::vector<ChunkResult> results;
        results.reserve(plan.size());
        std::mutex results_mutex;
        std::atomic<std::size_t> next{0};
        std::atomic<bool> failed{false};

        auto work = [&] {
            while (!failed.load(std::memory_order_relaxed)) {
                const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
                if (i >= plan.size()) {
                    return;
                }
                auto value = run_task(task, plan[i]);
                if (!value) {
                    failed.store(true, std::memory_order_relaxed);
                }
                std::lock_guard<std::mutex> lock(results_mutex);
                results.push_back(ChunkResult{.index = i, .value = std::move(value)});
            }
        };

        {
            std::vector<std::thread> workers;
            workers.reserve(workers_n);
            const JoinAll join_all{workers};
            try {
                for (std::size_t t = 0; t < workers_n; ++t) {
                    workers.emplace_back(work);
                }
            } catch (const std::system_error& e) {
                spdlog::warn("chunked: started {} of {} workers: {}", workers.size(), workers_n,
                             e.what());
            }
            if (workers.empty()) {
                work();
            }
        }
        // Every worker has joined; `results` is complete.
        return results;
    };
}

auto execute_chunks(const SplitExpr& split, const storage::DataSource& source,
                    const PartitionPlan& plan, const MapStrategy& strategy,
                    const runtime::EvalOptions& options) -> Result<std::vector<runtime::Value>> {
    spdlog::debug("chunked: {} partitions of {} over {} elements", plan.size(),
                  plan.chunk_size(), plan.length());

    ChunkTask task = [&](const Partition& part) -> Result<runtime::Value> {
        auto data = source.slice(part.start, part.stop);
        if (!data) {
            return std::unexpected(std::move(data.error()));
        }
        return runtime::evaluate(*split.chunk_expr, *split.chunk_symbol, std::move(*data),
                                 options);
    };

    auto results = strategy(plan, task);
    std::ranges::sort(results, {}, &ChunkResult::index);

    std::vector<runtime::Value> values;
    values.reserve(results.size());
    for (auto& result : results) {
        if (!result.value) {
            spdlog::debug("chunked: partition {} failed: {}", result.index,
                          result.value.error().message);
            return std::unexpected(std::move(result.value.error()));
        }
        values.push_back(std::move(*result.value));
    }
    if (values.size() != plan.size()) {
        return make_error(ErrorKind::Evaluation,
                          "chunked: map strategy returned " + std::to_string(values.size()) +
                              " of " + std::to_string(plan.size()) + " partitions");
    }
    return values;
}

}  // namespace chunkwise::engine
