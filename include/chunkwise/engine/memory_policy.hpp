#pragma once

#include <cstddef>
#include <functional>

namespace chunkwise::engine {

/// Reports the bytes of memory currently available to the process.
using AvailableMemory = std::function<std::size_t()>;

/// Host reading: available physical pages times the page size.
[[nodiscard]] auto system_available_memory() -> std::size_t;

/// Reading that always reports `bytes`.
[[nodiscard]] auto fixed_memory(std::size_t bytes) -> AvailableMemory;

/// Decides whether data of a given size may be materialized at once.
///
/// `available` runs on every call; nothing is cached, so each decision sees
/// the memory available at that moment.
struct MemoryPolicy {
    AvailableMemory available = system_available_memory;
    /// Data fits when it is smaller than available / divisor.
    std::size_t divisor = 4;

    [[nodiscard]] auto fits_in_memory(std::size_t byte_size) const -> bool;
};

}  // namespace chunkwise::engine
