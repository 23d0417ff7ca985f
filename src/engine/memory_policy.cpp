#include <chunkwise/engine/memory_policy.hpp>

#include <unistd.h>

namespace chunkwise::engine {

auto system_available_memory() -> std::size_t {
    const long pages = ::sysconf(_SC_AVPHYS_PAGES);
    const long page_size = ::sysconf(_SC_PAGESIZE);
    if (pages <= 0 || page_size <= 0) {
        return 0;
    }
    return static_cast<std::size_t>(pages) * static_cast<std::size_t>(page_size);
}

auto fixed_memory(std::size_t bytes) -> AvailableMemory {
    return [bytes]() { return bytes; };
}

auto MemoryPolicy::fits_in_memory(std::size_t byte_size) const -> bool {
    const std::size_t free_bytes = available ? available() : 0;
    const std::size_t budget = divisor == 0 ? free_bytes : free_bytes / divisor;
    return byte_size < budget;
}

}  // namespace chunkwise::engine
