#include <chunkwise/engine/partition.hpp>

#include <algorithm>
#include <stdexcept>

namespace chunkwise::engine {

PartitionPlan::PartitionPlan(std::size_t length, std::size_t chunk_size)
    : PartitionPlan(0, length, chunk_size) {}

PartitionPlan::PartitionPlan(std::size_t start, std::size_t stop, std::size_t chunk_size)
    : start_(start), stop_(stop), chunk_size_(chunk_size), count_(0) {
    if (chunk_size == 0) {
        throw std::invalid_argument("PartitionPlan: chunk size must be positive");
    }
    if (start > stop) {
        throw std::invalid_argument("PartitionPlan: start after stop");
    }
    const std::size_t length = stop - start;
    count_ = length / chunk_size + (length % chunk_size == 0 ? 0 : 1);
}

auto PartitionPlan::operator[](std::size_t index) const noexcept -> Partition {
    const std::size_t start = start_ + index * chunk_size_;
    return Partition{
        .index = index, .start = start, .stop = std::min(stop_, start + chunk_size_)};
}

}  // namespace chunkwise::engine
