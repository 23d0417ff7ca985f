#pragma once

#include <cstddef>
#include <iterator>

namespace chunkwise::engine {

/// Half-open element range [start, stop) of a data source.
struct Partition {
    std::size_t index = 0;
    std::size_t start = 0;
    std::size_t stop = 0;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return stop - start; }

    auto operator==(const Partition&) const -> bool = default;
};

/// Ordered, finite partitioning of [0, length), or of a sub-range
/// [start, stop), into ranges of `chunk_size` elements; the last range may
/// be short.
///
/// Nothing is stored: partitions are derived on demand, so the plan can be
/// iterated any number of times with identical results.
class PartitionPlan {
   public:
    class Iterator {
       public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Partition;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = Partition;

        Iterator() = default;
        Iterator(const PartitionPlan* plan, std::size_t index) : plan_(plan), index_(index) {}

        auto operator*() const -> Partition { return (*plan_)[index_]; }
        auto operator++() -> Iterator& {
            ++index_;
            return *this;
        }
        auto operator++(int) -> Iterator {
            Iterator copy = *this;
            ++index_;
            return copy;
        }
        auto operator==(const Iterator& other) const -> bool { return index_ == other.index_; }

       private:
        const PartitionPlan* plan_ = nullptr;
        std::size_t index_ = 0;
    };

    /// Throws std::invalid_argument when `chunk_size` is zero.
    PartitionPlan(std::size_t length, std::size_t chunk_size);
    /// Covers [start, stop) only. Throws std::invalid_argument when
    /// `chunk_size` is zero or start > stop.
    PartitionPlan(std::size_t start, std::size_t stop, std::size_t chunk_size);

    /// Elements covered.
    [[nodiscard]] auto length() const noexcept -> std::size_t { return stop_ - start_; }
    [[nodiscard]] auto start() const noexcept -> std::size_t { return start_; }
    [[nodiscard]] auto stop() const noexcept -> std::size_t { return stop_; }
    [[nodiscard]] auto chunk_size() const noexcept -> std::size_t { return chunk_size_; }
    /// ceil(length() / chunk_size).
    [[nodiscard]] auto size() const noexcept -> std::size_t { return count_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return count_ == 0; }

    /// Partition `index`; requires index < size().
    [[nodiscard]] auto operator[](std::size_t index) const noexcept -> Partition;

    [[nodiscard]] auto begin() const -> Iterator { return {this, 0}; }
    [[nodiscard]] auto end() const -> Iterator { return {this, count_}; }

   private:
    std::size_t start_;
    std::size_t stop_;
    std::size_t chunk_size_;
    std::size_t count_;
};

}  // namespace chunkwise::engine
