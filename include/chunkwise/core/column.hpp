#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace chunkwise {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// A typed, owning columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values.
/// Chunks of a data source are materialized as Column<T> (or tables of
/// them), so range slicing and appending are first-class here.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    /// Number of elements.
    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }

    /// Whether the column is empty.
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Bounds-checked element access.
    [[nodiscard]] auto at(size_type idx) const -> const T& { return data_.at(idx); }

    /// Unchecked element access.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const T& { return data_[idx]; }
    [[nodiscard]] auto operator[](size_type idx) noexcept -> T& { return data_[idx]; }

    /// Zero-copy view of the underlying data.
    [[nodiscard]] auto span() const noexcept -> std::span<const T> { return data_; }

    [[nodiscard]] auto data() noexcept -> T* { return data_.data(); }
    [[nodiscard]] auto data() const noexcept -> const T* { return data_.data(); }

    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    void reserve(size_type capacity) { data_.reserve(capacity); }
    void resize(size_type count) { data_.resize(count); }
    void clear() noexcept { data_.clear(); }

    /// Copy of the half-open range [start, stop).
    ///
    /// Throws std::out_of_range when the range does not lie inside the column.
    [[nodiscard]] auto slice(size_type start, size_type stop) const -> Column<T> {
        if (start > stop || stop > data_.size()) {
            throw std::out_of_range("Column::slice: range outside column");
        }
        return Column<T>{std::vector<T>(data_.begin() + static_cast<std::ptrdiff_t>(start),
                                        data_.begin() + static_cast<std::ptrdiff_t>(stop))};
    }

    /// Append every element of `other`, preserving order.
    void append(const Column<T>& other) {
        data_.insert(data_.end(), other.data_.begin(), other.data_.end());
    }

    /// Apply a predicate and return a filtered column.
    template <std::predicate<const T&> Pred>
    [[nodiscard]] auto filter(Pred pred) const -> Column<T> {
        std::vector<T> result;
        std::ranges::copy_if(data_, std::back_inserter(result), pred);
        return Column<T>{std::move(result)};
    }

    /// Apply a transform and return a new column.
    template <typename F>
        requires std::invocable<F, const T&>
    [[nodiscard]] auto transform(F func) const -> Column<std::invoke_result_t<F, const T&>> {
        using U = std::invoke_result_t<F, const T&>;
        std::vector<U> result;
        result.reserve(data_.size());
        std::ranges::transform(data_, std::back_inserter(result), func);
        return Column<U>{std::move(result)};
    }

    [[nodiscard]] auto begin() noexcept { return data_.begin(); }
    [[nodiscard]] auto end() noexcept { return data_.end(); }
    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

    friend auto operator==(const Column& lhs, const Column& rhs) -> bool {
        return lhs.data_ == rhs.data_;
    }

   private:
    std::vector<T> data_;
};

}  // namespace chunkwise
