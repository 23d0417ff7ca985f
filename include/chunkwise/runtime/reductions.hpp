#pragma once

#include <chunkwise/core/error.hpp>
#include <chunkwise/expr/node.hpp>
#include <chunkwise/runtime/value.hpp>

#include <cstdint>
#include <optional>
#include <robin_hood.h>

namespace chunkwise::runtime {

// ─── Variance accumulators ────────────────────────────────────────────────────

/// Running (n, mean, M2) updated with Welford's recurrence and combined with
/// Chan's pairwise formula:
///
///   δ  = mean_b − mean_a
///   M2 = M2_a + M2_b + δ² · n_a · n_b / n
class Moments {
   public:
    Moments() = default;
    [[nodiscard]] static auto from_state(std::int64_t n, double mean, double m2) -> Moments;

    void update(double x) noexcept;
    void merge(const Moments& other) noexcept;

    [[nodiscard]] auto count() const noexcept -> std::int64_t { return n_; }
    [[nodiscard]] auto mean() const noexcept -> double { return mean_; }
    [[nodiscard]] auto m2() const noexcept -> double { return m2_; }

    /// M2 / (n − unbiased). Domain error when the divisor is not positive.
    [[nodiscard]] auto variance(bool unbiased) const -> Result<double>;

   private:
    std::int64_t n_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
};

/// Single-pass Σx and Σx². Cancels badly for large, tightly clustered values;
/// negative results are clamped to zero.
class SumSquares {
   public:
    SumSquares() = default;
    [[nodiscard]] static auto from_state(std::int64_t n, double sum, double sumsq) -> SumSquares;

    void update(double x) noexcept;
    void merge(const SumSquares& other) noexcept;

    [[nodiscard]] auto count() const noexcept -> std::int64_t { return n_; }
    [[nodiscard]] auto sum() const noexcept -> double { return sum_; }
    [[nodiscard]] auto sumsq() const noexcept -> double { return sumsq_; }

    [[nodiscard]] auto variance(bool unbiased) const -> Result<double>;

   private:
    std::int64_t n_ = 0;
    double sum_ = 0.0;
    double sumsq_ = 0.0;
};

// ─── Reducer ──────────────────────────────────────────────────────────────────

using RowSet = robin_hood::unordered_flat_set<Row, RowHash, RowEq>;

struct ReduceOptions {
    expr::VarianceMethod method = expr::VarianceMethod::Welford;
    bool unbiased = false;
};

/// Mergeable accumulator for one reduction kind.
///
/// The same object serves direct evaluation (one update over a whole
/// column), streaming (row-at-a-time updates) and chunked evaluation
/// (per-chunk reducers merged, or partial-state tables folded in).
class Reducer {
   public:
    /// `input` is the element kind; it decides the result type of sum.
    Reducer(expr::NodeKind kind, ScalarKind input, ReduceOptions options = {});

    /// One element.
    [[nodiscard]] auto update(const ScalarValue& value) -> Result<void>;
    /// One row; record rows are accepted by count and nunique only.
    [[nodiscard]] auto update(const Row& row) -> Result<void>;
    [[nodiscard]] auto update(const ColumnValue& column) -> Result<void>;
    [[nodiscard]] auto update(const Table& table) -> Result<void>;

    [[nodiscard]] auto merge(const Reducer& other) -> Result<void>;

    [[nodiscard]] auto finish() const -> Result<ScalarValue>;

    /// One-row accumulator-state table for mean/var/std (column layout in
    /// expr::partial_fields).
    [[nodiscard]] auto partial_state() const -> Result<Table>;
    /// Fold every row of a partial-state table into this reducer.
    [[nodiscard]] auto merge_partial_state(const Table& states) -> Result<void>;

    [[nodiscard]] auto kind() const noexcept -> expr::NodeKind { return kind_; }

   private:
    expr::NodeKind kind_;
    ScalarKind input_;
    ReduceOptions options_;

    std::int64_t count_ = 0;
    std::int64_t int_sum_ = 0;
    double dbl_sum_ = 0.0;
    Moments moments_;
    SumSquares sumsq_;
    RowSet distinct_;
    std::optional<ScalarValue> best_;
};

/// Apply reduction `kind` to an array, table, sequence or scalar.
[[nodiscard]] auto reduce_value(expr::NodeKind kind, const Value& value,
                                ReduceOptions options = {}) -> Result<ScalarValue>;

}  // namespace chunkwise::runtime
