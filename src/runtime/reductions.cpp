#include <chunkwise/core/int_math.hpp>
#include <chunkwise/runtime/reductions.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace chunkwise::runtime {

namespace {

using expr::NodeKind;

auto empty_error(NodeKind kind) -> std::unexpected<Error> {
    return make_error(ErrorKind::Domain, fmt::format("{} of empty data", expr::to_string(kind)));
}

auto variance_divisor(std::int64_t n, bool unbiased) -> Result<double> {
    std::int64_t divisor = n - (unbiased ? 1 : 0);
    if (divisor <= 0) {
        return make_error(ErrorKind::Domain,
                          fmt::format("variance of {} element(s) with ddof={}", n,
                                      unbiased ? 1 : 0));
    }
    return static_cast<double>(divisor);
}

// Ordering used by min/max: numeric kinds compare by value, strings
// lexicographically. Mixing the two is a type error.
auto scalar_less(const ScalarValue& a, const ScalarValue& b) -> Result<bool> {
    const auto* as = std::get_if<std::string>(&a);
    const auto* bs = std::get_if<std::string>(&b);
    if (as != nullptr && bs != nullptr) {
        return *as < *bs;
    }
    if (as != nullptr || bs != nullptr) {
        return make_error(ErrorKind::Type, "cannot order string and numeric values");
    }
    const auto* ai = std::get_if<std::int64_t>(&a);
    const auto* bi = std::get_if<std::int64_t>(&b);
    if (ai != nullptr && bi != nullptr) {
        return *ai < *bi;
    }
    return *as_double(a) < *as_double(b);
}

auto column_int(const Table& table, const char* name, std::size_t row) -> Result<std::int64_t> {
    const auto* column = table.find(name);
    if (column == nullptr) {
        return make_error(ErrorKind::Type, fmt::format("partial state lacks column '{}'", name));
    }
    auto value = scalar_at(*column, row);
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return *i;
    }
    auto d = as_double(value);
    if (!d) {
        return std::unexpected(d.error());
    }
    return static_cast<std::int64_t>(*d);
}

auto column_double(const Table& table, const char* name, std::size_t row) -> Result<double> {
    const auto* column = table.find(name);
    if (column == nullptr) {
        return make_error(ErrorKind::Type, fmt::format("partial state lacks column '{}'", name));
    }
    return as_double(scalar_at(*column, row));
}

}  // namespace

// ─── Moments ──────────────────────────────────────────────────────────────────

auto Moments::from_state(std::int64_t n, double mean, double m2) -> Moments {
    Moments out;
    out.n_ = n;
    out.mean_ = mean;
    out.m2_ = m2;
    return out;
}

void Moments::update(double x) noexcept {
    ++n_;
    double delta = x - mean_;
    mean_ += delta / static_cast<double>(n_);
    m2_ += delta * (x - mean_);
}

void Moments::merge(const Moments& other) noexcept {
    if (other.n_ == 0) {
        return;
    }
    if (n_ == 0) {
        *this = other;
        return;
    }
    const auto na = static_cast<double>(n_);
    const auto nb = static_cast<double>(other.n_);
    const double n = na + nb;
    const double delta = other.mean_ - mean_;
    mean_ += delta * nb / n;
    m2_ += other.m2_ + delta * delta * na * nb / n;
    n_ += other.n_;
}

auto Moments::variance(bool unbiased) const -> Result<double> {
    auto divisor = variance_divisor(n_, unbiased);
    if (!divisor) {
        return std::unexpected(divisor.error());
    }
    return std::max(m2_, 0.0) / *divisor;
}

// ─── SumSquares ───────────────────────────────────────────────────────────────

auto SumSquares::from_state(std::int64_t n, double sum, double sumsq) -> SumSquares {
    SumSquares out;
    out.n_ = n;
    out.sum_ = sum;
    out.sumsq_ = sumsq;
    return out;
}

void SumSquares::update(double x) noexcept {
    ++n_;
    sum_ += x;
    sumsq_ += x * x;
}

void SumSquares::merge(const SumSquares& other) noexcept {
    n_ += other.n_;
    sum_ += other.sum_;
    sumsq_ += other.sumsq_;
}

auto SumSquares::variance(bool unbiased) const -> Result<double> {
    auto divisor = variance_divisor(n_, unbiased);
    if (!divisor) {
        return std::unexpected(divisor.error());
    }
    double m2 = sumsq_ - (sum_ * sum_) / static_cast<double>(n_);
    return std::max(m2, 0.0) / *divisor;
}

// ─── Reducer ──────────────────────────────────────────────────────────────────

Reducer::Reducer(NodeKind kind, ScalarKind input, ReduceOptions options)
    : kind_(kind), input_(input), options_(options) {}

auto Reducer::update(const ScalarValue& value) -> Result<void> {
    switch (kind_) {
        case NodeKind::Count:
            ++count_;
            return {};
        case NodeKind::NUnique:
            distinct_.insert(Row{value});
            return {};
        case NodeKind::Min:
        case NodeKind::Max: {
            if (!best_) {
                best_ = value;
                return {};
            }
            auto less = kind_ == NodeKind::Min ? scalar_less(value, *best_)
                                               : scalar_less(*best_, value);
            if (!less) {
                return std::unexpected(less.error());
            }
            if (*less) {
                best_ = value;
            }
            return {};
        }
        default:
            break;
    }
    if (std::holds_alternative<std::string>(value)) {
        return make_error(ErrorKind::Type,
                          fmt::format("{} of a string value", expr::to_string(kind_)));
    }
    double x = *as_double(value);
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        int_sum_ = wrapping_add(int_sum_, *i);
    } else {
        input_ = ScalarKind::Double;
    }
    ++count_;
    dbl_sum_ += x;
    if (kind_ == NodeKind::Var || kind_ == NodeKind::Std) {
        if (options_.method == expr::VarianceMethod::Welford) {
            moments_.update(x);
        } else {
            sumsq_.update(x);
        }
    }
    return {};
}

auto Reducer::update(const Row& row) -> Result<void> {
    if (kind_ == NodeKind::Count) {
        ++count_;
        return {};
    }
    if (kind_ == NodeKind::NUnique) {
        distinct_.insert(row);
        return {};
    }
    if (row.size() != 1) {
        return make_error(ErrorKind::Type,
                          fmt::format("{} over record elements", expr::to_string(kind_)));
    }
    return update(row.front());
}

auto Reducer::update(const ColumnValue& column) -> Result<void> {
    if (kind_ == NodeKind::Count) {
        count_ += static_cast<std::int64_t>(column_size(column));
        return {};
    }
    return std::visit(
        [&](const auto& col) -> Result<void> {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, std::string>) {
                for (const auto& v : col) {
                    auto updated = update(ScalarValue{v});
                    if (!updated) {
                        return updated;
                    }
                }
                return {};
            } else {
                if (kind_ == NodeKind::NUnique || kind_ == NodeKind::Min ||
                    kind_ == NodeKind::Max) {
                    for (auto v : col) {
                        auto updated = update(ScalarValue{v});
                        if (!updated) {
                            return updated;
                        }
                    }
                    return {};
                }
                if constexpr (std::is_same_v<T, double>) {
                    input_ = ScalarKind::Double;
                }
                const bool variance = kind_ == NodeKind::Var || kind_ == NodeKind::Std;
                const bool welford = options_.method == expr::VarianceMethod::Welford;
                for (auto v : col) {
                    const auto x = static_cast<double>(v);
                    if constexpr (std::is_same_v<T, std::int64_t>) {
                        int_sum_ = wrapping_add(int_sum_, v);
                    }
                    dbl_sum_ += x;
                    if (variance) {
                        if (welford) {
                            moments_.update(x);
                        } else {
                            sumsq_.update(x);
                        }
                    }
                }
                count_ += static_cast<std::int64_t>(col.size());
                return {};
            }
        },
        column);
}

auto Reducer::update(const Table& table) -> Result<void> {
    if (kind_ == NodeKind::Count) {
        count_ += static_cast<std::int64_t>(table.rows());
        return {};
    }
    if (kind_ == NodeKind::NUnique) {
        for (std::size_t r = 0; r < table.rows(); ++r) {
            distinct_.insert(table_row(table, r));
        }
        return {};
    }
    return make_error(ErrorKind::Type,
                      fmt::format("{} over record elements", expr::to_string(kind_)));
}

auto Reducer::merge(const Reducer& other) -> Result<void> {
    if (other.kind_ != kind_) {
        return make_error(ErrorKind::InvalidArgument,
                          fmt::format("cannot merge {} into {}", expr::to_string(other.kind_),
                                      expr::to_string(kind_)));
    }
    if (other.input_ == ScalarKind::Double) {
        input_ = ScalarKind::Double;
    }
    count_ += other.count_;
    int_sum_ = wrapping_add(int_sum_, other.int_sum_);
    dbl_sum_ += other.dbl_sum_;
    moments_.merge(other.moments_);
    sumsq_.merge(other.sumsq_);
    for (const auto& row : other.distinct_) {
        distinct_.insert(row);
    }
    if (other.best_) {
        return update(*other.best_);
    }
    return {};
}

auto Reducer::finish() const -> Result<ScalarValue> {
    switch (kind_) {
        case NodeKind::Count:
            return ScalarValue{count_};
        case NodeKind::NUnique:
            return ScalarValue{static_cast<std::int64_t>(distinct_.size())};
        case NodeKind::Sum:
            if (input_ == ScalarKind::Int) {
                return ScalarValue{int_sum_};
            }
            return ScalarValue{dbl_sum_};
        case NodeKind::Mean:
            if (count_ == 0) {
                return empty_error(kind_);
            }
            return ScalarValue{dbl_sum_ / static_cast<double>(count_)};
        case NodeKind::Var:
        case NodeKind::Std: {
            auto variance = options_.method == expr::VarianceMethod::Welford
                                ? moments_.variance(options_.unbiased)
                                : sumsq_.variance(options_.unbiased);
            if (!variance) {
                if (moments_.count() == 0 && sumsq_.count() == 0) {
                    return empty_error(kind_);
                }
                return std::unexpected(variance.error());
            }
            if (kind_ == NodeKind::Std) {
                return ScalarValue{std::sqrt(*variance)};
            }
            return ScalarValue{*variance};
        }
        case NodeKind::Min:
        case NodeKind::Max:
            if (!best_) {
                return empty_error(kind_);
            }
            return *best_;
        default:
            return make_error(ErrorKind::InvalidArgument,
                              fmt::format("not a reduction: {}", expr::to_string(kind_)));
    }
}

auto Reducer::partial_state() const -> Result<Table> {
    Table out;
    switch (kind_) {
        case NodeKind::Mean:
            out.add_column(expr::kPartialSum, Column<double>{dbl_sum_});
            out.add_column(expr::kPartialCount, Column<std::int64_t>{count_});
            return out;
        case NodeKind::Var:
        case NodeKind::Std:
            if (options_.method == expr::VarianceMethod::Welford) {
                out.add_column(expr::kPartialCount, Column<std::int64_t>{moments_.count()});
                out.add_column(expr::kPartialMean, Column<double>{moments_.mean()});
                out.add_column(expr::kPartialM2, Column<double>{moments_.m2()});
            } else {
                out.add_column(expr::kPartialCount, Column<std::int64_t>{sumsq_.count()});
                out.add_column(expr::kPartialSum, Column<double>{sumsq_.sum()});
                out.add_column(expr::kPartialSumSq, Column<double>{sumsq_.sumsq()});
            }
            return out;
        default:
            return make_error(ErrorKind::InvalidArgument,
                              fmt::format("{} has no partial state", expr::to_string(kind_)));
    }
}

auto Reducer::merge_partial_state(const Table& states) -> Result<void> {
    const bool welford = options_.method == expr::VarianceMethod::Welford;
    for (std::size_t r = 0; r < states.rows(); ++r) {
        auto n = column_int(states, expr::kPartialCount, r);
        if (!n) {
            return std::unexpected(n.error());
        }
        if (kind_ == NodeKind::Mean) {
            auto sum = column_double(states, expr::kPartialSum, r);
            if (!sum) {
                return std::unexpected(sum.error());
            }
            count_ += *n;
            dbl_sum_ += *sum;
        } else if (kind_ == NodeKind::Var || kind_ == NodeKind::Std) {
            if (welford) {
                auto mean = column_double(states, expr::kPartialMean, r);
                auto m2 = column_double(states, expr::kPartialM2, r);
                if (!mean || !m2) {
                    return std::unexpected(!mean ? mean.error() : m2.error());
                }
                moments_.merge(Moments::from_state(*n, *mean, *m2));
            } else {
                auto sum = column_double(states, expr::kPartialSum, r);
                auto sumsq = column_double(states, expr::kPartialSumSq, r);
                if (!sum || !sumsq) {
                    return std::unexpected(!sum ? sum.error() : sumsq.error());
                }
                sumsq_.merge(SumSquares::from_state(*n, *sum, *sumsq));
            }
        } else {
            return make_error(ErrorKind::InvalidArgument,
                              fmt::format("{} has no partial state", expr::to_string(kind_)));
        }
    }
    return {};
}

auto reduce_value(NodeKind kind, const Value& value, ReduceOptions options)
    -> Result<ScalarValue> {
    return std::visit(
        [&](const auto& v) -> Result<ScalarValue> {
            using T = std::decay_t<decltype(v)>;
            Result<void> updated;
            ScalarKind input = ScalarKind::Int;
            if constexpr (std::is_same_v<T, ScalarValue>) {
                input = scalar_kind(v);
            } else if constexpr (std::is_same_v<T, ColumnValue>) {
                input = column_kind(v);
            } else if constexpr (std::is_same_v<T, Sequence>) {
                if (v.names.empty() && !v.rows.empty() && !v.rows.front().empty()) {
                    input = scalar_kind(v.rows.front().front());
                }
            }
            Reducer reducer(kind, input, options);
            if constexpr (std::is_same_v<T, Sequence>) {
                for (const auto& row : v.rows) {
                    updated = reducer.update(row);
                    if (!updated) {
                        return std::unexpected(updated.error());
                    }
                }
            } else {
                updated = reducer.update(v);
                if (!updated) {
                    return std::unexpected(updated.error());
                }
            }
            return reducer.finish();
        },
        value);
}

}  // namespace chunkwise::runtime
