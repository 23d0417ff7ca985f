#pragma once

#include <cstdint>

namespace chunkwise {

// ─── Wrapping int64 arithmetic ────────────────────────────────────────────────
//  Integer sums and elementwise arithmetic wrap modulo 2^64 (two's complement).
//  The arithmetic is carried out in std::uint64_t, where overflow is defined,
//  and converted back.

[[nodiscard]] constexpr auto wrapping_add(std::int64_t lhs, std::int64_t rhs) noexcept
    -> std::int64_t {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(lhs) +
                                     static_cast<std::uint64_t>(rhs));
}

[[nodiscard]] constexpr auto wrapping_sub(std::int64_t lhs, std::int64_t rhs) noexcept
    -> std::int64_t {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(lhs) -
                                     static_cast<std::uint64_t>(rhs));
}

[[nodiscard]] constexpr auto wrapping_mul(std::int64_t lhs, std::int64_t rhs) noexcept
    -> std::int64_t {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(lhs) *
                                     static_cast<std::uint64_t>(rhs));
}

/// -INT64_MIN wraps to INT64_MIN.
[[nodiscard]] constexpr auto wrapping_neg(std::int64_t value) noexcept -> std::int64_t {
    return static_cast<std::int64_t>(std::uint64_t{0} - static_cast<std::uint64_t>(value));
}

/// Remainder with the sign of the dividend. `rhs` must be non-zero;
/// INT64_MIN % -1 is 0.
[[nodiscard]] constexpr auto wrapping_mod(std::int64_t lhs, std::int64_t rhs) noexcept
    -> std::int64_t {
    return rhs == -1 ? 0 : lhs % rhs;
}

}  // namespace chunkwise
