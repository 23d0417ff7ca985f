#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace chunkwise {

/// Category of a failed operation.
enum class ErrorKind : std::uint8_t {
    /// No execution strategy exists for this expression/source pair.
    /// Callers may retry with a different backend.
    Unsupported,
    /// Numeric domain violation (mean of empty data, variance with n <= ddof).
    Domain,
    /// Operation applied to a value of the wrong shape or element type.
    Type,
    InvalidArgument,
    Io,
    Evaluation,
};

/// Error value carried through Result<T>.
struct Error {
    ErrorKind kind = ErrorKind::Evaluation;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message)
    -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

}  // namespace chunkwise
