#include <chunkwise/core/error.hpp>

#include <fmt/format.h>

namespace chunkwise {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::Unsupported:
            return "unsupported";
        case ErrorKind::Domain:
            return "domain error";
        case ErrorKind::Type:
            return "type error";
        case ErrorKind::InvalidArgument:
            return "invalid argument";
        case ErrorKind::Io:
            return "io error";
        case ErrorKind::Evaluation:
            return "evaluation error";
    }
    return "error";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace chunkwise
