#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkwise {

enum class ScalarKind : std::uint8_t {
    Int,
    Double,
    String,
};

/// A named scalar field of a record type.
struct FieldType {
    std::string name;
    ScalarKind kind = ScalarKind::Double;

    auto operator==(const FieldType&) const -> bool = default;
};

/// Element type: a bare scalar kind, or a record of named fields.
struct DType {
    ScalarKind kind = ScalarKind::Double;
    /// Non-empty for record types; `kind` is ignored then.
    std::vector<FieldType> fields;

    [[nodiscard]] auto is_record() const noexcept -> bool { return !fields.empty(); }
    [[nodiscard]] auto find(const std::string& name) const -> std::optional<FieldType>;

    auto operator==(const DType&) const -> bool = default;
};

enum class DimKind : std::uint8_t {
    Scalar,
    Fixed,
    Var,
};

/// Declared shape of data: a dimension plus an element type.
///
///   DataShape::scalar(ScalarKind::Int)     -> int64
///   DataShape::fixed(1024, dtype)          -> 1024 * dtype
///   DataShape::var(dtype)                  -> var * dtype
struct DataShape {
    DimKind dim = DimKind::Var;
    std::size_t length = 0;
    DType dtype;

    [[nodiscard]] static auto scalar(ScalarKind kind) -> DataShape;
    [[nodiscard]] static auto fixed(std::size_t n, DType dtype) -> DataShape;
    [[nodiscard]] static auto var(DType dtype) -> DataShape;

    [[nodiscard]] auto is_scalar() const noexcept -> bool { return dim == DimKind::Scalar; }
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const DataShape&) const -> bool = default;
};

[[nodiscard]] auto scalar_dtype(ScalarKind kind) -> DType;
[[nodiscard]] auto record_dtype(std::vector<FieldType> fields) -> DType;
[[nodiscard]] auto to_string(ScalarKind kind) -> std::string;
/// Fixed byte width of a scalar kind; strings report a nominal width.
[[nodiscard]] auto byte_width(ScalarKind kind) noexcept -> std::size_t;

}  // namespace chunkwise
