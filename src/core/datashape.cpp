#include <chunkwise/core/datashape.hpp>

#include <fmt/format.h>

namespace chunkwise {

namespace {

auto dtype_string(const DType& dtype) -> std::string {
    if (!dtype.is_record()) {
        return to_string(dtype.kind);
    }
    std::string out = "{";
    for (std::size_t i = 0; i < dtype.fields.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(fmt::format("{}: {}", dtype.fields[i].name, to_string(dtype.fields[i].kind)));
    }
    out.push_back('}');
    return out;
}

}  // namespace

auto DType::find(const std::string& name) const -> std::optional<FieldType> {
    for (const auto& field : fields) {
        if (field.name == name) {
            return field;
        }
    }
    return std::nullopt;
}

auto DataShape::scalar(ScalarKind kind) -> DataShape {
    return DataShape{.dim = DimKind::Scalar, .length = 0, .dtype = scalar_dtype(kind)};
}

auto DataShape::fixed(std::size_t n, DType dtype) -> DataShape {
    return DataShape{.dim = DimKind::Fixed, .length = n, .dtype = std::move(dtype)};
}

auto DataShape::var(DType dtype) -> DataShape {
    return DataShape{.dim = DimKind::Var, .length = 0, .dtype = std::move(dtype)};
}

auto DataShape::to_string() const -> std::string {
    switch (dim) {
        case DimKind::Scalar:
            return dtype_string(dtype);
        case DimKind::Fixed:
            return fmt::format("{} * {}", length, dtype_string(dtype));
        case DimKind::Var:
            return fmt::format("var * {}", dtype_string(dtype));
    }
    return dtype_string(dtype);
}

auto scalar_dtype(ScalarKind kind) -> DType {
    return DType{.kind = kind, .fields = {}};
}

auto record_dtype(std::vector<FieldType> fields) -> DType {
    return DType{.kind = ScalarKind::Double, .fields = std::move(fields)};
}

auto to_string(ScalarKind kind) -> std::string {
    switch (kind) {
        case ScalarKind::Int:
            return "int64";
        case ScalarKind::Double:
            return "float64";
        case ScalarKind::String:
            return "string";
    }
    return "unknown";
}

auto byte_width(ScalarKind kind) noexcept -> std::size_t {
    switch (kind) {
        case ScalarKind::Int:
        case ScalarKind::Double:
            return 8;
        case ScalarKind::String:
            return 32;
    }
    return 8;
}

}  // namespace chunkwise
