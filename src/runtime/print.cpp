#include <chunkwise/runtime/print.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <vector>

namespace chunkwise::runtime {

namespace {

void print_grid(const std::vector<std::string>& names,
                const std::vector<std::vector<std::string>>& cells, std::size_t rows,
                std::ostream& out) {
    std::vector<std::size_t> widths(names.size());
    for (std::size_t c = 0; c < names.size(); ++c) {
        widths[c] = names[c].size();
        for (const auto& s : cells[c]) {
            widths[c] = std::max(widths[c], s.size());
        }
    }

    // Header row.
    for (std::size_t c = 0; c < names.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << fmt::format("{:<{}}", names[c], widths[c]);
    }
    out << "\n";

    // Separator.
    for (std::size_t c = 0; c < names.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";

    // Data rows.
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < names.size(); ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", cells[c][r], widths[c]);
        }
        out << "\n";
    }
}

}  // namespace

auto format_scalar(const ScalarValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{:g}", v);
            } else {
                return std::to_string(v);
            }
        },
        value);
}

void print(const Table& table, std::ostream& out) {
    if (table.columns.empty()) {
        out << "(empty table)\n";
        return;
    }
    std::size_t rows = table.rows();
    std::vector<std::vector<std::string>> cells(table.columns.size());
    for (std::size_t c = 0; c < table.columns.size(); ++c) {
        cells[c].reserve(rows);
        for (std::size_t r = 0; r < rows; ++r) {
            cells[c].push_back(format_scalar(scalar_at(*table.columns[c].column, r)));
        }
    }
    print_grid(column_names(table), cells, rows, out);
}

void print(const Value& value, std::ostream& out) {
    if (const auto* scalar = std::get_if<ScalarValue>(&value)) {
        out << format_scalar(*scalar) << "\n";
        return;
    }
    if (const auto* column = std::get_if<ColumnValue>(&value)) {
        out << "[";
        for (std::size_t i = 0; i < column_size(*column); ++i) {
            if (i > 0)
                out << ", ";
            out << format_scalar(scalar_at(*column, i));
        }
        out << "]\n";
        return;
    }
    if (const auto* table = std::get_if<Table>(&value)) {
        print(*table, out);
        return;
    }
    const auto& sequence = std::get<Sequence>(value);
    std::vector<std::string> names = sequence.names;
    if (names.empty()) {
        names.emplace_back("_");
    }
    std::vector<std::vector<std::string>> cells(names.size());
    for (const auto& row : sequence.rows) {
        for (std::size_t c = 0; c < names.size(); ++c) {
            cells[c].push_back(c < row.size() ? format_scalar(row[c]) : std::string{});
        }
    }
    print_grid(names, cells, sequence.rows.size(), out);
}

}  // namespace chunkwise::runtime
