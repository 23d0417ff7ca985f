#include <chunkwise/storage/csv.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace chunkwise::storage {

namespace {

auto split_line(const std::string& line) -> std::vector<std::string> {
    std::vector<std::string> fields;
    std::string field;
    std::stringstream ss(line);
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

auto try_parse_int(const std::string& text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto try_parse_double(const std::string& text, double& out) -> bool {
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

// Narrowest kind that can hold `text`, given the kind seen so far.
auto widen_kind(ScalarKind current, const std::string& text) -> ScalarKind {
    if (current == ScalarKind::String) {
        return current;
    }
    std::int64_t int_value = 0;
    double double_value = 0.0;
    if (current == ScalarKind::Int && try_parse_int(text, int_value)) {
        return ScalarKind::Int;
    }
    if (try_parse_double(text, double_value)) {
        return ScalarKind::Double;
    }
    return ScalarKind::String;
}

auto parse_field(const std::string& text, ScalarKind kind) -> runtime::ScalarValue {
    switch (kind) {
        case ScalarKind::Int: {
            std::int64_t value = 0;
            if (try_parse_int(text, value)) {
                return value;
            }
            break;
        }
        case ScalarKind::Double: {
            double value = 0.0;
            if (try_parse_double(text, value)) {
                return value;
            }
            break;
        }
        case ScalarKind::String:
            break;
    }
    // Left as text; appending it to a numeric column reports the mismatch.
    return text;
}

auto read_header(std::ifstream& input, std::string_view path)
    -> Result<std::vector<std::string>> {
    if (!input) {
        return make_error(ErrorKind::Io, fmt::format("failed to open csv: {}", path));
    }
    std::string header_line;
    if (!std::getline(input, header_line)) {
        return make_error(ErrorKind::Io, fmt::format("csv is empty: {}", path));
    }
    auto headers = split_line(header_line);
    if (headers.empty()) {
        return make_error(ErrorKind::Io, fmt::format("csv has no headers: {}", path));
    }
    return headers;
}

auto wrong_width(std::size_t line_no, std::size_t got, std::size_t expected)
    -> std::unexpected<Error> {
    return make_error(ErrorKind::Io,
                      fmt::format("csv line {} has {} fields, expected {}", line_no, got,
                                  expected));
}

// Positions of `columns` among `headers`; every header when `columns` is
// empty.
auto select_columns(const std::vector<std::string>& headers,
                    const std::vector<std::string>& columns)
    -> Result<std::vector<std::size_t>> {
    std::vector<std::size_t> selected;
    if (columns.empty()) {
        selected.resize(headers.size());
        for (std::size_t i = 0; i < headers.size(); ++i) {
            selected[i] = i;
        }
        return selected;
    }
    selected.reserve(columns.size());
    for (const auto& name : columns) {
        auto it = std::find(headers.begin(), headers.end(), name);
        if (it == headers.end()) {
            return make_error(ErrorKind::InvalidArgument,
                              fmt::format("csv has no column '{}'", name));
        }
        selected.push_back(static_cast<std::size_t>(it - headers.begin()));
    }
    return selected;
}

class CsvRowStream final : public runtime::RowStream {
   public:
    CsvRowStream(std::ifstream input, std::vector<std::string> headers,
                 std::vector<ScalarKind> kinds, std::vector<std::size_t> selected,
                 std::size_t width)
        : input_(std::move(input)),
          names_(std::move(headers)),
          kinds_(std::move(kinds)),
          selected_(std::move(selected)),
          width_(width) {}

    [[nodiscard]] auto names() const -> const std::vector<std::string>& override {
        return names_;
    }

    auto next() -> Result<std::optional<runtime::Row>> override {
        std::string line;
        while (std::getline(input_, line)) {
            ++line_no_;
            if (line.empty()) {
                continue;
            }
            auto fields = split_line(line);
            if (fields.size() != width_) {
                return wrong_width(line_no_, fields.size(), width_);
            }
            runtime::Row row;
            row.reserve(selected_.size());
            for (std::size_t i = 0; i < selected_.size(); ++i) {
                row.push_back(parse_field(fields[selected_[i]], kinds_[i]));
            }
            return row;
        }
        return std::nullopt;
    }

   private:
    std::ifstream input_;
    std::vector<std::string> names_;
    std::vector<ScalarKind> kinds_;
    std::vector<std::size_t> selected_;
    std::size_t width_;
    std::size_t line_no_ = 1;
};

}  // namespace

auto read_csv(std::string_view path, const std::vector<std::string>& wanted)
    -> Result<runtime::Table> {
    std::ifstream input{std::string(path)};
    auto headers = read_header(input, path);
    if (!headers) {
        return std::unexpected(headers.error());
    }
    auto selected = select_columns(*headers, wanted);
    if (!selected) {
        return std::unexpected(selected.error());
    }

    std::vector<std::vector<std::string>> columns(selected->size());
    std::string line;
    std::size_t line_no = 1;
    while (std::getline(input, line)) {
        ++line_no;
        if (line.empty()) {
            continue;
        }
        auto fields = split_line(line);
        if (fields.size() != headers->size()) {
            return wrong_width(line_no, fields.size(), headers->size());
        }
        for (std::size_t i = 0; i < selected->size(); ++i) {
            columns[i].push_back(std::move(fields[(*selected)[i]]));
        }
    }

    runtime::Table table;
    for (std::size_t i = 0; i < selected->size(); ++i) {
        ScalarKind kind = ScalarKind::Int;
        for (const auto& value : columns[i]) {
            kind = widen_kind(kind, value);
            if (kind == ScalarKind::String) {
                break;
            }
        }
        runtime::ColumnValue column = runtime::make_empty_column(kind);
        std::visit([&](auto& col) { col.reserve(columns[i].size()); }, column);
        for (auto& value : columns[i]) {
            auto appended = runtime::append_scalar(column, parse_field(value, kind));
            if (!appended) {
                return std::unexpected(appended.error());
            }
        }
        table.add_column((*headers)[(*selected)[i]], std::move(column));
    }
    return table;
}

CsvStreamSource::CsvStreamSource(Token /*token*/, std::filesystem::path path,
                                 std::vector<std::string> headers, std::vector<ScalarKind> kinds,
                                 std::vector<std::size_t> selected, std::size_t width,
                                 std::size_t rows)
    : path_(std::move(path)),
      headers_(std::move(headers)),
      kinds_(std::move(kinds)),
      selected_(std::move(selected)),
      width_(width),
      rows_(rows) {
    std::vector<FieldType> fields;
    fields.reserve(headers_.size());
    for (std::size_t i = 0; i < headers_.size(); ++i) {
        fields.push_back(FieldType{.name = headers_[i], .kind = kinds_[i]});
    }
    shape_ = DataShape::fixed(rows_, record_dtype(std::move(fields)));
}

auto CsvStreamSource::open(std::filesystem::path path)
    -> Result<std::shared_ptr<CsvStreamSource>> {
    std::ifstream input(path);
    auto headers = read_header(input, path.string());
    if (!headers) {
        return std::unexpected(headers.error());
    }
    std::vector<ScalarKind> kinds(headers->size(), ScalarKind::Int);
    std::size_t rows = 0;
    std::size_t line_no = 1;
    std::string line;
    while (std::getline(input, line)) {
        ++line_no;
        if (line.empty()) {
            continue;
        }
        auto fields = split_line(line);
        if (fields.size() != headers->size()) {
            return wrong_width(line_no, fields.size(), headers->size());
        }
        for (std::size_t i = 0; i < fields.size(); ++i) {
            kinds[i] = widen_kind(kinds[i], fields[i]);
        }
        ++rows;
    }
    auto selected = select_columns(*headers, {});
    if (!selected) {
        return std::unexpected(selected.error());
    }
    const std::size_t width = headers->size();
    return std::make_shared<CsvStreamSource>(Token{}, std::move(path), std::move(*headers),
                                             std::move(kinds), std::move(*selected), width,
                                             rows);
}

auto CsvStreamSource::byte_size() const noexcept -> std::size_t {
    std::size_t total = 0;
    for (auto kind : kinds_) {
        total += byte_width(kind);
    }
    return total * rows_;
}

auto CsvStreamSource::iterate() const -> Result<runtime::RowStreamPtr> {
    std::ifstream input(path_);
    auto headers = read_header(input, path_.string());
    if (!headers) {
        return std::unexpected(headers.error());
    }
    return std::make_unique<CsvRowStream>(std::move(input), headers_, kinds_, selected_,
                                          width_);
}

auto CsvStreamSource::project(const std::vector<std::string>& columns) const
    -> Result<DataSourcePtr> {
    auto positions = select_columns(headers_, columns);
    if (!positions) {
        return std::unexpected(positions.error());
    }
    std::vector<std::string> headers;
    std::vector<ScalarKind> kinds;
    std::vector<std::size_t> selected;
    for (auto i : *positions) {
        headers.push_back(headers_[i]);
        kinds.push_back(kinds_[i]);
        selected.push_back(selected_[i]);
    }
    return std::make_shared<const CsvStreamSource>(Token{}, path_, std::move(headers),
                                                   std::move(kinds), std::move(selected),
                                                   width_, rows_);
}

}  // namespace chunkwise::storage
