#include <chunkwise/storage/data_source.hpp>

#include <fmt/format.h>

namespace chunkwise::storage {

auto DataSource::slice(std::size_t /*start*/, std::size_t /*stop*/) const
    -> Result<runtime::Value> {
    return make_error(ErrorKind::Unsupported, "data source does not support slicing");
}

auto DataSource::iterate() const -> Result<runtime::RowStreamPtr> {
    return make_error(ErrorKind::Unsupported, "data source does not support iteration");
}

auto DataSource::project(const std::vector<std::string>& /*columns*/) const
    -> Result<DataSourcePtr> {
    return make_error(ErrorKind::Unsupported, "data source does not support projection");
}

auto check_range(std::size_t start, std::size_t stop, std::size_t length) -> Result<void> {
    if (start > stop || stop > length) {
        return make_error(ErrorKind::InvalidArgument,
                          fmt::format("slice [{}, {}) out of range for length {}", start, stop,
                                      length));
    }
    return {};
}

}  // namespace chunkwise::storage
