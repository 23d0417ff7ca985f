#include <chunkwise/core/column.hpp>

#include <cstdint>
#include <string>

// Column<T> is header-only. Explicit instantiations for the element types the
// runtime materializes keep the common cases out of every translation unit.

namespace chunkwise {

template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;

}  // namespace chunkwise
