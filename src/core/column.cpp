#include <gridseries/core/column.hpp>
#include <gridseries/core/time.hpp>

#include <string>

// Column<T> is fully header-only (template class).
// This translation unit anchors explicit instantiations for the element
// types carried by series tables.

namespace gridseries {

template class Column<std::string>;
template class Column<Date>;
template class Column<double>;

}  // namespace gridseries
