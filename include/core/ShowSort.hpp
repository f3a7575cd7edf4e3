#pragma once

#include "core/ShowRecord.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace showgrab {
namespace core {

enum class ShowColumn {
    Published,
    Size,
    Title
};

enum class SortOrder {
    Ascending,
    Descending
};

// Strict weak ordering of two shows by the column's sort key
bool compareShows(const ShowRecord& lhs, const ShowRecord& rhs, ShowColumn column);

// Stable permutation of indices into `shows`
std::vector<std::size_t> sortedIndices(const std::vector<ShowRecord>& shows,
                                       ShowColumn column,
                                       SortOrder order = SortOrder::Ascending);

// Accepts "date", "size" or "title"; returns false for anything else
bool parseShowColumn(const std::string& name, ShowColumn& column);

} // namespace core
} // namespace showgrab
