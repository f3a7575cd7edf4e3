#include "core/ShowSort.hpp"
#include <algorithm>
#include <cctype>
#include <numeric>

namespace showgrab {
namespace core {

namespace {

std::string foldCase(const std::string& value) {
    std::string folded = value;
    std::transform(folded.begin(), folded.end(), folded.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return folded;
}

} // namespace

bool compareShows(const ShowRecord& lhs, const ShowRecord& rhs, ShowColumn column) {
    switch (column) {
        case ShowColumn::Published:
            return lhs.publishedTimestamp < rhs.publishedTimestamp;
        case ShowColumn::Size:
            return lhs.lengthBytes < rhs.lengthBytes;
        case ShowColumn::Title:
            return foldCase(lhs.title) < foldCase(rhs.title);
    }
    return false;
}

std::vector<std::size_t> sortedIndices(const std::vector<ShowRecord>& shows,
                                       ShowColumn column,
                                       SortOrder order) {
    std::vector<std::size_t> indices(shows.size());
    std::iota(indices.begin(), indices.end(), 0);

    std::stable_sort(indices.begin(), indices.end(), [&](std::size_t a, std::size_t b) {
        if (order == SortOrder::Descending) {
            return compareShows(shows[b], shows[a], column);
        }
        return compareShows(shows[a], shows[b], column);
    });
    return indices;
}

bool parseShowColumn(const std::string& name, ShowColumn& column) {
    std::string key = foldCase(name);
    if (key == "date" || key == "published") {
        column = ShowColumn::Published;
    } else if (key == "size") {
        column = ShowColumn::Size;
    } else if (key == "title") {
        column = ShowColumn::Title;
    } else {
        return false;
    }
    return true;
}

} // namespace core
} // namespace showgrab
