#pragma once

#include "operation.hpp"
#include <cstddef>
#include <vector>

namespace pkgdash {

// Zero-based terminal cell rectangle
struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool contains(int col, int row) const {
        return col >= x && col < x + width && row >= y && row < y + height;
    }
};

struct TabRegion {
    int start = 0;  // first column
    int end = 0;    // one past the last column
    View view = View::Installed;
};

// Regions the renderer drew in the last frame, used for mouse hit-testing
struct Layout {
    Rect tab_bar;
    Rect filter_bar;
    Rect search_bar;
    Rect package_list;  // header row + data rows + scrollbar
    Rect scrollbar;     // track only
    Rect status_bar;
    std::vector<TabRegion> tabs;

    int list_content_y = 0;   // row of the first data row
    int list_rows = 0;        // data rows that fit
    size_t first_index = 0;   // visible-list index shown on the first data row
};

} // namespace pkgdash
