#ifndef FOLIO_PAGINATION_LAYOUT_METRICS_H
#define FOLIO_PAGINATION_LAYOUT_METRICS_H

#include "folio/types.h"
#include <cstdint>

namespace folio::pagination {

constexpr std::int32_t kSplitMinColumnWidth = 20;
constexpr std::int32_t kSingleMinColumnWidth = 30;
constexpr std::int32_t kSingleMaxColumnWidth = 120;
constexpr std::int32_t kChromeRows = 2; // header + footer

struct LayoutMetrics {
    std::int32_t columnWidth{0};
    std::int32_t contentHeight{0};
    std::int32_t linesPerPage{0};
};

/**
 * Column width and page height for a terminal of width x height cells.
 *
 * split  : max((width - 3) / 2, 20)
 * single : clamp(floor(width * 0.9), 30, 120)
 * height : max(height - 2, 1), then scaled by the line spacing multiplier
 *
 * @throws std::invalid_argument when width or height is not positive
 */
LayoutMetrics computeLayoutMetrics(std::int32_t width, std::int32_t height, ViewMode viewMode,
                                   LineSpacing lineSpacing);

/**
 * floor(height * multiplier), never below 1.
 */
std::int32_t adjustForLineSpacing(std::int32_t height, LineSpacing lineSpacing);

// First content row (1-based) that vertically centers `lineCount` lines; never above row 3.
std::int32_t centerStartRow(std::int32_t contentHeight, std::int32_t lineCount, LineSpacing lineSpacing);

// Left column (1-based) of a `columnWidth` column centered in `totalWidth`.
std::int32_t centerStartColumn(std::int32_t totalWidth, std::int32_t columnWidth);

} // namespace folio::pagination

#endif // FOLIO_PAGINATION_LAYOUT_METRICS_H
