#include "folio/pagination/layout_metrics.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace folio::pagination {

LayoutMetrics computeLayoutMetrics(std::int32_t width, std::int32_t height, ViewMode viewMode,
                                   LineSpacing lineSpacing) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("invalid display geometry " + std::to_string(width) + "x"
                                    + std::to_string(height));
    }

    LayoutMetrics metrics;
    if (viewMode == ViewMode::Split) {
        metrics.columnWidth = std::max((width - 3) / 2, kSplitMinColumnWidth);
    } else {
        const auto scaled = static_cast<std::int32_t>(static_cast<double>(width) * 0.9);
        metrics.columnWidth = std::clamp(scaled, kSingleMinColumnWidth, kSingleMaxColumnWidth);
    }
    metrics.contentHeight = std::max(height - kChromeRows, 1);
    metrics.linesPerPage = adjustForLineSpacing(metrics.contentHeight, lineSpacing);
    return metrics;
}

std::int32_t adjustForLineSpacing(std::int32_t height, LineSpacing lineSpacing) {
    if (height <= 0) return 1;
    const double scaled = std::floor(static_cast<double>(height) * lineSpacingMultiplier(lineSpacing));
    return std::max(static_cast<std::int32_t>(scaled), 1);
}

std::int32_t centerStartRow(std::int32_t contentHeight, std::int32_t lineCount, LineSpacing lineSpacing) {
    const std::int32_t rows = lineSpacing == LineSpacing::Relaxed ? std::max(lineCount * 2 - 1, 0) : lineCount;
    const std::int32_t padding = std::max((contentHeight - rows) / 2, 0);
    return 3 + padding;
}

std::int32_t centerStartColumn(std::int32_t totalWidth, std::int32_t columnWidth) {
    return std::max((totalWidth - columnWidth) / 2, 1);
}

} // namespace folio::pagination
