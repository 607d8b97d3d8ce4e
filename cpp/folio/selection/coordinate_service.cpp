#include "folio/selection/coordinate_service.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace folio::selection {

using render::LineGeometry;

ScreenPoint CoordinateService::terminalToMouse(ScreenPoint terminal) {
    return ScreenPoint{std::max(terminal.x - 1, 0), std::max(terminal.y - 1, 0)};
}

std::int32_t CoordinateService::cellIndexAt(const LineGeometry& geometry, std::int32_t relativeColumn, Bias bias) {
    const std::vector<text::LineCell>& cells = geometry.cells;
    if (cells.empty() || relativeColumn < 0) return 0;

    for (std::size_t i = 0; i < cells.size(); ++i) {
        const text::LineCell& cell = cells[i];
        if (cell.displayWidth == 0) continue;
        const std::int32_t left = static_cast<std::int32_t>(cell.screenX);
        const std::int32_t width = static_cast<std::int32_t>(cell.displayWidth);
        if (relativeColumn < left || relativeColumn >= left + width) continue;

        const auto index = static_cast<std::int32_t>(i);
        switch (bias) {
        case Bias::Leading:
            return index;
        case Bias::Trailing:
            return index + 1;
        case Bias::Nearest:
            return (relativeColumn - left) * 2 < width ? index : index + 1;
        }
    }
    return static_cast<std::int32_t>(cells.size());
}

std::optional<SelectionAnchor> CoordinateService::anchorFromPoint(ScreenPoint point,
                                                                  const render::RenderedLines& rendered,
                                                                  Bias bias) const {
    const ScreenPoint cell = mouseToTerminal(point);

    const LineGeometry* best = nullptr;
    std::int32_t bestDistance = std::numeric_limits<std::int32_t>::max();
    for (const LineGeometry* geometry : rendered.ordered()) {
        if (geometry->row != cell.y) continue;

        const std::int32_t start = geometry->columnOrigin;
        const std::int32_t end = std::max(geometry->columnEnd(), start + 1); // exclusive
        std::int32_t distance = 0;
        if (cell.x < start) {
            distance = start - cell.x;
        } else if (cell.x >= end) {
            distance = cell.x - end + 1;
        }
        if (distance < bestDistance) {
            best = geometry;
            bestDistance = distance;
            if (distance == 0) break;
        }
    }
    if (!best) return std::nullopt;

    SelectionAnchor anchor;
    anchor.pageId = best->pageId;
    anchor.columnId = best->columnId;
    anchor.geometryKey = best->key();
    anchor.lineOffset = best->lineOffset;
    anchor.row = best->row;
    anchor.columnOrigin = best->columnOrigin;
    anchor.cellIndex = cellIndexAt(*best, cell.x - best->columnOrigin, bias);
    return anchor;
}

SelectionRange CoordinateService::normalizeSelectionRange(const SelectionAnchor& a, const SelectionAnchor& b) const {
    if (b < a) return SelectionRange{b, a};
    return SelectionRange{a, b};
}

std::optional<SelectionRange> CoordinateService::normalizeSelectionRange(ScreenPoint from, ScreenPoint to,
                                                                         const render::RenderedLines& rendered) const {
    std::optional<SelectionAnchor> a = anchorFromPoint(from, rendered, Bias::Leading);
    std::optional<SelectionAnchor> b = anchorFromPoint(to, rendered, Bias::Leading);
    if (!a || !b) return std::nullopt;

    // The later endpoint covers the cell under it.
    if (*b < *a) {
        std::swap(a, b);
        std::swap(from, to);
    }
    std::optional<SelectionAnchor> end = anchorFromPoint(to, rendered, Bias::Trailing);
    if (!end) return std::nullopt;
    return SelectionRange{*a, *end};
}

} // namespace folio::selection
