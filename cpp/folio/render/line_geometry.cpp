#include "folio/render/line_geometry.h"

namespace folio::render {

std::uint32_t LineGeometry::visibleWidth() const {
    if (cells.empty()) return 0;
    const text::LineCell& last = cells.back();
    return last.screenX + last.displayWidth;
}

LineGeometry LineGeometryBuilder::build(std::int32_t pageId, std::int32_t columnId, std::int32_t row,
                                        std::int32_t column, std::int32_t lineOffset, std::string plainText,
                                        std::string styledText) const {
    LineGeometry geometry;
    geometry.pageId = pageId;
    geometry.columnId = columnId;
    geometry.row = row;
    geometry.columnOrigin = column;
    geometry.lineOffset = lineOffset;
    // Cells index the tab-expanded text, so store that as the plain text.
    geometry.plainText = metrics_.expandTabs(plainText);
    geometry.styledText = std::move(styledText);
    geometry.cells = metrics_.cellDataFor(geometry.plainText);
    return geometry;
}

} // namespace folio::render
