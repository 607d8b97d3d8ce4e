#ifndef FOLIO_RENDER_LINE_GEOMETRY_H
#define FOLIO_RENDER_LINE_GEOMETRY_H

#include "folio/text/text_metrics.h"
#include "folio/text/text_types.h"
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace folio::render {

/**
 * Identity of one rendered line within a frame. Rendering the same screen
 * position twice yields the same key, so the second geometry replaces the first.
 */
struct GeometryKey {
    std::int32_t pageId{0};
    std::int32_t columnId{0};
    std::int32_t row{0};
    std::int32_t columnOrigin{0};

    bool operator==(const GeometryKey& o) const {
        return pageId == o.pageId && columnId == o.columnId && row == o.row && columnOrigin == o.columnOrigin;
    }
    bool operator!=(const GeometryKey& o) const { return !(*this == o); }
    bool operator<(const GeometryKey& o) const {
        return std::tie(pageId, columnId, row, columnOrigin) < std::tie(o.pageId, o.columnId, o.row, o.columnOrigin);
    }
};

/**
 * Screen placement of one drawn line. `row` and `columnOrigin` are absolute
 * 1-based terminal coordinates; cell screenX values are relative to columnOrigin.
 */
struct LineGeometry {
    std::int32_t pageId{0};
    std::int32_t columnId{0};
    std::int32_t row{0};
    std::int32_t columnOrigin{0};
    std::int32_t lineOffset{0};
    std::string plainText;
    std::string styledText;
    std::vector<text::LineCell> cells;

    GeometryKey key() const { return GeometryKey{pageId, columnId, row, columnOrigin}; }

    // Total display width of all cells.
    std::uint32_t visibleWidth() const;

    // Absolute column one past the last cell.
    std::int32_t columnEnd() const { return columnOrigin + static_cast<std::int32_t>(visibleWidth()); }
};

class LineGeometryBuilder {
public:
    explicit LineGeometryBuilder(const text::TextMetrics& metrics) : metrics_(metrics) {}

    LineGeometry build(std::int32_t pageId, std::int32_t columnId, std::int32_t row, std::int32_t column,
                       std::int32_t lineOffset, std::string plainText, std::string styledText) const;

private:
    const text::TextMetrics& metrics_;
};

} // namespace folio::render

#endif // FOLIO_RENDER_LINE_GEOMETRY_H
