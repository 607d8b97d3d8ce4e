#ifndef FOLIO_SELECTION_SELECTION_ANCHOR_H
#define FOLIO_SELECTION_SELECTION_ANCHOR_H

#include "folio/render/line_geometry.h"
#include <cstdint>
#include <tuple>

namespace folio::selection {

/**
 * One end of a text selection, expressed against recorded line geometry
 * rather than raw screen coordinates.
 */
struct SelectionAnchor {
    std::int32_t pageId{0};
    std::int32_t columnId{0};
    render::GeometryKey geometryKey;
    std::int32_t lineOffset{0};
    std::int32_t cellIndex{0};
    std::int32_t row{0};
    std::int32_t columnOrigin{0};

    // Reading order: page, line offset, column, row, column origin, cell.
    auto compareTuple() const { return std::tie(pageId, lineOffset, columnId, row, columnOrigin, cellIndex); }

    SelectionAnchor withCellIndex(std::int32_t index) const {
        SelectionAnchor copy = *this;
        copy.cellIndex = index;
        return copy;
    }

    bool operator<(const SelectionAnchor& o) const { return compareTuple() < o.compareTuple(); }
    bool operator==(const SelectionAnchor& o) const {
        return compareTuple() == o.compareTuple() && geometryKey == o.geometryKey;
    }
    bool operator!=(const SelectionAnchor& o) const { return !(*this == o); }
};

struct SelectionRange {
    SelectionAnchor start;
    SelectionAnchor end;

    bool operator==(const SelectionRange& o) const { return start == o.start && end == o.end; }
};

} // namespace folio::selection

#endif // FOLIO_SELECTION_SELECTION_ANCHOR_H
