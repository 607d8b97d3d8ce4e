#ifndef FOLIO_SELECTION_SELECTION_SERVICE_H
#define FOLIO_SELECTION_SELECTION_SERVICE_H

#include "folio/render/rendered_lines.h"
#include "folio/selection/selection_anchor.h"
#include <cstdint>
#include <string>

namespace folio::selection {

class SelectionService {
public:
    /**
     * Plain text between two anchors of the current frame, one line per
     * geometry joined with '\n'. Cell ranges are half-open: [start.cellIndex,
     * end.cellIndex) on the boundary lines, whole lines in between.
     * Geometries without cells (image rows) contribute nothing.
     * @return empty string when either anchor refers to a geometry not in `rendered`
     */
    std::string extractText(const SelectionRange& range, const render::RenderedLines& rendered) const;

    static std::size_t charIndexForCell(const render::LineGeometry& geometry, std::int32_t cellIndex);
};

} // namespace folio::selection

#endif // FOLIO_SELECTION_SELECTION_SERVICE_H
