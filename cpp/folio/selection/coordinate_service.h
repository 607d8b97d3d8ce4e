#ifndef FOLIO_SELECTION_COORDINATE_SERVICE_H
#define FOLIO_SELECTION_COORDINATE_SERVICE_H

#include "folio/render/rendered_lines.h"
#include "folio/selection/selection_anchor.h"
#include <cstdint>
#include <optional>

namespace folio::selection {

// 0-based mouse cell or 1-based terminal cell depending on context.
struct ScreenPoint {
    std::int32_t x{0};
    std::int32_t y{0};

    bool operator==(const ScreenPoint& o) const { return x == o.x && y == o.y; }
};

// How a point between two cell boundaries resolves to a cell index.
enum class Bias : std::uint8_t {
    Leading,   // cell under the point
    Trailing,  // boundary after the cell under the point
    Nearest,   // closer boundary
};

class CoordinateService {
public:
    static ScreenPoint mouseToTerminal(ScreenPoint mouse) { return ScreenPoint{mouse.x + 1, mouse.y + 1}; }
    static ScreenPoint terminalToMouse(ScreenPoint terminal);

    /**
     * Anchor for a 0-based screen point. The geometry on the point's row whose
     * column range contains it wins; otherwise the one nearest to it.
     * @return std::nullopt when no geometry was recorded on that row
     */
    std::optional<SelectionAnchor> anchorFromPoint(ScreenPoint point, const render::RenderedLines& rendered,
                                                   Bias bias) const;

    /**
     * Orders two anchors so that start precedes end in reading order.
     */
    SelectionRange normalizeSelectionRange(const SelectionAnchor& a, const SelectionAnchor& b) const;

    /**
     * Resolves two 0-based points (leading bias for `from`, trailing for `to`)
     * and orders them.
     * @return std::nullopt when either point has no geometry
     */
    std::optional<SelectionRange> normalizeSelectionRange(ScreenPoint from, ScreenPoint to,
                                                          const render::RenderedLines& rendered) const;

    static std::int32_t cellIndexAt(const render::LineGeometry& geometry, std::int32_t relativeColumn, Bias bias);
};

} // namespace folio::selection

#endif // FOLIO_SELECTION_COORDINATE_SERVICE_H
