#include "folio/selection/selection_service.h"

#include <algorithm>

namespace folio::selection {

using render::LineGeometry;

std::size_t SelectionService::charIndexForCell(const LineGeometry& geometry, std::int32_t cellIndex) {
    if (geometry.cells.empty() || cellIndex <= 0) return 0;
    if (static_cast<std::size_t>(cellIndex) >= geometry.cells.size()) return geometry.plainText.size();
    return geometry.cells[static_cast<std::size_t>(cellIndex)].charStart;
}

std::string SelectionService::extractText(const SelectionRange& range, const render::RenderedLines& rendered) const {
    if (rendered.empty()) return {};

    const std::vector<const LineGeometry*> ordered = rendered.ordered();
    auto indexOf = [&ordered](const render::GeometryKey& key) -> std::ptrdiff_t {
        auto it = std::find_if(ordered.begin(), ordered.end(),
                               [&key](const LineGeometry* g) { return g->key() == key; });
        return it == ordered.end() ? -1 : std::distance(ordered.begin(), it);
    };

    const std::ptrdiff_t first = indexOf(range.start.geometryKey);
    const std::ptrdiff_t last = indexOf(range.end.geometryKey);
    if (first < 0 || last < 0 || first > last) return {};

    std::string out;
    bool any = false;
    for (std::ptrdiff_t i = first; i <= last; ++i) {
        const LineGeometry& geometry = *ordered[static_cast<std::size_t>(i)];
        if (geometry.cells.empty()) continue;

        const std::int32_t cellCount = static_cast<std::int32_t>(geometry.cells.size());
        const std::int32_t startCell = i == first ? range.start.cellIndex : 0;
        const std::int32_t endCell = i == last ? range.end.cellIndex : cellCount;
        if (endCell < startCell) continue;

        const std::size_t from = charIndexForCell(geometry, startCell);
        const std::size_t to = std::max(from, charIndexForCell(geometry, endCell));
        if (any) out += '\n';
        out.append(geometry.plainText, from, to - from);
        any = true;
    }
    return out;
}

} // namespace folio::selection
