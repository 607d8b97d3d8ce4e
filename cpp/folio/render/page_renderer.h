#ifndef FOLIO_RENDER_PAGE_RENDERER_H
#define FOLIO_RENDER_PAGE_RENDERER_H

#include "folio/pagination/page_calculator.h"
#include "folio/render/line_drawer.h"
#include "folio/render/rendered_lines.h"
#include "folio/render/surface.h"
#include "folio/types.h"
#include <cstdint>

namespace folio::render {

constexpr std::int32_t kFirstContentRow = 3;
constexpr std::int32_t kSplitGutter = 5;      // right column starts at colWidth + 5
constexpr std::int32_t kSplitDividerOffset = 3;

// Lines of one page together with the ids recorded into their geometry.
struct PageContent {
    const text::DisplayLines* lines{nullptr};
    std::int32_t lineOffset{0};  // chapter line of lines[0]
    std::int32_t pageId{0};
};

/**
 * PageRenderer: lays out one page (single view) or two facing pages (split
 * view) and draws them line by line through LineDrawer.
 */
class PageRenderer {
public:
    explicit PageRenderer(const text::TextMetrics& metrics) : drawer_(metrics) {}

    /**
     * Centered single column, vertically centered when the page is short.
     */
    void renderSingle(Surface& surface, const Rect& bounds, const PageContent& page, LineSpacing spacing,
                      FrameRecorder& recorder) const;

    /**
     * Left page in column 0, optional right page in column 1, divider between.
     */
    void renderSplit(Surface& surface, const Rect& bounds, const PageContent& left, const PageContent* right,
                     LineSpacing spacing, FrameRecorder& recorder) const;

    /**
     * Draw page `pageIndex` of a dynamic page map (and its successor in split
     * view) and commit the frame's geometry into `rendered`.
     * @return false when the page map is empty
     */
    bool render(Surface& surface, const Rect& bounds, pagination::PageCalculator& calculator,
                std::int32_t pageIndex, const LayoutConfig& config, RenderedLines& rendered) const;

private:
    void drawColumn(Surface& surface, const Rect& bounds, const PageContent& page, std::int32_t startRow,
                    std::int32_t col, std::int32_t width, std::int32_t columnId, std::int32_t lastRow,
                    LineSpacing spacing, FrameRecorder& recorder) const;

    LineDrawer drawer_;
};

} // namespace folio::render

#endif // FOLIO_RENDER_PAGE_RENDERER_H
