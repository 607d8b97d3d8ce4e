#include "folio/render/page_renderer.h"
#include "folio/pagination/layout_metrics.h"

#include <algorithm>

namespace folio::render {

void PageRenderer::drawColumn(Surface& surface, const Rect& bounds, const PageContent& page,
                              std::int32_t startRow, std::int32_t col, std::int32_t width,
                              std::int32_t columnId, std::int32_t lastRow, LineSpacing spacing,
                              FrameRecorder& recorder) const {
    if (!page.lines) return;
    const std::int32_t stride = spacing == LineSpacing::Relaxed ? 2 : 1;

    for (std::size_t i = 0; i < page.lines->size(); ++i) {
        const std::int32_t row = startRow + static_cast<std::int32_t>(i) * stride;
        if (row > lastRow) break;

        LinePlacement placement;
        placement.row = row;
        placement.col = col;
        placement.width = width;
        placement.columnId = columnId;
        placement.lineOffset = page.lineOffset + static_cast<std::int32_t>(i);
        placement.pageId = page.pageId;
        drawer_.drawLine(surface, bounds, (*page.lines)[i], placement, recorder);
    }
}

void PageRenderer::renderSingle(Surface& surface, const Rect& bounds, const PageContent& page,
                                LineSpacing spacing, FrameRecorder& recorder) const {
    const pagination::LayoutMetrics layout =
        pagination::computeLayoutMetrics(bounds.width, bounds.height, ViewMode::Single, spacing);
    const std::int32_t col = pagination::centerStartColumn(bounds.width, layout.columnWidth);
    const std::int32_t lineCount = page.lines ? static_cast<std::int32_t>(page.lines->size()) : 0;
    const std::int32_t startRow = pagination::centerStartRow(layout.contentHeight, lineCount, spacing);

    drawColumn(surface, bounds, page, startRow, col, layout.columnWidth, 0, bounds.height - 1, spacing, recorder);
}

void PageRenderer::renderSplit(Surface& surface, const Rect& bounds, const PageContent& left,
                               const PageContent* right, LineSpacing spacing, FrameRecorder& recorder) const {
    const pagination::LayoutMetrics layout =
        pagination::computeLayoutMetrics(bounds.width, bounds.height, ViewMode::Split, spacing);
    const std::int32_t colWidth = layout.columnWidth;
    const std::int32_t lastRow = bounds.height - 2;

    drawColumn(surface, bounds, left, kFirstContentRow, 1, colWidth, 0, lastRow, spacing, recorder);

    const std::string divider = std::string(sgr::kMuted) + "\xE2\x94\x82" + sgr::kReset; // U+2502
    for (std::int32_t row = kFirstContentRow; row <= std::max(bounds.height - 1, 4); ++row) {
        surface.write(bounds, row, colWidth + kSplitDividerOffset, divider);
    }

    if (right) {
        drawColumn(surface, bounds, *right, kFirstContentRow, colWidth + kSplitGutter, colWidth, 1, lastRow,
                   spacing, recorder);
    }
}

bool PageRenderer::render(Surface& surface, const Rect& bounds, pagination::PageCalculator& calculator,
                          std::int32_t pageIndex, const LayoutConfig& config, RenderedLines& rendered) const {
    std::optional<pagination::PageRecord> page = calculator.getPage(pageIndex);
    if (!page) return false;
    const std::int32_t leftIndex = std::clamp(pageIndex, 0, calculator.totalPages() - 1);

    FrameRecorder recorder(rendered);
    PageContent left{page->lines ? &*page->lines : nullptr, page->startLine, leftIndex};

    if (config.viewMode == ViewMode::Single) {
        renderSingle(surface, bounds, left, config.lineSpacing, recorder);
    } else {
        std::optional<pagination::PageRecord> next;
        if (leftIndex + 1 < calculator.totalPages()) next = calculator.getPage(leftIndex + 1);
        if (next) {
            PageContent right{next->lines ? &*next->lines : nullptr, next->startLine, leftIndex + 1};
            renderSplit(surface, bounds, left, &right, config.lineSpacing, recorder);
        } else {
            renderSplit(surface, bounds, left, nullptr, config.lineSpacing, recorder);
        }
    }
    recorder.commit();
    return true;
}

} // namespace folio::render
