#include "folio/render/line_drawer.h"

#include <algorithm>

namespace folio::render {

using text::DisplayLine;
using text::TextStyleFlags;

std::string LineDrawer::styleCodes(const text::TextStyle& style, const text::LineMetadata& metadata) {
    std::string codes;
    const bool heading = metadata.blockType && *metadata.blockType == text::BlockType::Heading;
    if (style.has(TextStyleFlags::Bold) || heading) codes += sgr::kBold;
    if (style.has(TextStyleFlags::Italic)) codes += sgr::kItalic;
    if (style.has(TextStyleFlags::Underline)) codes += sgr::kUnderline;
    if (style.has(TextStyleFlags::Code)) codes += sgr::kCode;
    if (style.has(TextStyleFlags::Link)) {
        codes += sgr::kLink;
        if (!style.has(TextStyleFlags::Underline)) codes += sgr::kUnderline;
    }
    if (style.has(TextStyleFlags::Prefix) || style.has(TextStyleFlags::Separator)) codes += sgr::kMuted;
    return codes;
}

ComposedLine LineDrawer::compose(const DisplayLine& line, std::int32_t width) const {
    ComposedLine out;
    if (width <= 0) return out;

    std::int32_t remaining = width;
    for (const text::TextSegment& segment : line.segments) {
        if (remaining <= 0) break;
        if (segment.text.empty()) continue;

        std::string chunk = segment.text;
        if (static_cast<std::int32_t>(metrics_.visibleLength(chunk)) > remaining) {
            chunk = metrics_.truncateTo(chunk, remaining);
        }
        if (chunk.empty()) continue;

        const std::string codes = styleCodes(segment.style, line.metadata);
        out.plain += chunk;
        if (codes.empty()) {
            out.styled += chunk;
        } else {
            out.styled += codes;
            out.styled += chunk;
            out.styled += sgr::kReset;
        }
        remaining -= static_cast<std::int32_t>(metrics_.visibleLength(chunk));
    }

    if (out.styled.empty()) {
        out.plain = metrics_.truncateTo(line.text, width);
        out.styled = out.plain;
    }
    return out;
}

void LineDrawer::drawLine(Surface& surface, const Rect& bounds, const DisplayLine& line,
                          const LinePlacement& placement, FrameRecorder& recorder) const {
    const std::int32_t absRow = bounds.y + placement.row - 1;
    const std::int32_t absCol = bounds.x + placement.col - 1;

    if (line.isImage()) {
        recorder.record(geometryBuilder_.build(placement.pageId, placement.columnId, absRow, absCol,
                                               placement.lineOffset, std::string(), std::string()));
        return;
    }

    const ComposedLine composed = compose(line, placement.width);
    const std::int32_t maxWidth = std::max(std::min(placement.width, bounds.right() - absCol + 1), 0);
    const std::uint32_t startColumn = static_cast<std::uint32_t>(std::max(absCol - 1, 0));

    std::string clippedStyled;
    if (maxWidth > 0) clippedStyled = metrics_.truncateTo(composed.styled, maxWidth, startColumn);
    std::string clippedPlain = text::TextMetrics::stripAnsi(clippedStyled);

    recorder.record(geometryBuilder_.build(placement.pageId, placement.columnId, absRow, absCol,
                                           placement.lineOffset, std::move(clippedPlain), clippedStyled));
    surface.write(bounds, placement.row, placement.col, clippedStyled);
}

} // namespace folio::render
