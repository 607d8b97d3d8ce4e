/**
 * Part of line_assembler.h: image placeholder rows.
 */

#include "folio/format/line_assembler.h"
#include "folio/core/string_utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace folio::format {

using text::BlockType;
using text::ContentBlock;
using text::DisplayLine;
using text::DisplayLines;
using text::LineMetadata;

bool LineAssembler::isRenderableImageSrc(const std::string& src) {
    if (src.empty()) return false;

    std::string path = src.substr(0, src.find_first_of("?#"));
    const std::size_t slash = path.find_last_of('/');
    const std::size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return false;

    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg";
}

std::uint32_t LineAssembler::imageRowsFor(std::uint32_t cols, std::optional<std::uint32_t> maxRows) {
    std::uint32_t rows = static_cast<std::uint32_t>(std::lround(static_cast<double>(cols) * 0.5));
    rows = std::clamp(rows, kMinImageRows, kMaxImageRows);
    if (maxRows && *maxRows > 0) rows = std::min(rows, *maxRows);
    return std::max(rows, 1u);
}

std::uint32_t LineAssembler::placementId(const std::string& seed) const {
    const std::uint32_t id = hashBytes32(kHashOffset32, seed);
    return id == 0 ? 1u : id;
}

void LineAssembler::appendBlockImage(const ContentBlock& block, std::size_t index, DisplayLines& out) const {
    const text::ImageRef& image = *block.metadata.image;
    const std::uint32_t cols = static_cast<std::uint32_t>(width_);

    LineMetadata base = metadataFor(block);
    text::ImageRender render;
    render.cols = cols;
    render.rows = imageRowsFor(cols, options_.maxImageRows);
    render.placementId = placementId(options_.chapterSeed + "|" + image.src + "|" + std::to_string(index));
    render.src = image.src;
    base.image = render;
    appendImageRows(base, out);
}

void LineAssembler::appendInlineImage(const text::ImageRef& image, std::uint32_t indentCols, DisplayLines& out) {
    ++inlineImageCounter_;
    const std::int32_t available = width_ - static_cast<std::int32_t>(indentCols);
    const std::uint32_t cols = static_cast<std::uint32_t>(std::max(available, 1));

    LineMetadata base;
    base.blockType = BlockType::Image;
    base.chapterIndex = options_.chapterIndex;
    text::ImageRender render;
    render.cols = cols;
    render.rows = imageRowsFor(cols, options_.maxImageRows);
    render.colOffset = indentCols;
    render.inlineImage = true;
    render.src = image.src;
    render.placementId = placementId(options_.chapterSeed + "|" + image.src + "|inline|"
                                     + std::to_string(inlineImageCounter_));
    base.image = render;
    appendImageRows(base, out);
}

void LineAssembler::appendImageRows(const LineMetadata& base, DisplayLines& out) const {
    const std::uint32_t rows = base.image->rows;
    for (std::uint32_t row = 0; row < rows; ++row) {
        DisplayLine line;
        line.metadata = base;
        line.metadata.image->lineIndex = row;
        line.metadata.image->renderLine = (row == 0);
        out.push_back(std::move(line));
    }
}

} // namespace folio::format
