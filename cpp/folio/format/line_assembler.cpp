#include "folio/format/line_assembler.h"
#include "folio/core/string_utils.h"

#include <algorithm>

namespace folio::format {

using text::BlockType;
using text::ContentBlock;
using text::DisplayLine;
using text::DisplayLines;
using text::LineMetadata;
using text::TextSegment;
using text::TextStyleFlags;

namespace {

constexpr const char* kQuotePrefix = "\xE2\x94\x82 "; // "│ "
constexpr const char* kRuleUnit = "\xE2\x94\x80";     // "─"

bool isPreformatted(BlockType type) {
    return type == BlockType::Code || type == BlockType::Table;
}

DisplayLine spacerLine() {
    DisplayLine line;
    line.metadata.spacer = true;
    return line;
}

} // namespace

LineAssembler::LineAssembler(const text::TextMetrics& metrics)
    : metrics_(metrics) {}

DisplayLines LineAssembler::build(const std::vector<ContentBlock>& blocks, std::int32_t width,
                                  const AssemblerOptions& options) {
    width_ = std::max(width, kMinWidth);
    options_ = options;
    inlineImageCounter_ = 0;

    DisplayLines out;
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        const std::size_t before = out.size();
        appendBlock(blocks[i], i, out);
        // Blocks that produced nothing get no spacer either.
        if (out.size() == before && blocks[i].type != BlockType::Break) continue;
        if (spacerAfter(blocks, i)) out.push_back(spacerLine());
    }
    return out;
}

void LineAssembler::appendBlock(const ContentBlock& block, std::size_t index, DisplayLines& out) {
    if (isPreformatted(block.type)) {
        appendPreformatted(block, out);
        return;
    }

    switch (block.type) {
        case BlockType::Separator:
            out.push_back(separatorLine());
            return;
        case BlockType::Break:
            out.push_back(spacerLine());
            return;
        case BlockType::Image:
            if (options_.variant == RenderVariant::Images && block.metadata.image
                && isRenderableImageSrc(block.metadata.image->src)) {
                appendBlockImage(block, index, out);
                return;
            }
            break;
        default:
            break;
    }

    // Text rendition of an image block: its alt text as a paragraph.
    const std::vector<TextSegment>* segments = &block.segments;
    std::vector<TextSegment> altSegments;
    if (block.type == BlockType::Image && block.segments.empty() && block.metadata.image) {
        const std::string& alt = block.metadata.image->alt;
        altSegments.push_back(TextSegment{"[Image: " + (alt.empty() ? std::string("image") : alt) + "]", {}});
        segments = &altSegments;
    }

    LineMetadata metadata = metadataFor(block);
    std::string prefix;
    std::string continuation;
    switch (block.type) {
        case BlockType::Quote:
            prefix = kQuotePrefix;
            continuation = kQuotePrefix;
            break;
        case BlockType::ListItem: {
            const std::string indent = repeat("  ", static_cast<std::size_t>(std::max(block.level - 1, 0)));
            const std::string& marker = block.metadata.marker;
            prefix = indent + marker + " ";
            continuation = indent + std::string(metrics_.visibleLength(marker) + 1, ' ');
            metadata.list = true;
            break;
        }
        default:
            break;
    }

    wrapTokens(tokenize(*segments), metadata, prefix, continuation, out);
}

void LineAssembler::appendPreformatted(const ContentBlock& block, DisplayLines& out) const {
    const std::string content = block.plainText();
    if (content.empty()) return;

    text::TextStyle style = block.segments.empty() ? text::TextStyle{} : block.segments.front().style;
    style.flags = style.flags | TextStyleFlags::Code;

    std::vector<std::string> rows = splitLines(content);
    // Trailing newlines do not open more rows.
    while (!rows.empty() && rows.back().empty()) rows.pop_back();

    for (const std::string& row : rows) {
        DisplayLine line;
        line.text = rstrip(row);
        if (!line.text.empty()) line.segments.push_back(TextSegment{line.text, style});
        line.metadata = metadataFor(block);
        out.push_back(std::move(line));
    }
}

DisplayLine LineAssembler::separatorLine() const {
    const std::size_t count = std::min<std::size_t>(static_cast<std::size_t>(width_), kSeparatorMaxWidth);
    DisplayLine line;
    line.text = repeat(kRuleUnit, count);
    text::TextStyle style;
    style.flags = TextStyleFlags::Separator;
    line.segments.push_back(TextSegment{line.text, style});
    line.metadata.blockType = BlockType::Separator;
    line.metadata.chapterIndex = options_.chapterIndex;
    return line;
}

LineMetadata LineAssembler::metadataFor(const ContentBlock& block) const {
    LineMetadata metadata;
    metadata.blockType = block.type;
    metadata.chapterIndex = options_.chapterIndex;
    return metadata;
}

bool LineAssembler::spacerAfter(const std::vector<ContentBlock>& blocks, std::size_t index) {
    if (index + 1 >= blocks.size()) return false;
    const BlockType type = blocks[index].type;
    if (type == BlockType::Image || isPreformatted(type)) return true;
    return blocks[index + 1].type != BlockType::ListItem;
}

} // namespace folio::format
