#include "folio/format/plain_lines_builder.h"
#include "folio/core/string_utils.h"

namespace folio::format {

using text::BlockType;
using text::ContentBlock;

namespace {

void appendBlockLines(const ContentBlock& block, std::vector<std::string>& out) {
    switch (block.type) {
        case BlockType::Code:
        case BlockType::Table: {
            std::vector<std::string> rows = splitLines(block.plainText());
            if (rows.size() > 1 && rows.back().empty()) rows.pop_back();
            for (const std::string& row : rows) out.push_back(rstrip(row));
            return;
        }
        case BlockType::Separator:
            out.push_back(repeat("\xE2\x94\x80", 40));
            return;
        case BlockType::Break:
            out.emplace_back();
            return;
        case BlockType::Image:
            if (block.metadata.image) {
                const std::string& alt = block.metadata.image->alt;
                out.push_back("[Image: " + (alt.empty() ? std::string("image") : alt) + "]");
                return;
            }
            break;
        default:
            break;
    }

    std::string text;
    for (const text::TextSegment& segment : block.segments) {
        if (segment.text.empty() && segment.style.inlineImage) {
            text += "[Image: " + segment.style.inlineImage->alt + "]";
        } else {
            text += segment.text;
        }
    }
    if (block.type == BlockType::ListItem) text = block.metadata.marker + " " + text;
    for (const std::string& row : splitLines(text)) out.push_back(rstrip(row));
}

} // namespace

std::vector<std::string> PlainLinesBuilder::build(const BlockList& blocks) {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        appendBlockLines(blocks[i], out);
        if (i + 1 < blocks.size()) out.emplace_back();
    }
    return out;
}

} // namespace folio::format
