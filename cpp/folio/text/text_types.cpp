#include "folio/text/text_types.h"

namespace folio::text {

const char* blockTypeName(BlockType type) {
    switch (type) {
        case BlockType::Heading: return "heading";
        case BlockType::Paragraph: return "paragraph";
        case BlockType::ListItem: return "list_item";
        case BlockType::Quote: return "quote";
        case BlockType::Code: return "code";
        case BlockType::Table: return "table";
        case BlockType::Separator: return "separator";
        case BlockType::Break: return "break";
        case BlockType::Image: return "image";
    }
    return "paragraph";
}

std::string ContentBlock::plainText() const {
    std::string out;
    for (const TextSegment& seg : segments) out += seg.text;
    return out;
}

} // namespace folio::text
