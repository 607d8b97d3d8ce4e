#ifndef FOLIO_TEXT_TEXT_TYPES_H
#define FOLIO_TEXT_TEXT_TYPES_H

/**
 * Semantic block and display line model.
 *
 * ContentBlock    - parsed chapter content (heading, paragraph, list item ...)
 * TextSegment     - run of text sharing one TextStyle
 * DisplayLine     - one wrapped screen row of a chapter
 * LineCell        - one grapheme cluster of a rendered line
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace folio::text {

// =============================================================================
// Styles
// =============================================================================

enum class TextStyleFlags : std::uint8_t {
    None = 0,
    Bold = 1 << 0,
    Italic = 1 << 1,
    Underline = 1 << 2,
    Code = 1 << 3,
    Link = 1 << 4,
    Prefix = 1 << 5,      // quote bar / list marker inserted by the wrapper
    Separator = 1 << 6,
};

inline TextStyleFlags operator|(TextStyleFlags a, TextStyleFlags b) {
    return static_cast<TextStyleFlags>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

inline TextStyleFlags operator&(TextStyleFlags a, TextStyleFlags b) {
    return static_cast<TextStyleFlags>(static_cast<std::uint8_t>(a) & static_cast<std::uint8_t>(b));
}

inline bool hasFlag(TextStyleFlags value, TextStyleFlags flag) {
    return (static_cast<std::uint8_t>(value) & static_cast<std::uint8_t>(flag)) != 0;
}

struct ImageRef {
    std::string src;
    std::string alt;

    bool operator==(const ImageRef& o) const { return src == o.src && alt == o.alt; }
    bool operator!=(const ImageRef& o) const { return !(*this == o); }
};

struct TextStyle {
    TextStyleFlags flags{TextStyleFlags::None};
    std::optional<ImageRef> inlineImage; // set on inline <img> segments

    bool has(TextStyleFlags flag) const { return hasFlag(flags, flag); }

    bool operator==(const TextStyle& o) const { return flags == o.flags && inlineImage == o.inlineImage; }
    bool operator!=(const TextStyle& o) const { return !(*this == o); }
};

struct TextSegment {
    std::string text;
    TextStyle style;

    bool operator==(const TextSegment& o) const { return text == o.text && style == o.style; }
    bool operator!=(const TextSegment& o) const { return !(*this == o); }
};

// =============================================================================
// Blocks
// =============================================================================

enum class BlockType : std::uint8_t {
    Heading = 0,
    Paragraph = 1,
    ListItem = 2,
    Quote = 3,
    Code = 4,
    Table = 5,
    Separator = 6,
    Break = 7,
    Image = 8,
};

const char* blockTypeName(BlockType type);

inline constexpr const char* kDefaultListMarker = "\xE2\x80\xA2"; // U+2022

struct BlockMetadata {
    std::string marker{kDefaultListMarker};
    std::optional<ImageRef> image;      // Image blocks only
    std::uint32_t listOrdinal{0};       // 1-based for ordered lists, 0 otherwise

    bool operator==(const BlockMetadata& o) const {
        return marker == o.marker && image == o.image && listOrdinal == o.listOrdinal;
    }
};

struct ContentBlock {
    BlockType type{BlockType::Paragraph};
    std::int32_t level{0};
    std::vector<TextSegment> segments;
    BlockMetadata metadata;

    // Concatenated segment text.
    std::string plainText() const;

    bool operator==(const ContentBlock& o) const {
        return type == o.type && level == o.level && segments == o.segments && metadata == o.metadata;
    }
};

// =============================================================================
// Display lines
// =============================================================================

struct ImageRender {
    std::uint32_t cols{0};
    std::uint32_t rows{0};
    std::uint32_t placementId{0};
    std::uint32_t colOffset{0};
    std::uint32_t lineIndex{0};   // row of the image this line covers
    bool renderLine{false};       // true on the first row only
    bool inlineImage{false};
    std::string src;

    bool operator==(const ImageRender& o) const {
        return cols == o.cols && rows == o.rows && placementId == o.placementId
            && colOffset == o.colOffset && lineIndex == o.lineIndex
            && renderLine == o.renderLine && inlineImage == o.inlineImage && src == o.src;
    }
};

struct LineMetadata {
    std::optional<BlockType> blockType;
    bool spacer{false};
    bool list{false};
    std::int32_t chapterIndex{-1};
    std::optional<ImageRender> image;

    bool operator==(const LineMetadata& o) const {
        return blockType == o.blockType && spacer == o.spacer && list == o.list
            && chapterIndex == o.chapterIndex && image == o.image;
    }
};

struct DisplayLine {
    std::string text;
    std::vector<TextSegment> segments;
    LineMetadata metadata;

    bool isImage() const { return metadata.image.has_value(); }

    bool operator==(const DisplayLine& o) const {
        return text == o.text && segments == o.segments && metadata == o.metadata;
    }
    bool operator!=(const DisplayLine& o) const { return !(*this == o); }
};

using DisplayLines = std::vector<DisplayLine>;

// =============================================================================
// Cells
// =============================================================================

/**
 * One grapheme cluster of a line. charStart/charEnd are UTF-8 byte offsets
 * into the line's plain text; screenX is the column offset from the line start.
 */
struct LineCell {
    std::string cluster;
    std::uint32_t charStart{0};
    std::uint32_t charEnd{0};
    std::uint32_t displayWidth{0};
    std::uint32_t screenX{0};

    bool operator==(const LineCell& o) const {
        return cluster == o.cluster && charStart == o.charStart && charEnd == o.charEnd
            && displayWidth == o.displayWidth && screenX == o.screenX;
    }
};

} // namespace folio::text

#endif // FOLIO_TEXT_TEXT_TYPES_H
