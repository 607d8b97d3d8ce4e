#include "folio/format/chapter_parser.h"
#include "folio/core/string_utils.h"

#include <cctype>
#include <stdexcept>

namespace folio::format {

using text::BlockType;
using text::ContentBlock;
using text::ImageRef;
using text::TextSegment;
using text::TextStyle;
using text::TextStyleFlags;

namespace {

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Parses "![alt](src)" at the start of `s`; returns consumed length or 0.
std::size_t parseImage(std::string_view s, ImageRef& out) {
    if (!startsWith(s, "![")) return 0;
    const std::size_t closeAlt = s.find("](", 2);
    if (closeAlt == std::string_view::npos) return 0;
    const std::size_t closeSrc = s.find(')', closeAlt + 2);
    if (closeSrc == std::string_view::npos) return 0;
    out.alt = std::string(s.substr(2, closeAlt - 2));
    out.src = std::string(s.substr(closeAlt + 2, closeSrc - closeAlt - 2));
    return closeSrc + 1;
}

struct ListMarker {
    std::int32_t level{1};
    std::string marker;
    std::uint32_t ordinal{0};
    std::size_t contentStart{0};
};

bool parseListMarker(std::string_view line, ListMarker& out) {
    std::size_t indent = 0;
    while (indent < line.size() && line[indent] == ' ') ++indent;
    std::string_view rest = line.substr(indent);
    out.level = static_cast<std::int32_t>(indent / 2) + 1;

    if (startsWith(rest, "- ") || startsWith(rest, "* ")) {
        out.marker = text::kDefaultListMarker;
        out.ordinal = 0;
        out.contentStart = indent + 2;
        return true;
    }

    std::size_t digits = 0;
    while (digits < rest.size() && std::isdigit(static_cast<unsigned char>(rest[digits]))) ++digits;
    if (digits > 0 && digits + 1 < rest.size() && rest[digits] == '.' && rest[digits + 1] == ' ') {
        out.marker = std::string(rest.substr(0, digits + 1));
        out.ordinal = static_cast<std::uint32_t>(std::stoul(std::string(rest.substr(0, digits))));
        out.contentStart = indent + digits + 2;
        return true;
    }
    return false;
}

class BlockCollector {
public:
    explicit BlockCollector(BlockList& out) : out_(out) {}

    void addParagraphLine(std::string_view line) {
        if (!paragraph_.empty()) paragraph_ += ' ';
        paragraph_ += std::string(stripView(line));
    }

    void flushParagraph() {
        if (paragraph_.empty()) return;
        ContentBlock block;
        block.type = pendingType_;
        block.level = pendingLevel_;
        block.metadata = pendingMetadata_;
        block.segments = PlainTextChapterParser::parseInline(paragraph_);
        out_.push_back(std::move(block));
        paragraph_.clear();
        pendingType_ = BlockType::Paragraph;
        pendingLevel_ = 0;
        pendingMetadata_ = text::BlockMetadata{};
    }

    void beginBlock(BlockType type, std::int32_t level, text::BlockMetadata metadata = {}) {
        flushParagraph();
        pendingType_ = type;
        pendingLevel_ = level;
        pendingMetadata_ = std::move(metadata);
    }

    BlockType pendingType() const { return pendingType_; }
    bool hasPending() const { return !paragraph_.empty(); }

    void push(ContentBlock block) {
        flushParagraph();
        out_.push_back(std::move(block));
    }

private:
    BlockList& out_;
    std::string paragraph_;
    BlockType pendingType_{BlockType::Paragraph};
    std::int32_t pendingLevel_{0};
    text::BlockMetadata pendingMetadata_{};
};

} // namespace

std::vector<TextSegment> PlainTextChapterParser::parseInline(std::string_view text) {
    std::vector<TextSegment> segments;
    TextStyleFlags flags = TextStyleFlags::None;
    std::string current;

    auto flush = [&]() {
        if (current.empty()) return;
        TextStyle style;
        style.flags = flags;
        segments.push_back(TextSegment{current, style});
        current.clear();
    };
    auto toggle = [&](TextStyleFlags flag) {
        flush();
        flags = hasFlag(flags, flag)
            ? static_cast<TextStyleFlags>(static_cast<std::uint8_t>(flags) & ~static_cast<std::uint8_t>(flag))
            : flags | flag;
    };

    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::string_view rest = text.substr(pos);
        if (!hasFlag(flags, TextStyleFlags::Code)) {
            ImageRef image;
            const std::size_t consumed = parseImage(rest, image);
            if (consumed > 0) {
                flush();
                TextStyle style;
                style.flags = flags;
                style.inlineImage = image;
                segments.push_back(TextSegment{"", style});
                pos += consumed;
                continue;
            }
            if (startsWith(rest, "**")) {
                toggle(TextStyleFlags::Bold);
                pos += 2;
                continue;
            }
            if (rest[0] == '*' && rest.size() > 1 && !isAsciiSpace(rest[1])) {
                toggle(TextStyleFlags::Italic);
                pos += 1;
                continue;
            }
            if (rest[0] == '*' && hasFlag(flags, TextStyleFlags::Italic)) {
                toggle(TextStyleFlags::Italic);
                pos += 1;
                continue;
            }
        }
        if (rest[0] == '`') {
            toggle(TextStyleFlags::Code);
            pos += 1;
            continue;
        }
        current.push_back(rest[0]);
        ++pos;
    }
    flush();
    return segments;
}

BlockList PlainTextChapterParser::parse(std::string_view raw) const {
    BlockList blocks;
    BlockCollector collector(blocks);

    const std::vector<std::string> lines = splitLines(raw);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        const std::string_view trimmed = stripView(line);

        if (startsWith(trimmed, "```")) {
            collector.flushParagraph();
            std::string body;
            std::size_t j = i + 1;
            bool closed = false;
            for (; j < lines.size(); ++j) {
                if (startsWith(stripView(lines[j]), "```")) {
                    closed = true;
                    break;
                }
                body += lines[j];
                body += '\n';
            }
            if (!closed) {
                throw std::runtime_error("unterminated code fence at line " + std::to_string(i + 1));
            }
            ContentBlock block;
            block.type = BlockType::Code;
            block.segments.push_back(TextSegment{body, {}});
            collector.push(std::move(block));
            i = j;
            continue;
        }

        if (trimmed.empty()) {
            collector.flushParagraph();
            continue;
        }

        if (!trimmed.empty() && trimmed[0] == '|') {
            collector.flushParagraph();
            std::string body;
            std::size_t j = i;
            while (j < lines.size() && !stripView(lines[j]).empty() && stripView(lines[j])[0] == '|') {
                body += lines[j];
                body += '\n';
                ++j;
            }
            ContentBlock block;
            block.type = BlockType::Table;
            block.segments.push_back(TextSegment{body, {}});
            collector.push(std::move(block));
            i = j - 1;
            continue;
        }

        if (trimmed == "---" || trimmed == "***") {
            ContentBlock block;
            block.type = BlockType::Separator;
            collector.push(std::move(block));
            continue;
        }

        ImageRef image;
        if (parseImage(trimmed, image) == trimmed.size()) {
            ContentBlock block;
            block.type = BlockType::Image;
            block.metadata.image = image;
            collector.push(std::move(block));
            continue;
        }

        if (trimmed[0] == '#') {
            std::size_t level = 0;
            while (level < trimmed.size() && trimmed[level] == '#') ++level;
            if (level <= 6 && level < trimmed.size() && trimmed[level] == ' ') {
                collector.beginBlock(BlockType::Heading, static_cast<std::int32_t>(level));
                collector.addParagraphLine(trimmed.substr(level + 1));
                collector.flushParagraph();
                continue;
            }
        }

        if (startsWith(trimmed, "> ") || trimmed == ">") {
            if (collector.pendingType() != BlockType::Quote) collector.beginBlock(BlockType::Quote, 0);
            collector.addParagraphLine(trimmed.substr(1));
            continue;
        }

        ListMarker marker;
        if (parseListMarker(line, marker)) {
            text::BlockMetadata metadata;
            metadata.marker = marker.marker;
            metadata.listOrdinal = marker.ordinal;
            collector.beginBlock(BlockType::ListItem, marker.level, std::move(metadata));
            collector.addParagraphLine(std::string_view(line).substr(marker.contentStart));
            continue;
        }

        // Lazy continuation: a plain line after a quote or list item extends it.
        if (collector.pendingType() != BlockType::Paragraph && !collector.hasPending()) {
            collector.beginBlock(BlockType::Paragraph, 0);
        }
        collector.addParagraphLine(line);
    }
    collector.flushParagraph();
    return blocks;
}

} // namespace folio::format
