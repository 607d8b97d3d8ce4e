#pragma once

#include <gtest/gtest.h>
#include "folio/document.h"
#include "folio/format/chapter_parser.h"
#include "folio/render/surface.h"
#include "folio/text/text_metrics.h"
#include "folio/text/text_types.h"
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio_test {

using folio::text::BlockType;
using folio::text::ContentBlock;
using folio::text::DisplayLine;
using folio::text::DisplayLines;
using folio::text::TextSegment;
using folio::text::TextStyle;
using folio::text::TextStyleFlags;

inline ContentBlock makeBlock(BlockType type, const std::string& text, std::int32_t level = 0) {
    ContentBlock block;
    block.type = type;
    block.level = level;
    if (!text.empty()) block.segments.push_back(TextSegment{text, {}});
    return block;
}

inline std::vector<std::string> texts(const DisplayLines& lines) {
    std::vector<std::string> out;
    out.reserve(lines.size());
    for (const DisplayLine& line : lines) out.push_back(line.text);
    return out;
}

// `count` numbered one-line paragraphs separated by nothing but a newline each,
// parsed as code so every row becomes exactly one display line.
inline std::string numberedRows(int count) {
    std::string body = "```\n";
    for (int i = 0; i < count; ++i) body += "row " + std::to_string(i) + "\n";
    body += "```\n";
    return body;
}

/**
 * Delegates to PlainTextChapterParser and counts calls.
 */
class CountingParser : public folio::format::ChapterParser {
public:
    folio::BlockList parse(std::string_view raw) const override {
        ++calls;
        return inner_.parse(raw);
    }

    mutable std::atomic<int> calls{0};

private:
    folio::format::PlainTextChapterParser inner_;
};

class ThrowingParser : public folio::format::ChapterParser {
public:
    folio::BlockList parse(std::string_view) const override {
        throw std::runtime_error("malformed markup");
    }
};

struct SurfaceWrite {
    folio::render::Rect bounds;
    std::int32_t row{0};
    std::int32_t col{0};
    std::string text;
};

class RecordingSurface : public folio::render::Surface {
public:
    void write(const folio::render::Rect& bounds, std::int32_t row, std::int32_t col,
               const std::string& text) override {
        writes.push_back(SurfaceWrite{bounds, row, col, text});
    }

    std::vector<SurfaceWrite> writes;
};

} // namespace folio_test
