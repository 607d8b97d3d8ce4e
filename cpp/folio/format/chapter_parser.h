#ifndef FOLIO_FORMAT_CHAPTER_PARSER_H
#define FOLIO_FORMAT_CHAPTER_PARSER_H

#include "folio/document.h"
#include <string_view>

namespace folio::format {

/**
 * ChapterParser: raw chapter text -> semantic blocks.
 *
 * Implementations may throw on malformed input; the formatting service turns
 * that into the plain-line fallback. parse() must be safe to call from
 * several threads.
 */
class ChapterParser {
public:
    virtual ~ChapterParser() = default;
    virtual BlockList parse(std::string_view raw) const = 0;
};

/**
 * Lightweight markup parser for pre-extracted chapter text.
 *
 * - blank lines separate paragraphs, consecutive lines join with a space
 * - "#".."######" headings, "> " quotes, "- " / "* " / "1. " list items
 *   (two leading spaces per nesting level)
 * - ``` fences delimit code, lines starting with '|' form a table
 * - "---" alone is a separator, "![alt](src)" alone is an image block
 * - inline **bold**, *italic*, `code` and ![alt](src)
 *
 * Throws std::runtime_error on an unterminated code fence.
 */
class PlainTextChapterParser : public ChapterParser {
public:
    BlockList parse(std::string_view raw) const override;

    static std::vector<text::TextSegment> parseInline(std::string_view text);
};

} // namespace folio::format

#endif // FOLIO_FORMAT_CHAPTER_PARSER_H
