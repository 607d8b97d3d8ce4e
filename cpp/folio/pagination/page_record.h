#ifndef FOLIO_PAGINATION_PAGE_RECORD_H
#define FOLIO_PAGINATION_PAGE_RECORD_H

#include "folio/text/text_types.h"
#include <cstdint>
#include <optional>

namespace folio::pagination {

/**
 * Persisted form of a page: line range only, never the wrapped content.
 */
struct CompactPage {
    std::int32_t chapterIndex{0};
    std::int32_t pageInChapter{0};
    std::int32_t totalPagesInChapter{0};
    std::int32_t startLine{0};
    std::int32_t endLine{0};

    bool operator==(const CompactPage& o) const {
        return chapterIndex == o.chapterIndex && pageInChapter == o.pageInChapter
            && totalPagesInChapter == o.totalPagesInChapter && startLine == o.startLine
            && endLine == o.endLine;
    }
};

/**
 * One page of the dynamic page map. `lines` is empty for stubs loaded from
 * the pagination cache until the page is hydrated.
 * Invariants: startLine <= endLine, 0 <= pageInChapter < totalPagesInChapter.
 */
struct PageRecord {
    std::int32_t chapterIndex{0};
    std::int32_t pageInChapter{0};
    std::int32_t totalPagesInChapter{0};
    std::int32_t startLine{0};
    std::int32_t endLine{0};           // inclusive
    std::optional<text::DisplayLines> lines;

    std::int32_t lineCount() const { return endLine - startLine + 1; }
    bool hydrated() const { return lines.has_value(); }
    bool contains(std::int32_t lineOffset) const { return lineOffset >= startLine && lineOffset <= endLine; }

    CompactPage compact() const {
        return CompactPage{chapterIndex, pageInChapter, totalPagesInChapter, startLine, endLine};
    }

    static PageRecord fromCompact(const CompactPage& page) {
        PageRecord record;
        record.chapterIndex = page.chapterIndex;
        record.pageInChapter = page.pageInChapter;
        record.totalPagesInChapter = page.totalPagesInChapter;
        record.startLine = page.startLine;
        record.endLine = page.endLine;
        return record;
    }
};

} // namespace folio::pagination

#endif // FOLIO_PAGINATION_PAGE_RECORD_H
