#include "folio/pagination/page_hydrator.h"
#include "folio/core/logging.h"

#include <exception>

namespace folio::pagination {

bool PageHydrator::hydrate(PageRecord& page, Document& document, std::int32_t columnWidth,
                           const format::WrapOptions& options) const {
    const std::int32_t length = page.lineCount();
    if (length <= 0) return false;

    try {
        text::DisplayLines lines =
            formatting_.wrapWindow(document, page.chapterIndex, columnWidth, page.startLine, length, options);
        if (static_cast<std::int32_t>(lines.size()) == length) {
            page.lines = std::move(lines);
            return true;
        }
        FOLIO_LOG_WARN("page %d/%d of chapter %d: expected %d lines, got %zu", page.pageInChapter + 1,
                       page.totalPagesInChapter, page.chapterIndex, length, lines.size());
    } catch (const std::exception& e) {
        FOLIO_LOG_WARN("hydrating chapter %d failed: %s", page.chapterIndex, e.what());
    }

    // Fallback: whatever plain text the chapter still has for this range.
    Chapter* chapter = document.getChapter(page.chapterIndex);
    if (!chapter) return false;
    const std::vector<std::string> plain = chapter->lines();
    text::DisplayLines fallback;
    for (std::int32_t i = page.startLine; i <= page.endLine && i < static_cast<std::int32_t>(plain.size()); ++i) {
        text::DisplayLine line;
        line.text = plain[static_cast<std::size_t>(i)];
        line.metadata.chapterIndex = page.chapterIndex;
        fallback.push_back(std::move(line));
    }
    if (!page.lines) page.lines = std::move(fallback);
    return false;
}

} // namespace folio::pagination
