#include "folio/pagination/page_map_builder.h"
#include "folio/core/logging.h"

#include <algorithm>
#include <stdexcept>

namespace folio::pagination {

namespace {

void requirePageHeight(std::int32_t linesPerPage) {
    if (linesPerPage <= 0) throw std::invalid_argument("lines per page must be positive");
}

std::int32_t pageCountFor(std::int32_t lineCount, std::int32_t linesPerPage) {
    if (lineCount <= 0) return 0;
    return (lineCount + linesPerPage - 1) / linesPerPage;
}

} // namespace

std::vector<std::int32_t> AbsolutePageMapBuilder::build(Document& document, std::int32_t columnWidth,
                                                        std::int32_t linesPerPage,
                                                        const format::WrapOptions& options,
                                                        const ProgressCallback& progress) const {
    requirePageHeight(linesPerPage);
    const std::int32_t total = document.chapterCount();
    std::vector<std::int32_t> pages;
    pages.reserve(static_cast<std::size_t>(std::max(total, 0)));

    for (std::int32_t i = 0; i < total; ++i) {
        const format::DisplayLinesPtr lines = formatting_.wrapAll(document, i, columnWidth, options);
        pages.push_back(pageCountFor(static_cast<std::int32_t>(lines->size()), linesPerPage));
        if (progress) progress(i + 1, total);
    }
    return pages;
}

std::vector<PageRecord> DynamicPageMapBuilder::paginate(std::int32_t chapterIndex, std::int32_t lineCount,
                                                        std::int32_t linesPerPage) {
    requirePageHeight(linesPerPage);
    std::vector<PageRecord> pages;
    const std::int32_t count = pageCountFor(lineCount, linesPerPage);
    pages.reserve(static_cast<std::size_t>(count));
    for (std::int32_t p = 0; p < count; ++p) {
        PageRecord record;
        record.chapterIndex = chapterIndex;
        record.pageInChapter = p;
        record.totalPagesInChapter = count;
        record.startLine = p * linesPerPage;
        record.endLine = std::min(record.startLine + linesPerPage - 1, lineCount - 1);
        pages.push_back(std::move(record));
    }
    return pages;
}

std::vector<PageRecord> DynamicPageMapBuilder::build(Document& document, std::int32_t columnWidth,
                                                     std::int32_t linesPerPage,
                                                     const format::WrapOptions& options,
                                                     const ProgressCallback& progress) const {
    requirePageHeight(linesPerPage);
    const std::int32_t total = document.chapterCount();
    std::vector<PageRecord> pages;

    for (std::int32_t i = 0; i < total; ++i) {
        const format::DisplayLinesPtr lines = formatting_.wrapAll(document, i, columnWidth, options);
        std::vector<PageRecord> chapterPages =
            paginate(i, static_cast<std::int32_t>(lines->size()), linesPerPage);
        for (PageRecord& record : chapterPages) {
            record.lines = text::DisplayLines(lines->begin() + record.startLine, lines->begin() + record.endLine + 1);
            pages.push_back(std::move(record));
        }
        if (progress) progress(i + 1, total);
    }

    FOLIO_LOG_DEBUG("dynamic page map: %zu pages over %d chapters", pages.size(), total);
    return pages;
}

} // namespace folio::pagination
