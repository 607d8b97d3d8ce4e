#ifndef FOLIO_PAGINATION_PAGE_MAP_BUILDER_H
#define FOLIO_PAGINATION_PAGE_MAP_BUILDER_H

#include "folio/document.h"
#include "folio/format/formatting_service.h"
#include "folio/pagination/page_record.h"
#include <cstdint>
#include <functional>
#include <vector>

namespace folio::pagination {

/**
 * Called after each chapter with (chapters done, chapter count).
 * Purely informational: a build always runs to completion.
 */
using ProgressCallback = std::function<void(std::int32_t done, std::int32_t total)>;

/**
 * Per-chapter paging: the page count of every chapter at the given width.
 */
class AbsolutePageMapBuilder {
public:
    explicit AbsolutePageMapBuilder(format::FormattingService& formatting) : formatting_(formatting) {}

    std::vector<std::int32_t> build(Document& document, std::int32_t columnWidth, std::int32_t linesPerPage,
                                    const format::WrapOptions& options = {},
                                    const ProgressCallback& progress = {}) const;

private:
    format::FormattingService& formatting_;
};

/**
 * Global paging: one PageRecord per page across the whole book, with the
 * wrapped lines of each page attached. Chapters without lines contribute
 * no pages; the last page of a chapter is not padded.
 */
class DynamicPageMapBuilder {
public:
    explicit DynamicPageMapBuilder(format::FormattingService& formatting) : formatting_(formatting) {}

    std::vector<PageRecord> build(Document& document, std::int32_t columnWidth, std::int32_t linesPerPage,
                                  const format::WrapOptions& options = {},
                                  const ProgressCallback& progress = {}) const;

    /**
     * Page records for `lineCount` lines of one chapter, without content.
     */
    static std::vector<PageRecord> paginate(std::int32_t chapterIndex, std::int32_t lineCount,
                                            std::int32_t linesPerPage);

private:
    format::FormattingService& formatting_;
};

} // namespace folio::pagination

#endif // FOLIO_PAGINATION_PAGE_MAP_BUILDER_H
