#ifndef FOLIO_PAGINATION_PAGE_HYDRATOR_H
#define FOLIO_PAGINATION_PAGE_HYDRATOR_H

#include "folio/document.h"
#include "folio/format/formatting_service.h"
#include "folio/pagination/page_record.h"

namespace folio::pagination {

/**
 * Re-derives the wrapped lines of a page stub from its chapter.
 */
class PageHydrator {
public:
    explicit PageHydrator(format::FormattingService& formatting) : formatting_(formatting) {}

    /**
     * Fill `page.lines` with the window [startLine, endLine] of its chapter.
     * @return false when the chapter cannot supply that window; `page` is
     *         then given the chapter's plain lines for the range, if any, and
     *         should not be treated as hydrated
     */
    bool hydrate(PageRecord& page, Document& document, std::int32_t columnWidth,
                 const format::WrapOptions& options) const;

private:
    format::FormattingService& formatting_;
};

} // namespace folio::pagination

#endif // FOLIO_PAGINATION_PAGE_HYDRATOR_H
