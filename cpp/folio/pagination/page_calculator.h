#ifndef FOLIO_PAGINATION_PAGE_CALCULATOR_H
#define FOLIO_PAGINATION_PAGE_CALCULATOR_H

#include "folio/document.h"
#include "folio/format/formatting_service.h"
#include "folio/pagination/layout_metrics.h"
#include "folio/pagination/page_hydrator.h"
#include "folio/pagination/page_map_builder.h"
#include "folio/pagination/pagination_cache.h"
#include "folio/types.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace folio::pagination {

struct PageInfo {
    std::int32_t chapterIndex{0};
    std::int32_t pageInChapter{0};        // 0-based
    std::int32_t totalPagesInChapter{0};
    std::int32_t globalPage{0};           // 1-based
    std::int32_t totalPages{0};
};

/**
 * Reading position captured before a page map rebuild.
 * `lineOffset` is preferred; `pageInChapter` is the coarse fallback.
 */
struct PendingProgress {
    std::int32_t chapterIndex{0};
    std::optional<std::int32_t> lineOffset;
    std::optional<std::int32_t> pageInChapter;
};

/**
 * PageCalculator: owns the in-memory page map.
 *
 * Dynamic mode keeps one PageRecord per page across the book, loaded from the
 * pagination cache when possible (as unhydrated stubs) and hydrated lazily on
 * access. Absolute mode keeps per-chapter page counts only.
 */
class PageCalculator {
public:
    PageCalculator(format::FormattingService& formatting, PaginationCache* cache, bool imagesEnabled = false);

    PageCalculator(const PageCalculator&) = delete;
    PageCalculator& operator=(const PageCalculator&) = delete;

    /**
     * Build (or load) the dynamic page map. No-op apart from clearing the
     * dynamic map when `config` is in absolute mode.
     * @throws std::invalid_argument for non-positive width or height
     */
    void buildPageMap(std::int32_t width, std::int32_t height, Document& document, const LayoutConfig& config,
                      const ProgressCallback& progress = {});

    /**
     * Per-chapter page counts for absolute mode.
     * @throws std::invalid_argument for non-positive width or height
     */
    std::vector<std::int32_t> buildAbsoluteMap(std::int32_t width, std::int32_t height, Document& document,
                                               const LayoutConfig& config, const ProgressCallback& progress = {});

    /**
     * Page at `pageIndex`, clamped to the valid range. Stubs are hydrated on
     * first access and the hydrated record replaces the stub.
     * @return std::nullopt only when the map is empty
     */
    std::optional<PageRecord> getPage(std::int32_t pageIndex);

    /**
     * Index of the first page of `chapterIndex` whose endLine >= lineOffset,
     * the chapter's last page when none is, 0 when the chapter has no pages.
     */
    std::int32_t findPageIndex(std::int32_t chapterIndex, std::int32_t lineOffset) const;

    std::int32_t totalPages() const { return static_cast<std::int32_t>(pages_.size()); }
    std::optional<PageInfo> pageInfo(std::int32_t pageIndex) const;

    PendingProgress captureProgress(std::int32_t pageIndex) const;

    /**
     * Page index for a position captured before a rebuild. The exact line
     * offset wins; otherwise pageInChapter * linesPerPage is used.
     */
    std::int32_t restorePosition(const PendingProgress& pending) const;

    const std::vector<std::int32_t>& absolutePageCounts() const { return absolutePages_; }
    const LayoutMetrics& layout() const { return layout_; }
    bool loadedFromCache() const { return loadedFromCache_; }

    void setImagesEnabled(bool enabled) { imagesEnabled_ = enabled; }

private:
    format::WrapOptions wrapOptions() const;
    void rebuildIndex();

    format::FormattingService& formatting_;
    PaginationCache* cache_;
    PageHydrator hydrator_;
    bool imagesEnabled_;

    Document* document_{nullptr};
    LayoutMetrics layout_{};
    std::vector<PageRecord> pages_;
    // chapter -> page indices, ordered by endLine
    std::vector<std::vector<std::int32_t>> chapterIndex_;
    std::vector<std::int32_t> absolutePages_;
    bool loadedFromCache_{false};
};

} // namespace folio::pagination

#endif // FOLIO_PAGINATION_PAGE_CALCULATOR_H
