#include "folio/pagination/page_calculator.h"
#include "folio/core/logging.h"
#include "folio/core/util.h"

#include <algorithm>

namespace folio::pagination {

PageCalculator::PageCalculator(format::FormattingService& formatting, PaginationCache* cache, bool imagesEnabled)
    : formatting_(formatting), cache_(cache), hydrator_(formatting), imagesEnabled_(imagesEnabled) {}

format::WrapOptions PageCalculator::wrapOptions() const {
    format::WrapOptions options;
    if (imagesEnabled_) {
        options.variant = RenderVariant::Images;
        if (layout_.linesPerPage > 0) options.maxImageRows = static_cast<std::uint32_t>(layout_.linesPerPage);
    }
    return options;
}

// =============================================================================
// Building
// =============================================================================

void PageCalculator::buildPageMap(std::int32_t width, std::int32_t height, Document& document,
                                  const LayoutConfig& config, const ProgressCallback& progress) {
    if (config.pageNumberingMode != PageNumberingMode::Dynamic) {
        pages_.clear();
        chapterIndex_.clear();
        return;
    }

    layout_ = computeLayoutMetrics(width, height, config.viewMode, config.lineSpacing);
    document_ = &document;
    loadedFromCache_ = false;
    [[maybe_unused]] const double started = nowMs();
    const format::WrapOptions options = wrapOptions();

    std::string key;
    if (cache_) {
        key = cache_->layoutKey(width, height, config.viewMode, config.lineSpacing);
        // Image rows change line counts, so each variant keeps its own map.
        if (options.variant == RenderVariant::Images) {
            key += "_img";
            if (options.maxImageRows) key += std::to_string(*options.maxImageRows);
        }
        std::optional<std::vector<CompactPage>> cached = cache_->loadForDocument(document, key);
        if (cached && !cached->empty()) {
            pages_.clear();
            pages_.reserve(cached->size());
            for (const CompactPage& page : *cached) pages_.push_back(PageRecord::fromCompact(page));
            rebuildIndex();
            loadedFromCache_ = true;
            if (progress) progress(document.chapterCount(), document.chapterCount());
            FOLIO_LOG_DEBUG("page map %s loaded from cache (%zu pages)", key.c_str(), pages_.size());
            return;
        }
    }

    DynamicPageMapBuilder builder(formatting_);
    pages_ = builder.build(document, layout_.columnWidth, layout_.linesPerPage, options, progress);
    rebuildIndex();
    FOLIO_LOG_DEBUG("page map built in %.1f ms (%zu pages)", nowMs() - started, pages_.size());

    if (cache_) {
        std::vector<CompactPage> compact;
        compact.reserve(pages_.size());
        for (const PageRecord& page : pages_) compact.push_back(page.compact());
        if (!cache_->saveForDocument(document, key, compact)) {
            FOLIO_LOG_WARN("page map %s was not persisted", key.c_str());
        }
    }
}

std::vector<std::int32_t> PageCalculator::buildAbsoluteMap(std::int32_t width, std::int32_t height,
                                                           Document& document, const LayoutConfig& config,
                                                           const ProgressCallback& progress) {
    layout_ = computeLayoutMetrics(width, height, config.viewMode, config.lineSpacing);
    document_ = &document;
    pages_.clear();
    chapterIndex_.clear();

    AbsolutePageMapBuilder builder(formatting_);
    absolutePages_ = builder.build(document, layout_.columnWidth, layout_.linesPerPage, wrapOptions(), progress);
    return absolutePages_;
}

void PageCalculator::rebuildIndex() {
    chapterIndex_.clear();
    for (std::size_t i = 0; i < pages_.size(); ++i) {
        const std::int32_t chapter = pages_[i].chapterIndex;
        if (chapter < 0) continue;
        if (static_cast<std::size_t>(chapter) >= chapterIndex_.size()) {
            chapterIndex_.resize(static_cast<std::size_t>(chapter) + 1);
        }
        chapterIndex_[static_cast<std::size_t>(chapter)].push_back(static_cast<std::int32_t>(i));
    }
    for (auto& indices : chapterIndex_) {
        std::stable_sort(indices.begin(), indices.end(), [this](std::int32_t a, std::int32_t b) {
            return pages_[static_cast<std::size_t>(a)].endLine < pages_[static_cast<std::size_t>(b)].endLine;
        });
    }
}

// =============================================================================
// Queries
// =============================================================================

std::optional<PageRecord> PageCalculator::getPage(std::int32_t pageIndex) {
    if (pages_.empty()) return std::nullopt;
    const std::size_t index = static_cast<std::size_t>(std::clamp(pageIndex, 0, totalPages() - 1));
    PageRecord& page = pages_[index];

    if (!page.hydrated() && document_) {
        PageRecord hydrated = page;
        if (hydrator_.hydrate(hydrated, *document_, layout_.columnWidth, wrapOptions())) {
            page = std::move(hydrated);
        } else {
            return hydrated;
        }
    }
    return page;
}

std::int32_t PageCalculator::findPageIndex(std::int32_t chapterIndex, std::int32_t lineOffset) const {
    if (chapterIndex < 0 || static_cast<std::size_t>(chapterIndex) >= chapterIndex_.size()) return 0;
    const std::vector<std::int32_t>& indices = chapterIndex_[static_cast<std::size_t>(chapterIndex)];
    if (indices.empty()) return 0;

    auto it = std::lower_bound(indices.begin(), indices.end(), lineOffset,
                               [this](std::int32_t pageIdx, std::int32_t offset) {
                                   return pages_[static_cast<std::size_t>(pageIdx)].endLine < offset;
                               });
    return it == indices.end() ? indices.back() : *it;
}

std::optional<PageInfo> PageCalculator::pageInfo(std::int32_t pageIndex) const {
    if (pages_.empty()) return std::nullopt;
    const std::int32_t index = std::clamp(pageIndex, 0, totalPages() - 1);
    const PageRecord& page = pages_[static_cast<std::size_t>(index)];
    PageInfo info;
    info.chapterIndex = page.chapterIndex;
    info.pageInChapter = page.pageInChapter;
    info.totalPagesInChapter = page.totalPagesInChapter;
    info.globalPage = index + 1;
    info.totalPages = totalPages();
    return info;
}

PendingProgress PageCalculator::captureProgress(std::int32_t pageIndex) const {
    PendingProgress pending;
    if (pages_.empty()) return pending;
    const PageRecord& page = pages_[static_cast<std::size_t>(std::clamp(pageIndex, 0, totalPages() - 1))];
    pending.chapterIndex = page.chapterIndex;
    pending.lineOffset = page.startLine;
    pending.pageInChapter = page.pageInChapter;
    return pending;
}

std::int32_t PageCalculator::restorePosition(const PendingProgress& pending) const {
    if (pending.lineOffset) return findPageIndex(pending.chapterIndex, *pending.lineOffset);
    if (pending.pageInChapter) {
        const std::int32_t estimate = *pending.pageInChapter * std::max(layout_.linesPerPage, 1);
        return findPageIndex(pending.chapterIndex, estimate);
    }
    return findPageIndex(pending.chapterIndex, 0);
}

} // namespace folio::pagination
