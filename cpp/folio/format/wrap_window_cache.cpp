#include "folio/format/wrap_window_cache.h"
#include "folio/core/logging.h"
#include "folio/core/string_utils.h"

#include <algorithm>
#include <exception>

namespace folio::format {

using text::DisplayLines;

WrapWindowCache::WrapWindowCache(FormattingService& formatting, std::uint32_t prefetchPages)
    : formatting_(formatting), prefetchPages_(prefetchPages) {
    worker_ = std::thread([this]() { workerLoop(); });
}

WrapWindowCache::~WrapWindowCache() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopping_ = true;
        queue_.clear();
        queuedKeys_.clear();
    }
    queueCv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

std::string WrapWindowCache::windowKey(const Document& document, std::int32_t chapterIndex, std::uint64_t checksum,
                                       std::int32_t width, std::int32_t offset, std::int32_t length,
                                       const WrapOptions& options) {
    return FormattingService::chapterKey(document, chapterIndex) + "@" + toHex(checksum) + "|"
        + options.cacheKey(width) + "|"
        + std::to_string(offset) + "+" + std::to_string(length);
}

DisplayLines WrapWindowCache::fetch(const std::shared_ptr<Document>& document, std::int32_t chapterIndex,
                                    std::int32_t width, std::int32_t offset, std::int32_t length,
                                    const WrapOptions& options) {
    if (!document || width <= 0 || length <= 0) return {};
    offset = std::max(offset, 0);

    const std::uint64_t checksum = formatting_.checksumFor(*document, chapterIndex);
    const std::string key = windowKey(*document, chapterIndex, checksum, width, offset, length, options);
    DisplayLines lines;
    bool hit = false;
    {
        std::lock_guard<std::mutex> lock(windowMutex_);
        auto it = windows_.find(key);
        if (it != windows_.end()) {
            lines = it->second;
            hit = true;
        }
    }
    if (!hit) {
        lines = formatting_.wrapWindow(*document, chapterIndex, width, offset, length, options);
        storeWindow(key, lines);
    }

    if (prefetchPages_ > 0) schedulePrefetch(document, chapterIndex, width, offset, length, options);
    return lines;
}

DisplayLines WrapWindowCache::fetchWithOffset(const std::shared_ptr<Document>& document, std::int32_t chapterIndex,
                                              std::int32_t width, std::int32_t& offset, std::int32_t length,
                                              const WrapOptions& options) {
    if (document && width > 0 && offset > 0) {
        const DisplayLinesPtr all = formatting_.wrapAll(*document, chapterIndex, width, options);
        const std::size_t at = static_cast<std::size_t>(offset);
        if (at < all->size()) {
            const text::DisplayLine& line = (*all)[at];
            if (line.metadata.image && line.metadata.image->lineIndex > 0) {
                offset -= static_cast<std::int32_t>(std::min<std::uint32_t>(line.metadata.image->lineIndex,
                                                                           static_cast<std::uint32_t>(offset)));
            }
        }
    }
    return fetch(document, chapterIndex, width, offset, length, options);
}

bool WrapWindowCache::hasWindow(Document& document, std::int32_t chapterIndex, std::int32_t width,
                                std::int32_t offset, std::int32_t length, const WrapOptions& options) const {
    const std::string key = windowKey(document, chapterIndex, formatting_.checksumFor(document, chapterIndex),
                                      width, offset, length, options);
    std::lock_guard<std::mutex> lock(windowMutex_);
    return windows_.count(key) > 0;
}

void WrapWindowCache::storeWindow(const std::string& key, DisplayLines lines) {
    std::lock_guard<std::mutex> lock(windowMutex_);
    if (windows_.size() >= kMaxWindows && windows_.count(key) == 0) {
        FOLIO_LOG_DEBUG("window cache full, dropping %zu windows", windows_.size());
        windows_.clear();
    }
    windows_.emplace(key, std::move(lines));
}

void WrapWindowCache::clear() {
    std::lock_guard<std::mutex> lock(windowMutex_);
    windows_.clear();
}

std::size_t WrapWindowCache::windowCount() const {
    std::lock_guard<std::mutex> lock(windowMutex_);
    return windows_.size();
}

// =============================================================================
// Prefetch
// =============================================================================

void WrapWindowCache::schedulePrefetch(const std::shared_ptr<Document>& document, std::int32_t chapterIndex,
                                       std::int32_t width, std::int32_t offset, std::int32_t length,
                                       const WrapOptions& options) {
    PrefetchJob job;
    job.document = document;
    job.chapterIndex = chapterIndex;
    job.width = width;
    job.offset = offset;
    job.length = length;
    job.options = options;
    job.key = windowKey(*document, chapterIndex, formatting_.checksumFor(*document, chapterIndex), width, offset,
                        length, options);

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stopping_ || !queuedKeys_.insert(job.key).second) return;
        queue_.push_back(std::move(job));
    }
    queueCv_.notify_one();
}

void WrapWindowCache::runPrefetch(const PrefetchJob& job) {
    std::shared_ptr<Document> document = job.document.lock();
    if (!document) return;

    const std::uint64_t checksum = formatting_.checksumFor(*document, job.chapterIndex);
    const DisplayLinesPtr all = formatting_.wrapAll(*document, job.chapterIndex, job.width, job.options);
    const std::int64_t total = static_cast<std::int64_t>(all->size());
    const std::int64_t pages = static_cast<std::int64_t>(prefetchPages_.load());
    const std::int64_t span = pages * job.length;
    const std::int64_t start = std::max<std::int64_t>(job.offset - span, 0);
    const std::int64_t end = job.offset + span + job.length - 1;

    for (std::int64_t k = -pages; k <= pages; ++k) {
        const std::int64_t windowStart = job.offset + k * job.length;
        if (k == 0 || windowStart < start || windowStart > end || windowStart >= total) continue;
        const std::int32_t offset = static_cast<std::int32_t>(windowStart);
        const std::string key =
            windowKey(*document, job.chapterIndex, checksum, job.width, offset, job.length, job.options);
        {
            std::lock_guard<std::mutex> lock(windowMutex_);
            if (windows_.count(key) > 0) continue;
        }
        const std::size_t from = static_cast<std::size_t>(windowStart);
        const std::size_t to = std::min(all->size(), from + static_cast<std::size_t>(job.length));
        storeWindow(key, DisplayLines(all->begin() + static_cast<std::ptrdiff_t>(from),
                                      all->begin() + static_cast<std::ptrdiff_t>(to)));
    }
}

void WrapWindowCache::workerLoop() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    while (true) {
        queueCv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (stopping_) break;

        PrefetchJob job = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
        lock.unlock();

        try {
            runPrefetch(job);
        } catch (const std::exception& e) {
            FOLIO_LOG_WARN("prefetch of %s failed: %s", job.key.c_str(), e.what());
        } catch (...) {
            FOLIO_LOG_WARN("prefetch of %s failed: unknown exception", job.key.c_str());
        }

        lock.lock();
        queuedKeys_.erase(job.key);
        busy_ = false;
        if (queue_.empty()) idleCv_.notify_all();
    }
    busy_ = false;
    idleCv_.notify_all();
}

void WrapWindowCache::waitIdle() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idleCv_.wait(lock, [this]() { return stopping_ || (queue_.empty() && !busy_); });
}

} // namespace folio::format
