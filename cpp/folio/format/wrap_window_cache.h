#ifndef FOLIO_FORMAT_WRAP_WINDOW_CACHE_H
#define FOLIO_FORMAT_WRAP_WINDOW_CACHE_H

#include "folio/format/formatting_service.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace folio::format {

/**
 * WrapWindowCache: window-level cache in front of FormattingService with a
 * background prefetcher.
 *
 * After serving a window, `prefetchPages` windows before and after it are
 * queued for a single worker thread owned by the cache. Jobs for a window
 * already queued are coalesced; a job that throws is logged and dropped.
 * Documents are held weakly so a closed book is skipped, not kept alive.
 * Window keys carry the chapter's content checksum, so windows of replaced
 * content are never served.
 */
class WrapWindowCache {
public:
    static constexpr std::size_t kMaxWindows = 1024;

    explicit WrapWindowCache(FormattingService& formatting, std::uint32_t prefetchPages = kDefaultPrefetchPages);
    ~WrapWindowCache();

    WrapWindowCache(const WrapWindowCache&) = delete;
    WrapWindowCache& operator=(const WrapWindowCache&) = delete;

    /**
     * Lines [offset, offset + length) of the chapter; schedules a prefetch
     * around the window when prefetching is enabled.
     */
    text::DisplayLines fetch(const std::shared_ptr<Document>& document, std::int32_t chapterIndex,
                             std::int32_t width, std::int32_t offset, std::int32_t length,
                             const WrapOptions& options = {});

    /**
     * Like fetch(), but first moves `offset` back to the first row of an
     * image placeholder it lands inside.
     */
    text::DisplayLines fetchWithOffset(const std::shared_ptr<Document>& document, std::int32_t chapterIndex,
                                       std::int32_t width, std::int32_t& offset, std::int32_t length,
                                       const WrapOptions& options = {});

    bool hasWindow(Document& document, std::int32_t chapterIndex, std::int32_t width,
                   std::int32_t offset, std::int32_t length, const WrapOptions& options) const;

    /**
     * Block until the prefetch queue is drained.
     */
    void waitIdle();

    void setPrefetchPages(std::uint32_t pages) { prefetchPages_ = pages; }
    void clear();
    std::size_t windowCount() const;

private:
    struct PrefetchJob {
        std::weak_ptr<Document> document;
        std::int32_t chapterIndex{0};
        std::int32_t width{0};
        std::int32_t offset{0};
        std::int32_t length{0};
        WrapOptions options;
        std::string key;
    };

    static std::string windowKey(const Document& document, std::int32_t chapterIndex, std::uint64_t checksum,
                                 std::int32_t width, std::int32_t offset, std::int32_t length,
                                 const WrapOptions& options);

    void storeWindow(const std::string& key, text::DisplayLines lines);
    void schedulePrefetch(const std::shared_ptr<Document>& document, std::int32_t chapterIndex,
                          std::int32_t width, std::int32_t offset, std::int32_t length,
                          const WrapOptions& options);
    void runPrefetch(const PrefetchJob& job);
    void workerLoop();

    FormattingService& formatting_;
    std::atomic<std::uint32_t> prefetchPages_;

    mutable std::mutex windowMutex_;
    std::unordered_map<std::string, text::DisplayLines> windows_;

    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::condition_variable idleCv_;
    std::deque<PrefetchJob> queue_;
    std::unordered_set<std::string> queuedKeys_;
    bool busy_{false};
    bool stopping_{false};
    std::thread worker_;
};

} // namespace folio::format

#endif // FOLIO_FORMAT_WRAP_WINDOW_CACHE_H
