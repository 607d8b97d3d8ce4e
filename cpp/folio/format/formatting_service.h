#ifndef FOLIO_FORMAT_FORMATTING_SERVICE_H
#define FOLIO_FORMAT_FORMATTING_SERVICE_H

#include "folio/document.h"
#include "folio/format/chapter_parser.h"
#include "folio/text/text_metrics.h"
#include "folio/types.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace folio::format {

using DisplayLinesPtr = std::shared_ptr<const text::DisplayLines>;

struct WrapOptions {
    RenderVariant variant{RenderVariant::Text};
    std::optional<std::uint32_t> maxImageRows; // lines-per-page hint, Images only

    // Composite wrap cache key: "width|txt", "width|img" or "width|img|rows".
    std::string cacheKey(std::int32_t width) const;
};

/**
 * FormattingService: parse cache and wrap cache for chapter content.
 *
 * Parse cache  "<canonical_path>:<chapter>" -> blocks + content checksum
 * Wrap cache   same chapter key -> { WrapOptions::cacheKey -> lines }
 *
 * Both caches are guarded by one mutex. Parsing and wrapping run outside the
 * lock; results are inserted only if absent, so racing callers may compute
 * twice but always observe a single cached value afterwards.
 */
class FormattingService {
public:
    struct Stats {
        std::uint64_t parses{0};
        std::uint64_t parseFailures{0};
        std::uint64_t wraps{0};
        std::uint64_t wrapHits{0};
    };

    explicit FormattingService(std::shared_ptr<const ChapterParser> parser,
                               const text::TextMetrics& metrics = text::defaultTextMetrics());

    FormattingService(const FormattingService&) = delete;
    FormattingService& operator=(const FormattingService&) = delete;

    /**
     * Parse the chapter (or reuse the cached parse when its checksum still
     * matches) and memoize blocks and plain lines onto the chapter.
     * @return nullptr when the chapter has no raw content or parsing failed
     */
    BlockListPtr ensureFormatted(Document& document, std::int32_t chapterIndex, Chapter* chapter = nullptr);

    /**
     * All wrapped lines of a chapter. Repeated calls with the same width and
     * options return the same cached object.
     * Falls back to the chapter's plain lines when formatting is unavailable.
     */
    DisplayLinesPtr wrapAll(Document& document, std::int32_t chapterIndex, std::int32_t width,
                            const WrapOptions& options = {});

    /**
     * Lines [offset, offset + length) of the wrapped chapter, clamped.
     * Empty for width <= 0 or length <= 0. Never throws on out-of-range input.
     */
    text::DisplayLines wrapWindow(Document& document, std::int32_t chapterIndex, std::int32_t width,
                                  std::int32_t offset, std::int32_t length, const WrapOptions& options = {});

    /**
     * Drop every cache entry belonging to `document`.
     */
    void invalidate(const Document& document);
    void clear();

    /**
     * Checksum of the chapter's current raw content, 0 when it has none.
     */
    std::uint64_t checksumFor(Document& document, std::int32_t chapterIndex) const;

    bool hasWrapped(const Document& document, std::int32_t chapterIndex, std::int32_t width,
                    const WrapOptions& options) const;
    Stats stats() const;

    const text::TextMetrics& metrics() const { return metrics_; }

    static std::string chapterKey(const Document& document, std::int32_t chapterIndex);

private:
    struct ParsedChapter {
        std::uint64_t checksum{0};
        BlockListPtr blocks;
        std::shared_ptr<const std::vector<std::string>> plainLines;
    };

    void applyToChapter(Chapter& chapter, const ParsedChapter& parsed) const;
    text::DisplayLines buildFallbackLines(Chapter& chapter, std::int32_t chapterIndex, std::int32_t width) const;

    std::shared_ptr<const ChapterParser> parser_;
    const text::TextMetrics& metrics_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ParsedChapter> parseCache_;
    std::unordered_map<std::string, std::unordered_map<std::string, DisplayLinesPtr>> wrapCache_;

    std::atomic<std::uint64_t> parses_{0};
    std::atomic<std::uint64_t> parseFailures_{0};
    std::atomic<std::uint64_t> wraps_{0};
    std::atomic<std::uint64_t> wrapHits_{0};
};

} // namespace folio::format

#endif // FOLIO_FORMAT_FORMATTING_SERVICE_H
