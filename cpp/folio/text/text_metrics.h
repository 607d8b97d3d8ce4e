#ifndef FOLIO_TEXT_TEXT_METRICS_H
#define FOLIO_TEXT_TEXT_METRICS_H

#include "folio/text/text_types.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <unicode/uversion.h>

U_NAMESPACE_BEGIN
class BreakIterator;
U_NAMESPACE_END

namespace folio::text {

constexpr std::uint32_t kTabSize = 4;

/**
 * TextMetrics: terminal cell measurement of UTF-8 text.
 *
 * Subclasses supply grapheme segmentation and per-cluster width; every other
 * operation (ANSI stripping, tab expansion, truncation, cell layout) is built
 * on those two primitives.
 */
class TextMetrics {
public:
    virtual ~TextMetrics() = default;

    /**
     * Split plain text (no escape sequences) into grapheme clusters.
     */
    virtual std::vector<std::string> graphemeClusters(std::string_view text) const = 0;

    /**
     * Terminal columns occupied by one cluster.
     * Tab is kTabSize, soft hyphen is 0, any other non-empty cluster is at least 1.
     */
    virtual std::uint32_t displayWidthFor(std::string_view cluster) const = 0;

    /**
     * Visible width of `text`, ignoring CSI escape sequences.
     */
    std::uint32_t visibleLength(std::string_view text) const;

    /**
     * Per-cluster layout of `text` after tab expansion.
     * Offsets in the returned cells refer to the expanded text.
     */
    std::vector<LineCell> cellDataFor(std::string_view text) const;

    /**
     * Clip `text` to `width` columns without splitting a cluster.
     * CSI sequences are kept verbatim, tabs expand relative to `startColumn`
     * and line breaks become a single space.
     */
    std::string truncateTo(std::string_view text, std::int32_t width, std::uint32_t startColumn = 0) const;

    /**
     * Truncate then pad with spaces up to `width`.
     */
    std::string padRight(std::string_view text, std::int32_t width, std::uint32_t startColumn = 0) const;

    std::string expandTabs(std::string_view text) const;

    static std::string stripAnsi(std::string_view text);

    /**
     * Length of the CSI sequence starting at `pos`, or 0 when there is none.
     */
    static std::size_t csiLength(std::string_view text, std::size_t pos);
};

/**
 * ICU backed metrics: extended grapheme clusters from icu::BreakIterator,
 * widths from the East Asian Width and Emoji_Presentation properties.
 */
class UnicodeTextMetrics : public TextMetrics {
public:
    UnicodeTextMetrics();
    ~UnicodeTextMetrics() override;

    UnicodeTextMetrics(const UnicodeTextMetrics&) = delete;
    UnicodeTextMetrics& operator=(const UnicodeTextMetrics&) = delete;

    std::vector<std::string> graphemeClusters(std::string_view text) const override;
    std::uint32_t displayWidthFor(std::string_view cluster) const override;

private:
    mutable std::mutex iteratorMutex_;
    std::unique_ptr<icu::BreakIterator> iterator_;
};

/**
 * Process-wide default metrics instance.
 */
const TextMetrics& defaultTextMetrics();

} // namespace folio::text

#endif // FOLIO_TEXT_TEXT_METRICS_H
