#include "folio/text/text_metrics.h"
#include "folio/core/logging.h"
#include "folio/core/string_utils.h"

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace folio::text {

namespace {

constexpr std::string_view kSoftHyphen = "\xC2\xAD";

bool isAscii(std::string_view text) {
    for (char c : text) {
        if (static_cast<unsigned char>(c) >= 0x80) return false;
    }
    return true;
}

// Calls fn(plainRun) / fn(escape) in order, distinguishing the two by `isEscape`.
template <typename Fn>
void forEachAnsiRun(std::string_view text, Fn&& fn) {
    std::size_t runStart = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != '\x1b') {
            ++pos;
            continue;
        }
        const std::size_t len = TextMetrics::csiLength(text, pos);
        if (pos > runStart) fn(text.substr(runStart, pos - runStart), false);
        if (len > 0) {
            fn(text.substr(pos, len), true);
            pos += len;
        } else {
            // Lone ESC without a valid sequence is dropped.
            pos += 1;
        }
        runStart = pos;
    }
    if (runStart < text.size()) fn(text.substr(runStart), false);
}

} // namespace

// =============================================================================
// TextMetrics
// =============================================================================

std::size_t TextMetrics::csiLength(std::string_view text, std::size_t pos) {
    if (pos + 1 >= text.size() || text[pos] != '\x1b' || text[pos + 1] != '[') return 0;
    std::size_t i = pos + 2;
    while (i < text.size() && text[i] >= 0x30 && text[i] <= 0x3F) ++i;
    while (i < text.size() && text[i] >= 0x20 && text[i] <= 0x2F) ++i;
    if (i >= text.size() || text[i] < 0x40 || text[i] > 0x7E) return 0;
    return i + 1 - pos;
}

std::string TextMetrics::stripAnsi(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t len = csiLength(text, pos);
        if (len > 0) {
            pos += len;
            continue;
        }
        out.push_back(text[pos]);
        ++pos;
    }
    return out;
}

std::string TextMetrics::expandTabs(std::string_view text) const {
    if (text.find('\t') == std::string_view::npos) return std::string(text);

    std::string out;
    std::uint32_t column = 0;
    for (const std::string& cluster : graphemeClusters(text)) {
        if (cluster == "\t") {
            const std::uint32_t spaces = kTabSize - (column % kTabSize);
            out.append(spaces, ' ');
            column += spaces;
        } else {
            out += cluster;
            column += displayWidthFor(cluster);
        }
    }
    return out;
}

std::vector<LineCell> TextMetrics::cellDataFor(std::string_view text) const {
    const std::string expanded = expandTabs(text);
    std::vector<LineCell> cells;
    std::uint32_t charIndex = 0;
    std::uint32_t screenX = 0;
    for (std::string& cluster : graphemeClusters(expanded)) {
        const std::uint32_t len = static_cast<std::uint32_t>(cluster.size());
        const std::uint32_t width = displayWidthFor(cluster);
        LineCell cell;
        cell.charStart = charIndex;
        cell.charEnd = charIndex + len;
        cell.displayWidth = width;
        cell.screenX = screenX;
        cell.cluster = std::move(cluster);
        cells.push_back(std::move(cell));
        charIndex += len;
        screenX += width;
    }
    return cells;
}

std::uint32_t TextMetrics::visibleLength(std::string_view text) const {
    const std::string plain = stripAnsi(text);
    if (isAscii(plain) && plain.find_first_of("\t\r") == std::string::npos) {
        return static_cast<std::uint32_t>(plain.size());
    }
    std::uint32_t total = 0;
    for (const LineCell& cell : cellDataFor(plain)) total += cell.displayWidth;
    return total;
}

std::string TextMetrics::truncateTo(std::string_view text, std::int32_t width, std::uint32_t startColumn) const {
    if (width <= 0 || text.empty()) return {};
    const std::uint32_t maxWidth = static_cast<std::uint32_t>(width);

    if (text.find_first_of("\t\n\r") == std::string_view::npos && visibleLength(text) <= maxWidth) {
        return std::string(text);
    }

    std::string out;
    std::uint32_t current = 0;
    std::uint32_t column = startColumn;
    bool full = false;

    forEachAnsiRun(text, [&](std::string_view run, bool isEscape) {
        if (isEscape) {
            out.append(run);
            return;
        }
        if (full) return;
        for (const std::string& cluster : graphemeClusters(run)) {
            const std::uint32_t remaining = maxWidth - current;
            if (remaining == 0) {
                full = true;
                return;
            }
            if (cluster == "\t") {
                const std::uint32_t spaces = kTabSize - (column % kTabSize);
                const std::uint32_t take = spaces < remaining ? spaces : remaining;
                out.append(take, ' ');
                current += take;
                column += take;
            } else if (cluster == "\n" || cluster == "\r" || cluster == "\r\n") {
                out.push_back(' ');
                current += 1;
                column += 1;
            } else {
                const std::uint32_t w = displayWidthFor(cluster);
                if (w > remaining) {
                    full = true;
                    return;
                }
                out += cluster;
                current += w;
                column += w;
            }
        }
    });
    return out;
}

std::string TextMetrics::padRight(std::string_view text, std::int32_t width, std::uint32_t startColumn) const {
    if (width <= 0) return {};
    std::string clipped = truncateTo(text, width, startColumn);
    const std::uint32_t visible = visibleLength(clipped);
    if (visible < static_cast<std::uint32_t>(width)) {
        clipped.append(static_cast<std::uint32_t>(width) - visible, ' ');
    }
    return clipped;
}

// =============================================================================
// UnicodeTextMetrics
// =============================================================================

UnicodeTextMetrics::UnicodeTextMetrics() {
    UErrorCode status = U_ZERO_ERROR;
    iterator_.reset(icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
    if (U_FAILURE(status)) {
        FOLIO_LOG_ERROR("grapheme iterator unavailable: %s", u_errorName(status));
        iterator_.reset();
    }
}

UnicodeTextMetrics::~UnicodeTextMetrics() = default;

std::vector<std::string> UnicodeTextMetrics::graphemeClusters(std::string_view text) const {
    std::vector<std::string> out;
    if (text.empty()) return out;

    if (isAscii(text)) {
        out.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                out.emplace_back("\r\n");
                ++i;
            } else {
                out.emplace_back(1, text[i]);
            }
        }
        return out;
    }

    // Decode ourselves so every UTF-16 index maps back to a byte offset.
    icu::UnicodeString ustr;
    std::vector<std::uint32_t> byteAt;
    byteAt.reserve(text.size() + 1);
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(text, pos, byteLen);
        if (byteLen == 0) break;
        ustr.append(static_cast<UChar32>(cp));
        const std::size_t units = cp > 0xFFFF ? 2 : 1;
        for (std::size_t u = 0; u < units; ++u) byteAt.push_back(static_cast<std::uint32_t>(pos));
        pos += byteLen;
    }
    byteAt.push_back(static_cast<std::uint32_t>(text.size()));

    if (!iterator_) {
        // Code point fallback.
        for (std::size_t i = 0; i + 1 < byteAt.size(); ++i) {
            if (byteAt[i + 1] != byteAt[i]) out.emplace_back(text.substr(byteAt[i], byteAt[i + 1] - byteAt[i]));
        }
        return out;
    }

    std::lock_guard<std::mutex> lock(iteratorMutex_);
    iterator_->setText(ustr);
    std::int32_t start = iterator_->first();
    for (std::int32_t end = iterator_->next(); end != icu::BreakIterator::DONE; start = end, end = iterator_->next()) {
        const std::uint32_t b0 = byteAt[static_cast<std::size_t>(start)];
        const std::uint32_t b1 = byteAt[static_cast<std::size_t>(end)];
        out.emplace_back(text.substr(b0, b1 - b0));
    }
    return out;
}

std::uint32_t UnicodeTextMetrics::displayWidthFor(std::string_view cluster) const {
    if (cluster.empty()) return 0;
    if (cluster == "\t") return kTabSize;
    if (cluster == kSoftHyphen) return 0;

    std::uint32_t byteLen = 0;
    const UChar32 cp = static_cast<UChar32>(decodeUtf8Codepoint(cluster, 0, byteLen));

    std::uint32_t width = 1;
    const std::int32_t eaw = u_getIntPropertyValue(cp, UCHAR_EAST_ASIAN_WIDTH);
    if (eaw == U_EA_WIDE || eaw == U_EA_FULLWIDTH) {
        width = 2;
    } else if (u_hasBinaryProperty(cp, UCHAR_EMOJI_PRESENTATION)) {
        width = 2;
    } else if (u_hasBinaryProperty(cp, UCHAR_EMOJI) && cluster.find("\xEF\xB8\x8F") != std::string_view::npos) {
        // VS16 requests emoji presentation.
        width = 2;
    } else {
        const std::int8_t category = u_charType(cp);
        if (category == U_NON_SPACING_MARK || category == U_ENCLOSING_MARK
            || category == U_FORMAT_CHAR || category == U_CONTROL_CHAR) {
            width = 0;
        }
    }

    // A stray mark or control still advances the terminal cursor.
    if (width == 0) width = 1;
    return width;
}

const TextMetrics& defaultTextMetrics() {
    static const UnicodeTextMetrics metrics;
    return metrics;
}

} // namespace folio::text
