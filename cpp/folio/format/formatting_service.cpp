#include "folio/format/formatting_service.h"
#include "folio/core/logging.h"
#include "folio/core/string_utils.h"
#include "folio/format/line_assembler.h"
#include "folio/format/plain_lines_builder.h"

#include <algorithm>
#include <exception>
#include <iterator>

namespace folio::format {

using text::BlockType;
using text::ContentBlock;
using text::DisplayLines;
using text::TextSegment;

std::string WrapOptions::cacheKey(std::int32_t width) const {
    std::string key = std::to_string(width);
    key += '|';
    key += toString(variant);
    if (variant == RenderVariant::Images && maxImageRows && *maxImageRows > 0) {
        key += '|';
        key += std::to_string(*maxImageRows);
    }
    return key;
}

FormattingService::FormattingService(std::shared_ptr<const ChapterParser> parser, const text::TextMetrics& metrics)
    : parser_(std::move(parser)), metrics_(metrics) {}

std::string FormattingService::chapterKey(const Document& document, std::int32_t chapterIndex) {
    return document.canonicalPath() + ":" + std::to_string(chapterIndex);
}

// =============================================================================
// Parse cache
// =============================================================================

BlockListPtr FormattingService::ensureFormatted(Document& document, std::int32_t chapterIndex, Chapter* chapter) {
    if (!chapter) chapter = document.getChapter(chapterIndex);
    if (!chapter) return nullptr;

    const std::optional<std::string> raw = chapter->rawContent();
    if (!raw || raw->empty()) return nullptr;

    const std::string key = chapterKey(document, chapterIndex);
    const std::uint64_t checksum = contentChecksum(*raw);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = parseCache_.find(key);
        if (it != parseCache_.end() && it->second.checksum == checksum) {
            const ParsedChapter cached = it->second;
            if (cached.blocks) applyToChapter(*chapter, cached);
            return cached.blocks;
        }
    }

    ParsedChapter parsed;
    parsed.checksum = checksum;
    if (parser_) {
        try {
            auto blocks = std::make_shared<BlockList>(parser_->parse(*raw));
            parsed.plainLines = std::make_shared<const std::vector<std::string>>(PlainLinesBuilder::build(*blocks));
            parsed.blocks = std::move(blocks);
            ++parses_;
        } catch (const std::exception& e) {
            ++parseFailures_;
            FOLIO_LOG_WARN("chapter %d of %s failed to parse: %s", chapterIndex,
                           document.canonicalPath().c_str(), e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = parseCache_.find(key);
        if (it != parseCache_.end() && it->second.checksum == checksum) {
            // Another caller stored this content first.
            parsed = it->second;
        } else {
            parseCache_[key] = parsed;
            wrapCache_.erase(key);
            FOLIO_LOG_DEBUG("parsed %s (%s)", key.c_str(), toHex(checksum).c_str());
        }
    }

    if (parsed.blocks) applyToChapter(*chapter, parsed);
    return parsed.blocks;
}

void FormattingService::applyToChapter(Chapter& chapter, const ParsedChapter& parsed) const {
    if (chapter.blocks() != parsed.blocks) chapter.setBlocks(parsed.blocks);
    if (parsed.plainLines && chapter.lines().empty()) chapter.setLines(*parsed.plainLines);
}

// =============================================================================
// Wrap cache
// =============================================================================

DisplayLinesPtr FormattingService::wrapAll(Document& document, std::int32_t chapterIndex, std::int32_t width,
                                           const WrapOptions& options) {
    static const DisplayLinesPtr kEmpty = std::make_shared<const DisplayLines>();
    if (width <= 0) return kEmpty;

    Chapter* chapter = document.getChapter(chapterIndex);
    if (!chapter) return kEmpty;

    const BlockListPtr blocks = ensureFormatted(document, chapterIndex, chapter);
    const std::string key = chapterKey(document, chapterIndex);
    const std::string wrapKey = options.cacheKey(width);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto bucket = wrapCache_.find(key);
        if (bucket != wrapCache_.end()) {
            auto hit = bucket->second.find(wrapKey);
            if (hit != bucket->second.end()) {
                ++wrapHits_;
                return hit->second;
            }
        }
    }

    DisplayLinesPtr built;
    if (blocks) {
        AssemblerOptions assemblerOptions;
        assemblerOptions.variant = options.variant;
        assemblerOptions.maxImageRows = options.maxImageRows;
        assemblerOptions.chapterIndex = chapterIndex;
        assemblerOptions.chapterSeed = key;
        LineAssembler assembler(metrics_);
        built = std::make_shared<const DisplayLines>(assembler.build(*blocks, width, assemblerOptions));
    } else {
        built = std::make_shared<const DisplayLines>(buildFallbackLines(*chapter, chapterIndex, width));
    }
    ++wraps_;

    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = wrapCache_[key];
    auto inserted = bucket.emplace(wrapKey, built);
    return inserted.first->second;
}

DisplayLines FormattingService::wrapWindow(Document& document, std::int32_t chapterIndex, std::int32_t width,
                                           std::int32_t offset, std::int32_t length, const WrapOptions& options) {
    if (width <= 0 || length <= 0) return {};

    const DisplayLinesPtr lines = wrapAll(document, chapterIndex, width, options);
    const std::size_t start = static_cast<std::size_t>(std::max(offset, 0));
    if (start >= lines->size()) return {};
    const std::size_t end = std::min(lines->size(), start + static_cast<std::size_t>(length));
    return DisplayLines(lines->begin() + static_cast<std::ptrdiff_t>(start),
                        lines->begin() + static_cast<std::ptrdiff_t>(end));
}

DisplayLines FormattingService::buildFallbackLines(Chapter& chapter, std::int32_t chapterIndex,
                                                   std::int32_t width) const {
    std::vector<std::string> plain = chapter.lines();
    if (plain.empty()) {
        const std::optional<std::string> raw = chapter.rawContent();
        if (raw) plain = splitLines(*raw);
    }

    AssemblerOptions assemblerOptions;
    assemblerOptions.chapterIndex = chapterIndex;
    LineAssembler assembler(metrics_);

    DisplayLines out;
    for (const std::string& row : plain) {
        ContentBlock block;
        block.type = BlockType::Paragraph;
        block.segments.push_back(TextSegment{row, {}});
        DisplayLines wrapped = assembler.build({block}, width, assemblerOptions);
        if (wrapped.empty()) {
            text::DisplayLine blank;
            blank.metadata.chapterIndex = chapterIndex;
            out.push_back(std::move(blank));
            continue;
        }
        for (auto& line : wrapped) out.push_back(std::move(line));
    }
    return out;
}

// =============================================================================
// Invalidation / introspection
// =============================================================================

void FormattingService::invalidate(const Document& document) {
    const std::string prefix = document.canonicalPath() + ":";
    auto owned = [&](const std::string& key) { return key.compare(0, prefix.size(), prefix) == 0; };

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = parseCache_.begin(); it != parseCache_.end();) {
        it = owned(it->first) ? parseCache_.erase(it) : std::next(it);
    }
    for (auto it = wrapCache_.begin(); it != wrapCache_.end();) {
        it = owned(it->first) ? wrapCache_.erase(it) : std::next(it);
    }
}

void FormattingService::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    parseCache_.clear();
    wrapCache_.clear();
}

std::uint64_t FormattingService::checksumFor(Document& document, std::int32_t chapterIndex) const {
    const Chapter* chapter = document.getChapter(chapterIndex);
    if (!chapter) return 0;
    const std::optional<std::string> raw = chapter->rawContent();
    return raw && !raw->empty() ? contentChecksum(*raw) : 0;
}

bool FormattingService::hasWrapped(const Document& document, std::int32_t chapterIndex, std::int32_t width,
                                   const WrapOptions& options) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bucket = wrapCache_.find(chapterKey(document, chapterIndex));
    if (bucket == wrapCache_.end()) return false;
    return bucket->second.count(options.cacheKey(width)) > 0;
}

FormattingService::Stats FormattingService::stats() const {
    Stats s;
    s.parses = parses_.load();
    s.parseFailures = parseFailures_.load();
    s.wraps = wraps_.load();
    s.wrapHits = wrapHits_.load();
    return s;
}

} // namespace folio::format
