#ifndef FOLIO_DOCUMENT_H
#define FOLIO_DOCUMENT_H

#include "folio/text/text_types.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace folio {

using BlockList = std::vector<text::ContentBlock>;
using BlockListPtr = std::shared_ptr<const BlockList>;

/**
 * Chapter: source text of one spine item.
 *
 * The formatting service memoizes parsed blocks and plain lines onto the
 * chapter through the setters. Implementations must tolerate those setters
 * being called from the prefetch worker.
 */
class Chapter {
public:
    virtual ~Chapter() = default;

    virtual std::optional<std::string> rawContent() const = 0;
    virtual std::string title() const { return {}; }

    // Plain fallback representation.
    virtual std::vector<std::string> lines() const = 0;
    virtual void setLines(std::vector<std::string> lines) = 0;

    virtual BlockListPtr blocks() const = 0;
    virtual void setBlocks(BlockListPtr blocks) = 0;
};

class Document {
public:
    virtual ~Document() = default;

    /**
     * @return nullptr when `index` is out of range
     */
    virtual Chapter* getChapter(std::int32_t index) = 0;
    virtual std::int32_t chapterCount() const = 0;

    // Stable identity used to namespace every cache entry.
    virtual std::string canonicalPath() const = 0;
};

// =============================================================================
// In-memory implementations
// =============================================================================

class MemoryChapter : public Chapter {
public:
    MemoryChapter() = default;
    explicit MemoryChapter(std::optional<std::string> raw, std::string title = {});

    std::optional<std::string> rawContent() const override;
    std::string title() const override { return title_; }
    std::vector<std::string> lines() const override;
    void setLines(std::vector<std::string> lines) override;
    BlockListPtr blocks() const override;
    void setBlocks(BlockListPtr blocks) override;

    void setRawContent(std::optional<std::string> raw);

private:
    mutable std::mutex mutex_;
    std::optional<std::string> raw_;
    std::string title_;
    std::vector<std::string> lines_;
    BlockListPtr blocks_;
};

class MemoryDocument : public Document {
public:
    explicit MemoryDocument(std::string canonicalPath);

    MemoryChapter& addChapter(std::optional<std::string> raw, std::string title = {});

    Chapter* getChapter(std::int32_t index) override;
    std::int32_t chapterCount() const override;
    std::string canonicalPath() const override { return canonicalPath_; }

private:
    std::string canonicalPath_;
    std::vector<std::unique_ptr<MemoryChapter>> chapters_;
};

} // namespace folio

#endif // FOLIO_DOCUMENT_H
