#include "folio/document.h"

namespace folio {

MemoryChapter::MemoryChapter(std::optional<std::string> raw, std::string title)
    : raw_(std::move(raw)), title_(std::move(title)) {}

std::optional<std::string> MemoryChapter::rawContent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return raw_;
}

void MemoryChapter::setRawContent(std::optional<std::string> raw) {
    std::lock_guard<std::mutex> lock(mutex_);
    raw_ = std::move(raw);
}

std::vector<std::string> MemoryChapter::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

void MemoryChapter::setLines(std::vector<std::string> lines) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_ = std::move(lines);
}

BlockListPtr MemoryChapter::blocks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocks_;
}

void MemoryChapter::setBlocks(BlockListPtr blocks) {
    std::lock_guard<std::mutex> lock(mutex_);
    blocks_ = std::move(blocks);
}

MemoryDocument::MemoryDocument(std::string canonicalPath)
    : canonicalPath_(std::move(canonicalPath)) {}

MemoryChapter& MemoryDocument::addChapter(std::optional<std::string> raw, std::string title) {
    chapters_.push_back(std::make_unique<MemoryChapter>(std::move(raw), std::move(title)));
    return *chapters_.back();
}

Chapter* MemoryDocument::getChapter(std::int32_t index) {
    if (index < 0 || static_cast<std::size_t>(index) >= chapters_.size()) return nullptr;
    return chapters_[static_cast<std::size_t>(index)].get();
}

std::int32_t MemoryDocument::chapterCount() const {
    return static_cast<std::int32_t>(chapters_.size());
}

} // namespace folio
