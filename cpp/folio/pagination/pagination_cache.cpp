#include "folio/pagination/pagination_cache.h"
#include "folio/core/logging.h"
#include "folio/core/string_utils.h"
#include "folio/core/util.h"
#include "folio/pagination/pagination_cache_internal.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace folio::pagination {

using namespace detail;
namespace fs = std::filesystem;

std::string PaginationCache::layoutKey(std::int32_t width, std::int32_t height, ViewMode viewMode,
                                       LineSpacing lineSpacing) const {
    return std::to_string(width) + "x" + std::to_string(height) + "_" + toString(viewMode) + "_"
        + toString(lineSpacing);
}

// =============================================================================
// Codec
// =============================================================================

std::vector<std::uint8_t> encodePaginationCache(const std::string& key, const std::vector<CompactPage>& pages) {
    const std::size_t payloadBytes = pages.size() * kPageRecordBytes;
    const std::size_t headerBytes = 4 * 3 + key.size() + 4 * 2;
    std::vector<std::uint8_t> out(headerBytes + payloadBytes);

    std::size_t o = 0;
    writeU32LE(out.data(), o, kCacheMagic); o += 4;
    writeU32LE(out.data(), o, kPaginationCacheVersion); o += 4;
    writeU32LE(out.data(), o, static_cast<std::uint32_t>(key.size())); o += 4;
    std::copy(key.begin(), key.end(), out.begin() + static_cast<std::ptrdiff_t>(o)); o += key.size();
    writeU32LE(out.data(), o, static_cast<std::uint32_t>(pages.size())); o += 4;
    const std::size_t crcOffset = o; o += 4;

    const std::size_t payloadStart = o;
    for (const CompactPage& page : pages) {
        writeU32LE(out.data(), o, static_cast<std::uint32_t>(page.chapterIndex)); o += 4;
        writeU32LE(out.data(), o, static_cast<std::uint32_t>(page.pageInChapter)); o += 4;
        writeU32LE(out.data(), o, static_cast<std::uint32_t>(page.totalPagesInChapter)); o += 4;
        writeU32LE(out.data(), o, static_cast<std::uint32_t>(page.startLine)); o += 4;
        writeU32LE(out.data(), o, static_cast<std::uint32_t>(page.endLine)); o += 4;
    }
    writeU32LE(out.data(), crcOffset, crc32(out.data() + payloadStart, payloadBytes));
    return out;
}

LayoutError decodePaginationCache(const std::uint8_t* src, std::size_t byteCount, const std::string& expectedKey,
                                  std::vector<CompactPage>& out) {
    out.clear();
    if (!src || byteCount < 12) return LayoutError::BufferTruncated;

    if (readU32(src, 0) != kCacheMagic) return LayoutError::InvalidMagic;
    const std::uint32_t version = readU32(src, 4);
    if (version == 0 || version > kPaginationCacheVersion) return LayoutError::UnsupportedVersion;

    const std::size_t keyLength = readU32(src, 8);
    if (keyLength > kMaxKeyBytes) return LayoutError::InvalidPayloadSize;
    std::size_t o = 12;
    if (!requireBytes(o, keyLength + 8, byteCount)) return LayoutError::BufferTruncated;
    const std::string key(reinterpret_cast<const char*>(src + o), keyLength);
    if (key != expectedKey) return LayoutError::KeyMismatch;
    o += keyLength;

    const std::uint32_t pageCount = readU32(src, o); o += 4;
    const std::uint32_t expectedCrc = readU32(src, o); o += 4;

    std::size_t payloadBytes = 0;
    if (!tryMul(pageCount, kPageRecordBytes, payloadBytes)) return LayoutError::InvalidPayloadSize;
    if (!requireBytes(o, payloadBytes, byteCount)) return LayoutError::BufferTruncated;
    if (o + payloadBytes != byteCount) return LayoutError::InvalidPayloadSize;
    if (crc32(src + o, payloadBytes) != expectedCrc) return LayoutError::ChecksumMismatch;

    out.reserve(pageCount);
    for (std::uint32_t i = 0; i < pageCount; ++i) {
        CompactPage page;
        page.chapterIndex = static_cast<std::int32_t>(readU32(src, o)); o += 4;
        page.pageInChapter = static_cast<std::int32_t>(readU32(src, o)); o += 4;
        page.totalPagesInChapter = static_cast<std::int32_t>(readU32(src, o)); o += 4;
        page.startLine = static_cast<std::int32_t>(readU32(src, o)); o += 4;
        page.endLine = static_cast<std::int32_t>(readU32(src, o)); o += 4;
        if (page.startLine < 0 || page.endLine < page.startLine || page.pageInChapter < 0
            || page.pageInChapter >= page.totalPagesInChapter) {
            out.clear();
            return LayoutError::InvalidPayloadSize;
        }
        out.push_back(page);
    }
    return LayoutError::Ok;
}

// =============================================================================
// FilePaginationCache
// =============================================================================

FilePaginationCache::FilePaginationCache(std::string directory)
    : directory_(std::move(directory)) {}

std::string FilePaginationCache::pathFor(const Document& document, const std::string& key) const {
    const std::uint64_t docHash = hashBytes64(kDigestOffset, document.canonicalPath());
    const std::uint64_t keyHash = hashBytes64(kDigestOffset, key);
    return (fs::path(directory_) / (toHex(docHash) + "-" + toHex(keyHash) + ".fpgc")).string();
}

std::optional<std::vector<CompactPage>> FilePaginationCache::loadForDocument(const Document& document,
                                                                             const std::string& key) {
    const std::string path = pathFor(document, key);
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;

    const std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<CompactPage> pages;
    const LayoutError err = decodePaginationCache(bytes.data(), bytes.size(), key, pages);
    if (err != LayoutError::Ok) {
        FOLIO_LOG_WARN("ignoring pagination cache %s: %s", path.c_str(), layoutErrorName(err));
        return std::nullopt;
    }
    return pages;
}

bool FilePaginationCache::saveForDocument(const Document& document, const std::string& key,
                                          const std::vector<CompactPage>& pages) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        FOLIO_LOG_WARN("cannot create cache directory %s: %s", directory_.c_str(), ec.message().c_str());
        return false;
    }

    const std::string path = pathFor(document, key);
    const std::string tmp = path + ".tmp";
    const std::vector<std::uint8_t> bytes = encodePaginationCache(key, pages);
    {
        std::ofstream outFile(tmp, std::ios::binary | std::ios::trunc);
        if (!outFile) return false;
        outFile.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!outFile) return false;
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        FOLIO_LOG_WARN("cannot write pagination cache %s: %s", path.c_str(), ec.message().c_str());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

bool FilePaginationCache::deleteForDocument(const Document& document, const std::string& key) {
    std::error_code ec;
    return fs::remove(pathFor(document, key), ec);
}

bool FilePaginationCache::existsForDocument(const Document& document, const std::string& key) {
    return loadForDocument(document, key).has_value();
}

// =============================================================================
// InMemoryPaginationCache
// =============================================================================

std::optional<std::vector<CompactPage>> InMemoryPaginationCache::loadForDocument(const Document& document,
                                                                                 const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++loads_;
    auto doc = entries_.find(document.canonicalPath());
    if (doc == entries_.end()) return std::nullopt;
    auto entry = doc->second.find(key);
    if (entry == doc->second.end()) return std::nullopt;

    std::vector<CompactPage> pages;
    if (decodePaginationCache(entry->second.data(), entry->second.size(), key, pages) != LayoutError::Ok) {
        return std::nullopt;
    }
    return pages;
}

bool InMemoryPaginationCache::saveForDocument(const Document& document, const std::string& key,
                                              const std::vector<CompactPage>& pages) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++saves_;
    entries_[document.canonicalPath()][key] = encodePaginationCache(key, pages);
    return true;
}

bool InMemoryPaginationCache::deleteForDocument(const Document& document, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto doc = entries_.find(document.canonicalPath());
    if (doc == entries_.end()) return false;
    return doc->second.erase(key) > 0;
}

bool InMemoryPaginationCache::existsForDocument(const Document& document, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto doc = entries_.find(document.canonicalPath());
    return doc != entries_.end() && doc->second.count(key) > 0;
}

} // namespace folio::pagination
