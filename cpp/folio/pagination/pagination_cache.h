#ifndef FOLIO_PAGINATION_PAGINATION_CACHE_H
#define FOLIO_PAGINATION_PAGINATION_CACHE_H

#include "folio/document.h"
#include "folio/pagination/page_record.h"
#include "folio/types.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace folio::pagination {

constexpr std::uint32_t kPaginationCacheVersion = 1;

/**
 * PaginationCache: persisted page maps, scoped by document identity and a
 * layout key. A load that cannot produce pages returns std::nullopt; callers
 * treat every such case as a cold cache.
 */
class PaginationCache {
public:
    virtual ~PaginationCache() = default;

    /**
     * "<width>x<height>_<view mode>_<line spacing>", e.g. "80x24_split_compact".
     */
    virtual std::string layoutKey(std::int32_t width, std::int32_t height, ViewMode viewMode,
                                  LineSpacing lineSpacing) const;

    virtual std::optional<std::vector<CompactPage>> loadForDocument(const Document& document,
                                                                   const std::string& key) = 0;
    virtual bool saveForDocument(const Document& document, const std::string& key,
                                 const std::vector<CompactPage>& pages) = 0;
    virtual bool deleteForDocument(const Document& document, const std::string& key) = 0;
    virtual bool existsForDocument(const Document& document, const std::string& key) = 0;
};

// =============================================================================
// Binary codec
// =============================================================================

/**
 * Layout (little endian):
 *   u32 magic "FPGC" | u32 version | u32 keyLength | key bytes |
 *   u32 pageCount | u32 crc32(payload) | payload: pageCount * 5 * u32
 */
std::vector<std::uint8_t> encodePaginationCache(const std::string& key, const std::vector<CompactPage>& pages);

LayoutError decodePaginationCache(const std::uint8_t* src, std::size_t byteCount, const std::string& expectedKey,
                                  std::vector<CompactPage>& out);

// =============================================================================
// Implementations
// =============================================================================

/**
 * One file per (document, layout key) under a cache directory.
 */
class FilePaginationCache : public PaginationCache {
public:
    explicit FilePaginationCache(std::string directory);

    std::optional<std::vector<CompactPage>> loadForDocument(const Document& document,
                                                           const std::string& key) override;
    bool saveForDocument(const Document& document, const std::string& key,
                         const std::vector<CompactPage>& pages) override;
    bool deleteForDocument(const Document& document, const std::string& key) override;
    bool existsForDocument(const Document& document, const std::string& key) override;

    std::string pathFor(const Document& document, const std::string& key) const;

private:
    std::string directory_;
};

/**
 * Process-local cache, used by tests and by hosts without a cache directory.
 */
class InMemoryPaginationCache : public PaginationCache {
public:
    std::optional<std::vector<CompactPage>> loadForDocument(const Document& document,
                                                           const std::string& key) override;
    bool saveForDocument(const Document& document, const std::string& key,
                         const std::vector<CompactPage>& pages) override;
    bool deleteForDocument(const Document& document, const std::string& key) override;
    bool existsForDocument(const Document& document, const std::string& key) override;

    std::uint32_t loads() const { return loads_; }
    std::uint32_t saves() const { return saves_; }

private:
    std::mutex mutex_;
    std::map<std::string, std::map<std::string, std::vector<std::uint8_t>>> entries_;
    std::uint32_t loads_{0};
    std::uint32_t saves_{0};
};

} // namespace folio::pagination

#endif // FOLIO_PAGINATION_PAGINATION_CACHE_H
