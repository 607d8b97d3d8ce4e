#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace folio::pagination::detail {

constexpr std::uint32_t fourCC(char a, char b, char c, char d) {
    return static_cast<std::uint32_t>(a)
        | (static_cast<std::uint32_t>(b) << 8)
        | (static_cast<std::uint32_t>(c) << 16)
        | (static_cast<std::uint32_t>(d) << 24);
}

constexpr std::uint32_t kCacheMagic = fourCC('F', 'P', 'G', 'C');
constexpr std::size_t kPageRecordBytes = 5 * 4;
constexpr std::size_t kMaxKeyBytes = 4096;

inline std::uint32_t crc32(const std::uint8_t* bytes, std::size_t len) {
    static const struct Table {
        std::uint32_t v[256];
        Table() {
            for (std::uint32_t i = 0; i < 256; ++i) {
                std::uint32_t c = i;
                for (int k = 0; k < 8; ++k) c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
                v[i] = c;
            }
        }
    } table;

    std::uint32_t crc = 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) crc = table.v[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    return crc ^ 0xFFFFFFFFu;
}

inline bool tryMul(std::size_t a, std::size_t b, std::size_t& out) {
    if (a != 0 && b > std::numeric_limits<std::size_t>::max() / a) return false;
    out = a * b;
    return true;
}

inline bool requireBytes(std::size_t offset, std::size_t size, std::size_t total) {
    return offset <= total && size <= total - offset;
}

} // namespace folio::pagination::detail
