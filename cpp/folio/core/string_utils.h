#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

// =============================================================================
// UTF-8
// =============================================================================

/**
 * Decode one code point at byte offset `pos`.
 * Malformed sequences decode to U+FFFD with byteLen 1.
 */
inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
    const std::size_t n = content.size();
    if (pos >= n) {
        byteLen = 0;
        return 0;
    }

    const unsigned char c0 = static_cast<unsigned char>(content[pos]);
    if ((c0 & 0x80) == 0) {
        byteLen = 1;
        return c0;
    }

    auto cont = [&](std::size_t i) {
        return (static_cast<unsigned char>(content[pos + i]) & 0xC0) == 0x80;
    };
    auto bits = [&](std::size_t i) {
        return static_cast<std::uint32_t>(static_cast<unsigned char>(content[pos + i]) & 0x3F);
    };

    if ((c0 & 0xE0) == 0xC0 && pos + 1 < n && cont(1)) {
        byteLen = 2;
        return ((c0 & 0x1Fu) << 6) | bits(1);
    }
    if ((c0 & 0xF0) == 0xE0 && pos + 2 < n && cont(1) && cont(2)) {
        byteLen = 3;
        return ((c0 & 0x0Fu) << 12) | (bits(1) << 6) | bits(2);
    }
    if ((c0 & 0xF8) == 0xF0 && pos + 3 < n && cont(1) && cont(2) && cont(3)) {
        byteLen = 4;
        return ((c0 & 0x07u) << 18) | (bits(1) << 12) | (bits(2) << 6) | bits(3);
    }

    byteLen = 1;
    return 0xFFFD;
}

// =============================================================================
// Whitespace helpers
// =============================================================================

inline bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool isBlank(std::string_view s) {
    for (char c : s) {
        if (!isAsciiSpace(c)) return false;
    }
    return true;
}

inline std::string rstrip(std::string_view s) {
    std::size_t end = s.size();
    while (end > 0 && isAsciiSpace(s[end - 1])) --end;
    return std::string(s.substr(0, end));
}

inline std::string_view stripView(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && isAsciiSpace(s[b])) ++b;
    while (e > b && isAsciiSpace(s[e - 1])) --e;
    return s.substr(b, e - b);
}

/**
 * Split on "\n", dropping one trailing "\r" from each row.
 * Always returns at least one row.
 */
inline std::vector<std::string> splitLines(std::string_view s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const std::size_t nl = s.find('\n', start);
        std::string_view row = s.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
        if (!row.empty() && row.back() == '\r') row.remove_suffix(1);
        out.emplace_back(row);
        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }
    return out;
}

inline std::string repeat(std::string_view unit, std::size_t count) {
    std::string out;
    out.reserve(unit.size() * count);
    for (std::size_t i = 0; i < count; ++i) out.append(unit);
    return out;
}

// =============================================================================
// Hashing (FNV-1a)
// =============================================================================

constexpr std::uint32_t kHashOffset32 = 2166136261u;
constexpr std::uint32_t kHashPrime32 = 16777619u;
constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint32_t hashBytes32(std::uint32_t h, std::string_view bytes) {
    for (unsigned char c : bytes) {
        h ^= c;
        h *= kHashPrime32;
    }
    return h;
}

inline std::uint64_t hashBytes64(std::uint64_t h, std::string_view bytes) {
    for (unsigned char c : bytes) {
        h ^= c;
        h *= kDigestPrime;
    }
    return h;
}

// Checksum used to detect changed chapter content.
inline std::uint64_t contentChecksum(std::string_view content) {
    return hashBytes64(kDigestOffset, content);
}

inline std::string toHex(std::uint64_t v) {
    static const char digits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = digits[v & 0xF];
        v >>= 4;
    }
    return out;
}

} // namespace folio
