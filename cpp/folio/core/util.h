#ifndef FOLIO_CORE_UTIL_H
#define FOLIO_CORE_UTIL_H

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <cstring>

namespace folio {

// Monotonic milliseconds, used for deadlines and timing logs.
inline double nowMs() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}

inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

} // namespace folio

#endif // FOLIO_CORE_UTIL_H
