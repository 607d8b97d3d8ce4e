#ifndef FOLIO_RENDER_SURFACE_H
#define FOLIO_RENDER_SURFACE_H

#include <cstdint>
#include <string>

namespace folio::render {

// Screen rectangle in 1-based terminal cells.
struct Rect {
    std::int32_t x{1};
    std::int32_t y{1};
    std::int32_t width{0};
    std::int32_t height{0};

    std::int32_t right() const { return x + width - 1; }
    std::int32_t bottom() const { return y + height - 1; }
};

/**
 * Render sink. `row` and `col` are 1-based and relative to `bounds`;
 * `text` may carry SGR escape sequences.
 */
class Surface {
public:
    virtual ~Surface() = default;
    virtual void write(const Rect& bounds, std::int32_t row, std::int32_t col, const std::string& text) = 0;
};

} // namespace folio::render

#endif // FOLIO_RENDER_SURFACE_H
