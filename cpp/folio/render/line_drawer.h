#ifndef FOLIO_RENDER_LINE_DRAWER_H
#define FOLIO_RENDER_LINE_DRAWER_H

#include "folio/render/line_geometry.h"
#include "folio/render/rendered_lines.h"
#include "folio/render/surface.h"
#include "folio/text/text_metrics.h"
#include "folio/text/text_types.h"
#include <cstdint>
#include <string>

namespace folio::render {

namespace sgr {
inline constexpr const char* kReset = "\x1b[0m";
inline constexpr const char* kBold = "\x1b[1m";
inline constexpr const char* kItalic = "\x1b[3m";
inline constexpr const char* kUnderline = "\x1b[4m";
inline constexpr const char* kCode = "\x1b[36m";
inline constexpr const char* kLink = "\x1b[34m";
inline constexpr const char* kMuted = "\x1b[90m";
} // namespace sgr

struct ComposedLine {
    std::string plain;
    std::string styled;
};

/**
 * Where a line lands: page and column identity plus its chapter line offset.
 */
struct LinePlacement {
    std::int32_t row{0};
    std::int32_t col{0};
    std::int32_t width{0};
    std::int32_t columnId{0};
    std::int32_t lineOffset{0};
    std::int32_t pageId{0};
};

/**
 * LineDrawer: draws one DisplayLine into a Surface and records its geometry.
 */
class LineDrawer {
public:
    explicit LineDrawer(const text::TextMetrics& metrics) : metrics_(metrics), geometryBuilder_(metrics) {}

    /**
     * Styled and plain text of `line` limited to `width` columns.
     */
    ComposedLine compose(const text::DisplayLine& line, std::int32_t width) const;

    /**
     * Compose, clip to `bounds`, record geometry into `recorder`, write to `surface`.
     * Image placeholder rows record an empty geometry and write nothing.
     */
    void drawLine(Surface& surface, const Rect& bounds, const text::DisplayLine& line,
                  const LinePlacement& placement, FrameRecorder& recorder) const;

    static std::string styleCodes(const text::TextStyle& style, const text::LineMetadata& metadata);

private:
    const text::TextMetrics& metrics_;
    LineGeometryBuilder geometryBuilder_;
};

} // namespace folio::render

#endif // FOLIO_RENDER_LINE_DRAWER_H
