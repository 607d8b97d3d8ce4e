#ifndef FOLIO_RENDER_RENDERED_LINES_H
#define FOLIO_RENDER_RENDERED_LINES_H

#include "folio/render/line_geometry.h"
#include <cstddef>
#include <map>
#include <vector>

namespace folio::render {

/**
 * RenderedLines: geometry of every line drawn in the last committed frame,
 * keyed by GeometryKey.
 */
class RenderedLines {
public:
    void record(LineGeometry geometry);
    const LineGeometry* find(const GeometryKey& key) const;

    // Distinct geometries in reading order: page, line offset, column, row, column origin.
    std::vector<const LineGeometry*> ordered() const;

    std::size_t size() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }
    void clear() { lines_.clear(); }

    const std::map<GeometryKey, LineGeometry>& entries() const { return lines_; }

private:
    std::map<GeometryKey, LineGeometry> lines_;
};

/**
 * Collects one frame of geometry locally and publishes it wholesale on
 * commit(); a frame that is never committed leaves the target untouched.
 */
class FrameRecorder {
public:
    explicit FrameRecorder(RenderedLines& target) : target_(target) {}

    FrameRecorder(const FrameRecorder&) = delete;
    FrameRecorder& operator=(const FrameRecorder&) = delete;

    void record(LineGeometry geometry) { frame_.record(std::move(geometry)); }
    const RenderedLines& pending() const { return frame_; }

    void commit();

private:
    RenderedLines& target_;
    RenderedLines frame_;
};

} // namespace folio::render

#endif // FOLIO_RENDER_RENDERED_LINES_H
