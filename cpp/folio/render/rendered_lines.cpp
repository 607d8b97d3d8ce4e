#include "folio/render/rendered_lines.h"

#include <algorithm>
#include <tuple>

namespace folio::render {

void RenderedLines::record(LineGeometry geometry) {
    const GeometryKey key = geometry.key();
    lines_.insert_or_assign(key, std::move(geometry));
}

const LineGeometry* RenderedLines::find(const GeometryKey& key) const {
    auto it = lines_.find(key);
    return it == lines_.end() ? nullptr : &it->second;
}

std::vector<const LineGeometry*> RenderedLines::ordered() const {
    std::vector<const LineGeometry*> out;
    out.reserve(lines_.size());
    for (const auto& entry : lines_) out.push_back(&entry.second);
    std::stable_sort(out.begin(), out.end(), [](const LineGeometry* a, const LineGeometry* b) {
        return std::tie(a->pageId, a->lineOffset, a->columnId, a->row, a->columnOrigin)
            < std::tie(b->pageId, b->lineOffset, b->columnId, b->row, b->columnOrigin);
    });
    return out;
}

void FrameRecorder::commit() {
    target_ = std::move(frame_);
    frame_.clear();
}

} // namespace folio::render
