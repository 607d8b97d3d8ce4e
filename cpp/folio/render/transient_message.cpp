#include "folio/render/transient_message.h"

namespace folio::render {

void TransientMessage::show(std::string text, double nowMs, double durationMs) {
    text_ = std::move(text);
    deadlineMs_ = nowMs + (durationMs > 0.0 ? durationMs : 0.0);
}

std::optional<std::string> TransientMessage::current(double nowMs) const {
    if (expired(nowMs)) return std::nullopt;
    return text_;
}

bool TransientMessage::expired(double nowMs) const {
    return !text_ || nowMs >= deadlineMs_;
}

void TransientMessage::clear() {
    text_.reset();
    deadlineMs_ = 0.0;
}

} // namespace folio::render
