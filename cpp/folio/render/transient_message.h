#ifndef FOLIO_RENDER_TRANSIENT_MESSAGE_H
#define FOLIO_RENDER_TRANSIENT_MESSAGE_H

#include "folio/types.h"
#include <optional>
#include <string>

namespace folio::render {

/**
 * Status line message that clears itself once its deadline passes.
 * Time is supplied by the caller (milliseconds, any monotonic origin) and
 * polled from the render loop, so no timer thread is involved.
 */
class TransientMessage {
public:
    void show(std::string text, double nowMs, double durationMs = kDefaultMessageDurationMs);

    // Message text while it is live, std::nullopt once expired or cleared.
    std::optional<std::string> current(double nowMs) const;

    bool expired(double nowMs) const;
    void clear();

private:
    std::optional<std::string> text_;
    double deadlineMs_{0.0};
};

} // namespace folio::render

#endif // FOLIO_RENDER_TRANSIENT_MESSAGE_H
