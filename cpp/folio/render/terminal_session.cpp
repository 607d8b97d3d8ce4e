#include "folio/render/terminal_session.h"
#include "folio/core/logging.h"

namespace folio::render {

TerminalSession::Lease& TerminalSession::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        session_ = other.session_;
        other.session_ = nullptr;
    }
    return *this;
}

void TerminalSession::Lease::release() {
    if (!session_) return;
    TerminalSession* session = session_;
    session_ = nullptr;
    session->releaseOne();
}

TerminalSession::TerminalSession(Hook setup, Hook cleanup)
    : setup_(std::move(setup)), cleanup_(std::move(cleanup)) {}

TerminalSession::Lease TerminalSession::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (refs_ == 0 && setup_) {
        FOLIO_LOG_DEBUG("terminal session setup");
        setup_();
    }
    ++refs_;
    return Lease(this);
}

void TerminalSession::releaseOne() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (refs_ == 0) return;
    --refs_;
    if (refs_ == 0 && cleanup_) {
        FOLIO_LOG_DEBUG("terminal session cleanup");
        cleanup_();
    }
}

std::uint32_t TerminalSession::refCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return refs_;
}

} // namespace folio::render
