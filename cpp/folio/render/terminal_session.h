#ifndef FOLIO_RENDER_TERMINAL_SESSION_H
#define FOLIO_RENDER_TERMINAL_SESSION_H

#include <cstdint>
#include <functional>
#include <mutex>

namespace folio::render {

/**
 * Reference counted terminal lifecycle. The first lease runs `setup`, the
 * release of the last lease runs `cleanup`. Leases must not outlive the session.
 */
class TerminalSession {
public:
    using Hook = std::function<void()>;

    class Lease {
    public:
        Lease() = default;
        ~Lease() { release(); }

        Lease(Lease&& other) noexcept : session_(other.session_) { other.session_ = nullptr; }
        Lease& operator=(Lease&& other) noexcept;

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        bool valid() const { return session_ != nullptr; }
        void release();

    private:
        friend class TerminalSession;
        explicit Lease(TerminalSession* session) : session_(session) {}

        TerminalSession* session_{nullptr};
    };

    TerminalSession(Hook setup, Hook cleanup);

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    Lease acquire();

    std::uint32_t refCount() const;
    bool active() const { return refCount() > 0; }

private:
    void releaseOne();

    Hook setup_;
    Hook cleanup_;
    mutable std::mutex mutex_;
    std::uint32_t refs_{0};
};

} // namespace folio::render

#endif // FOLIO_RENDER_TERMINAL_SESSION_H
