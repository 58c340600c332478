#ifndef CANCEL_HPP
#define CANCEL_HPP

#include <atomic>

namespace cancel
{
    // Set from a signal handler, polled by the copy and hash loops between buffers.
    class CancellationToken
    {
    public:
        CancellationToken() = default;
        CancellationToken(const CancellationToken &) = delete;
        CancellationToken &operator=(const CancellationToken &) = delete;

        void request() noexcept { requested_.store(true); }
        void reset() noexcept { requested_.store(false); }
        bool requested() const noexcept { return requested_.load(); }

        // Throws errors::AfsError(Cancelled) once a stop was requested.
        void throwIfRequested() const;

    private:
        std::atomic<bool> requested_{false};
    };

    // Routes SIGINT and SIGTERM to token.request(). The token must outlive the process run.
    void installSignalHandlers(CancellationToken &token);
} // namespace cancel

#endif // CANCEL_HPP
