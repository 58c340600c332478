#include "cancel.hpp"

#include "../errors/errors.hpp"

#include <csignal>

namespace cancel
{
    namespace
    {
        std::atomic<CancellationToken *> g_signalToken{nullptr};

        void signal_handler(int)
        {
            CancellationToken *token = g_signalToken.load();
            if (token != nullptr)
            {
                token->request();
            }
        }
    }

    void CancellationToken::throwIfRequested() const
    {
        if (requested())
        {
            throw errors::AfsError(errors::ErrorCategory::Cancelled, "operation cancelled by user");
        }
    }

    void installSignalHandlers(CancellationToken &token)
    {
        g_signalToken.store(&token);
        std::signal(SIGINT, signal_handler);  // Ctrl+C
        std::signal(SIGTERM, signal_handler); // kill
    }
} // namespace cancel
