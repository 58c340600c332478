#include "errors.hpp"

namespace errors
{
    const char *categoryLabel(ErrorCategory category)
    {
        switch (category)
        {
        case ErrorCategory::InvalidInput:
            return "invalid_input";
        case ErrorCategory::IoFailure:
            return "io_failure";
        case ErrorCategory::IntegrityFailure:
            return "integrity_failure";
        case ErrorCategory::ManifestFailure:
            return "manifest_failure";
        case ErrorCategory::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    int exitCodeFor(ErrorCategory category)
    {
        return category == ErrorCategory::Cancelled ? kExitCancelled : kExitFailure;
    }

    AfsError::AfsError(ErrorCategory category, const std::string &reason)
        : std::runtime_error(reason), category_(category)
    {
    }

    void throwInvalidInput(const std::string &reason)
    {
        throw AfsError(ErrorCategory::InvalidInput, reason);
    }

    void throwIoFailure(const std::string &reason)
    {
        throw AfsError(ErrorCategory::IoFailure, reason);
    }

    void throwIntegrityFailure(const std::string &reason)
    {
        throw AfsError(ErrorCategory::IntegrityFailure, reason);
    }

    void throwManifestFailure(const std::string &reason)
    {
        throw AfsError(ErrorCategory::ManifestFailure, reason);
    }
} // namespace errors
