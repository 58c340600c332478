#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace errors
{
    enum class ErrorCategory
    {
        InvalidInput,
        IoFailure,
        IntegrityFailure,
        ManifestFailure,
        Cancelled
    };

    // Process exit codes surfaced by the command line layer.
    constexpr int kExitSuccess = 0;
    constexpr int kExitFailure = 1;
    constexpr int kExitUsage = 2;
    constexpr int kExitCancelled = 130;

    const char *categoryLabel(ErrorCategory category);
    int exitCodeFor(ErrorCategory category);

    // Every failure raised by the split/merge/verify engine.
    // what() is the human readable reason; category() is what callers branch on.
    class AfsError : public std::runtime_error
    {
    public:
        AfsError(ErrorCategory category, const std::string &reason);

        ErrorCategory category() const noexcept { return category_; }

    private:
        ErrorCategory category_;
    };

    [[noreturn]] void throwInvalidInput(const std::string &reason);
    [[noreturn]] void throwIoFailure(const std::string &reason);
    [[noreturn]] void throwIntegrityFailure(const std::string &reason);
    [[noreturn]] void throwManifestFailure(const std::string &reason);
} // namespace errors

#endif // ERRORS_HPP
