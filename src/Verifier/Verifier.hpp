#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "../manifest/manifest.hpp"

namespace cancel
{
    class CancellationToken;
}

namespace verifier
{
    enum class VerifyMode
    {
        ManifestBacked,
        Degraded // no manifest: parts found by filename pattern only, nothing checked
    };

    enum class PartStatus
    {
        Valid,
        Missing,
        SizeMismatch,
        HashMismatch
    };

    const char *partStatusLabel(PartStatus status);
    const char *modeLabel(VerifyMode mode);

    struct PartCheck
    {
        std::size_t index = 0;
        std::string filename;
        PartStatus status = PartStatus::Valid;
        std::uint64_t expectedSize = 0;
        std::uint64_t actualSize = 0;
    };

    struct VerifyReport
    {
        VerifyMode mode = VerifyMode::ManifestBacked;
        bool passed = false;
        std::string reason;                               // first failure, empty when passed
        std::vector<PartCheck> checks;                    // parts examined, in manifest order
        std::vector<std::filesystem::path> orderedParts;  // merge order

        // Only a passing manifest-backed report vouches for the parts.
        bool verified() const { return passed && mode == VerifyMode::ManifestBacked; }
        const PartCheck *firstFailure() const;
    };

    class Verifier
    {
    public:
        // With stopOnFirstFailure the walk ends at the first bad part; otherwise every part is
        // examined and reported.
        Verifier(std::vector<char> &buffer, const cancel::CancellationToken *token = nullptr,
                 bool stopOnFirstFailure = true, bool quiet = false);

        // Existence, then size, then hash, for each part in manifest order.
        VerifyReport verify(const manifest::Manifest &m, const std::filesystem::path &parts_dir) const;

        // Fallback without a manifest: lexical listing of *.partNNN, no integrity checks.
        VerifyReport listDegraded(const std::filesystem::path &parts_dir) const;

    private:
        PartCheck checkPart(const manifest::Manifest &m, const manifest::PartRecord &part,
                            const std::filesystem::path &part_path) const;

        std::vector<char> &buffer_;
        const cancel::CancellationToken *token_;
        bool stopOnFirstFailure_;
        bool quiet_;
    };
} // namespace verifier
