#include "Verifier.hpp"

#include "../cancel/cancel.hpp"
#include "../logger/Mylogger.hpp"
#include "../merge/merge.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace verifier
{
    namespace
    {
        std::string describe(const PartCheck &check)
        {
            const std::string part = "Part " + std::to_string(check.index) + " (" + check.filename + ")";
            switch (check.status)
            {
            case PartStatus::Missing:
                return "missing part: " + part + " not found";
            case PartStatus::SizeMismatch:
                return "size mismatch: " + part + " expected " + std::to_string(check.expectedSize) +
                       " bytes, got " + std::to_string(check.actualSize);
            case PartStatus::HashMismatch:
                return "hash mismatch: " + part;
            case PartStatus::Valid:
                break;
            }
            return part + " valid";
        }
    }

    const char *partStatusLabel(PartStatus status)
    {
        switch (status)
        {
        case PartStatus::Valid:
            return "valid";
        case PartStatus::Missing:
            return "missing";
        case PartStatus::SizeMismatch:
            return "size_mismatch";
        case PartStatus::HashMismatch:
            return "hash_mismatch";
        }
        return "unknown";
    }

    const char *modeLabel(VerifyMode mode)
    {
        return mode == VerifyMode::ManifestBacked ? "manifest" : "degraded";
    }

    const PartCheck *VerifyReport::firstFailure() const
    {
        for (const auto &check : checks)
        {
            if (check.status != PartStatus::Valid)
                return &check;
        }
        return nullptr;
    }

    Verifier::Verifier(std::vector<char> &buffer, const cancel::CancellationToken *token, bool stopOnFirstFailure,
                       bool quiet)
        : buffer_(buffer), token_(token), stopOnFirstFailure_(stopOnFirstFailure), quiet_(quiet)
    {
    }

    PartCheck Verifier::checkPart(const manifest::Manifest &m, const manifest::PartRecord &part,
                                  const fs::path &part_path) const
    {
        PartCheck check;
        check.index = part.index;
        check.filename = part.filename;
        check.expectedSize = part.size;

        std::error_code ec;
        if (!fs::is_regular_file(part_path, ec))
        {
            check.status = PartStatus::Missing;
            return check;
        }

        // Size first: a stat is far cheaper than a full hash.
        check.actualSize = fs::file_size(part_path, ec);
        if (ec)
        {
            check.status = PartStatus::Missing;
            return check;
        }
        if (check.actualSize != part.size)
        {
            check.status = PartStatus::SizeMismatch;
            return check;
        }

        if (hashing::hashFile(part_path, m.hashAlgorithm, buffer_, token_).hex != part.hash)
        {
            check.status = PartStatus::HashMismatch;
        }
        return check;
    }

    VerifyReport Verifier::verify(const manifest::Manifest &m, const fs::path &parts_dir) const
    {
        VerifyReport report;
        report.mode = VerifyMode::ManifestBacked;
        report.passed = true;
        if (!quiet_)
        {
            MyLogger::info("Verifying " + std::to_string(m.numParts) + " parts against manifest...");
        }

        for (const auto &part : m.parts)
        {
            const fs::path part_path = parts_dir / part.filename;
            PartCheck check = checkPart(m, part, part_path);
            report.checks.push_back(check);
            report.orderedParts.push_back(part_path);

            if (check.status == PartStatus::Valid)
            {
                if (!quiet_)
                    MyLogger::info("  Part " + std::to_string(part.index) + ": Valid");
                continue;
            }

            MyLogger::error("  " + describe(check));
            if (report.passed)
            {
                report.passed = false;
                report.reason = describe(check);
            }
            if (stopOnFirstFailure_)
                break;
        }

        if (report.passed && !quiet_)
        {
            MyLogger::info("All parts verified successfully!");
        }
        return report;
    }

    VerifyReport Verifier::listDegraded(const fs::path &parts_dir) const
    {
        VerifyReport report;
        report.mode = VerifyMode::Degraded;
        report.orderedParts = merge::discoverParts(parts_dir);
        report.passed = !report.orderedParts.empty();
        if (!report.passed)
        {
            report.reason = "No part files found in directory " + parts_dir.string();
        }
        else
        {
            MyLogger::warning("No manifest found, using " + std::to_string(report.orderedParts.size()) +
                              " .partNNN files in lexical order without verification");
        }
        return report;
    }
} // namespace verifier
