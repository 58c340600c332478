#include "report.hpp"

using json = nlohmann::json;

namespace report
{
    json splitJson(const SplitResult &result)
    {
        return json{
            {"status", "success"},
            {"parts_directory", result.partsDirectory.string()},
            {"total_parts", result.totalParts},
            {"manifest", result.manifestPath.string()}};
    }

    json mergeJson(const MergeResult &result)
    {
        return json{
            {"status", "success"},
            {"output_file", result.outputFile.string()},
            {"parts_merged", result.partsMerged},
            {"verification_passed", result.verified},
            {"degraded", result.degraded}};
    }

    json verifyJson(const VerifyResult &result)
    {
        return json{
            {"status", result.match ? "success" : "failed"},
            {"hash_algorithm", hashing::algorithmName(result.algorithm)},
            {"original_hash", result.originalHash},
            {"merged_hash", result.mergedHash},
            {"verification_passed", result.match}};
    }

    json checkJson(const verifier::VerifyReport &result)
    {
        json parts = json::array();
        if (result.mode == verifier::VerifyMode::ManifestBacked)
        {
            for (const auto &check : result.checks)
            {
                parts.push_back(json{
                    {"index", check.index},
                    {"filename", check.filename},
                    {"status", verifier::partStatusLabel(check.status)}});
            }
        }
        else
        {
            for (const auto &path : result.orderedParts)
            {
                parts.push_back(json{{"filename", path.filename().string()}, {"status", "unverified"}});
            }
        }

        json j{
            {"status", result.passed ? "success" : "failed"},
            {"mode", verifier::modeLabel(result.mode)},
            {"verification_passed", result.verified()},
            {"parts", parts}};
        if (!result.reason.empty())
        {
            j["error"] = result.reason;
        }
        return j;
    }

    json failureJson(errors::ErrorCategory category, const std::string &reason)
    {
        return json{
            {"status", "failed"},
            {"category", errors::categoryLabel(category)},
            {"error", reason}};
    }

    void printSplit(std::ostream &out, const SplitResult &result)
    {
        out << "\nSplit complete! Parts saved to: " << result.partsDirectory.string() << "\n";
        out << "Total parts: " << result.totalParts << "\n";
    }

    void printMerge(std::ostream &out, const MergeResult &result)
    {
        if (result.verified)
        {
            out << "Verification passed: Files are bit-for-bit identical!\n";
        }
        else if (result.degraded)
        {
            out << "Merged without a manifest: integrity NOT verified\n";
        }
        out << "\nMerged file: " << result.outputFile.string() << "\n";
    }

    void printVerify(std::ostream &out, const VerifyResult &result)
    {
        if (result.match)
        {
            out << "\nVerification passed: Split-merge cycle preserves data integrity!\n";
        }
        else
        {
            out << "\nVerification failed: Hashes do not match!\n";
        }
    }

    void printCheck(std::ostream &out, const verifier::VerifyReport &result)
    {
        if (result.mode == verifier::VerifyMode::Degraded)
        {
            out << "No manifest: " << result.orderedParts.size()
                << " part files found, integrity cannot be checked\n";
            for (const auto &path : result.orderedParts)
            {
                out << "  " << path.filename().string() << "\n";
            }
            return;
        }
        for (const auto &check : result.checks)
        {
            out << "  Part " << check.index << " (" << check.filename << "): "
                << verifier::partStatusLabel(check.status) << "\n";
        }
        out << (result.passed ? "All parts verified successfully!\n" : "Verification failed: " + result.reason + "\n");
    }
}
