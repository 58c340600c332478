#ifndef FILE_SPLITTER_HPP
#define FILE_SPLITTER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "../Chunker/Partition.hpp"
#include "../Verifier/Verifier.hpp"
#include "../load_config/load_config.hpp"
#include "../manifest/manifest.hpp"

namespace cancel
{
    class CancellationToken;
}

struct SplitRequest
{
    std::filesystem::path inputFile;
    std::filesystem::path outputDir; // empty: "<input name>_parts" in the working directory
    partition::SizingDirective directive;
};

struct SplitResult
{
    std::filesystem::path partsDirectory;
    std::filesystem::path manifestPath;
    std::size_t totalParts = 0;
    manifest::Manifest manifestData;
};

struct MergeRequest
{
    std::filesystem::path partsDir;
    std::filesystem::path outputFile; // empty: manifest's original name, or "merged_file" without one
};

struct MergeResult
{
    std::filesystem::path outputFile;
    std::size_t partsMerged = 0;
    bool degraded = false;           // merged without a manifest
    bool verified = false;           // merged hash matched the manifest
    std::string expectedHash;        // empty when degraded
    std::string mergedHash;
};

struct VerifyRequest
{
    std::filesystem::path inputFile;
    partition::SizingDirective directive;
};

struct VerifyResult
{
    bool match = false;
    std::size_t parts = 0;
    hashing::HashAlgorithm algorithm = hashing::HashAlgorithm::Sha256;
    std::string originalHash;
    std::string mergedHash;
};

// Runs the split, merge, verify and check pipelines. All I/O goes through one buffer of
// config.ioBufferSize bytes owned here, so memory stays flat regardless of file size.
class FileSplitter
{
public:
    FileSplitter(const AfsConfig &config, const cancel::CancellationToken &token);

    // Plan, write parts, hash the original, write manifest.json next to the parts.
    SplitResult split(const SplitRequest &request);

    // Verify against manifest.json (or fall back to a lexical part listing), concatenate,
    // then compare the merged hash with the manifest. A mismatch throws IntegrityFailure and
    // leaves the merged file in place.
    MergeResult merge(const MergeRequest &request);

    // Split into a private scratch directory, merge back, compare digests. Nothing survives
    // the call, whatever the outcome.
    VerifyResult verify(const VerifyRequest &request);

    // Verification only, no merge.
    verifier::VerifyReport check(const std::filesystem::path &partsDir);

private:
    verifier::Verifier makeVerifier();

    AfsConfig config_;
    const cancel::CancellationToken &token_;
    std::vector<char> buffer_;
};

#endif // FILE_SPLITTER_HPP
