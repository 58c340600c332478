#include "FileSplitter.hpp"

#include "../Chunker/Chunker.hpp"
#include "../cancel/cancel.hpp"
#include "../errors/errors.hpp"
#include "../fsUtils/fsUtils.hpp"
#include "../logger/Mylogger.hpp"
#include "../merge/merge.hpp"

namespace fs = std::filesystem;

namespace
{
    constexpr const char *kDegradedOutputName = "merged_file";

    bool samePath(const fs::path &a, const fs::path &b)
    {
        std::error_code ec;
        if (fs::equivalent(a, b, ec))
            return true;
        std::error_code ecA;
        std::error_code ecB;
        const auto canonicalA = fs::weakly_canonical(a, ecA);
        const auto canonicalB = fs::weakly_canonical(b, ecB);
        return !ecA && !ecB && canonicalA == canonicalB;
    }
}

FileSplitter::FileSplitter(const AfsConfig &config, const cancel::CancellationToken &token)
    : config_(config), token_(token), buffer_(config.ioBufferSize == 0 ? hashing::kDefaultBufferSize : config.ioBufferSize)
{
}

verifier::Verifier FileSplitter::makeVerifier()
{
    return verifier::Verifier(buffer_, &token_, config_.verifyStopOnFirstFailure, config_.quiet);
}

SplitResult FileSplitter::split(const SplitRequest &request)
{
    const std::uint64_t size = fsUtils::regularFileSize(request.inputFile);
    const partition::PartitionPlan plan = partition::plan(size, request.directive, config_.defaultParts);

    SplitResult result;
    result.partsDirectory = request.outputDir.empty()
                                ? fs::path(request.inputFile.filename().string() + "_parts")
                                : request.outputDir;
    fsUtils::ensureDirectoryExists(result.partsDirectory);

    if (!config_.quiet)
    {
        const std::uint64_t base = size / plan.count();
        MyLogger::info("Base chunk size: " + std::to_string(base) + " bytes, " +
                       std::to_string(size % plan.count()) + " parts get +1 byte");
    }

    ChunkerOptions options;
    options.algorithm = config_.algorithm;
    options.quiet = config_.quiet;
    options.progressEvery = config_.progressEvery;
    Chunker chunker(options, buffer_, &token_);
    const auto parts = chunker.splitFile(request.inputFile, plan, result.partsDirectory);

    manifest::ManifestBuilder builder(config_.algorithm, buffer_, &token_);
    result.manifestData = builder.build(request.inputFile, parts);
    result.manifestPath = result.partsDirectory / manifest::kManifestFileName;
    manifest::writeManifest(result.manifestData, result.manifestPath);
    result.totalParts = parts.size();

    if (!config_.quiet)
    {
        MyLogger::info("Manifest created: " + result.manifestPath.string());
    }
    return result;
}

MergeResult FileSplitter::merge(const MergeRequest &request)
{
    std::error_code ec;
    if (!fs::is_directory(request.partsDir, ec))
    {
        errors::throwIoFailure("Parts directory not found: " + request.partsDir.string());
    }

    const fs::path manifestPath = request.partsDir / manifest::kManifestFileName;
    const bool haveManifest = fs::exists(manifestPath, ec);

    MergeResult result;
    verifier::Verifier checker = makeVerifier();
    verifier::VerifyReport report;
    manifest::Manifest m;
    if (haveManifest)
    {
        m = manifest::readManifest(manifestPath);
        report = checker.verify(m, request.partsDir);
        if (!report.passed)
        {
            errors::throwIntegrityFailure("Part verification failed, merge aborted: " + report.reason);
        }
        result.outputFile = request.outputFile.empty() ? fs::path(m.originalFile) : request.outputFile;
        result.expectedHash = m.originalHash;
    }
    else
    {
        report = checker.listDegraded(request.partsDir);
        if (!report.passed)
        {
            errors::throwInvalidInput(report.reason);
        }
        result.degraded = true;
        result.outputFile = request.outputFile.empty() ? fs::path(kDegradedOutputName) : request.outputFile;
    }

    if (haveManifest && samePath(manifestPath, result.outputFile))
    {
        errors::throwInvalidInput("Output file would overwrite the manifest " + manifestPath.string());
    }
    for (const auto &part : report.orderedParts)
    {
        if (samePath(part, result.outputFile))
        {
            errors::throwInvalidInput("Output file would overwrite part " + part.string());
        }
    }

    merge::Merger merger(buffer_, &token_, config_.quiet, config_.progressEvery);
    merger.mergeParts(report.orderedParts, result.outputFile);
    result.partsMerged = report.orderedParts.size();

    const hashing::HashAlgorithm algorithm = haveManifest ? m.hashAlgorithm : config_.algorithm;
    result.mergedHash = hashing::hashFile(result.outputFile, algorithm, buffer_, &token_).hex;

    if (haveManifest)
    {
        if (!config_.quiet)
        {
            MyLogger::info("Original hash: " + result.expectedHash);
            MyLogger::info("Merged hash:   " + result.mergedHash);
        }
        if (result.mergedHash != result.expectedHash)
        {
            errors::throwIntegrityFailure("Merged file hash " + result.mergedHash + " does not match original hash " +
                                          result.expectedHash + " (output left at " + result.outputFile.string() +
                                          ")");
        }
        result.verified = true;
    }
    return result;
}

VerifyResult FileSplitter::verify(const VerifyRequest &request)
{
    VerifyResult result;
    result.algorithm = config_.algorithm;

    const std::uint64_t size = fsUtils::regularFileSize(request.inputFile);
    // Owned for the whole pipeline; its destructor removes everything on any exit path.
    fsUtils::ScratchDirectory scratch("afs-verify-");

    result.originalHash = hashing::hashFile(request.inputFile, config_.algorithm, buffer_, &token_).hex;
    if (!config_.quiet)
    {
        MyLogger::info("Original hash (" + hashing::algorithmName(config_.algorithm) + "): " + result.originalHash);
    }

    const partition::PartitionPlan plan = partition::plan(size, request.directive, config_.defaultParts);
    ChunkerOptions options;
    options.algorithm = config_.algorithm;
    options.quiet = config_.quiet;
    options.progressEvery = config_.progressEvery;
    Chunker chunker(options, buffer_, &token_);
    const auto parts = chunker.splitFile(request.inputFile, plan, scratch.path());

    std::vector<fs::path> partPaths;
    partPaths.reserve(parts.size());
    for (const auto &part : parts)
    {
        partPaths.push_back(scratch.path() / part.filename);
    }
    const fs::path merged = scratch.path() / ("merged_" + request.inputFile.filename().string());
    merge::Merger merger(buffer_, &token_, config_.quiet, config_.progressEvery);
    merger.mergeParts(partPaths, merged);

    result.mergedHash = hashing::hashFile(merged, config_.algorithm, buffer_, &token_).hex;
    result.parts = parts.size();
    result.match = result.mergedHash == result.originalHash;
    if (!config_.quiet)
    {
        MyLogger::info("Merged hash (" + hashing::algorithmName(config_.algorithm) + "):   " + result.mergedHash);
    }
    return result;
}

verifier::VerifyReport FileSplitter::check(const fs::path &partsDir)
{
    std::error_code ec;
    if (!fs::is_directory(partsDir, ec))
    {
        errors::throwIoFailure("Parts directory not found: " + partsDir.string());
    }
    const fs::path manifestPath = partsDir / manifest::kManifestFileName;
    verifier::Verifier checker = makeVerifier();
    if (!fs::exists(manifestPath, ec))
    {
        return checker.listDegraded(partsDir);
    }
    return checker.verify(manifest::readManifest(manifestPath), partsDir);
}
