#include <catch2/catch.hpp>

#include <fstream>
#include <nlohmann/json.hpp>

#include "cancel/cancel.hpp"
#include "errors/errors.hpp"
#include "splitter/FileSplitter.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using errors::ErrorCategory;

namespace
{
    AfsConfig quietConfig(hashing::HashAlgorithm algorithm = hashing::HashAlgorithm::Sha256)
    {
        AfsConfig config;
        config.algorithm = algorithm;
        config.quiet = true;
        config.ioBufferSize = 4096;
        return config;
    }

    template <typename Fn>
    ErrorCategory categoryOf(Fn fn)
    {
        try
        {
            fn();
        }
        catch (const errors::AfsError &e)
        {
            return e.category();
        }
        FAIL("expected AfsError");
        return ErrorCategory::InvalidInput;
    }

    std::size_t entriesStartingWith(const fs::path &dir, const std::string &prefix)
    {
        std::size_t count = 0;
        for (const auto &entry : fs::directory_iterator(dir))
        {
            if (entry.path().filename().string().rfind(prefix, 0) == 0)
                ++count;
        }
        return count;
    }
}

TEST_CASE("split then merge reproduces the file for every algorithm and directive")
{
    const auto algorithm = GENERATE(hashing::HashAlgorithm::Md5, hashing::HashAlgorithm::Sha1,
                                    hashing::HashAlgorithm::Sha256, hashing::HashAlgorithm::Sha512);
    const auto directive = GENERATE(partition::SizingDirective::defaults(), partition::SizingDirective::fixedCount(7),
                                    partition::SizingDirective::maxPartSize(1500));
    const std::size_t expectedParts = directive.kind == partition::SizingDirective::Kind::Default ? 24 : 7;
    testutil::TempDir dir;
    const auto source = dir / "archive.tar";
    const std::string data = testutil::patternBytes(10007);
    testutil::writeFile(source, data);

    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(algorithm), token);
    const auto split = splitter.split({source, dir / "parts", directive});
    REQUIRE(split.totalParts == expectedParts);
    REQUIRE(fs::exists(split.manifestPath));
    REQUIRE(split.manifestData.originalFile == "archive.tar");
    REQUIRE(split.manifestData.hashAlgorithm == algorithm);

    const auto merged = splitter.merge({dir / "parts", dir / "restored.tar"});
    REQUIRE(merged.verified);
    REQUIRE_FALSE(merged.degraded);
    REQUIRE(merged.partsMerged == expectedParts);
    REQUIRE(merged.mergedHash == split.manifestData.originalHash);
    REQUIRE(testutil::readFile(dir / "restored.tar") == data);
}

TEST_CASE("splitting the same file twice gives the same parts")
{
    testutil::TempDir dir;
    const auto source = dir / "photo.raw";
    testutil::writeFile(source, testutil::patternBytes(7777));
    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(), token);

    const auto first = splitter.split({source, dir / "first", partition::SizingDirective::maxPartSize(1000)});
    const auto second = splitter.split({source, dir / "second", partition::SizingDirective::maxPartSize(1000)});

    REQUIRE(first.manifestData.originalHash == second.manifestData.originalHash);
    REQUIRE(first.manifestData.parts.size() == second.manifestData.parts.size());
    for (std::size_t i = 0; i < first.manifestData.parts.size(); ++i)
    {
        const auto &a = first.manifestData.parts[i];
        const auto &b = second.manifestData.parts[i];
        REQUIRE(a.index == b.index);
        REQUIRE(a.filename == b.filename);
        REQUIRE(a.size == b.size);
        REQUIRE(a.hash == b.hash);
    }
    REQUIRE(testutil::readFile(first.manifestPath) == testutil::readFile(second.manifestPath));
}

TEST_CASE("merge uses the algorithm recorded in the manifest")
{
    testutil::TempDir dir;
    const auto source = dir / "a.bin";
    testutil::writeFile(source, testutil::patternBytes(500));
    cancel::CancellationToken token;

    FileSplitter md5Splitter(quietConfig(hashing::HashAlgorithm::Md5), token);
    md5Splitter.split({source, dir / "parts", partition::SizingDirective::fixedCount(3)});

    FileSplitter shaMerger(quietConfig(hashing::HashAlgorithm::Sha512), token);
    const auto merged = shaMerger.merge({dir / "parts", dir / "out.bin"});
    REQUIRE(merged.verified);
    REQUIRE(merged.mergedHash.size() == 32);
}

TEST_CASE("max part size directive bounds every part")
{
    testutil::TempDir dir;
    const auto source = dir / "a.bin";
    testutil::writeFile(source, testutil::patternBytes(1000));
    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(), token);

    const auto split = splitter.split({source, dir / "parts", partition::SizingDirective::maxPartSize(300)});
    REQUIRE(split.totalParts == 4);
    for (const auto &part : split.manifestData.parts)
    {
        REQUIRE(part.size <= 300);
    }
}

TEST_CASE("split rejects bad input")
{
    testutil::TempDir dir;
    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(), token);

    REQUIRE(categoryOf([&] { splitter.split({dir / "absent", dir / "parts", {}}); }) == ErrorCategory::IoFailure);

    testutil::writeFile(dir / "empty", "");
    REQUIRE(categoryOf([&] { splitter.split({dir / "empty", dir / "parts", {}}); }) ==
            ErrorCategory::InvalidInput);

    testutil::writeFile(dir / "small", "abc");
    REQUIRE(categoryOf([&]
                       { splitter.split({dir / "small", dir / "parts", partition::SizingDirective::fixedCount(4)}); }) ==
            ErrorCategory::InvalidInput);
}

TEST_CASE("merge refuses to run on damaged parts")
{
    testutil::TempDir dir;
    const auto source = dir / "a.bin";
    testutil::writeFile(source, testutil::patternBytes(900));
    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(), token);
    const auto split = splitter.split({source, dir / "parts", partition::SizingDirective::fixedCount(3)});

    fs::remove(dir / "parts" / split.manifestData.parts[1].filename);
    REQUIRE(categoryOf([&] { splitter.merge({dir / "parts", dir / "out.bin"}); }) ==
            ErrorCategory::IntegrityFailure);
    REQUIRE_FALSE(fs::exists(dir / "out.bin"));
}

TEST_CASE("merge without a manifest concatenates in lexical order")
{
    testutil::TempDir dir;
    fs::create_directory(dir / "parts");
    testutil::writeFile(dir / "parts" / "x.part000", "one-");
    testutil::writeFile(dir / "parts" / "x.part002", "three");
    testutil::writeFile(dir / "parts" / "x.part001", "two-");

    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(), token);
    const auto merged = splitter.merge({dir / "parts", dir / "joined"});
    REQUIRE(merged.degraded);
    REQUIRE_FALSE(merged.verified);
    REQUIRE(merged.expectedHash.empty());
    REQUIRE(merged.partsMerged == 3);
    REQUIRE(testutil::readFile(dir / "joined") == "one-two-three");
}

TEST_CASE("merge rejects missing directories and empty degraded input")
{
    testutil::TempDir dir;
    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(), token);

    REQUIRE(categoryOf([&] { splitter.merge({dir / "nowhere", dir / "out"}); }) == ErrorCategory::IoFailure);

    fs::create_directory(dir / "empty");
    REQUIRE(categoryOf([&] { splitter.merge({dir / "empty", dir / "out"}); }) == ErrorCategory::InvalidInput);
}

TEST_CASE("merge will not write over one of its own parts")
{
    testutil::TempDir dir;
    fs::create_directory(dir / "parts");
    testutil::writeFile(dir / "parts" / "x.part000", "abc");
    testutil::writeFile(dir / "parts" / "x.part001", "def");

    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(), token);
    REQUIRE(categoryOf([&] { splitter.merge({dir / "parts", dir / "parts" / "x.part000"}); }) ==
            ErrorCategory::InvalidInput);
    REQUIRE(testutil::readFile(dir / "parts" / "x.part000") == "abc");
}

TEST_CASE("merge will not write over the manifest")
{
    testutil::TempDir dir;
    const auto source = dir / "a.bin";
    testutil::writeFile(source, testutil::patternBytes(600));
    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(), token);
    const auto split = splitter.split({source, dir / "parts", partition::SizingDirective::fixedCount(3)});
    const std::string before = testutil::readFile(split.manifestPath);

    REQUIRE(categoryOf([&] { splitter.merge({dir / "parts", split.manifestPath}); }) ==
            ErrorCategory::InvalidInput);
    REQUIRE(testutil::readFile(split.manifestPath) == before);
}

TEST_CASE("merge rejects a manifest whose original name leaves the working directory")
{
    testutil::TempDir dir;
    const auto source = dir / "a.bin";
    testutil::writeFile(source, testutil::patternBytes(300));
    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(), token);
    const auto split = splitter.split({source, dir / "parts", partition::SizingDirective::fixedCount(3)});

    auto tampered = nlohmann::json::parse(testutil::readFile(split.manifestPath));
    tampered["original_file"] = "../escaped.bin";
    testutil::writeFile(split.manifestPath, tampered.dump(2));

    REQUIRE(categoryOf([&] { splitter.merge({dir / "parts", ""}); }) == ErrorCategory::ManifestFailure);
}

TEST_CASE("verify round-trips through a scratch directory and cleans it up")
{
    testutil::TempDir dir;
    const auto source = dir / "video.mp4";
    testutil::writeFile(source, testutil::patternBytes(12345));

    const fs::path tmp = fs::temp_directory_path();
    const std::size_t before = entriesStartingWith(tmp, "afs-verify-");

    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(), token);
    const auto result = splitter.verify({source, partition::SizingDirective::fixedCount(5)});
    REQUIRE(result.match);
    REQUIRE(result.parts == 5);
    REQUIRE(result.originalHash == result.mergedHash);
    REQUIRE(entriesStartingWith(tmp, "afs-verify-") == before);
    // Nothing was written next to the source.
    REQUIRE(entriesStartingWith(dir.path(), "video.mp4.part") == 0);
}

TEST_CASE("verify cleans up after a failure too")
{
    testutil::TempDir dir;
    testutil::writeFile(dir / "tiny", "ab");

    const fs::path tmp = fs::temp_directory_path();
    const std::size_t before = entriesStartingWith(tmp, "afs-verify-");

    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(), token);
    REQUIRE(categoryOf([&] { splitter.verify({dir / "tiny", partition::SizingDirective::fixedCount(3)}); }) ==
            ErrorCategory::InvalidInput);
    REQUIRE(entriesStartingWith(tmp, "afs-verify-") == before);
}

TEST_CASE("cancelled operations report the cancelled category")
{
    testutil::TempDir dir;
    const auto source = dir / "a.bin";
    testutil::writeFile(source, testutil::patternBytes(20000));

    cancel::CancellationToken token;
    token.request();
    FileSplitter splitter(quietConfig(), token);
    REQUIRE(categoryOf([&] { splitter.split({source, dir / "parts", {}}); }) == ErrorCategory::Cancelled);
    REQUIRE(categoryOf([&] { splitter.verify({source, {}}); }) == ErrorCategory::Cancelled);
    REQUIRE(errors::exitCodeFor(ErrorCategory::Cancelled) == 130);
}

TEST_CASE("check reports part status without merging")
{
    testutil::TempDir dir;
    const auto source = dir / "a.bin";
    testutil::writeFile(source, testutil::patternBytes(800));
    cancel::CancellationToken token;
    FileSplitter splitter(quietConfig(), token);
    const auto split = splitter.split({source, dir / "parts", partition::SizingDirective::fixedCount(4)});

    const auto good = splitter.check(dir / "parts");
    REQUIRE(good.passed);
    REQUIRE(good.verified());

    testutil::writeFile(dir / "parts" / split.manifestData.parts[2].filename, "x");
    const auto bad = splitter.check(dir / "parts");
    REQUIRE_FALSE(bad.passed);
    REQUIRE(bad.firstFailure()->index == 2);
}
