#ifndef MANIFEST_HPP
#define MANIFEST_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../hashing/hashing.hpp"
#include "../version.hpp"

namespace manifest
{
    // File written next to the parts.
    constexpr const char *kManifestFileName = "manifest.json";
    // Tool version recorded in every manifest.
    constexpr const char *kFormatVersion = AFS_VERSION;

    struct PartRecord
    {
        std::size_t index = 0;
        std::string filename; // plain file name, relative to the parts directory
        std::uint64_t size = 0;
        std::string hash; // hex digest, algorithm given by the owning manifest
    };

    struct Manifest
    {
        std::string originalFile;
        std::uint64_t originalSize = 0;
        std::string originalHash;
        hashing::HashAlgorithm hashAlgorithm = hashing::HashAlgorithm::Sha256;
        std::size_t numParts = 0;
        std::string version = kFormatVersion;
        std::vector<PartRecord> parts;
    };

    void to_json(nlohmann::json &j, const PartRecord &part);
    void from_json(const nlohmann::json &j, PartRecord &part);
    void to_json(nlohmann::json &j, const Manifest &m);
    void from_json(const nlohmann::json &j, Manifest &m);

    // Checks the manifest invariants: part count, contiguous indices, sizes summing
    // to the original size, digest lengths matching the algorithm, plain filenames.
    // Throws errors::AfsError(ManifestFailure) naming the first violation.
    void validate(const Manifest &m);

    // Builds the manifest for a finished split. The original file is re-hashed here,
    // independently of the part hashes, so the manifest certifies the source itself.
    class ManifestBuilder
    {
    public:
        ManifestBuilder(hashing::HashAlgorithm algorithm, std::vector<char> &buffer,
                        const cancel::CancellationToken *token = nullptr);

        Manifest build(const std::filesystem::path &originalPath, const std::vector<PartRecord> &parts) const;

    private:
        hashing::HashAlgorithm algorithm_;
        std::vector<char> &buffer_;
        const cancel::CancellationToken *token_;
    };

    // Serializes with two-space indentation. Throws IoFailure when the file cannot be written.
    void writeManifest(const Manifest &m, const std::filesystem::path &path);

    // Throws ManifestFailure for missing, malformed or inconsistent manifests.
    Manifest readManifest(const std::filesystem::path &path);
} // namespace manifest

#endif // MANIFEST_HPP
