#include "manifest.hpp"

#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"

#include <cctype>
#include <fstream>

using json = nlohmann::json;

namespace manifest
{
    namespace
    {
        bool isLowerHex(const std::string &value)
        {
            for (unsigned char c : value)
            {
                if (!std::isxdigit(c) || std::isupper(c))
                    return false;
            }
            return true;
        }

        bool isPlainFileName(const std::string &name)
        {
            if (name.empty() || name == "." || name == "..")
                return false;
            return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
        }

        // Sizes and counts are non-negative integers; a plain get_to would wrap -1 around.
        std::uint64_t readCount(const json &j, const char *key)
        {
            const auto &value = j.at(key);
            if (!value.is_number_unsigned())
            {
                errors::throwManifestFailure(std::string(key) + " must be a non-negative integer, got " +
                                             value.dump());
            }
            return value.get<std::uint64_t>();
        }

        void checkDigest(const std::string &hex, hashing::HashAlgorithm algorithm, const std::string &what)
        {
            if (hex.size() != hashing::hexDigestLength(algorithm) || !isLowerHex(hex))
            {
                errors::throwManifestFailure(what + " is not a valid " + hashing::algorithmName(algorithm) +
                                             " digest");
            }
        }
    }

    void to_json(json &j, const PartRecord &part)
    {
        j = json{
            {"index", part.index},
            {"filename", part.filename},
            {"size", part.size},
            {"hash", part.hash}};
    }

    void from_json(const json &j, PartRecord &part)
    {
        part.index = static_cast<std::size_t>(readCount(j, "index"));
        j.at("filename").get_to(part.filename);
        part.size = readCount(j, "size");
        j.at("hash").get_to(part.hash);
    }

    void to_json(json &j, const Manifest &m)
    {
        j = json{
            {"original_file", m.originalFile},
            {"original_size", m.originalSize},
            {"original_hash", m.originalHash},
            {"hash_algorithm", hashing::algorithmName(m.hashAlgorithm)},
            {"num_parts", m.numParts},
            {"version", m.version},
            {"parts", m.parts}};
    }

    void from_json(const json &j, Manifest &m)
    {
        j.at("original_file").get_to(m.originalFile);
        m.originalSize = readCount(j, "original_size");
        j.at("original_hash").get_to(m.originalHash);
        const auto algorithm = j.at("hash_algorithm").get<std::string>();
        if (!hashing::tryParseAlgorithm(algorithm, m.hashAlgorithm))
        {
            errors::throwManifestFailure("unsupported hash_algorithm '" + algorithm + "'");
        }
        m.numParts = static_cast<std::size_t>(readCount(j, "num_parts"));
        j.at("version").get_to(m.version);
        j.at("parts").get_to(m.parts);
    }

    void validate(const Manifest &m)
    {
        if (m.parts.empty())
        {
            errors::throwManifestFailure("manifest lists no parts");
        }
        if (m.numParts != m.parts.size())
        {
            errors::throwManifestFailure("num_parts is " + std::to_string(m.numParts) + " but " +
                                         std::to_string(m.parts.size()) + " parts are listed");
        }
        if (!isPlainFileName(m.originalFile))
        {
            errors::throwManifestFailure("original_file '" + m.originalFile + "' is not a plain file name");
        }
        checkDigest(m.originalHash, m.hashAlgorithm, "original_hash");

        std::uint64_t total = 0;
        for (std::size_t i = 0; i < m.parts.size(); ++i)
        {
            const auto &part = m.parts[i];
            if (part.index != i)
            {
                errors::throwManifestFailure("part at position " + std::to_string(i) + " has index " +
                                             std::to_string(part.index));
            }
            if (!isPlainFileName(part.filename))
            {
                errors::throwManifestFailure("part " + std::to_string(i) + " has invalid filename '" +
                                             part.filename + "'");
            }
            checkDigest(part.hash, m.hashAlgorithm, "hash of part " + std::to_string(i));
            total += part.size;
        }
        if (total != m.originalSize)
        {
            errors::throwManifestFailure("part sizes sum to " + std::to_string(total) + " bytes, expected " +
                                         std::to_string(m.originalSize));
        }
    }

    ManifestBuilder::ManifestBuilder(hashing::HashAlgorithm algorithm, std::vector<char> &buffer,
                                     const cancel::CancellationToken *token)
        : algorithm_(algorithm), buffer_(buffer), token_(token)
    {
    }

    Manifest ManifestBuilder::build(const std::filesystem::path &originalPath,
                                    const std::vector<PartRecord> &parts) const
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(originalPath, ec);
        if (ec)
        {
            errors::throwIoFailure("Cannot stat " + originalPath.string() + ": " + ec.message());
        }

        Manifest m;
        m.originalFile = originalPath.filename().string();
        m.originalSize = size;
        m.originalHash = hashing::hashFile(originalPath, algorithm_, buffer_, token_).hex;
        m.hashAlgorithm = algorithm_;
        m.numParts = parts.size();
        m.parts = parts;
        validate(m);
        return m;
    }

    void writeManifest(const Manifest &m, const std::filesystem::path &path)
    {
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open())
        {
            errors::throwIoFailure("Unable to open manifest for writing: " + path.string());
        }
        out << json(m).dump(2) << '\n';
        out.close();
        if (!out)
        {
            errors::throwIoFailure("Error writing manifest: " + path.string());
        }
        MyLogger::debug("Manifest written: " + path.string());
    }

    Manifest readManifest(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            errors::throwManifestFailure("Unable to open manifest: " + path.string());
        }

        Manifest m;
        try
        {
            json j;
            in >> j;
            m = j.get<Manifest>();
        }
        catch (const json::parse_error &e)
        {
            errors::throwManifestFailure("JSON parse error in manifest " + path.string() + ": " + e.what());
        }
        catch (const json::exception &e)
        {
            errors::throwManifestFailure("Incomplete manifest " + path.string() + ": " + e.what());
        }
        validate(m);
        MyLogger::debug("Manifest loaded: " + path.string() + " (" + std::to_string(m.numParts) + " parts)");
        return m;
    }
} // namespace manifest
