#include "hashing.hpp"

#include "../cancel/cancel.hpp"
#include "../errors/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace hashing
{
    namespace
    {
        const EVP_MD *evpFor(HashAlgorithm algorithm)
        {
            switch (algorithm)
            {
            case HashAlgorithm::Md5:
                return EVP_md5();
            case HashAlgorithm::Sha1:
                return EVP_sha1();
            case HashAlgorithm::Sha256:
                return EVP_sha256();
            case HashAlgorithm::Sha512:
                return EVP_sha512();
            }
            throw std::logic_error("unhandled hash algorithm");
        }

        std::string toHex(const unsigned char *md, unsigned int len)
        {
            std::stringstream ss;
            for (unsigned int i = 0; i < len; ++i)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
            }
            return ss.str();
        }
    }

    bool tryParseAlgorithm(const std::string &name, HashAlgorithm &out)
    {
        std::string lowered = name;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "md5")
            out = HashAlgorithm::Md5;
        else if (lowered == "sha1")
            out = HashAlgorithm::Sha1;
        else if (lowered == "sha256")
            out = HashAlgorithm::Sha256;
        else if (lowered == "sha512")
            out = HashAlgorithm::Sha512;
        else
            return false;
        return true;
    }

    HashAlgorithm parseAlgorithm(const std::string &name)
    {
        HashAlgorithm algorithm;
        if (!tryParseAlgorithm(name, algorithm))
        {
            errors::throwInvalidInput("unsupported hash algorithm '" + name +
                                      "' (choose md5, sha1, sha256 or sha512)");
        }
        return algorithm;
    }

    std::string algorithmName(HashAlgorithm algorithm)
    {
        switch (algorithm)
        {
        case HashAlgorithm::Md5:
            return "md5";
        case HashAlgorithm::Sha1:
            return "sha1";
        case HashAlgorithm::Sha256:
            return "sha256";
        case HashAlgorithm::Sha512:
            return "sha512";
        }
        return "unknown";
    }

    std::size_t hexDigestLength(HashAlgorithm algorithm)
    {
        return static_cast<std::size_t>(EVP_MD_size(evpFor(algorithm))) * 2;
    }

    Hasher::Hasher(HashAlgorithm algorithm)
        : algorithm_(algorithm), md_(evpFor(algorithm)), ctx_(EVP_MD_CTX_new())
    {
        if (!ctx_)
        {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
        reset();
    }

    void Hasher::reset()
    {
        if (EVP_DigestInit_ex(ctx_.get(), md_, nullptr) != 1)
        {
            throw std::runtime_error("Failed to initialize " + algorithmName(algorithm_) + " digest");
        }
    }

    void Hasher::update(const char *data, std::size_t size)
    {
        if (size == 0)
            return;
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1)
        {
            throw std::runtime_error("Failed to update " + algorithmName(algorithm_) + " digest");
        }
    }

    FileDigest Hasher::finish()
    {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), md, &md_len) != 1)
        {
            throw std::runtime_error("Failed to finalize " + algorithmName(algorithm_) + " digest");
        }
        FileDigest digest{algorithm_, toHex(md, md_len)};
        reset();
        return digest;
    }

    FileDigest hashStream(std::istream &in, HashAlgorithm algorithm, std::vector<char> &buffer,
                          const cancel::CancellationToken *token)
    {
        if (buffer.empty())
        {
            throw std::invalid_argument("hash buffer must not be empty");
        }
        Hasher hasher(algorithm);
        while (in)
        {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize bytesRead = in.gcount();
            if (bytesRead > 0)
            {
                hasher.update(buffer.data(), static_cast<std::size_t>(bytesRead));
            }
            if (token != nullptr)
            {
                token->throwIfRequested();
            }
        }
        // A clean EOF sets eof+fail; bad alone means the device failed.
        if (in.bad())
        {
            errors::throwIoFailure("read error while hashing");
        }
        return hasher.finish();
    }

    FileDigest hashFile(const std::filesystem::path &path, HashAlgorithm algorithm,
                        std::vector<char> &buffer, const cancel::CancellationToken *token)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            errors::throwIoFailure("Error reading file " + path.string() + ": cannot open for hashing");
        }
        try
        {
            return hashStream(file, algorithm, buffer, token);
        }
        catch (const errors::AfsError &e)
        {
            if (e.category() != errors::ErrorCategory::IoFailure)
                throw;
            errors::throwIoFailure("Error reading file " + path.string() + ": " + e.what());
        }
    }

    FileDigest hashFile(const std::filesystem::path &path, HashAlgorithm algorithm,
                        std::size_t bufferSize, const cancel::CancellationToken *token)
    {
        std::vector<char> buffer(bufferSize == 0 ? kDefaultBufferSize : bufferSize);
        return hashFile(path, algorithm, buffer, token);
    }
} // namespace hashing
