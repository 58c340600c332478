#ifndef HASHING_HPP
#define HASHING_HPP

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace cancel
{
    class CancellationToken;
}

namespace hashing
{
    // I/O buffer used for hashing and for copying part data (4MB).
    constexpr std::size_t kDefaultBufferSize = 4 * 1024 * 1024;

    enum class HashAlgorithm
    {
        Md5,
        Sha1,
        Sha256,
        Sha512
    };

    // Resolves "md5", "sha1", "sha256", "sha512" (case-insensitive).
    // Throws errors::AfsError(InvalidInput) for anything else.
    HashAlgorithm parseAlgorithm(const std::string &name);
    bool tryParseAlgorithm(const std::string &name, HashAlgorithm &out);
    std::string algorithmName(HashAlgorithm algorithm);

    // Length of the hex rendering of a digest, e.g. 64 for SHA-256.
    std::size_t hexDigestLength(HashAlgorithm algorithm);

    struct FileDigest
    {
        HashAlgorithm algorithm;
        std::string hex;

        bool operator==(const FileDigest &other) const
        {
            return algorithm == other.algorithm && hex == other.hex;
        }
    };

    // Incremental digest over one EVP context.
    class Hasher
    {
    public:
        explicit Hasher(HashAlgorithm algorithm);

        void update(const char *data, std::size_t size);

        // Finishes the digest and resets the context for reuse.
        FileDigest finish();

    private:
        void reset();

        struct CtxDeleter
        {
            void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
        };

        HashAlgorithm algorithm_;
        const EVP_MD *md_;
        std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    };

    /**
     * @brief Digest everything readable from the stream, reading buffer.size() bytes at a time.
     *
     * @param in        Source stream; read until EOF.
     * @param algorithm Digest algorithm.
     * @param buffer    Caller-owned I/O buffer, must be non-empty.
     * @param token     Optional; checked after each chunk.
     *
     * @throws errors::AfsError IoFailure when the stream goes bad mid-read,
     *         Cancelled when the token fires.
     */
    FileDigest hashStream(std::istream &in, HashAlgorithm algorithm, std::vector<char> &buffer,
                          const cancel::CancellationToken *token = nullptr);

    FileDigest hashFile(const std::filesystem::path &path, HashAlgorithm algorithm,
                        std::vector<char> &buffer, const cancel::CancellationToken *token = nullptr);

    FileDigest hashFile(const std::filesystem::path &path, HashAlgorithm algorithm,
                        std::size_t bufferSize = kDefaultBufferSize,
                        const cancel::CancellationToken *token = nullptr);
} // namespace hashing

#endif // HASHING_HPP
