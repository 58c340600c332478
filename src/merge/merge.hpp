#ifndef MERGE_HPP
#define MERGE_HPP

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace cancel
{
    class CancellationToken;
}

namespace merge
{
    /**
     * @brief True for names ending in ".part" followed by exactly three digits.
     *
     * This is the only way parts are recognised when no manifest is present.
     */
    bool isPartFileName(const std::string &filename);

    /**
     * @brief List the part files of a directory in lexical filename order.
     *
     * @throws errors::AfsError(IoFailure) if the directory cannot be read.
     */
    std::vector<std::filesystem::path> discoverParts(const std::filesystem::path &directory);

    class Merger
    {
    public:
        Merger(std::vector<char> &buffer, const cancel::CancellationToken *token = nullptr, bool quiet = false,
               std::size_t progressEvery = 5);

        /**
         * @brief Concatenate parts, in the given order, into output_path (truncated first).
         *
         * Each part is opened, streamed through the shared buffer and closed before the next.
         * On failure the output is left incomplete and must be discarded by the caller.
         */
        void mergeParts(const std::vector<std::filesystem::path> &parts,
                        const std::filesystem::path &output_path);

    private:
        void appendPart(std::ofstream &output, const std::filesystem::path &part_path);

        std::vector<char> &buffer_;
        const cancel::CancellationToken *token_;
        bool quiet_;
        std::size_t progressEvery_;
    };
} // namespace merge

#endif // MERGE_HPP
