#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "fsUtils/fsUtils.hpp"

namespace testutil
{
    // Deterministic, non-repeating-looking content so misordered parts change the digest.
    inline std::string patternBytes(std::size_t size)
    {
        std::string data(size, '\0');
        unsigned int state = 2463534242u;
        for (std::size_t i = 0; i < size; ++i)
        {
            state ^= state << 13;
            state ^= state >> 17;
            state ^= state << 5;
            data[i] = static_cast<char>(state & 0xff);
        }
        return data;
    }

    inline void writeFile(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    inline std::string readFile(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    // Each test case gets its own directory under the system temp dir.
    class TempDir
    {
    public:
        TempDir() : scratch_("afs-test-") {}

        const std::filesystem::path &path() const { return scratch_.path(); }
        std::filesystem::path operator/(const std::string &name) const { return scratch_.path() / name; }

    private:
        fsUtils::ScratchDirectory scratch_;
    };
}

#endif // TEST_HELPERS_HPP
