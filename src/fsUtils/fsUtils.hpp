#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace fsUtils
{
    // Creates the directory (and parents) if needed; IoFailure if it cannot be created
    // or the path exists as something else.
    void ensureDirectoryExists(const std::filesystem::path &dirPath);

    // Size of a regular file. IoFailure if it does not exist or cannot be stat'ed,
    // InvalidInput if the path is not a regular file.
    std::uint64_t regularFileSize(const std::filesystem::path &filePath);

    // Removes a file or a whole directory tree. Never throws; failures are logged.
    bool removeEntry(const std::filesystem::path &entryPath);

    // A fresh, uniquely named directory under the system temp dir, removed with all its
    // contents when the object goes away, whichever way the owning scope is left.
    class ScratchDirectory
    {
    public:
        explicit ScratchDirectory(const std::string &prefix = "afs-");
        ~ScratchDirectory();

        ScratchDirectory(const ScratchDirectory &) = delete;
        ScratchDirectory &operator=(const ScratchDirectory &) = delete;

        const std::filesystem::path &path() const { return path_; }

    private:
        std::filesystem::path path_;
    };
} // namespace fsUtils
