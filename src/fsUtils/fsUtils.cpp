#include "fsUtils.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"

#include <random>
#include <sstream>
#include <iomanip>

namespace fsUtils
{
    namespace
    {
        std::string randomSuffix()
        {
            static thread_local std::mt19937_64 rng{std::random_device{}()};
            std::ostringstream oss;
            oss << std::hex << std::setw(16) << std::setfill('0') << rng();
            return oss.str();
        }
    }

    void ensureDirectoryExists(const std::filesystem::path &dirPath)
    {
        std::error_code ec;
        if (std::filesystem::exists(dirPath, ec))
        {
            if (!std::filesystem::is_directory(dirPath, ec))
            {
                errors::throwIoFailure("Not a directory: " + dirPath.string());
            }
            MyLogger::debug("Directory already exists: " + dirPath.string());
            return;
        }
        std::filesystem::create_directories(dirPath, ec);
        if (ec)
        {
            errors::throwIoFailure("Error creating directory '" + dirPath.string() + "': " + ec.message());
        }
        MyLogger::debug("Created directory: " + dirPath.string());
    }

    std::uint64_t regularFileSize(const std::filesystem::path &filePath)
    {
        std::error_code ec;
        auto status = std::filesystem::status(filePath, ec);
        if (ec || !std::filesystem::exists(status))
        {
            errors::throwIoFailure("Input file not found: " + filePath.string());
        }
        if (!std::filesystem::is_regular_file(status))
        {
            errors::throwInvalidInput("Not a regular file: " + filePath.string());
        }
        auto size = std::filesystem::file_size(filePath, ec);
        if (ec)
        {
            errors::throwIoFailure("Cannot read size of " + filePath.string() + ": " + ec.message());
        }
        return size;
    }

    bool removeEntry(const std::filesystem::path &entryPath)
    {
        std::error_code ec;
        if (!std::filesystem::exists(entryPath, ec))
        {
            return true;
        }
        auto count = std::filesystem::remove_all(entryPath, ec);
        if (ec)
        {
            MyLogger::error("Failed to remove '" + entryPath.string() + "': " + ec.message());
            return false;
        }
        MyLogger::debug("Removed " + std::to_string(count) + " entries: " + entryPath.string());
        return true;
    }

    ScratchDirectory::ScratchDirectory(const std::string &prefix)
    {
        std::error_code ec;
        auto base = std::filesystem::temp_directory_path(ec);
        if (ec)
        {
            errors::throwIoFailure("No temporary directory available: " + ec.message());
        }
        // create_directory reports false for an existing path, so a collision just retries.
        for (int attempt = 0; attempt < 16; ++attempt)
        {
            auto candidate = base / (prefix + randomSuffix());
            if (std::filesystem::create_directory(candidate, ec))
            {
                path_ = candidate;
                MyLogger::debug("Created scratch directory: " + path_.string());
                return;
            }
            if (ec)
            {
                errors::throwIoFailure("Error creating scratch directory '" + candidate.string() +
                                       "': " + ec.message());
            }
        }
        errors::throwIoFailure("Could not create a unique scratch directory under " + base.string());
    }

    ScratchDirectory::~ScratchDirectory()
    {
        if (!path_.empty())
        {
            removeEntry(path_);
        }
    }
} // namespace fsUtils
