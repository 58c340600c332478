#include "merge.hpp"

#include "../cancel/cancel.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace merge
{
    bool isPartFileName(const std::string &filename)
    {
        static const std::string marker = ".part";
        const std::size_t suffix = marker.size() + 3;
        if (filename.size() < suffix)
            return false;
        const std::size_t start = filename.size() - suffix;
        if (filename.compare(start, marker.size(), marker) != 0)
            return false;
        return std::all_of(filename.begin() + static_cast<std::ptrdiff_t>(start + marker.size()), filename.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    std::vector<fs::path> discoverParts(const fs::path &directory)
    {
        std::vector<fs::path> parts;
        try
        {
            for (const auto &entry : fs::directory_iterator(directory))
            {
                if (entry.is_regular_file() && isPartFileName(entry.path().filename().string()))
                {
                    parts.push_back(entry.path());
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            errors::throwIoFailure("Cannot list directory " + directory.string() + ": " + e.what());
        }

        // Directory order is arbitrary; the part suffix makes lexical order the split order.
        std::sort(parts.begin(), parts.end(), [](const fs::path &a, const fs::path &b)
                  { return a.filename().string() < b.filename().string(); });
        MyLogger::debug("Found " + std::to_string(parts.size()) + " part files in " + directory.string());
        return parts;
    }

    Merger::Merger(std::vector<char> &buffer, const cancel::CancellationToken *token, bool quiet,
                   std::size_t progressEvery)
        : buffer_(buffer), token_(token), quiet_(quiet), progressEvery_(progressEvery == 0 ? 1 : progressEvery)
    {
        if (buffer_.empty())
        {
            throw std::invalid_argument("merge buffer must not be empty");
        }
    }

    void Merger::mergeParts(const std::vector<fs::path> &parts, const fs::path &output_path)
    {
        if (!quiet_)
        {
            MyLogger::info("Merging " + std::to_string(parts.size()) + " parts...");
        }

        std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
        if (!output)
        {
            errors::throwIoFailure("Error opening output file: " + output_path.string());
        }

        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            appendPart(output, parts[i]);
            if (!quiet_ && ((i + 1) % progressEvery_ == 0 || i + 1 == parts.size()))
            {
                MyLogger::info("  Merged part " + std::to_string(i + 1) + "/" + std::to_string(parts.size()));
            }
        }

        output.close();
        if (!output)
        {
            errors::throwIoFailure("Error closing output file: " + output_path.string());
        }
    }

    void Merger::appendPart(std::ofstream &output, const fs::path &part_path)
    {
        std::ifstream part(part_path, std::ios::binary);
        if (!part)
        {
            errors::throwIoFailure("Error opening part file: " + part_path.string());
        }

        while (part)
        {
            part.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
            const std::streamsize got = part.gcount();
            if (got > 0)
            {
                output.write(buffer_.data(), got);
                if (!output)
                {
                    errors::throwIoFailure("Error writing merged output while copying " + part_path.string());
                }
            }
            if (token_ != nullptr)
            {
                token_->throwIfRequested();
            }
        }
        if (part.bad())
        {
            errors::throwIoFailure("Error reading part file: " + part_path.string());
        }
    }
} // namespace merge
