// File: Chunker.cpp
#include "Chunker.hpp"

#include "../cancel/cancel.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

Chunker::Chunker(const ChunkerOptions &options, std::vector<char> &buffer,
                 const cancel::CancellationToken *token)
    : options_(options), buffer_(buffer), token_(token)
{
    if (buffer_.empty())
    {
        throw std::invalid_argument("chunker buffer must not be empty");
    }
    if (options_.progressEvery == 0)
    {
        options_.progressEvery = 1;
    }
}

std::string Chunker::partFileName(const std::string &base_name, std::size_t index)
{
    std::ostringstream oss;
    oss << base_name << ".part" << std::setw(3) << std::setfill('0') << index;
    return oss.str();
}

std::vector<manifest::PartRecord> Chunker::splitFile(const fs::path &source_path,
                                                     const partition::PartitionPlan &plan,
                                                     const fs::path &output_dir)
{
    std::ifstream source(source_path, std::ios::binary);
    if (!source)
    {
        errors::throwIoFailure("Failed to open file: " + source_path.string());
    }

    const std::string base_name = source_path.filename().string();
    const std::size_t total = plan.count();
    if (!options_.quiet)
    {
        MyLogger::info("Splitting " + std::to_string(plan.total()) + " bytes into " + std::to_string(total) +
                       " parts...");
    }

    std::vector<manifest::PartRecord> parts;
    parts.reserve(total);
    for (std::size_t i = 0; i < total; ++i)
    {
        const std::uint64_t length = plan.lengths[i];
        const fs::path part_path = output_dir / partFileName(base_name, i);

        copyPart(source, i, length, part_path);

        // Hash what actually landed on disk, not what passed through the buffer.
        manifest::PartRecord record;
        record.index = i;
        record.filename = part_path.filename().string();
        record.size = length;
        record.hash = hashing::hashFile(part_path, options_.algorithm, buffer_, token_).hex;
        parts.push_back(record);

        if (!options_.quiet && ((i + 1) % options_.progressEvery == 0 || i + 1 == total))
        {
            MyLogger::info("  Created part " + std::to_string(i + 1) + "/" + std::to_string(total) + " (" +
                           std::to_string(length) + " bytes)");
        }
    }
    return parts;
}

void Chunker::copyPart(std::ifstream &source, std::size_t index, std::uint64_t length, const fs::path &part_path)
{
    std::ofstream part(part_path, std::ios::binary | std::ios::trunc);
    if (!part)
    {
        errors::throwIoFailure("Failed to create part file: " + part_path.string());
    }

    std::uint64_t written = 0;
    while (written < length)
    {
        const auto to_read = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer_.size(), length - written));
        source.read(buffer_.data(), static_cast<std::streamsize>(to_read));
        const std::streamsize got = source.gcount();
        if (got <= 0)
        {
            if (source.bad())
            {
                errors::throwIoFailure("Read error in source file at part " + std::to_string(index));
            }
            errors::throwIoFailure("Unexpected end of file at part " + std::to_string(index));
        }
        part.write(buffer_.data(), got);
        if (!part)
        {
            errors::throwIoFailure("Failed to write part file: " + part_path.string());
        }
        written += static_cast<std::uint64_t>(got);
        if (token_ != nullptr)
        {
            token_->throwIfRequested();
        }
    }

    part.close();
    if (!part)
    {
        errors::throwIoFailure("Failed to close part file: " + part_path.string());
    }
}
