
// File: Chunker.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "Partition.hpp"
#include "../hashing/hashing.hpp"
#include "../manifest/manifest.hpp"

namespace cancel
{
    class CancellationToken;
}

struct ChunkerOptions
{
    hashing::HashAlgorithm algorithm = hashing::HashAlgorithm::Sha256;
    bool quiet = false;
    std::size_t progressEvery = 5; // log every Nth part (and the last one)
};

// Chunker writes the planned parts of one source file and hashes each one as written to disk.
class Chunker
{
public:
    // buffer is the single I/O buffer shared with the rest of the pipeline; it must outlive the Chunker.
    Chunker(const ChunkerOptions &options, std::vector<char> &buffer,
            const cancel::CancellationToken *token = nullptr);

    // Reads source_path once, front to back, writing <basename>.partNNN files into output_dir.
    // Parts already written stay on disk if a later part fails.
    std::vector<manifest::PartRecord> splitFile(const std::filesystem::path &source_path,
                                                const partition::PartitionPlan &plan,
                                                const std::filesystem::path &output_dir);

    // "<base_name>.part<index zero-padded to 3 digits>"
    static std::string partFileName(const std::string &base_name, std::size_t index);

private:
    void copyPart(std::ifstream &source, std::size_t index, std::uint64_t length,
                  const std::filesystem::path &part_path);

    ChunkerOptions options_;
    std::vector<char> &buffer_;
    const cancel::CancellationToken *token_;
};
