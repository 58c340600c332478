#ifndef LOAD_CONFIG_HPP
#define LOAD_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

#include "../hashing/hashing.hpp"

using json = nlohmann::json;

// Settings every component receives at construction. Built once at startup and never mutated.
struct AfsConfig
{
    hashing::HashAlgorithm algorithm = hashing::HashAlgorithm::Sha256;
    std::uint64_t defaultParts = 24;
    std::size_t ioBufferSize = hashing::kDefaultBufferSize;
    std::size_t progressEvery = 5;
    bool verifyStopOnFirstFailure = true;
    bool quiet = false;
    bool verbose = false;
};

namespace ConfigReader
{
    // Environment variable naming a config file when --config is not given.
    constexpr const char *kConfigEnvVar = "AFS_CONFIG";

    json load(const std::string &filepath);

    // Typed lookups. A missing key yields the fallback; a key of the wrong type or out
    // of range throws errors::AfsError(InvalidInput).
    std::int64_t get_config_value(const std::string &key, const json &j, std::int64_t fallback);
    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback);
    bool get_config_bool(const std::string &key, const json &j, bool fallback);

    AfsConfig fromJson(const json &j, const AfsConfig &defaults = AfsConfig{});

    // Loads path if non-empty, else $AFS_CONFIG if set, else returns the built-in defaults.
    AfsConfig resolve(const std::string &path);
}

#endif // LOAD_CONFIG_HPP
