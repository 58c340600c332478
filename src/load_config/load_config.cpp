#include "load_config.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include <cstdlib>
#include <fstream>

namespace ConfigReader
{
    json load(const std::string &filepath)
    {
        std::ifstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file: " + filepath);
            errors::throwInvalidInput("Could not open config file: " + filepath);
        }

        json j;
        try
        {
            config_file >> j;
        }
        catch (const json::parse_error &e)
        {
            errors::throwInvalidInput("JSON parse error in config file " + filepath + ": " + e.what());
        }
        if (!j.is_object())
        {
            errors::throwInvalidInput("Config file " + filepath + " must contain a JSON object");
        }
        MyLogger::debug("Configuration file loaded: " + filepath);
        MyLogger::debug("Loaded JSON: " + j.dump(4));
        return j;
    }

    std::int64_t get_config_value(const std::string &key, const json &j, std::int64_t fallback)
    {
        if (!j.contains(key))
        {
            return fallback;
        }
        if (!j[key].is_number_integer())
        {
            errors::throwInvalidInput("Config key is not an integer: " + key);
        }
        return j[key].get<std::int64_t>();
    }

    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback)
    {
        if (!j.contains(key))
        {
            return fallback;
        }
        if (!j[key].is_string())
        {
            errors::throwInvalidInput("Config key is not a string: " + key);
        }
        return j[key].get<std::string>();
    }

    bool get_config_bool(const std::string &key, const json &j, bool fallback)
    {
        if (!j.contains(key))
        {
            return fallback;
        }
        if (!j[key].is_boolean())
        {
            errors::throwInvalidInput("Config key is not a boolean: " + key);
        }
        return j[key].get<bool>();
    }

    namespace
    {
        std::int64_t positive(const std::string &key, const json &j, std::int64_t fallback)
        {
            auto value = get_config_value(key, j, fallback);
            if (value < 1)
            {
                errors::throwInvalidInput("Config key '" + key + "' must be at least 1");
            }
            return value;
        }
    }

    AfsConfig fromJson(const json &j, const AfsConfig &defaults)
    {
        AfsConfig config = defaults;
        if (j.contains("hash_algorithm"))
        {
            config.algorithm = hashing::parseAlgorithm(get_config_string("hash_algorithm", j, ""));
        }
        config.defaultParts = static_cast<std::uint64_t>(
            positive("default_parts", j, static_cast<std::int64_t>(defaults.defaultParts)));
        config.ioBufferSize = static_cast<std::size_t>(
            positive("io_buffer_size", j, static_cast<std::int64_t>(defaults.ioBufferSize)));
        config.progressEvery = static_cast<std::size_t>(
            positive("progress_every", j, static_cast<std::int64_t>(defaults.progressEvery)));
        config.verifyStopOnFirstFailure =
            get_config_bool("verify_stop_on_first_failure", j, defaults.verifyStopOnFirstFailure);
        config.quiet = get_config_bool("quiet", j, defaults.quiet);
        config.verbose = get_config_bool("verbose", j, defaults.verbose);
        return config;
    }

    AfsConfig resolve(const std::string &path)
    {
        std::string source = path;
        if (source.empty())
        {
            const char *env = std::getenv(kConfigEnvVar);
            if (env != nullptr && *env != '\0')
            {
                source = env;
            }
        }
        if (source.empty())
        {
            return AfsConfig{};
        }
        return fromJson(load(source));
    }
}
