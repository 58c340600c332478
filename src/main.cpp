// main.cpp
#include "cancel/cancel.hpp"
#include "errors/errors.hpp"
#include "hashing/hashing.hpp"
#include "load_config/load_config.hpp"
#include "logger/Mylogger.hpp"
#include "report/report.hpp"
#include "splitter/FileSplitter.hpp"
#include "version.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace
{
    constexpr std::int64_t kBytesPerMiB = 1024 * 1024;

    class UsageError : public std::runtime_error
    {
    public:
        explicit UsageError(const std::string &msg) : std::runtime_error(msg) {}
    };

    enum class Command
    {
        Split,
        Merge,
        Verify,
        Check,
        Help,
        Version
    };

    struct CliOptions
    {
        Command command = Command::Help;
        std::string target; // input file (split/verify) or parts directory (merge/check)
        std::string output;
        std::optional<std::int64_t> numParts;
        std::optional<std::int64_t> maxPartSizeMb;
        std::optional<hashing::HashAlgorithm> algorithm;
        std::string configPath;
        bool quiet = false;
        bool json = false;
        bool verbose = false;
    };

    void print_usage(std::ostream &out)
    {
        out << "Usage:\n"
               "  afs split  <input_file> [-o DIR] [-n N | -s MB] [-a ALG] [-q] [--json]\n"
               "  afs merge  <parts_dir>  [-o FILE] [-a ALG] [-q] [--json]\n"
               "  afs verify <input_file> [-n N | -s MB] [-a ALG] [-q] [--json]\n"
               "  afs check  <parts_dir>  [-q] [--json]\n"
               "  afs --version | --help\n"
               "\n"
               "Options:\n"
               "  -o, --output-dir / --output-file  where parts or the merged file go\n"
               "  -n, --num-parts N                 number of parts (default: 24)\n"
               "  -s, --max-part-size-mb MB         maximum size per part in MiB\n"
               "  -a, --algorithm ALG               md5, sha1, sha256 (default) or sha512\n"
               "  -q, --quiet                       suppress progress output\n"
               "      --json                        print the result as one JSON object\n"
               "  -v, --verbose                     debug logging\n"
               "      --config FILE                 JSON config file (or $AFS_CONFIG)\n";
    }

    std::int64_t parse_integer(const std::string &flag, const std::string &value)
    {
        std::size_t consumed = 0;
        std::int64_t parsed = 0;
        try
        {
            parsed = std::stoll(value, &consumed);
        }
        catch (const std::exception &)
        {
            throw UsageError("invalid integer for " + flag + ": " + value);
        }
        if (consumed != value.size())
        {
            throw UsageError("invalid integer for " + flag + ": " + value);
        }
        return parsed;
    }

    Command parse_command(const std::string &word)
    {
        if (word == "split")
            return Command::Split;
        if (word == "merge")
            return Command::Merge;
        if (word == "verify")
            return Command::Verify;
        if (word == "check")
            return Command::Check;
        if (word == "--help" || word == "-h" || word == "help")
            return Command::Help;
        if (word == "--version")
            return Command::Version;
        throw UsageError("unknown command: " + word);
    }

    CliOptions parse_args(int argc, char **argv)
    {
        CliOptions opts;
        bool haveCommand = false;
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto next = [&](const std::string &flag) -> std::string
            {
                if (i + 1 >= argc)
                {
                    throw UsageError("missing value for " + flag);
                }
                return argv[++i];
            };

            const bool sizing = opts.command == Command::Split || opts.command == Command::Verify;
            if (arg == "--config")
            {
                opts.configPath = next(arg);
            }
            else if (arg == "-v" || arg == "--verbose")
            {
                opts.verbose = true;
            }
            else if (arg == "-q" || arg == "--quiet")
            {
                opts.quiet = true;
            }
            else if (arg == "--json")
            {
                opts.json = true;
            }
            else if (!haveCommand)
            {
                opts.command = parse_command(arg);
                haveCommand = true;
            }
            else if ((arg == "-o" || arg == "--output-dir" || arg == "--output-file") &&
                     (opts.command == Command::Split || opts.command == Command::Merge))
            {
                opts.output = next(arg);
            }
            else if ((arg == "-n" || arg == "--num-parts") && sizing)
            {
                opts.numParts = parse_integer(arg, next(arg));
            }
            else if ((arg == "-s" || arg == "--max-part-size-mb") && sizing)
            {
                opts.maxPartSizeMb = parse_integer(arg, next(arg));
            }
            else if ((arg == "-a" || arg == "--algorithm") && opts.command != Command::Check)
            {
                const std::string name = next(arg);
                hashing::HashAlgorithm algorithm = hashing::HashAlgorithm::Sha256;
                if (!hashing::tryParseAlgorithm(name, algorithm))
                {
                    throw UsageError("invalid choice for " + arg + ": " + name +
                                     " (choose from md5, sha1, sha256, sha512)");
                }
                opts.algorithm = algorithm;
            }
            else if (!arg.empty() && arg[0] == '-')
            {
                throw UsageError("unknown or misplaced option: " + arg);
            }
            else if (opts.target.empty())
            {
                opts.target = arg;
            }
            else
            {
                throw UsageError("unexpected argument: " + arg);
            }
        }

        if (opts.command == Command::Help || opts.command == Command::Version)
        {
            return opts;
        }
        if (opts.target.empty())
        {
            throw UsageError(opts.command == Command::Merge || opts.command == Command::Check
                                 ? "missing parts directory"
                                 : "missing input file");
        }
        if (opts.numParts && opts.maxPartSizeMb)
        {
            throw UsageError("-n/--num-parts and -s/--max-part-size-mb are mutually exclusive");
        }
        return opts;
    }

    partition::SizingDirective directive_from(const CliOptions &opts)
    {
        if (opts.numParts)
        {
            return partition::SizingDirective::fixedCount(*opts.numParts);
        }
        if (opts.maxPartSizeMb)
        {
            const std::int64_t mb = *opts.maxPartSizeMb;
            if (mb > std::numeric_limits<std::int64_t>::max() / kBytesPerMiB)
            {
                throw UsageError("max part size is too large: " + std::to_string(mb) + " MB");
            }
            return partition::SizingDirective::maxPartSize(mb * kBytesPerMiB);
        }
        return partition::SizingDirective::defaults();
    }

    // Config file first, then command line flags on top.
    AfsConfig effective_config(const CliOptions &opts)
    {
        AfsConfig config = ConfigReader::resolve(opts.configPath);
        if (opts.algorithm)
            config.algorithm = *opts.algorithm;
        if (opts.quiet || opts.json)
            config.quiet = true;
        if (opts.verbose)
            config.verbose = true;
        return config;
    }

    int run(const CliOptions &opts, const AfsConfig &config, const cancel::CancellationToken &token)
    {
        FileSplitter splitter(config, token);
        switch (opts.command)
        {
        case Command::Split:
        {
            SplitRequest request{opts.target, opts.output, directive_from(opts)};
            const SplitResult result = splitter.split(request);
            if (opts.json)
                std::cout << report::splitJson(result).dump() << std::endl;
            else if (!config.quiet)
                report::printSplit(std::cout, result);
            return errors::kExitSuccess;
        }
        case Command::Merge:
        {
            MergeRequest request{opts.target, opts.output};
            const MergeResult result = splitter.merge(request);
            if (opts.json)
                std::cout << report::mergeJson(result).dump() << std::endl;
            else if (!config.quiet)
                report::printMerge(std::cout, result);
            return errors::kExitSuccess;
        }
        case Command::Verify:
        {
            VerifyRequest request{opts.target, directive_from(opts)};
            const VerifyResult result = splitter.verify(request);
            if (opts.json)
                std::cout << report::verifyJson(result).dump() << std::endl;
            else if (!result.match)
                report::printVerify(std::cerr, result);
            else if (!config.quiet)
                report::printVerify(std::cout, result);
            return result.match ? errors::kExitSuccess : errors::kExitFailure;
        }
        case Command::Check:
        {
            const verifier::VerifyReport result = splitter.check(opts.target);
            if (opts.json)
                std::cout << report::checkJson(result).dump() << std::endl;
            else if (!config.quiet || !result.passed)
                report::printCheck(result.passed ? std::cout : std::cerr, result);
            return result.passed ? errors::kExitSuccess : errors::kExitFailure;
        }
        case Command::Help:
        case Command::Version:
            break;
        }
        return errors::kExitSuccess;
    }
} // namespace

int main(int argc, char *argv[])
{
    CliOptions opts;
    try
    {
        opts = parse_args(argc, argv);
    }
    catch (const UsageError &e)
    {
        std::cerr << "error: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return errors::kExitUsage;
    }

    if (opts.command == Command::Help)
    {
        print_usage(std::cout);
        return errors::kExitSuccess;
    }
    if (opts.command == Command::Version)
    {
        std::cout << "afs " << AFS_VERSION << std::endl;
        return errors::kExitSuccess;
    }

    cancel::CancellationToken token;
    cancel::installSignalHandlers(token);

    try
    {
        MyLogger::init(opts.verbose ? LogLevel::Debug : (opts.quiet || opts.json ? LogLevel::Warning : LogLevel::Info));
        const AfsConfig config = effective_config(opts);
        MyLogger::setThreshold(config.verbose ? LogLevel::Debug : (config.quiet ? LogLevel::Warning : LogLevel::Info));
        return run(opts, config, token);
    }
    catch (const UsageError &e)
    {
        std::cerr << "error: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return errors::kExitUsage;
    }
    catch (const errors::AfsError &e)
    {
        if (opts.json)
            std::cout << report::failureJson(e.category(), e.what()).dump() << std::endl;
        else if (e.category() == errors::ErrorCategory::Cancelled)
            std::cerr << "\n\nOperation cancelled by user" << std::endl;
        else
            std::cerr << "Error: " << e.what() << std::endl;
        return errors::exitCodeFor(e.category());
    }
    catch (const std::exception &e)
    {
        if (opts.json)
            std::cout << nlohmann::json{{"status", "failed"}, {"error", e.what()}}.dump() << std::endl;
        else
            std::cerr << "Error: " << e.what() << std::endl;
        return errors::kExitFailure;
    }
}
