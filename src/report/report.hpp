#ifndef REPORT_HPP
#define REPORT_HPP

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

#include "../errors/errors.hpp"
#include "../splitter/FileSplitter.hpp"

// Presentation of pipeline results: one JSON object for --json callers, short text otherwise.
namespace report
{
    nlohmann::json splitJson(const SplitResult &result);
    nlohmann::json mergeJson(const MergeResult &result);
    nlohmann::json verifyJson(const VerifyResult &result);
    nlohmann::json checkJson(const verifier::VerifyReport &result);
    nlohmann::json failureJson(errors::ErrorCategory category, const std::string &reason);

    void printSplit(std::ostream &out, const SplitResult &result);
    void printMerge(std::ostream &out, const MergeResult &result);
    void printVerify(std::ostream &out, const VerifyResult &result);
    void printCheck(std::ostream &out, const verifier::VerifyReport &result);
}

#endif // REPORT_HPP
