#include "Mylogger.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <iostream>
#include <mutex>

namespace logging = boost::log;

namespace
{
    std::once_flag g_sinkOnce;

    logging::trivial::severity_level toSeverity(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::Debug:
            return logging::trivial::debug;
        case LogLevel::Info:
            return logging::trivial::info;
        case LogLevel::Warning:
            return logging::trivial::warning;
        case LogLevel::Error:
        default:
            return logging::trivial::error;
        }
    }

    // Progress and diagnostics go to stderr so that --json output on stdout stays parseable.
    void installSink()
    {
        logging::add_console_log(
            std::clog,
            logging::keywords::format = "[%Severity%] %Message%",
            logging::keywords::auto_flush = true);
        logging::add_common_attributes();
    }
}

void MyLogger::init(LogLevel threshold)
{
    std::call_once(g_sinkOnce, installSink);
    setThreshold(threshold);
}

void MyLogger::setThreshold(LogLevel threshold)
{
    logging::core::get()->set_filter(logging::trivial::severity >= toSeverity(threshold));
}

void MyLogger::debug(const std::string &msg)
{
    BOOST_LOG_TRIVIAL(debug) << msg;
}

void MyLogger::info(const std::string &msg)
{
    BOOST_LOG_TRIVIAL(info) << msg;
}

void MyLogger::warning(const std::string &msg)
{
    BOOST_LOG_TRIVIAL(warning) << msg;
}

void MyLogger::error(const std::string &msg)
{
    BOOST_LOG_TRIVIAL(error) << msg;
}
