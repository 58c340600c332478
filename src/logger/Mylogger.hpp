#ifndef MYLOGGER_HPP
#define MYLOGGER_HPP

#include <string>

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

// Console logger shared by every afs component.
// init() installs the sink once; later calls only move the threshold.
class MyLogger
{
public:
    static void init(LogLevel threshold = LogLevel::Info);
    static void setThreshold(LogLevel threshold);

    static void debug(const std::string &msg);
    static void info(const std::string &msg);
    static void warning(const std::string &msg);
    static void error(const std::string &msg);
};

#endif // MYLOGGER_HPP
