#ifndef MYLOGGER_HPP
#define MYLOGGER_HPP

#include <string>

// Thin static facade over Boost.Log used by every module.
class MyLogger
{
public:
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    // Sets up the console sink and, if logFile is not empty, a file sink.
    // Safe to call more than once; later calls replace the sinks.
    static void init(const std::string &logFile, Level minLevel);

    static Level parseLevel(const std::string &name);

    static void debug(const std::string &msg);
    static void info(const std::string &msg);
    static void warning(const std::string &msg);
    static void error(const std::string &msg);
};

#endif // MYLOGGER_HPP
