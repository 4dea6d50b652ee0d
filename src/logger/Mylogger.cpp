#include "Mylogger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>

namespace logging = boost::log;

namespace
{
    std::mutex g_initMutex;
    bool g_attributesAdded = false;

    logging::trivial::severity_level toSeverity(MyLogger::Level level)
    {
        switch (level)
        {
        case MyLogger::Level::Debug:
            return logging::trivial::debug;
        case MyLogger::Level::Info:
            return logging::trivial::info;
        case MyLogger::Level::Warning:
            return logging::trivial::warning;
        case MyLogger::Level::Error:
        default:
            return logging::trivial::error;
        }
    }
}

void MyLogger::init(const std::string &logFile, Level minLevel)
{
    std::lock_guard<std::mutex> lock(g_initMutex);

    if (!g_attributesAdded)
    {
        // Adds TimeStamp, ProcessID, ThreadID, LineID.
        logging::add_common_attributes();
        logging::register_simple_formatter_factory<logging::trivial::severity_level, char>("Severity");
        g_attributesAdded = true;
    }
    logging::core::get()->remove_all_sinks();
    logging::add_console_log(
        std::clog,
        logging::keywords::format = "[%TimeStamp%] [%Severity%]: %Message%",
        logging::keywords::auto_flush = true);

    if (!logFile.empty())
    {
        logging::add_file_log(
            logging::keywords::file_name = logFile,
            logging::keywords::open_mode = std::ios_base::app,
            logging::keywords::format = "[%TimeStamp%] [%Severity%]: %Message%",
            logging::keywords::auto_flush = true);
    }

    logging::core::get()->set_filter(logging::trivial::severity >= toSeverity(minLevel));
}

MyLogger::Level MyLogger::parseLevel(const std::string &name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug")
        return Level::Debug;
    if (lower == "warning" || lower == "warn")
        return Level::Warning;
    if (lower == "error")
        return Level::Error;
    return Level::Info;
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
