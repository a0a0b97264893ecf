#include "Mylogger.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <iostream>
#include <mutex>

namespace logging = boost::log;

namespace
{
    std::mutex g_init_mutex;

    const char *kFormat = "[%TimeStamp%] [%Severity%]: %Message%";

    logging::trivial::severity_level toSeverity(MyLogger::Level level)
    {
        switch (level)
        {
        case MyLogger::Level::debug:
            return logging::trivial::debug;
        case MyLogger::Level::warning:
            return logging::trivial::warning;
        case MyLogger::Level::error:
            return logging::trivial::error;
        case MyLogger::Level::info:
        default:
            return logging::trivial::info;
        }
    }
}

void MyLogger::init(Level level, const std::string &logFile)
{
    std::lock_guard<std::mutex> lock(g_init_mutex);

    logging::core::get()->remove_all_sinks();
    logging::register_simple_formatter_factory<logging::trivial::severity_level, char>("Severity");

    logging::add_console_log(
        std::clog,
        logging::keywords::format = kFormat);

    if (!logFile.empty())
    {
        logging::add_file_log(
            logging::keywords::file_name = logFile,
            logging::keywords::open_mode = std::ios_base::app,
            logging::keywords::auto_flush = true,
            logging::keywords::format = kFormat);
    }

    logging::core::get()->set_filter(
        logging::trivial::severity >= toSeverity(level));
    logging::add_common_attributes();
}

void MyLogger::init(const std::string &level, const std::string &logFile)
{
    init(parseLevel(level), logFile);
}

MyLogger::Level MyLogger::parseLevel(const std::string &name)
{
    if (name == "debug")
        return Level::debug;
    if (name == "warning" || name == "warn")
        return Level::warning;
    if (name == "error")
        return Level::error;
    return Level::info;
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
