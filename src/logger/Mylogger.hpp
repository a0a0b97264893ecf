#ifndef MYLOGGER_HPP
#define MYLOGGER_HPP

#include <string>

// Process-wide logging facade over Boost.Log.
// Call MyLogger::init() once at startup; before that, messages go to the
// Boost.Log default console sink.
class MyLogger
{
public:
    enum class Level
    {
        debug,
        info,
        warning,
        error
    };

    // Installs a console sink and, when logFile is non-empty, a file sink.
    // Calling it again replaces the previously installed sinks.
    static void init(Level level = Level::info, const std::string &logFile = "");
    static void init(const std::string &level, const std::string &logFile);

    // Unknown names map to info.
    static Level parseLevel(const std::string &name);

    static void debug(const std::string &msg);
    static void info(const std::string &msg);
    static void warning(const std::string &msg);
    static void error(const std::string &msg);
};

#endif // MYLOGGER_HPP
