#pragma once

#include <mutex>
#include <string>

namespace folio {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Level comes from FOLIO_LOG (error|warn|info|debug or 0-3), default info.
 * Errors and warnings go to stderr, info and debug to stdout. Safe to call
 * from pipeline worker threads.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

    /// Parse a level name or digit; returns fallback when unrecognized
    static LogLevel parseLevel(const std::string& value, LogLevel fallback);

private:
    Logger();
    void write(LogLevel at, const char* prefix, const std::string& msg) const;

    LogLevel currentLevel;
    mutable std::mutex mtx;
};

}
