#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace folio {

LogLevel Logger::parseLevel(const std::string& v, LogLevel fallback) {
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return fallback;
}

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("FOLIO_LOG");
    if (!env) return LogLevel::Info;
    return Logger::parseLevel(env, LogLevel::Info);
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()) {}

void Logger::setLevel(LogLevel level) {
    std::scoped_lock lock(mtx);
    currentLevel = level;
}

LogLevel Logger::level() const {
    std::scoped_lock lock(mtx);
    return currentLevel;
}

void Logger::write(LogLevel at, const char* prefix, const std::string& msg) const {
    std::scoped_lock lock(mtx);
    if (currentLevel < at) return;
    std::ostream& os = at <= LogLevel::Warn ? std::cerr : std::cout;
    os << prefix << msg << "\n";
}

void Logger::error(const std::string& msg) const { write(LogLevel::Error, "[error] ", msg); }
void Logger::warn(const std::string& msg) const { write(LogLevel::Warn, "[warn ] ", msg); }
void Logger::info(const std::string& msg) const { write(LogLevel::Info, "[info ] ", msg); }
void Logger::debug(const std::string& msg) const { write(LogLevel::Debug, "[debug] ", msg); }

}
