#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace batchfs {

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("BATCHFS_LOG");
    if (!env) return LogLevel::Info;
    std::string v(env);
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return LogLevel::Info;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()), outStream(&std::cout), errStream(&std::cerr) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::setSink(std::ostream& out, std::ostream& err) {
    outStream = &out;
    errStream = &err;
}

void Logger::resetSink() {
    outStream = &std::cout;
    errStream = &std::cerr;
}

void Logger::error(const std::string& msg) const { if (currentLevel >= LogLevel::Error) *errStream << "[error] " << msg << "\n"; }
void Logger::warn(const std::string& msg) const { if (currentLevel >= LogLevel::Warn) *errStream << "[warn ] " << msg << "\n"; }
void Logger::info(const std::string& msg) const { if (currentLevel >= LogLevel::Info) *outStream << "[info ] " << msg << "\n"; }
void Logger::debug(const std::string& msg) const { if (currentLevel >= LogLevel::Debug) *outStream << "[debug] " << msg << "\n"; }

}
