#pragma once

#include <iosfwd>
#include <string>

namespace batchfs {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;

    /// Redirect output (info/debug) and error (error/warn) streams
    void setSink(std::ostream& out, std::ostream& err);
    /// Restore std::cout / std::cerr
    void resetSink();

    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    LogLevel currentLevel;
    std::ostream* outStream;
    std::ostream* errStream;
};

}
