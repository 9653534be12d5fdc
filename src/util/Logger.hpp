#pragma once

#include <mutex>
#include <string>

namespace evidhash {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Level comes from EVIDHASH_LOG (error|warn|info|debug or 0..3), default info.
 * Safe to call from worker threads; each line is written whole.
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

private:
    Logger();
    void write(LogLevel level, const char* tag, const std::string& msg) const;

    LogLevel currentLevel;
    mutable std::mutex mtx;
};

}
