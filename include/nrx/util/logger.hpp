#pragma once

#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace nrx {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

const char* log_level_name(LogLevel level);

// Accepts debug|info|warning|warn|error in any case
std::optional<LogLevel> parse_log_level(const std::string& name);

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

protected:
    LogLevel min_level_ = LogLevel::INFO;
};

/**
 * Writes "[LEVEL] message" lines to stderr.
 *
 * Engine components log from the download poller thread as well as
 * the caller's thread, so writes are serialized.
 */
class ConsoleLogger : public Logger {
public:
    void log(LogLevel level, const std::string& message) override;

private:
    std::mutex write_mutex_;
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
};

}  // namespace nrx
