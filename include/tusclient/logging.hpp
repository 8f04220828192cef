#pragma once

#include <cstdarg>
#include <memory>
#include <mutex>
#include <string>

namespace tusclient {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

const char* log_level_to_string(LogLevel level);

/// Logging capability injected into the orchestrator.
class Logger {
public:
    explicit Logger(LogLevel min_level = LogLevel::Info) : min_level_(min_level) {}
    virtual ~Logger() = default;

    /// Emit one complete line. Called only for levels >= min_level().
    virtual void write(LogLevel level, const std::string& message) = 0;

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel min_level() const { return min_level_; }
    bool enabled(LogLevel level) const { return level >= min_level_; }

    void debug(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void info(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void warning(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void error(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

private:
    void vlog(LogLevel level, const char* fmt, va_list args);

    LogLevel min_level_;
};

/// Debug/info lines go to stdout, warnings and errors to stderr.
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info) : Logger(min_level) {}

    void write(LogLevel level, const std::string& message) override;

private:
    std::mutex mutex_;
};

/// Shared default used when no logger is injected.
std::shared_ptr<Logger> default_logger();

}  // namespace tusclient
