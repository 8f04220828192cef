#include "tusclient/logging.hpp"

#include <cstdio>
#include <vector>

namespace tusclient {

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::vlog(LogLevel level, const char* fmt, va_list args) {
    if (!enabled(level)) return;

    va_list copy;
    va_copy(copy, args);
    int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed < 0) return;

    std::vector<char> buf(static_cast<size_t>(needed) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    write(level, std::string(buf.data(), static_cast<size_t>(needed)));
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, fmt, args);
    va_end(args);
}

void Logger::warning(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warning, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, fmt, args);
    va_end(args);
}

void ConsoleLogger::write(LogLevel level, const std::string& message) {
    // Part uploads log from several threads
    std::lock_guard<std::mutex> lock(mutex_);
    FILE* out = stdout;
    if (level >= LogLevel::Warning) {
        out = stderr;
        fputs(log_level_to_string(level), out);
        fputs(": ", out);
    }
    fputs(message.c_str(), out);
    fputc('\n', out);
    fflush(out);
}

std::shared_ptr<Logger> default_logger() {
    static auto logger = std::make_shared<ConsoleLogger>();
    return logger;
}

}  // namespace tusclient
