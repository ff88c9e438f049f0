#include "Logger.hpp"
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace {
    std::mutex log_mutex;
    std::function<void(LogLevel, const std::string&)> log_sink;

    void emit(LogLevel level, const std::string& line) {
        std::function<void(LogLevel, const std::string&)> sink;
        {
            std::lock_guard<std::mutex> lock(log_mutex);
            sink = log_sink;
            std::ostream& os = (level == LogLevel::Warn || level == LogLevel::Error) ? std::cerr : std::cout;
            os << "[" << log_level_name(level) << "] " << line << '\n';
            os.flush();
        }
        // Called without the lock, a sink may log itself
        if (sink) {
            sink(level, line);
        }
    }
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

void log_debug(const std::string& line) {
    if (std::getenv("GPR_DEBUG") == nullptr) return;
    emit(LogLevel::Debug, line);
}

void log_info(const std::string& line) { emit(LogLevel::Info, line); }
void log_warn(const std::string& line) { emit(LogLevel::Warn, line); }
void log_error(const std::string& line) { emit(LogLevel::Error, line); }

void set_log_sink(std::function<void(LogLevel, const std::string&)> sink) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_sink = std::move(sink);
}
