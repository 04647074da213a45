#include <fundunit/utils/logger.hpp>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace fundunit::utils {

std::mutex Logger::console_mutex_;
LogLevel Logger::current_level_ = LogLevel::INFO;

LogLevel parse_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        return LogLevel::DEBUG;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::WARN;
    }
    if (lowered == "error") {
        return LogLevel::LOG_ERROR;
    }
    return LogLevel::INFO;
}

Logger::Logger(LogLevel level) : level_(level) {}

Logger& Logger::acquire(Logger& instance) {
    // Manipulators from the previous line must not leak into this one
    static thread_local const std::stringstream pristine;
    instance.stream_.str("");
    instance.stream_.clear();
    instance.stream_.copyfmt(pristine);
    return instance;
}

Logger& Logger::debug() {
    static thread_local Logger instance(LogLevel::DEBUG);
    return acquire(instance);
}

Logger& Logger::info() {
    static thread_local Logger instance(LogLevel::INFO);
    return acquire(instance);
}

Logger& Logger::warn() {
    static thread_local Logger instance(LogLevel::WARN);
    return acquire(instance);
}

Logger& Logger::error() {
    static thread_local Logger instance(LogLevel::LOG_ERROR);
    return acquire(instance);
}

Logger& Logger::operator<<(const EndlType&) {
    if (!enabled(level_)) {
        return *this;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count() % 1000;

    std::stringstream time_str;
    time_str << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S");
    time_str << '.' << std::setfill('0') << std::setw(3) << ms;

    const char* tag = "[INFO] ";
    switch (level_) {
        case LogLevel::DEBUG:
            tag = "[DEBUG] ";
            break;
        case LogLevel::INFO:
            tag = "[INFO] ";
            break;
        case LogLevel::WARN:
            tag = "[WARN] ";
            break;
        case LogLevel::LOG_ERROR:
            tag = "[ERROR] ";
            break;
    }

    std::lock_guard<std::mutex> lock(console_mutex_);
    std::cout << "[" << time_str.str() << "] " << tag << stream_.str() << std::endl;

    return *this;
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
}

LogLevel Logger::level() {
    return current_level_;
}

bool Logger::enabled(LogLevel level) {
    return level >= current_level_;
}

} // namespace fundunit::utils
