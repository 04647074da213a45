#pragma once
#include <string>
#include <sstream>
#include <mutex>

namespace fundunit::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};

// Maps "debug", "info", "warn"/"warning", "error" (any case) to a level.
// Unknown names fall back to INFO.
LogLevel parse_level(const std::string& name);

class Logger {
public:
    struct EndlType {};
    inline static constexpr EndlType endl{};

    static Logger& debug();
    static Logger& info();
    static Logger& warn();
    static Logger& error();

    template<typename T>
    Logger& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

    // Flushes the buffered line to the console if the level is enabled.
    Logger& operator<<(const EndlType&);

    static void set_level(LogLevel level);
    static LogLevel level();
    static bool enabled(LogLevel level);

private:
    explicit Logger(LogLevel level);
    static Logger& acquire(Logger& instance);

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex console_mutex_;
    static LogLevel current_level_;
};

} // namespace fundunit::utils
