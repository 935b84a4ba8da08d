#pragma once
#include <string>
#include <sstream>
#include <ostream>
#include <mutex>

namespace meridian::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};

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

    // Flushes the buffered line if the level passes the filter
    Logger& operator<<(const EndlType&);

    static void set_level(LogLevel level);
    static LogLevel level();

    // Accepts debug/info/warn/warning/error in any case; unknown names map to INFO
    static LogLevel level_from_string(const std::string& name);

    // Redirects output (std::cout by default). Passing nullptr restores std::cout.
    static void set_output(std::ostream* out);

private:
    explicit Logger(LogLevel level);

    static Logger& instance_for(LogLevel level);

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex console_mutex_;
    static LogLevel current_level_;
    static std::ostream* output_;
};

} // namespace meridian::utils
