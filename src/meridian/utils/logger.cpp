#include <meridian/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace meridian::utils {

std::mutex Logger::console_mutex_;
LogLevel Logger::current_level_ = LogLevel::INFO;
std::ostream* Logger::output_ = &std::cout;

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "[DEBUG] ";
        case LogLevel::INFO:
            return "[INFO] ";
        case LogLevel::WARN:
            return "[WARN] ";
        case LogLevel::LOG_ERROR:
            return "[ERROR] ";
    }
    return "[INFO] ";
}

} // namespace

Logger::Logger(LogLevel level) : level_(level) {}

Logger& Logger::instance_for(LogLevel level) {
    // One buffered instance per level per thread; a new statement discards
    // anything left over from an unterminated one.
    static thread_local Logger debug_instance(LogLevel::DEBUG);
    static thread_local Logger info_instance(LogLevel::INFO);
    static thread_local Logger warn_instance(LogLevel::WARN);
    static thread_local Logger error_instance(LogLevel::LOG_ERROR);

    Logger* instance = &info_instance;
    switch (level) {
        case LogLevel::DEBUG:
            instance = &debug_instance;
            break;
        case LogLevel::INFO:
            instance = &info_instance;
            break;
        case LogLevel::WARN:
            instance = &warn_instance;
            break;
        case LogLevel::LOG_ERROR:
            instance = &error_instance;
            break;
    }
    instance->stream_.str("");
    instance->stream_.clear();
    return *instance;
}

Logger& Logger::debug() {
    return instance_for(LogLevel::DEBUG);
}

Logger& Logger::info() {
    return instance_for(LogLevel::INFO);
}

Logger& Logger::warn() {
    return instance_for(LogLevel::WARN);
}

Logger& Logger::error() {
    return instance_for(LogLevel::LOG_ERROR);
}

Logger& Logger::operator<<(const EndlType&) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    if (level_ < current_level_) {
        stream_.str("");
        return *this;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count() % 1000;

    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::ostream& out = *output_;
    out << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << std::setfill(' ') << "] "
        << level_tag(level_) << stream_.str() << '\n';
    out.flush();

    stream_.str("");
    return *this;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    current_level_ = level;
}

LogLevel Logger::level() {
    std::lock_guard<std::mutex> lock(console_mutex_);
    return current_level_;
}

LogLevel Logger::level_from_string(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::LOG_ERROR;
    return LogLevel::INFO;
}

void Logger::set_output(std::ostream* out) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    output_ = out ? out : &std::cout;
}

} // namespace meridian::utils
