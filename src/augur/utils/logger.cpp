#include <augur/utils/logger.hpp>
#include <iostream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace augur::utils {

std::mutex Logger::console_mutex_;
LogLevel Logger::current_level_ = LogLevel::INFO;

Logger::Logger(LogLevel level) : level_(level) {}

Logger& Logger::debug() {
    static thread_local Logger instance(LogLevel::DEBUG);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::info() {
    static thread_local Logger instance(LogLevel::INFO);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::warn() {
    static thread_local Logger instance(LogLevel::WARN);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::error() {
    static thread_local Logger instance(LogLevel::LOG_ERROR);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::operator<<(const EndlType&) {
    if (level_ >= current_level_) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count() % 1000;

        std::tm local_tm{};
        localtime_r(&time, &local_tm);

        std::stringstream time_str;
        time_str << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        time_str << '.' << std::setfill('0') << std::setw(3) << ms;

        std::lock_guard<std::mutex> lock(console_mutex_);

        // Warnings and errors go to stderr so summaries on stdout stay parseable
        std::ostream& out = (level_ >= LogLevel::WARN) ? std::cerr : std::cout;
        out << "[" << time_str.str() << "] ";

        switch (level_) {
            case LogLevel::DEBUG:
                out << "[DEBUG] ";
                break;
            case LogLevel::INFO:
                out << "[INFO] ";
                break;
            case LogLevel::WARN:
                out << "[WARN] ";
                break;
            case LogLevel::LOG_ERROR:
                out << "[ERROR] ";
                break;
        }

        out << stream_.str() << std::endl;
    }
    stream_.str("");
    stream_.flags(std::ios_base::dec | std::ios_base::skipws);
    stream_.precision(6);

    return *this;
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
}

LogLevel Logger::level() {
    return current_level_;
}

bool Logger::set_level(const std::string& name) {
    if (name == "debug") {
        current_level_ = LogLevel::DEBUG;
    } else if (name == "info") {
        current_level_ = LogLevel::INFO;
    } else if (name == "warn") {
        current_level_ = LogLevel::WARN;
    } else if (name == "error") {
        current_level_ = LogLevel::LOG_ERROR;
    } else {
        return false;
    }
    return true;
}

} // namespace augur::utils
