#include "pvsignal/utils/Logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace pvsignal {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : out_(&std::cerr) {}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::setOutputStream(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = &stream;
}

void Logger::debug(const std::string& source, const std::string& message) {
    log(LogLevel::DEBUG, source, message);
}

void Logger::info(const std::string& source, const std::string& message) {
    log(LogLevel::INFO, source, message);
}

void Logger::warning(const std::string& source, const std::string& message) {
    log(LogLevel::WARNING, source, message);
}

void Logger::error(const std::string& source, const std::string& message) {
    log(LogLevel::ERROR, source, message);
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "NONE";
    }
}

void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_ || level_ == LogLevel::NONE) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&now_c, &tm_buf);

    std::ostringstream line;
    line << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
         << " [" << levelName(level) << "] [" << source << "] " << message << '\n';
    (*out_) << line.str();
    out_->flush();
}

} // namespace pvsignal
