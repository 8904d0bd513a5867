#include "util/logging.h"
#include <iostream>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <utility>

namespace OnsetAnalyzer {
namespace Util {

LogLevel Logger::s_logLevel = LogLevel::Info;
Logger::Sink Logger::s_sink;

void Logger::setLogLevel(LogLevel level) {
    s_logLevel = level;
}

LogLevel Logger::getLogLevel() {
    return s_logLevel;
}

bool Logger::isEnabled(LogLevel level) {
    return level >= s_logLevel;
}

void Logger::setSink(Sink sink) {
    s_sink = std::move(sink);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::Debug, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::Info, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::Warning, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::Error, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::Fatal, message);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO ";
        case LogLevel::Warning: return "WARN ";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
        default:                return "UNKN ";
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) return;

    if (s_sink) {
        s_sink(level, message);
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << "[" << std::put_time(std::localtime(&time), "%H:%M:%S") << "] "
       << levelToString(level) << ": " << message;

    std::cout << ss.str() << std::endl;
}

} // namespace Util
} // namespace OnsetAnalyzer
