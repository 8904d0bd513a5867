#pragma once

#include <string>
#include <functional>

namespace OnsetAnalyzer {
namespace Util {

/**
 * Logging utilities.
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Fatal
};

class Logger {
public:
    // Replaces the default stdout writer. Pass an empty function to restore it.
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static void setLogLevel(LogLevel level);
    static LogLevel getLogLevel();
    static bool isEnabled(LogLevel level);

    static void setSink(Sink sink);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);

    static std::string levelToString(LogLevel level);

private:
    static LogLevel s_logLevel;
    static Sink s_sink;

    static void log(LogLevel level, const std::string& message);
};

} // namespace Util
} // namespace OnsetAnalyzer

// Convenience macros
#define LOG_DEBUG(msg) OnsetAnalyzer::Util::Logger::debug(msg)
#define LOG_INFO(msg) OnsetAnalyzer::Util::Logger::info(msg)
#define LOG_WARN(msg) OnsetAnalyzer::Util::Logger::warning(msg)
#define LOG_ERROR(msg) OnsetAnalyzer::Util::Logger::error(msg)
#define LOG_FATAL(msg) OnsetAnalyzer::Util::Logger::fatal(msg)
