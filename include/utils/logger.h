#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace leetshell {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    uint64_t timestamp;
    uint64_t threadId;
};

class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static void enableConsole(bool enable);
    static void enableFile(bool enable);
    static void setMaxFileSize(uint64_t bytes);
    static void setMaxFiles(uint32_t count);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);

    static void log(LogLevel level, const std::string& msg);
    static void log(LogLevel level, const std::string& category, const std::string& msg);

    static void flush();

    static uint64_t getLogCount();
    static uint64_t getErrorCount();

    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();

    // Session cookies and tokens never reach the log unless explicitly allowed
    static void setAllowSensitiveLogging(bool allow);
    static bool isAllowSensitiveLogging();
    static std::string redactSensitive(const std::string& data, const std::string& type = "secret");
};

#define LOG_DEBUG(msg) do { if (leetshell::utils::Logger::getLevel() <= leetshell::utils::LogLevel::DEBUG) leetshell::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) leetshell::utils::Logger::info(msg)
#define LOG_WARN(msg) leetshell::utils::Logger::warn(msg)
#define LOG_ERROR(msg) leetshell::utils::Logger::error(msg)

}
}
