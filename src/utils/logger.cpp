#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <thread>
#include <cstdlib>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <deque>

namespace leetshell {
namespace utils {

static LogLevel currentLevel = LogLevel::INFO;
static std::ofstream logFile;
static std::string logPath;
static std::mutex logMutex;
static bool consoleEnabled = true;
static bool fileEnabled = true;
static uint64_t maxFileSize = 4 * 1024 * 1024;
static uint32_t maxFiles = 3;
static std::atomic<uint64_t> logCount{0};
static std::atomic<uint64_t> errorCount{0};
static std::deque<LogEntry> recentLogs;
static const size_t maxRecentLogs = 500;
static bool allowSensitive = false;

static const char* levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

static uint64_t getThreadId() {
    std::hash<std::thread::id> hasher;
    return hasher(std::this_thread::get_id());
}

static std::string sanitize(const std::string& in) {
    std::string s = in;
    static const char* keys[] = {"LEETCODE_SESSION", "session", "csrftoken", "cookie", "password"};
    for (const char* k : keys) {
        const std::string key(k);
        size_t pos = 0;
        while ((pos = s.find(key, pos)) != std::string::npos) {
            size_t i = pos + key.size();
            while (i < s.size() && (s[i] == ' ' || s[i] == '"' || s[i] == '\'' || s[i] == ':' || s[i] == '=')) i++;
            size_t end = i;
            while (end < s.size() && s[end] != '"' && s[end] != '\'' && s[end] != ' ' && s[end] != ',' && s[end] != ';' && s[end] != '\n') end++;
            if (i < end) {
                s.replace(i, end - i, "[REDACTED]");
                pos = i + 10;
            } else {
                pos += key.size();
            }
        }
    }
    return s;
}

static void rotateUnlocked() {
    if (logPath.empty()) return;

    if (logFile.is_open()) {
        logFile.close();
    }

    std::error_code ec;
    for (int i = static_cast<int>(maxFiles) - 1; i >= 1; i--) {
        std::string oldPath = logPath + "." + std::to_string(i);
        std::string newPath = logPath + "." + std::to_string(i + 1);
        if (std::filesystem::exists(oldPath, ec)) {
            if (i == static_cast<int>(maxFiles) - 1) {
                std::filesystem::remove(oldPath, ec);
            } else {
                std::filesystem::rename(oldPath, newPath, ec);
            }
        }
    }

    if (std::filesystem::exists(logPath, ec)) {
        std::filesystem::rename(logPath, logPath + ".1", ec);
    }

    logFile.open(logPath, std::ios::app);
}

static void writeLog(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel) return;

    std::lock_guard<std::mutex> lock(logMutex);

    time_t now = std::time(nullptr);
    char timeBuf[64];
    std::tm tmNow{};
    localtime_r(&now, &tmNow);
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);

    std::string outMsg = allowSensitive ? msg : sanitize(msg);

    std::ostringstream oss;
    oss << timeBuf << " [" << levelToString(level) << "]";
    if (!category.empty()) {
        oss << " [" << category << "]";
    }
    oss << " " << outMsg << "\n";

    std::string line = oss.str();

    if (consoleEnabled) {
        if (level >= LogLevel::ERROR) {
            std::cerr << line;
        } else {
            std::cout << line;
        }
    }

    if (fileEnabled && logFile.is_open()) {
        logFile << line;
        logFile.flush();

        if (logFile.tellp() > static_cast<std::streampos>(maxFileSize)) {
            rotateUnlocked();
        }
    }

    logCount++;
    if (level >= LogLevel::ERROR) errorCount++;

    LogEntry entry;
    entry.level = level;
    entry.message = outMsg;
    entry.category = category;
    entry.timestamp = static_cast<uint64_t>(now);
    entry.threadId = getThreadId();

    recentLogs.push_back(entry);
    while (recentLogs.size() > maxRecentLogs) {
        recentLogs.pop_front();
    }
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    logPath = path;

    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    logFile.open(path, std::ios::app);
    const char* env = std::getenv("LEETSHELL_ALLOW_SENSITIVE_LOGS");
    if (env && *env) {
        std::string v(env);
        if (v == "1" || v == "true" || v == "TRUE") allowSensitive = true;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), ::tolower);
    if (n == "trace") out = LogLevel::TRACE;
    else if (n == "debug") out = LogLevel::DEBUG;
    else if (n == "info") out = LogLevel::INFO;
    else if (n == "warn" || n == "warning") out = LogLevel::WARN;
    else if (n == "error") out = LogLevel::ERROR;
    else if (n == "fatal") out = LogLevel::FATAL;
    else if (n == "off") out = LogLevel::OFF;
    else return false;
    return true;
}

void Logger::setAllowSensitiveLogging(bool allow) {
    allowSensitive = allow;
}

bool Logger::isAllowSensitiveLogging() {
    return allowSensitive;
}

void Logger::enableConsole(bool enable) {
    std::lock_guard<std::mutex> lock(logMutex);
    consoleEnabled = enable;
}

void Logger::enableFile(bool enable) {
    std::lock_guard<std::mutex> lock(logMutex);
    fileEnabled = enable;
}

void Logger::setMaxFileSize(uint64_t bytes) {
    maxFileSize = bytes;
}

void Logger::setMaxFiles(uint32_t count) {
    maxFiles = count;
}

void Logger::debug(const std::string& msg) {
    writeLog(LogLevel::DEBUG, "", msg);
}

void Logger::info(const std::string& msg) {
    writeLog(LogLevel::INFO, "", msg);
}

void Logger::warn(const std::string& msg) {
    writeLog(LogLevel::WARN, "", msg);
}

void Logger::error(const std::string& msg) {
    writeLog(LogLevel::ERROR, "", msg);
}

void Logger::log(LogLevel level, const std::string& msg) {
    writeLog(level, "", msg);
}

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    writeLog(level, category, msg);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
    }
}

uint64_t Logger::getLogCount() {
    return logCount;
}

uint64_t Logger::getErrorCount() {
    return errorCount;
}

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::vector<LogEntry> result;
    size_t start = recentLogs.size() > count ? recentLogs.size() - count : 0;
    for (size_t i = start; i < recentLogs.size(); i++) {
        result.push_back(recentLogs[i]);
    }
    return result;
}

void Logger::clearLogs() {
    std::lock_guard<std::mutex> lock(logMutex);
    recentLogs.clear();
    logCount = 0;
    errorCount = 0;
}

std::string Logger::redactSensitive(const std::string& data, const std::string& type) {
    if (!allowSensitive) {
        return "[REDACTED_" + type + "]";
    }
    return data;
}

}
}
