#include "utils/logger.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace leetshell::utils;

static std::string logDir() {
    return (std::filesystem::temp_directory_path() / "leetshell_test_logs").string();
}

static std::string readFile(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void testParseLevel() {
    LogLevel level = LogLevel::INFO;
    assert(Logger::parseLevel("DEBUG", level) && level == LogLevel::DEBUG);
    assert(Logger::parseLevel("warning", level) && level == LogLevel::WARN);
    assert(Logger::parseLevel("off", level) && level == LogLevel::OFF);
    assert(!Logger::parseLevel("verbose", level));
    assert(level == LogLevel::OFF);
}

static void testLevelFiltering() {
    Logger::clearLogs();
    Logger::setLevel(LogLevel::WARN);
    Logger::info("dropped");
    LOG_DEBUG("dropped too");
    Logger::warn("kept");
    Logger::error("failed");

    auto logs = Logger::getRecentLogs();
    assert(logs.size() == 2);
    assert(logs[0].message == "kept");
    assert(logs[1].level == LogLevel::ERROR);
    assert(Logger::getLogCount() == 2);
    assert(Logger::getErrorCount() == 1);
}

static void testCategoryAndRecentWindow() {
    Logger::clearLogs();
    Logger::setLevel(LogLevel::TRACE);
    Logger::log(LogLevel::INFO, "notice", "Signed in");
    for (int i = 0; i < 5; i++) Logger::log(LogLevel::TRACE, "tick " + std::to_string(i));

    auto last = Logger::getRecentLogs(2);
    assert(last.size() == 2);
    assert(last[1].message == "tick 4");

    auto all = Logger::getRecentLogs();
    assert(all.front().category == "notice");
}

static void testCredentialsAreRedacted() {
    Logger::clearLogs();
    Logger::setLevel(LogLevel::DEBUG);
    Logger::setAllowSensitiveLogging(false);
    Logger::debug("login csrftoken=abc123 user=me");
    auto logs = Logger::getRecentLogs(1);
    assert(logs[0].message.find("abc123") == std::string::npos);
    assert(logs[0].message.find("user=me") != std::string::npos);

    assert(Logger::redactSensitive("secret-cookie", "session") == "[REDACTED_session]");
    Logger::setAllowSensitiveLogging(true);
    assert(Logger::isAllowSensitiveLogging());
    assert(Logger::redactSensitive("secret-cookie", "session") == "secret-cookie");
    Logger::setAllowSensitiveLogging(false);
}

static void testFileSinkAndRotation() {
    std::string dir = logDir();
    std::filesystem::remove_all(dir);
    std::string path = dir + "/leetshell.log";

    Logger::init(path);
    Logger::enableConsole(false);
    Logger::setLevel(LogLevel::INFO);
    Logger::info("first line");
    Logger::flush();
    assert(readFile(path).find("first line") != std::string::npos);

    Logger::enableFile(false);
    Logger::info("not in file");
    Logger::flush();
    assert(readFile(path).find("not in file") == std::string::npos);
    Logger::enableFile(true);

    Logger::setMaxFileSize(64);
    Logger::setMaxFiles(3);
    for (int i = 0; i < 10; i++) Logger::info("filler line number " + std::to_string(i));
    Logger::flush();
    assert(std::filesystem::exists(path + ".1"));
    assert(!std::filesystem::exists(path + ".4"));

    Logger::shutdown();
    Logger::setMaxFileSize(4 * 1024 * 1024);
    std::filesystem::remove_all(dir);
}

int main() {
    testParseLevel();
    testLevelFiltering();
    testCategoryAndRecentWindow();
    testCredentialsAreRedacted();
    testFileSinkAndRotation();
    return 0;
}
