#include "tui/tui.h"
#include "term/terminal.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <algorithm>
#include <iostream>
#include <string>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>

namespace leetshell {

struct LaunchOptions {
    std::string configPath;
    std::string dataDir;
    std::string logLevel;
    std::string language;
    bool showHelp = false;
    bool showVersion = false;
};

void printHelp(const char* progName) {
    std::cout << "leetshell v0.1.0 - coding problems in your terminal\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help            Show this help\n";
    std::cout << "  -v, --version         Show version\n";
    std::cout << "  -c, --config FILE     Use custom config file\n";
    std::cout << "  -D, --datadir DIR     Data directory (default: ~/.leetshell)\n";
    std::cout << "  -l, --loglevel LEVEL  trace|debug|info|warn|error|off\n";
    std::cout << "  -L, --language SLUG   Preferred solution language (e.g. python3, cpp)\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  LEETSHELL_SESSION, LEETSHELL_CSRFTOKEN  Pre-fill the sign-in form\n";
    std::cout << "\nKeys:\n";
    std::cout << "  Ctrl+C quits from any screen. Each screen lists its keys in the status bar.\n";
}

void printVersion() {
    std::cout << "leetshell v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

bool parseArgs(int argc, char* argv[], LaunchOptions& options) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'D'},
        {"loglevel", required_argument, nullptr, 'l'},
        {"language", required_argument, nullptr, 'L'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "hvc:D:l:L:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                options.showHelp = true;
                return true;
            case 'v':
                options.showVersion = true;
                return true;
            case 'c':
                options.configPath = optarg;
                break;
            case 'D':
                options.dataDir = optarg;
                break;
            case 'l':
                options.logLevel = optarg;
                break;
            case 'L':
                options.language = optarg;
                break;
            default:
                std::cerr << "Try '" << argv[0] << " --help' for usage\n";
                return false;
        }
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

static void configureLogging(const LaunchOptions& options, utils::Config& cfg) {
    utils::Logger::init(cfg.getString("log.file", cfg.getDataDir() + "/leetshell.log"));
    utils::Logger::enableConsole(false);
    utils::Logger::setMaxFileSize(static_cast<uint64_t>(std::max<int64_t>(4096, cfg.getInt64("log.max_file_size", 4 * 1024 * 1024))));
    utils::Logger::setMaxFiles(static_cast<uint32_t>(std::max(1, cfg.getInt("log.max_files", 3))));

    std::string level = options.logLevel.empty() ? cfg.getString("log.level", "info") : options.logLevel;
    utils::LogLevel parsed = utils::LogLevel::INFO;
    if (!utils::Logger::parseLevel(level, parsed)) {
        std::cerr << "Unknown log level '" << level << "', using info\n";
    }
    utils::Logger::setLevel(parsed);
}

static service::Credentials credentialsFromEnvironment() {
    service::Credentials creds;
    if (const char* session = std::getenv("LEETSHELL_SESSION")) creds.session = session;
    if (const char* csrf = std::getenv("LEETSHELL_CSRFTOKEN")) creds.csrfToken = csrf;
    return creds;
}

}

int main(int argc, char* argv[]) {
    using namespace leetshell;

    LaunchOptions options;
    const char* home = std::getenv("HOME");
    options.dataDir = home ? std::string(home) + "/.leetshell" : ".leetshell";

    if (!parseArgs(argc, argv, options)) {
        return 1;
    }
    if (options.showHelp) {
        printHelp(argv[0]);
        return 0;
    }
    if (options.showVersion) {
        printVersion();
        return 0;
    }

    std::error_code ec;
    std::filesystem::create_directories(options.dataDir, ec);
    if (ec) {
        std::cerr << "Warning: cannot create " << options.dataDir << ": " << ec.message() << "\n";
    }

    utils::Config& cfg = utils::Config::instance();
    cfg.loadDefaults();
    cfg.setDataDir(options.dataDir);
    std::string configPath = options.configPath.empty() ? options.dataDir + "/leetshell.conf" : options.configPath;
    bool haveConfig = cfg.load(configPath);
    if (!options.language.empty()) cfg.setLanguage(options.language);

    configureLogging(options, cfg);
    LOG_INFO("leetshell starting, data directory " + options.dataDir);
    if (!haveConfig) LOG_INFO("No config file at " + configPath + ", using defaults");

    utils::UiConfig ui = cfg.getUiConfig();
    utils::InputConfig input = cfg.getInputConfig();
    auto opened = term::Terminal::open(ui.minCols, ui.minRows, input.escapeTimeoutMs);
    if (!opened.ok()) {
        LOG_ERROR(describe(opened.error()));
        std::cerr << "leetshell: " << opened.error().message << "\n";
        utils::Logger::shutdown();
        return 1;
    }

    int result = 0;
    try {
        tui::TUI app;
        tui::TuiOptions tuiOptions;
        tuiOptions.credentials = credentialsFromEnvironment();
        tuiOptions.serviceLatencyMs = static_cast<uint32_t>(std::max(0, cfg.getInt("service.latency_ms", 250)));

        if (!app.init(std::move(opened.value()), tuiOptions)) {
            std::cerr << "leetshell: failed to initialize the terminal UI\n";
            utils::Logger::shutdown();
            return 1;
        }
        app.run();
        app.shutdown();
    } catch (const TerminalError& e) {
        LOG_ERROR(std::string("terminal failure: ") + e.what());
        std::cerr << "leetshell: terminal failure: " << e.what() << "\n";
        result = 1;
    }

    if (!cfg.save(configPath)) {
        LOG_WARN("Could not write " + configPath);
    }
    LOG_INFO("leetshell exiting, " + std::to_string(utils::Logger::getErrorCount()) + " errors logged");
    utils::Logger::shutdown();
    return result;
}
