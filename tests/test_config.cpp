#include "utils/config.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

using leetshell::utils::Config;

static std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("leetshell_test_" + name)).string();
}

static void testDefaults() {
    Config& cfg = Config::instance();
    cfg.reset();
    assert(cfg.getLanguage() == "python3");
    assert(cfg.getInt("ui.split_percent") == 40);
    assert(cfg.getString("log.level") == "info");

    auto editor = cfg.getEditorConfig();
    assert(editor.tabWidth == 4);
    assert(editor.undoLimit == 2000);
    assert(editor.undoCoalesceMs == 500);

    auto ui = cfg.getUiConfig();
    assert(ui.minCols == 40);
    assert(ui.minRows == 12);
    assert(cfg.getInputConfig().escapeTimeoutMs == 25);
}

static void testLoadOverridesAndIgnoresNoise() {
    std::string path = tempPath("load.conf");
    {
        std::ofstream out(path);
        out << "# comment\n";
        out << "\n";
        out << "editor.tab_width = 2\n";
        out << "ui.split_percent=55\n";
        out << "no equals sign here\n";
        out << "preferences.language = cpp  \n";
    }
    Config& cfg = Config::instance();
    cfg.reset();
    assert(cfg.load(path));
    assert(cfg.getEditorConfig().tabWidth == 2);
    assert(cfg.getUiConfig().splitPercent == 55);
    assert(cfg.getLanguage() == "cpp");
    assert(cfg.getConfigPath() == path);
    std::filesystem::remove(path);
}

static void testMissingFile() {
    Config& cfg = Config::instance();
    cfg.reset();
    assert(!cfg.load(tempPath("does_not_exist.conf")));
    assert(cfg.getLanguage() == "python3");
}

static void testGroupedViewsClamp() {
    Config& cfg = Config::instance();
    cfg.reset();
    cfg.set("ui.split_percent", 5);
    cfg.set("editor.tab_width", 100);
    cfg.set("editor.undo_coalesce_ms", -10);
    cfg.set("input.escape_timeout_ms", "garbage");
    assert(cfg.getUiConfig().splitPercent == 10);
    assert(cfg.getEditorConfig().tabWidth == 16);
    assert(cfg.getEditorConfig().undoCoalesceMs == 0);
    assert(cfg.getInputConfig().escapeTimeoutMs == 25);
}

static void testSaveRoundTrip() {
    std::string path = tempPath("save.conf");
    Config& cfg = Config::instance();
    cfg.reset();
    cfg.setLanguage("java");
    cfg.set("ui.notification_ms", 1500);
    assert(cfg.save(path));

    cfg.reset();
    assert(cfg.getLanguage() == "python3");
    assert(cfg.load(path));
    assert(cfg.getLanguage() == "java");
    assert(cfg.getUiConfig().notificationMs == 1500);
    std::filesystem::remove(path);
}

static void testKeysByPrefix() {
    Config& cfg = Config::instance();
    cfg.reset();
    auto editorKeys = cfg.keys("editor.");
    assert(editorKeys.size() == 4);
    assert(editorKeys.front() == "editor.page_size");
    assert(cfg.has("service.latency_ms"));
    cfg.remove("service.latency_ms");
    assert(!cfg.has("service.latency_ms"));
}

int main() {
    testDefaults();
    testLoadOverridesAndIgnoresNoise();
    testMissingFile();
    testGroupedViewsClamp();
    testSaveRoundTrip();
    testKeysByPrefix();
    return 0;
}
