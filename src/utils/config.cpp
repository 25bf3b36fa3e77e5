#include "utils/config.h"
#include <unordered_map>
#include <fstream>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <stdexcept>

namespace leetshell {
namespace utils {

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::string dataDir;
    mutable std::mutex mtx;
};

static std::string trimWs(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    size_t last = s.find_last_not_of(" \t\r");
    if (last == std::string::npos) return {};
    s.erase(last + 1);
    return s;
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    const char* home = std::getenv("HOME");
    if (home) {
        impl_->dataDir = std::string(home) + "/.leetshell";
    } else {
        impl_->dataDir = ".leetshell";
    }
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("editor.tab_width", 4);
    set("editor.undo_limit", 2000);
    set("editor.undo_coalesce_ms", 500);
    set("editor.page_size", 20);

    set("input.escape_timeout_ms", 25);

    set("ui.split_percent", 40);
    set("ui.min_cols", 40);
    set("ui.min_rows", 12);
    set("ui.notification_ms", 3000);

    set("preferences.language", "python3");

    // Simulated round trip of the offline problem service
    set("service.latency_ms", 250);

    set("log.level", "info");
    set("log.max_file_size", static_cast<int64_t>(4 * 1024 * 1024));
    set("log.max_files", 3);

    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        line = trimWs(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) continue;

        std::string key = trimWs(line.substr(0, pos));
        std::string value = trimWs(line.substr(pos + 1));
        if (key.empty()) continue;
        impl_->data[key] = value;
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::filesystem::path p(savePath);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# leetshell configuration\n\n";

    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());

    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoi(it->second); }
    catch (const std::logic_error&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoll(it->second); }
    catch (const std::logic_error&) { return def; }
}

void Config::setUnlocked(const std::string& key, const std::string& value) {
    impl_->data[key] = value;
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    setUnlocked(key, value);
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value ? value : ""));
}

void Config::set(const std::string& key, int value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    setUnlocked(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    setUnlocked(key, std::to_string(value));
}

void Config::set(const std::string& key, bool value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    setUnlocked(key, value ? "true" : "false");
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.erase(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

EditorConfig Config::getEditorConfig() const {
    EditorConfig cfg;
    cfg.tabWidth = std::clamp(getInt("editor.tab_width", 4), 1, 16);
    cfg.undoLimit = static_cast<size_t>(std::max<int64_t>(1, getInt64("editor.undo_limit", 2000)));
    cfg.undoCoalesceMs = static_cast<uint32_t>(std::max(0, getInt("editor.undo_coalesce_ms", 500)));
    cfg.pageSize = std::max(1, getInt("editor.page_size", 20));
    return cfg;
}

UiConfig Config::getUiConfig() const {
    UiConfig cfg;
    cfg.splitPercent = std::clamp(getInt("ui.split_percent", 40), 10, 90);
    cfg.minCols = std::max(20, getInt("ui.min_cols", 40));
    cfg.minRows = std::max(6, getInt("ui.min_rows", 12));
    cfg.notificationMs = static_cast<uint32_t>(std::max(0, getInt("ui.notification_ms", 3000)));
    return cfg;
}

InputConfig Config::getInputConfig() const {
    InputConfig cfg;
    cfg.escapeTimeoutMs = static_cast<uint32_t>(std::clamp(getInt("input.escape_timeout_ms", 25), 1, 1000));
    return cfg;
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->dataDir;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

void Config::setDataDir(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->dataDir = path;
}

size_t Config::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.size();
}

}
}
