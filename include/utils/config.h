#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace leetshell {
namespace utils {

struct EditorConfig {
    int tabWidth = 4;
    size_t undoLimit = 2000;
    uint32_t undoCoalesceMs = 500;
    int pageSize = 20;
};

struct UiConfig {
    int splitPercent = 40;
    int minCols = 40;
    int minRows = 12;
    uint32_t notificationMs = 3000;
};

struct InputConfig {
    uint32_t escapeTimeoutMs = 25;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, bool value);

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;

    EditorConfig getEditorConfig() const;
    UiConfig getUiConfig() const;
    InputConfig getInputConfig() const;

    std::string getDataDir() const;
    std::string getConfigPath() const;
    void setDataDir(const std::string& path);

    size_t size() const;

    std::string getLanguage() const { return getString("preferences.language", "python3"); }
    void setLanguage(const std::string& slug) { set("preferences.language", slug); }

private:
    Config();
    void setUnlocked(const std::string& key, const std::string& value);
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
