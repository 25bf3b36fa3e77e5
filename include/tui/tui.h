#pragma once

#include "term/terminal.h"
#include "service/models.h"
#include <string>
#include <memory>
#include <cstdint>

namespace leetshell {
namespace tui {

struct TuiOptions {
    service::Credentials credentials;
    uint32_t serviceLatencyMs = 250;
};

// Owns the terminal session and runs the single-threaded event loop:
// read one event, dispatch it through the navigator, compose and present
// the next frame.
class TUI {
public:
    TUI();
    ~TUI();

    TUI(const TUI&) = delete;
    TUI& operator=(const TUI&) = delete;

    bool init(std::unique_ptr<term::Terminal> terminal, const TuiOptions& options);
    void run();
    void shutdown();
    bool isRunning() const;

    void showMessage(const std::string& msg);
    void showError(const std::string& err);

    const std::string& language() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
