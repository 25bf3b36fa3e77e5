#pragma once

#include "term/input_event.h"
#include "term/event_queue.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <memory>
#include <optional>
#include <cstdint>

namespace leetshell {
namespace term {

class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void write(const std::string& bytes) = 0;
    virtual void flush() = 0;
};

struct TerminalSize {
    int cols = 0;
    int rows = 0;
};

class Terminal;

// Restores cooked mode, the main screen and the cursor when it goes out of
// scope, including during stack unwinding.
class RawModeGuard {
public:
    RawModeGuard() = default;
    explicit RawModeGuard(Terminal* terminal) : terminal_(terminal) {}
    ~RawModeGuard();

    RawModeGuard(RawModeGuard&& other) noexcept : terminal_(other.terminal_) { other.terminal_ = nullptr; }
    RawModeGuard& operator=(RawModeGuard&& other) noexcept;
    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    void release();
    bool active() const { return terminal_ != nullptr; }

private:
    Terminal* terminal_ = nullptr;
};

class Terminal : public OutputSink {
public:
    // Fails with TERMINAL_UNSUPPORTED when stdin/stdout are not ttys or the
    // terminfo entry lacks cursor addressing or the alternate screen, and with
    // TERMINAL_TOO_SMALL below minCols x minRows.
    static Result<std::unique_ptr<Terminal>> open(int minCols, int minRows, uint32_t escapeTimeoutMs);

    ~Terminal() override;
    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    RawModeGuard enterRawMode();
    void restore();
    bool isRaw() const;

    TerminalSize size() const;

    // Blocks up to timeoutMs (negative waits forever) for a key, paste,
    // resize or queued completion.
    std::optional<InputEvent> readEvent(EventQueue& queue, int timeoutMs);

    void write(const std::string& bytes) override;
    void flush() override;

    uint64_t bytesWritten() const;

private:
    Terminal();
    void collectDecoded();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
