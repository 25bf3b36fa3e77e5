#include "term/terminal.h"
#include "term/input_decoder.h"
#include "terminfo.h"
#include "utils/logger.h"
#include <deque>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <sys/ioctl.h>

namespace leetshell {
namespace term {

static const char ENTER_SEQ[] = "\x1b[?1049h\x1b[?25l\x1b[?2004h\x1b[0m\x1b[2J";
static const char RESTORE_SEQ[] = "\x1b[?2004l\x1b[0m\x1b[?25h\x1b[?1049l";

// Process-wide so the signal and atexit paths can reach it.
static int g_inFd = STDIN_FILENO;
static int g_outFd = STDOUT_FILENO;
static struct termios g_saved;
static volatile sig_atomic_t g_rawActive = 0;
static int g_winchPipe[2] = {-1, -1};
static bool g_handlersInstalled = false;

static const int FATAL_SIGNALS[] = {SIGTERM, SIGHUP, SIGQUIT, SIGSEGV, SIGABRT, SIGBUS, SIGFPE};

static void restoreTerminalState() {
    if (!g_rawActive) return;
    g_rawActive = 0;
    ssize_t n = ::write(g_outFd, RESTORE_SEQ, sizeof(RESTORE_SEQ) - 1);
    (void)n;
    tcsetattr(g_inFd, TCSAFLUSH, &g_saved);
}

static void fatalSignalHandler(int sig) {
    restoreTerminalState();
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

static void winchHandler(int) {
    int saved = errno;
    char b = 'w';
    ssize_t n = ::write(g_winchPipe[1], &b, 1);
    (void)n;
    errno = saved;
}

static void atexitRestore() {
    restoreTerminalState();
}

static void installHandlers() {
    if (g_handlersInstalled) return;
    if (::pipe(g_winchPipe) != 0) {
        throw TerminalError(ErrorCode::TERMINAL_IO, std::string("winch pipe: ") + std::strerror(errno));
    }
    for (int fd : g_winchPipe) {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
    std::signal(SIGWINCH, winchHandler);
    for (int sig : FATAL_SIGNALS) {
        std::signal(sig, fatalSignalHandler);
    }
    std::signal(SIGPIPE, SIG_IGN);
    std::atexit(atexitRestore);
    g_handlersInstalled = true;
}

struct Terminal::Impl {
    uint32_t escapeTimeoutMs = 25;
    InputDecoder decoder;
    std::deque<InputEvent> ready;
    std::string out;
    bool raw = false;
    uint64_t bytesWritten = 0;
};

RawModeGuard::~RawModeGuard() {
    release();
}

RawModeGuard& RawModeGuard::operator=(RawModeGuard&& other) noexcept {
    if (this != &other) {
        release();
        terminal_ = other.terminal_;
        other.terminal_ = nullptr;
    }
    return *this;
}

void RawModeGuard::release() {
    if (terminal_) {
        terminal_->restore();
        terminal_ = nullptr;
    }
}

Terminal::Terminal() : impl_(std::make_unique<Impl>()) {}

Terminal::~Terminal() {
    restore();
}

Result<std::unique_ptr<Terminal>> Terminal::open(int minCols, int minRows, uint32_t escapeTimeoutMs) {
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        return makeError(ErrorCode::TERMINAL_UNSUPPORTED, "stdin and stdout must be a terminal");
    }

    TerminfoProbe probe = probeTerminfo(STDOUT_FILENO);
    if (!probe.ok) {
        return makeError(ErrorCode::TERMINAL_UNSUPPORTED, probe.missing, "TERM=" + probe.termName);
    }

    std::unique_ptr<Terminal> terminal(new Terminal());
    terminal->impl_->escapeTimeoutMs = escapeTimeoutMs;

    TerminalSize sz = terminal->size();
    if (sz.cols < minCols || sz.rows < minRows) {
        return makeError(ErrorCode::TERMINAL_TOO_SMALL,
                         std::to_string(sz.cols) + "x" + std::to_string(sz.rows) +
                         " is below the minimum " + std::to_string(minCols) + "x" + std::to_string(minRows));
    }

    utils::Logger::log(utils::LogLevel::INFO, "term",
                       "terminal " + probe.termName + " " + std::to_string(sz.cols) + "x" + std::to_string(sz.rows));
    return Result<std::unique_ptr<Terminal>>(std::move(terminal));
}

RawModeGuard Terminal::enterRawMode() {
    if (impl_->raw) {
        throw TerminalError(ErrorCode::INVALID_STATE, "raw mode already active");
    }
    if (tcgetattr(g_inFd, &g_saved) != 0) {
        throw TerminalError(ErrorCode::TERMINAL_IO, std::string("tcgetattr: ") + std::strerror(errno));
    }

    struct termios raw = g_saved;
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_oflag &= ~(OPOST);
    raw.c_cflag |= CS8;
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;

    installHandlers();
    if (tcsetattr(g_inFd, TCSAFLUSH, &raw) != 0) {
        throw TerminalError(ErrorCode::TERMINAL_IO, std::string("tcsetattr: ") + std::strerror(errno));
    }
    g_rawActive = 1;
    impl_->raw = true;

    RawModeGuard guard(this);
    write(ENTER_SEQ);
    flush();
    LOG_DEBUG("raw mode entered");
    return guard;
}

void Terminal::restore() {
    if (!impl_->raw) return;
    impl_->raw = false;
    impl_->out.clear();
    restoreTerminalState();
    LOG_DEBUG("terminal restored");
}

bool Terminal::isRaw() const {
    return impl_->raw;
}

TerminalSize Terminal::size() const {
    TerminalSize sz;
    struct winsize ws;
    if (ioctl(g_outFd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        sz.cols = ws.ws_col;
        sz.rows = ws.ws_row;
        return sz;
    }
    const char* cols = std::getenv("COLUMNS");
    const char* rows = std::getenv("LINES");
    sz.cols = cols ? std::atoi(cols) : 80;
    sz.rows = rows ? std::atoi(rows) : 24;
    return sz;
}

void Terminal::collectDecoded() {
    for (auto& ev : impl_->decoder.drain()) {
        impl_->ready.push_back(std::move(ev));
    }
}

std::optional<InputEvent> Terminal::readEvent(EventQueue& queue, int timeoutMs) {
    auto popReady = [this]() {
        InputEvent ev = std::move(impl_->ready.front());
        impl_->ready.pop_front();
        return ev;
    };

    if (!impl_->ready.empty()) return popReady();
    if (auto ev = queue.tryPop()) return ev;

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeoutMs < 0 ? 0 : timeoutMs);

    for (;;) {
        int wait = -1;
        if (timeoutMs >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            wait = left > 0 ? static_cast<int>(left) : 0;
        }
        bool escapePending = impl_->decoder.hasPendingEscape();
        if (escapePending) {
            wait = static_cast<int>(impl_->escapeTimeoutMs);
        }

        struct pollfd fds[3];
        fds[0] = {g_inFd, POLLIN, 0};
        fds[1] = {g_winchPipe[0], POLLIN, 0};
        fds[2] = {queue.wakeFd(), POLLIN, 0};

        int rc = ::poll(fds, 3, wait);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw TerminalError(ErrorCode::TERMINAL_IO, std::string("poll: ") + std::strerror(errno));
        }

        if (rc == 0) {
            if (escapePending) {
                impl_->decoder.expirePending();
                collectDecoded();
                if (!impl_->ready.empty()) return popReady();
                continue;
            }
            return std::nullopt;
        }

        if (fds[1].fd >= 0 && (fds[1].revents & POLLIN)) {
            char buf[32];
            while (::read(g_winchPipe[0], buf, sizeof(buf)) > 0) {
            }
            TerminalSize sz = size();
            ResizeEvent resize;
            resize.cols = sz.cols;
            resize.rows = sz.rows;
            impl_->ready.push_back(resize);
        }

        if (fds[2].revents & POLLIN) {
            queue.clearWake();
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            char buf[4096];
            ssize_t n = ::read(g_inFd, buf, sizeof(buf));
            if (n > 0) {
                impl_->decoder.feed(buf, static_cast<size_t>(n));
                collectDecoded();
            } else if (n == 0) {
                throw TerminalError(ErrorCode::TERMINAL_IO, "terminal input closed");
            } else if (errno != EINTR && errno != EAGAIN) {
                throw TerminalError(ErrorCode::TERMINAL_IO, std::string("read: ") + std::strerror(errno));
            }
        }

        if (!impl_->ready.empty()) return popReady();
        if (auto ev = queue.tryPop()) return ev;
        if (timeoutMs >= 0 && clock::now() >= deadline && !impl_->decoder.hasPendingEscape()) {
            return std::nullopt;
        }
    }
}

void Terminal::write(const std::string& bytes) {
    impl_->out += bytes;
}

void Terminal::flush() {
    const std::string& out = impl_->out;
    size_t off = 0;
    while (off < out.size()) {
        ssize_t n = ::write(g_outFd, out.data() + off, out.size() - off);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno == EAGAIN) {
            struct pollfd pfd = {g_outFd, POLLOUT, 0};
            ::poll(&pfd, 1, 100);
            continue;
        }
        impl_->out.clear();
        throw TerminalError(ErrorCode::TERMINAL_IO, std::string("write: ") + std::strerror(errno));
    }
    impl_->bytesWritten += out.size();
    impl_->out.clear();
}

uint64_t Terminal::bytesWritten() const {
    return impl_->bytesWritten;
}

}
}
