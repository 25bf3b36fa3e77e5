#include "term/event_queue.h"
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace leetshell {
namespace term {

static void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    fcntl(fd, F_SETFD, FD_CLOEXEC);
}

EventQueue::EventQueue() {
    if (::pipe(pipe_) != 0) {
        throw TerminalError(ErrorCode::INTERNAL_ERROR,
                            std::string("event queue pipe: ") + std::strerror(errno));
    }
    setNonBlocking(pipe_[0]);
    setNonBlocking(pipe_[1]);
}

EventQueue::~EventQueue() {
    ::close(pipe_[0]);
    ::close(pipe_[1]);
}

void EventQueue::push(InputEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push_back(std::move(event));
    }
    char b = 1;
    // A full pipe already guarantees a pending wakeup.
    ssize_t n = ::write(pipe_[1], &b, 1);
    (void)n;
}

std::optional<InputEvent> EventQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) return std::nullopt;
    InputEvent ev = std::move(items_.front());
    items_.pop_front();
    return ev;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

bool EventQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
}

void EventQueue::clearWake() {
    char buf[64];
    while (::read(pipe_[0], buf, sizeof(buf)) > 0) {
    }
}

}
}
