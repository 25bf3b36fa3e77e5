#pragma once

#include "term/input_event.h"
#include <deque>
#include <mutex>
#include <optional>

namespace leetshell {
namespace term {

// FIFO shared between the event loop and collaborator threads. Every push
// also writes a byte to a wake pipe so a loop blocked in poll() returns.
class EventQueue {
public:
    EventQueue();
    ~EventQueue();

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    void push(InputEvent event);
    std::optional<InputEvent> tryPop();

    size_t size() const;
    bool empty() const;

    int wakeFd() const { return pipe_[0]; }
    void clearWake();

private:
    mutable std::mutex mutex_;
    std::deque<InputEvent> items_;
    int pipe_[2];
};

}
}
