#include "utils/task_scheduler.h"
#include "utils/logger.h"
#include <algorithm>
#include <exception>

namespace leetshell {
namespace utils {

TaskScheduler::TaskScheduler() : running_(false), nextId_(1), completed_(0) {}

TaskScheduler::~TaskScheduler() {
    stop();
}

void TaskScheduler::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&TaskScheduler::run, this);
}

void TaskScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

uint64_t TaskScheduler::scheduleOnce(std::function<void()> task, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);

    ScheduledTask st;
    st.task = std::move(task);
    st.nextRun = std::chrono::steady_clock::now() + delay;
    st.cancelled = false;
    st.id = nextId_++;

    tasks_.push_back(std::move(st));
    cv_.notify_one();
    return tasks_.back().id;
}

void TaskScheduler::cancel(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& task : tasks_) {
        if (task.id == id) {
            task.cancelled = true;
            break;
        }
    }
}

void TaskScheduler::cancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& task : tasks_) {
        task.cancelled = true;
    }
}

size_t TaskScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
        [](const ScheduledTask& t) { return !t.cancelled; }));
}

void TaskScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        tasks_.erase(
            std::remove_if(tasks_.begin(), tasks_.end(),
                [](const ScheduledTask& t) { return t.cancelled; }),
            tasks_.end());

        if (tasks_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        auto next = std::min_element(tasks_.begin(), tasks_.end(),
            [](const ScheduledTask& a, const ScheduledTask& b) {
                return a.nextRun < b.nextRun;
            });

        if (next->nextRun > now) {
            cv_.wait_until(lock, next->nextRun);
            continue;
        }

        auto task = std::move(next->task);
        next->cancelled = true;
        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::ERROR, "scheduler", std::string("task failed: ") + e.what());
        }
        completed_++;
        lock.lock();
    }
}

}
}
