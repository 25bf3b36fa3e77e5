#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <functional>
#include <chrono>
#include <cstdint>

namespace leetshell {
namespace utils {

// Single background thread running delayed one-shot tasks in due order.
class TaskScheduler {
public:
    TaskScheduler();
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_; }

    uint64_t scheduleOnce(std::function<void()> task, std::chrono::milliseconds delay);
    void cancel(uint64_t id);
    void cancelAll();

    size_t pending() const;
    uint64_t completed() const { return completed_; }

private:
    struct ScheduledTask {
        std::function<void()> task;
        std::chrono::steady_clock::time_point nextRun;
        bool cancelled;
        uint64_t id;
    };

    void run();

    std::vector<ScheduledTask> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> nextId_;
    std::atomic<uint64_t> completed_;
};

}
}
