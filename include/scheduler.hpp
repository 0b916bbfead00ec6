#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace voxkey {

// Single-shot, cancellable delayed tasks
class Scheduler {
public:
    using TaskId = uint64_t;
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    // Returns a non-zero id usable with cancel()
    virtual TaskId schedule(std::chrono::milliseconds delay, Task task) = 0;

    // Unknown or already fired ids are ignored
    virtual void cancel(TaskId id) = 0;
};

// Runs tasks on one background worker thread.
// cancel() never waits for a running task, so a task may cancel itself.
class ThreadScheduler : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TaskId schedule(std::chrono::milliseconds delay, Task task) override;
    void cancel(TaskId id) override;

    size_t pending() const;

    // Drops pending tasks and joins the worker, waiting for a task that is
    // already running. Later tasks never run.
    void stop();

private:
    using Clock = std::chrono::steady_clock;

    void run_loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    // Keyed by (deadline, id) so the earliest task is always first
    std::map<std::pair<Clock::time_point, TaskId>, Task> tasks_;
    TaskId next_id_ = 1;
    bool stopping_ = false;
    std::thread worker_thread_;
};

} // namespace voxkey
