#include "scheduler.hpp"
#include <iostream>
#include <exception>

namespace voxkey {

ThreadScheduler::ThreadScheduler() {
    worker_thread_ = std::thread([this]() {
        run_loop();
    });
}

ThreadScheduler::~ThreadScheduler() {
    stop();
}

void ThreadScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        tasks_.clear();
    }
    cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

Scheduler::TaskId ThreadScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        if (stopping_) return id;
        tasks_.emplace(std::make_pair(Clock::now() + delay, id), std::move(task));
    }
    cv_.notify_all();
    return id;
}

void ThreadScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
        if (it->first.second == id) {
            tasks_.erase(it);
            break;
        }
    }
    // Worker re-evaluates its deadline on the next wakeup
}

size_t ThreadScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadScheduler::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        if (tasks_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto next = tasks_.begin();
        if (Clock::now() < next->first.first) {
            cv_.wait_until(lock, next->first.first);
            continue;
        }

        Task task = std::move(next->second);
        tasks_.erase(next);

        // Run without the lock so the task can schedule or cancel
        lock.unlock();
        try {
            if (task) task();
        } catch (const std::exception& e) {
            std::cerr << "Scheduled task failed: " << e.what() << std::endl;
        }
        lock.lock();
    }
}

} // namespace voxkey
