#include "dispatch_executor.h"
#include "logger.h"
#include <chrono>
#include <exception>

namespace wayfarer {

ThreadedDispatchExecutor::ThreadedDispatchExecutor()
    : running_(true) {
    worker_ = std::thread(&ThreadedDispatchExecutor::worker_thread, this);
}

ThreadedDispatchExecutor::~ThreadedDispatchExecutor() {
    shutdown();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool ThreadedDispatchExecutor::submit(Task task) {
    if (!running_) {
        Logger::warn("Dispatch executor is shut down, task rejected");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

bool ThreadedDispatchExecutor::is_idle() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.empty() && active_ == 0;
}

size_t ThreadedDispatchExecutor::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size() + active_;
}

bool ThreadedDispatchExecutor::wait_for_completion(int timeout_ms) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    auto idle = [this] { return task_queue_.empty() && active_ == 0; };
    if (timeout_ms > 0) {
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
    }
    idle_cv_.wait(lock, idle);
    return true;
}

void ThreadedDispatchExecutor::shutdown() {
    running_ = false;
    queue_cv_.notify_all();
}

void ThreadedDispatchExecutor::worker_thread() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !task_queue_.empty() || !running_;
            });

            if (task_queue_.empty()) {
                break;  // shut down and drained
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            active_++;
        }

        try {
            task();
        } catch (const std::exception& e) {
            Logger::error(std::string("Dispatch task threw: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_--;
        }
        idle_cv_.notify_all();
    }
}

} // namespace wayfarer
