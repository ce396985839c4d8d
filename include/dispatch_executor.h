#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace wayfarer {

/**
 * @brief Runs backend dispatch work off the session's event path
 */
class IDispatchExecutor {
public:
    using Task = std::function<void()>;

    virtual ~IDispatchExecutor() = default;

    /// @return false if the executor no longer accepts work
    virtual bool submit(Task task) = 0;
};

/**
 * @brief Single worker thread executing tasks in submission order
 *
 * Backend calls block on the network, so they run here and report back by
 * posting to the session event queue.
 */
class ThreadedDispatchExecutor : public IDispatchExecutor {
public:
    ThreadedDispatchExecutor();

    /**
     * @brief Destructor - finishes queued tasks, then joins the worker
     */
    ~ThreadedDispatchExecutor() override;

    // Non-copyable
    ThreadedDispatchExecutor(const ThreadedDispatchExecutor&) = delete;
    ThreadedDispatchExecutor& operator=(const ThreadedDispatchExecutor&) = delete;

    bool submit(Task task) override;

    /**
     * @brief Check if executor is idle (no queued or running task)
     */
    bool is_idle() const;

    size_t pending_count() const;

    /**
     * @brief Wait for all pending tasks to complete
     * @param timeout_ms Maximum time to wait (0 = wait indefinitely)
     * @return true if all completed, false if timeout
     */
    bool wait_for_completion(int timeout_ms = 0);

    /**
     * @brief Stop accepting new tasks; queued tasks still run
     */
    void shutdown();

private:
    void worker_thread();

    std::atomic<bool> running_;
    size_t active_ = 0;

    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;

    std::thread worker_;
};

} // namespace wayfarer
