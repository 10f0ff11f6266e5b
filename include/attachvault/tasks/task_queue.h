#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

#include <boost/asio/thread_pool.hpp>

namespace attachvault::tasks {

/// @brief Background work queue backed by a Boost.Asio thread pool.
///
/// Each task runs behind its own error boundary: an escaping exception is
/// logged with the task name and never reaches the pool.
class TaskQueue {
public:
    explicit TaskQueue(std::size_t threads);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    void Post(const std::string& name, std::function<void()> task);
    /// @brief Block until every task posted so far has finished.
    void Drain();
    std::size_t Pending() const;

private:
    /// @brief Marks one task finished however its body exits.
    class FinishGuard {
    public:
        explicit FinishGuard(TaskQueue& queue) : queue_(queue) {}
        ~FinishGuard() { queue_.Finish(); }

        FinishGuard(const FinishGuard&) = delete;
        FinishGuard& operator=(const FinishGuard&) = delete;

    private:
        TaskQueue& queue_;
    };

    void Finish();

    boost::asio::thread_pool pool_;
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::size_t pending_{0};
};

}  // namespace attachvault::tasks
