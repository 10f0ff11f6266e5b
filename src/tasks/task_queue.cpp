#include "attachvault/tasks/task_queue.h"

#include <exception>
#include <utility>

#include <boost/asio/post.hpp>

#include "attachvault/core/logger.h"

namespace attachvault::tasks {

TaskQueue::TaskQueue(std::size_t threads) : pool_(threads) {}

TaskQueue::~TaskQueue() {
    pool_.join();
}

void TaskQueue::Post(const std::string& name, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pending_;
    }
    boost::asio::post(pool_, [this, name, task = std::move(task)]() {
        FinishGuard guard(*this);
        try {
            task();
        } catch (const std::exception& ex) {
            core::LogError("Background task " + name + " failed: " + ex.what());
        } catch (...) {
            core::LogError("Background task " + name + " failed with a non-standard exception");
        }
    });
}

void TaskQueue::Drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this]() { return pending_ == 0; });
}

std::size_t TaskQueue::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

void TaskQueue::Finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    --pending_;
    if (pending_ == 0) {
        idle_.notify_all();
    }
}

}  // namespace attachvault::tasks
