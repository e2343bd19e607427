// filename: work_queue.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace ensemble {

/**
 * @brief Unbounded blocking FIFO shared by any number of producers and consumers.
 *
 * Each pushed value is handed to exactly one pop() call.
 */
template <typename T>
class WorkQueue {
public:
    WorkQueue() = default;
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(value));
        }
        ready_.notify_one();
    }

    /// Blocks until a value is available.
    T pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this]() { return !items_.empty(); });
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> items_;
};

}  // namespace ensemble
