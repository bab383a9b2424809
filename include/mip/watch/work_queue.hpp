/**
 * @file work_queue.hpp
 * @brief Blocking FIFO feeding the validation workers
 *
 * The event source pushes candidate paths; worker threads pop them and run
 * the (slow) stability check. After close(), pushes are refused and
 * consumers drain what is left, then get nullopt. reopen() makes the queue
 * usable again once those consumers are gone.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace mip::watch {

template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /**
     * @brief Enqueue an item
     *
     * RETURNS: false once the queue is closed (item dropped)
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Blocking pop
     *
     * RETURNS: nullopt when the queue is closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !items_.empty() || closed_; });
        return take_front();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !items_.empty() || closed_; })) {
            return std::nullopt;
        }
        return take_front();
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return items_.size();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

    /// Refuse further pushes and wake every waiting consumer
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// Accept pushes again after close(); leftover items are dropped
    void reopen() {
        std::unique_lock lock(mutex_);
        items_.clear();
        closed_ = false;
    }

private:
    // Caller holds mutex_
    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace mip::watch
