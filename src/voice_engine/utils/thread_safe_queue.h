/**
 * @file thread_safe_queue.h
 * @brief Defines a generic, optionally bounded, thread-safe queue.
 * @details The queue is the hand-off point between producer threads (ingestion,
 *          silence detection) and long-lived consumer workers. Producers never block:
 *          `try_push` reports a full or stopped queue instead of waiting. Consumers
 *          block in `pop` until an item arrives or the queue is stopped and drained.
 */
#ifndef THREAD_SAFE_QUEUE_H
#define THREAD_SAFE_QUEUE_H

#include <cstddef>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <utility>

namespace voicetap {
namespace audio {
namespace utils {

/**
 * @class ThreadSafeQueue
 * @brief A template class for a thread-safe FIFO queue.
 * @tparam T The type of elements to be stored in the queue.
 */
template <typename T>
class ThreadSafeQueue {
public:
    enum class PushResult {
        Pushed,
        QueueStopped,
        QueueFull
    };

    /**
     * @brief Constructs a queue.
     * @param capacity Maximum number of queued items (0 = unbounded).
     */
    explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity), stop_requested_(false) {}

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue(ThreadSafeQueue&&) = delete;
    ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

    /**
     * @brief Non-blocking push against the configured capacity.
     * @details A full queue rejects the new item and leaves its contents untouched.
     */
    PushResult try_push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_requested_) {
            return PushResult::QueueStopped;
        }
        if (capacity_ > 0 && queue_.size() >= capacity_) {
            return PushResult::QueueFull;
        }
        queue_.push_back(std::move(item));
        lock.unlock();
        cond_.notify_one();
        return PushResult::Pushed;
    }

    /**
     * @brief Pops an item, blocking while the queue is empty.
     * @details Items queued before `stop()` are still returned; once stopped and empty
     *          the call returns false immediately.
     * @param item Receives the popped item.
     * @return true if an item was popped.
     */
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return !queue_.empty() || stop_requested_; });

        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    /**
     * @brief Closes the queue to producers and wakes blocked consumers.
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        cond_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const {
        return capacity_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<T> queue_;
    bool stop_requested_;
};

} // namespace utils
} // namespace audio
} // namespace voicetap
#endif // THREAD_SAFE_QUEUE_H
