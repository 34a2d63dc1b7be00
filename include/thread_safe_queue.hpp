#ifndef ROSLINK_THREAD_SAFE_QUEUE_HPP
#define ROSLINK_THREAD_SAFE_QUEUE_HPP

#include <queue>
#include <mutex>
#include <condition_variable>
#include <stdexcept>

namespace roslink {

class QueueShutdown : public std::runtime_error {
public:
    QueueShutdown() : std::runtime_error("Queue shutdown") {}
};

// Multi-producer/multi-consumer FIFO. After shutdown() pending items are still
// handed out; consumers get QueueShutdown once the queue has drained.
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    // Returns false if the queue has been shut down and the item was dropped
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) return false;
            queue_.push(std::move(item));
        }
        cond_.notify_one();
        return true;
    }

    // Blocking pop
    T pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return !queue_.empty() || shutdown_; });

        if (shutdown_ && queue_.empty()) {
            throw QueueShutdown();
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    // Drops queued items; returns how many were dropped
    size_t clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        const size_t dropped = queue_.size();
        queue_ = std::queue<T>();
        return dropped;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        cond_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cond_;
    std::queue<T> queue_;
    bool shutdown_ = false;
};

} // namespace roslink

#endif // ROSLINK_THREAD_SAFE_QUEUE_HPP
