#ifndef THREAD_SAFE_QUEUE_H_
#define THREAD_SAFE_QUEUE_H_

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

template <typename T> class ThreadSafeQueue {
  public:
    explicit ThreadSafeQueue(size_t capacity = 0)
        : capacity_(capacity) {}

    // Returns false without queuing when the queue already holds `capacity` items.
    bool try_push(T t) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (capacity_ > 0 && queue_.size() >= capacity_) {
            return false;
        }
        queue_.push(std::move(t));
        cond_.notify_one();
        return true;
    }

    std::optional<T> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cond_.wait_for(lock, timeout, [this]() {
                return !queue_.empty();
            })) {
            return std::nullopt;
        }
        T t = std::move(queue_.front());
        queue_.pop();
        return t;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_ = std::queue<T>();
    }

  private:
    size_t capacity_;
    std::queue<T> queue_;
    std::mutex mutex_;
    std::condition_variable cond_;
};

#endif // THREAD_SAFE_QUEUE_H_
