#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

namespace execution {

    // Blocking FIFO shared by the order workers. After close(), pop() keeps
    // handing out queued items and returns false once the queue is drained.
    template<typename T>
    class WorkQueue {
    public:
        // False when the queue is already closed
        bool push(T value) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) return false;
                queue_.push_back(std::move(value));
            }
            cv_.notify_one();
            return true;
        }

        bool pop(T& result) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (queue_.empty()) return false;

            result = std::move(queue_.front());
            queue_.pop_front();
            return true;
        }

        void close() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return queue_.size();
        }

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<T> queue_;
        bool closed_ = false;
    };

} // namespace execution
