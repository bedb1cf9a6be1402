#pragma once
/*-----------------------------------------------------------------------
 * BlockingQueue<T>
 * Thread-safe FIFO with shutdown. capacity 0 = unbounded; otherwise push()
 * blocks while the queue is full (back-pressure on the producer).
 *---------------------------------------------------------------------*/
#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <stdexcept>
#include <cstddef>

template<class T>
class BlockingQueue {
public:
    explicit BlockingQueue(size_t capacity = 0)
        : capacity_(capacity) {}

    BlockingQueue(const BlockingQueue&)            = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    // Throws std::logic_error after shutdown()
    template<class U>
    void push(U&& value) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_not_full_.wait(lock, [this]{
            return done_ || capacity_ == 0 || q_.size() < capacity_;
        });
        if (done_) {
            throw std::logic_error("push on stopped BlockingQueue");
        }
        q_.emplace(std::forward<U>(value));
        lock.unlock();
        cv_not_empty_.notify_one();
    }

    // Blocks until an item arrives; std::nullopt once shut down and drained
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_not_empty_.wait(lock, [this]{
            return done_ || !q_.empty();
        });
        if (q_.empty()) return std::nullopt;
        T val = std::move(q_.front());
        q_.pop();
        lock.unlock();
        cv_not_full_.notify_one();
        return val;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            done_ = true;
        }
        cv_not_empty_.notify_all();
        cv_not_full_.notify_all();
    }

private:
    std::mutex              mtx_;
    std::condition_variable cv_not_empty_;
    std::condition_variable cv_not_full_;
    std::queue<T>           q_;
    size_t                  capacity_ = 0;
    bool                    done_     = false;
};
