#pragma once
/*-----------------------------------------------------------------------
 * ThreadPool
 *
 * - Fixed number of worker threads created in the constructor.
 * - submit() enqueues a callable and returns std::future<R>; an exception
 *   thrown by the callable is stored in the future and rethrown by get().
 * - Bounded task queue (default 2 * n_threads) so producers block instead
 *   of queueing unbounded work.
 * - stop() (or the destructor) drains the queue and joins the workers.
 *---------------------------------------------------------------------*/
#include <algorithm>
#include <vector>
#include <thread>
#include <future>
#include <functional>
#include <atomic>
#include <memory>
#include <type_traits>
#include <utility>
#include <stdexcept>
#include "BlockingQueue.hpp"

class ThreadPool {
public:
    explicit ThreadPool(size_t n_threads = std::thread::hardware_concurrency(), size_t queue_capacity = 0)
        : tasks_(compute_capacity_(n_threads, queue_capacity))
    {
        workers_.reserve(n_threads);
        for (size_t i = 0; i < n_threads; ++i) {
            workers_.emplace_back([this]{ this->worker_loop_(); });
        }
    }

    ~ThreadPool() {
        stop();
    }

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool(ThreadPool&&)                 = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool& operator=(ThreadPool&&)      = delete;

    // Blocks while the queue is full.
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F,Args...>>
    {
        using R = std::invoke_result_t<F,Args...>;
        if (stopped_.load(std::memory_order_acquire)) {
            throw std::logic_error("submit on stopped ThreadPool");
        }

        auto task = std::make_shared<std::packaged_task<R()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        std::future<R> fut = task->get_future();
        tasks_.push([task]{ (*task)(); });
        return fut;
    }

    // Idempotent.
    void stop() {
        bool expected = false;
        if (!stopped_.compare_exchange_strong(expected, true)) {
            return;
        }
        tasks_.shutdown();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
    }

private:
    static size_t compute_capacity_(size_t& n_threads, size_t user_cap) {
        if (n_threads == 0) n_threads = 1;
        return user_cap == 0 ? 2 * n_threads : user_cap;
    }

    // packaged_task never throws out of operator(); errors travel in the future
    void worker_loop_() {
        while (auto opt = tasks_.pop()) {
            (*opt)();
        }
    }

    std::vector<std::thread>             workers_;
    BlockingQueue<std::function<void()>> tasks_;
    std::atomic<bool>                    stopped_{false};
};

/*-----------------------------------------------------------------------
 * parallel_map(n, threads, fn)
 * Runs fn(i) for i in [0,n) and returns results in index order. With
 * threads <= 1 it runs inline. The first exception (lowest index) is
 * rethrown after all tasks finished.
 *---------------------------------------------------------------------*/
template<class F>
auto parallel_map(size_t n, size_t threads, F&& fn)
    -> std::vector<std::invoke_result_t<F&, size_t>>
{
    using R = std::invoke_result_t<F&, size_t>;
    std::vector<R> out;
    out.reserve(n);
    if (threads <= 1 || n <= 1) {
        for (size_t i = 0; i < n; ++i) out.push_back(fn(i));
        return out;
    }

    std::vector<std::future<R>> futs;
    futs.reserve(n);
    {
        ThreadPool pool(std::min(threads, n));
        for (size_t i = 0; i < n; ++i) {
            futs.push_back(pool.submit([&fn, i]{ return fn(i); }));
        }
        pool.stop();
    }
    for (auto& f : futs) out.push_back(f.get());
    return out;
}
