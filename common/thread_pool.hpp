#pragma once

// ============================================================
// thread_pool.hpp -- Fixed-width worker pool with a drain barrier
// ============================================================
//
// Workers pull from one FIFO queue. wait_idle() returns once the
// queue is empty and no worker is inside a task; the pool stays
// usable afterwards, so one pool can serve several drains.

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

class ThreadPool {
public:
    explicit ThreadPool(size_t width) {
        if (width == 0) width = 1;
        workers_.reserve(width);
        for (size_t i = 0; i < width; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    // Finishes queued work, then joins
    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            stopping_ = true;
        }
        work_cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>
    {
        using Result = std::invoke_result_t<F, Args...>;

        auto job = std::make_shared<std::packaged_task<Result()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<Result> fut = job->get_future();

        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (stopping_) throw std::runtime_error("enqueue on a stopping ThreadPool");
            queue_.push([job] { (*job)(); });
        }
        work_cv_.notify_one();
        return fut;
    }

    void wait_idle() {
        std::unique_lock<std::mutex> lk(mutex_);
        idle_cv_.wait(lk, [this] { return queue_.empty() && busy_ == 0; });
    }

    size_t size() const { return workers_.size(); }

private:
    void worker_loop() {
        std::unique_lock<std::mutex> lk(mutex_);
        for (;;) {
            work_cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;  // stopping and drained

            std::function<void()> job = std::move(queue_.front());
            queue_.pop();
            ++busy_;

            lk.unlock();
            job();  // packaged_task keeps exceptions in the future
            lk.lock();

            if (--busy_ == 0 && queue_.empty()) idle_cv_.notify_all();
        }
    }

    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> queue_;
    std::mutex                        mutex_;
    std::condition_variable           work_cv_;
    std::condition_variable           idle_cv_;
    size_t                            busy_{0};
    bool                              stopping_{false};
};
