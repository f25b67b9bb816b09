#pragma once

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

namespace slngen {

// Fixed-size worker pool. Tasks run in FIFO order; results come back
// through std::future. The destructor drains nothing: queued tasks that
// have not started are dropped, running ones are joined.
class ThreadPool {
public:
    // thread_count == 0 picks std::thread::hardware_concurrency()
    explicit ThreadPool(size_t thread_count = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    auto post(F&& callable) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(callable));
        auto future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (terminated_) {
                throw std::runtime_error("thread pool is terminating");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        work_cv_.notify_one();
        return future;
    }

    size_t size() const { return workers_.size(); }

private:
    void run();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    bool terminated_ = false;
    std::mutex mutex_;
    std::condition_variable work_cv_;
};

} // namespace slngen
