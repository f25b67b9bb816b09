#include "common/thread_pool.hpp"
#include <algorithm>

namespace slngen {

ThreadPool::ThreadPool(size_t thread_count) {
    if (thread_count == 0) {
        thread_count = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    workers_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back(&ThreadPool::run, this);
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        terminated_ = true;
        while (!tasks_.empty()) {
            tasks_.pop();
        }
    }
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
}

void ThreadPool::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        work_cv_.wait(lock, [this] { return terminated_ || !tasks_.empty(); });
        if (terminated_) {
            return;
        }
        auto task = std::move(tasks_.front());
        tasks_.pop();
        lock.unlock();
        task();
        lock.lock();
    }
}

} // namespace slngen
