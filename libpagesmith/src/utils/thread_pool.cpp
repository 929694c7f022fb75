#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <stdexcept>

ThreadPool::ThreadPool(const unsigned threads) {
    const unsigned n = threads == 0 ? 1 : threads;
    workers_.reserve(n);
    for (unsigned i = 0; i < n; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { work(st); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(mtx_);
        closed_ = true;
    }
    wake_.notify_all();
    // the jthreads request stop and join here
}

void ThreadPool::post(Task task) {
    {
        std::lock_guard lock(mtx_);
        if (closed_) {
            throw std::runtime_error("ThreadPool is closed");
        }
        queue_.push_back(std::move(task));
        ++busy_;
    }
    wake_.notify_one();
}

bool ThreadPool::take(const std::stop_token& st, Task& out) {
    std::unique_lock lock(mtx_);
    wake_.wait(lock, st, [this] { return closed_ || !queue_.empty(); });
    if (st.stop_requested() || queue_.empty()) {
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void ThreadPool::done_one() {
    {
        std::lock_guard lock(mtx_);
        if (busy_ > 0) --busy_;
    }
    idle_.notify_all();
}

void ThreadPool::work(const std::stop_token& st) {
    Task task;
    while (take(st, task)) {
        try {
            task(st);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Task failed: ") + e.what(), "thread_pool");
        }
        task = nullptr;
        done_one();
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(mtx_);
    idle_.wait(lock, [this] { return busy_ == 0; });
}

void ThreadPool::request_stop() {
    {
        std::lock_guard lock(mtx_);
        closed_ = true;
        busy_ -= std::min(busy_, queue_.size());
        queue_.clear();
    }
    wake_.notify_all();
    idle_.notify_all();
    for (auto& w : workers_) {
        w.request_stop();
    }
}
