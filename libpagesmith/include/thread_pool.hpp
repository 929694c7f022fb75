/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used by the export pipelines and the OCR queue.
 */

#ifndef PAGESMITH_THREAD_POOL_HPP
#define PAGESMITH_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

/**
 * @brief A fixed set of std::jthread workers draining one FIFO task queue.
 *
 * @details Tasks receive the worker's std::stop_token. post() is the
 * fire-and-forget entry point used for continuations: a task may post
 * follow-up work and return, so no worker is held while that work waits on
 * something external. enqueue() wraps post() for callers that want a future.
 */
class ThreadPool {
public:
    using Task = std::function<void(std::stop_token)>;

    /// @param threads Number of workers. Zero is clamped to one.
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());

    /// Closes the queue and joins the workers. Tasks not yet started are dropped.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queues a task without a result channel.
     * Exceptions escaping the task are logged and dropped.
     * @throws std::runtime_error once the pool is closed.
     */
    void post(Task task);

    /**
     * @brief Queues a task and returns a future for its result.
     * Exceptions thrown by the task are stored in the future.
     * @throws std::runtime_error once the pool is closed.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using R = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<R(std::stop_token)>>(std::forward<F>(f));
        auto result = task->get_future();
        post([task](std::stop_token st) { (*task)(st); });
        return result;
    }

    /// @brief Blocks until the queue is empty and no task is running.
    void wait_idle();

    /**
     * @brief Closes the queue, drops queued tasks and signals running ones
     * through their stop_token. Futures of dropped tasks report broken_promise.
     */
    void request_stop();

    /// @return Number of worker threads.
    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

private:
    void work(const std::stop_token& st);
    bool take(const std::stop_token& st, Task& out);
    void done_one();

    std::mutex mtx_;
    std::condition_variable_any wake_;
    std::condition_variable idle_;
    std::deque<Task> queue_;
    bool closed_{false};
    std::size_t busy_{0};   ///< Tasks queued or running
    std::vector<std::jthread> workers_;
};

#endif // PAGESMITH_THREAD_POOL_HPP
