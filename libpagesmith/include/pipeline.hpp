/**
 * @file pipeline.hpp
 * @brief Ordered concurrent stage chains over a set of work items.
 */

#ifndef PAGESMITH_PIPELINE_HPP
#define PAGESMITH_PIPELINE_HPP

#include "thread_pool.hpp"
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <utility>
#include <vector>

namespace pagesmith {

/**
 * @brief Runs a fixed sequence of steps over every item of a list.
 *
 * @details Each item gets its own chain (step 1, step 2, ...) on a
 * ThreadPool, so chains of different items interleave freely while the steps
 * of one item always run in order. Results are gathered in the order of the
 * input list regardless of completion order.
 *
 * A suspending step (suspend()) starts external work and hands the chain a
 * Resume callback instead of returning. The worker is released at once and
 * the chain is posted back to the pool when Resume is called, so items
 * waiting on slow external work never block the steps of other items.
 *
 * The cancel token is checked before every step; once it is triggered the
 * remaining steps of a chain are skipped and the item is passed through
 * unchanged.
 *
 * @code
 * auto running = Pipeline<PageExportState*>::over(pages)
 *     .step(render)
 *     .suspend(start_ocr)
 *     .step(write)
 *     .run(pool, token);
 * auto done = running.get();
 * @endcode
 */
template <typename T>
class Pipeline {
public:
    using Step = std::function<T(T, std::stop_token)>;
    using Resume = std::function<void()>;

    /**
     * @brief Step that continues asynchronously.
     *
     * Must either throw without calling Resume, or arrange for Resume to be
     * called exactly once. Resume may run on any thread, even before the step
     * returns; the step must not touch the item after handing it off.
     */
    using SuspendingStep = std::function<void(T&, std::stop_token, Resume)>;

    /**
     * @brief Handle to a pipeline whose chains have been scheduled.
     */
    class Running {
    public:
        Running() = default;
        explicit Running(std::vector<std::future<T>> futures) : futures_(std::move(futures)) {}

        Running(Running&&) noexcept = default;
        Running& operator=(Running&&) noexcept = default;

        /**
         * @brief Waits for every chain to finish.
         * Never throws; errors are reported by get().
         */
        void wait() {
            for (auto& f : futures_) {
                if (f.valid()) f.wait();
            }
        }

        /**
         * @brief Waits for every chain and returns the items in input order.
         * @throws The first exception raised by any chain (in input order),
         * after all chains have drained.
         */
        std::vector<T> get() {
            wait();
            std::vector<T> out;
            out.reserve(futures_.size());
            std::exception_ptr first_error;
            for (auto& f : futures_) {
                try {
                    out.push_back(f.get());
                } catch (...) {
                    if (!first_error) first_error = std::current_exception();
                }
            }
            futures_.clear();
            if (first_error) std::rethrow_exception(first_error);
            return out;
        }

        ~Running() { wait(); }

    private:
        std::vector<std::future<T>> futures_;
    };

    static Pipeline over(std::vector<T> items) {
        Pipeline p;
        p.items_ = std::move(items);
        return p;
    }

    Pipeline&& step(Step s) && {
        stages_.push_back({std::move(s), {}});
        return std::move(*this);
    }

    Pipeline& step(Step s) & {
        stages_.push_back({std::move(s), {}});
        return *this;
    }

    Pipeline&& suspend(SuspendingStep s) && {
        stages_.push_back({{}, std::move(s)});
        return std::move(*this);
    }

    Pipeline& suspend(SuspendingStep s) & {
        stages_.push_back({{}, std::move(s)});
        return *this;
    }

    /**
     * @brief Schedules one chain per item on the pool.
     * @param pool Pool executing the chains. Must outlive the returned handle.
     * @param cancel Cooperative cancellation token checked before each step.
     */
    Running run(ThreadPool& pool, std::stop_token cancel) {
        auto shared = std::make_shared<const Shared>(Shared{&pool, std::move(stages_), std::move(cancel)});
        std::vector<std::future<T>> futures;
        futures.reserve(items_.size());
        for (auto& item : items_) {
            auto chain = std::make_shared<Chain>(std::move(item));
            futures.push_back(chain->done.get_future());
            schedule(shared, chain);
        }
        items_.clear();
        stages_.clear();
        return Running(std::move(futures));
    }

private:
    struct Stage {
        Step step;
        SuspendingStep suspending;
    };

    struct Shared {
        ThreadPool* pool;
        std::vector<Stage> stages;
        std::stop_token cancel;
    };

    struct Chain {
        explicit Chain(T v) : value(std::move(v)) {}
        T value;
        std::size_t next = 0;
        std::promise<T> done;
    };

    static void schedule(const std::shared_ptr<const Shared>& shared, const std::shared_ptr<Chain>& chain) {
        try {
            shared->pool->post([shared, chain](std::stop_token) { advance(shared, chain); });
        } catch (...) {
            chain->done.set_exception(std::current_exception());
        }
    }

    static void advance(const std::shared_ptr<const Shared>& shared, const std::shared_ptr<Chain>& chain) {
        try {
            while (chain->next < shared->stages.size() && !shared->cancel.stop_requested()) {
                const auto& stage = shared->stages[chain->next++];
                if (stage.step) {
                    chain->value = stage.step(std::move(chain->value), shared->cancel);
                    continue;
                }
                stage.suspending(chain->value, shared->cancel, [shared, chain] { schedule(shared, chain); });
                return;
            }
        } catch (...) {
            chain->done.set_exception(std::current_exception());
            return;
        }
        chain->done.set_value(std::move(chain->value));
    }

    std::vector<T> items_;
    std::vector<Stage> stages_;
};

} // namespace pagesmith

#endif // PAGESMITH_PIPELINE_HPP
