#include "../../include/ocr_request_queue.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <atomic>
#include <functional>
#include <iterator>
#include <vector>

namespace pagesmith {

using CancelCallback = std::stop_callback<std::function<void()>>;

/// One caller waiting for an entry. Settled exactly once.
struct OcrRequestQueue::Waiter {
    std::promise<std::optional<OcrResult>> promise;
    OcrReadyCallback on_ready;
    std::atomic<bool> settled{false};

    void settle(const std::optional<OcrResult> &result) {
        if (settled.exchange(true)) return;
        promise.set_value(result);
        if (on_ready) on_ready(result);
    }
};

/// Cache slot: in flight until done, then holds the result.
struct OcrRequestQueue::Entry {
    std::mutex mtx;
    bool done = false;
    std::optional<OcrResult> result;
    std::vector<std::shared_ptr<Waiter>> waiters;
    std::vector<std::unique_ptr<CancelCallback>> callbacks;
    std::stop_source stop;   ///< Triggered once every waiter has given up
};

struct OcrRequestQueue::Job {
    std::string key;
    std::shared_ptr<Entry> entry;
    std::shared_ptr<IOcrEngine> engine;
    TempFile file;
    OcrParams params;
};

OcrRequestQueue::OcrRequestQueue(const unsigned threads)
    : pool_(threads == 0 ? 1 : threads) {
}

OcrRequestQueue::~OcrRequestQueue() {
    shutdown_.request_stop();
    std::deque<std::unique_ptr<Job>> abandoned;
    {
        std::lock_guard lock(jobs_mutex_);
        std::ranges::move(foreground_, std::back_inserter(abandoned));
        std::ranges::move(background_, std::back_inserter(abandoned));
        foreground_.clear();
        background_.clear();
    }
    for (const auto &job : abandoned) {
        finish(job->key, job->entry, std::nullopt);
    }
    pool_.request_stop();
}

std::string OcrRequestQueue::make_key(const IOcrEngine &engine, const PageImage &image, const OcrParams &params) {
    return engine.identity() + "|" + image.content_identity() + "|" + params.cache_key();
}

bool OcrRequestQueue::has_cached_result(const IOcrEngine &engine,
                                        const PageImage &image,
                                        const OcrParams &params) const {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard lock(cache_mutex_);
        const auto it = cache_.find(make_key(engine, image, params));
        if (it == cache_.end()) return false;
        entry = it->second;
    }
    std::lock_guard lock(entry->mtx);
    return entry->done && entry->result.has_value();
}

PendingOcr OcrRequestQueue::enqueue(std::shared_ptr<IOcrEngine> engine,
                                    const PageImage &image,
                                    TempFile image_file,
                                    const OcrParams &params,
                                    std::stop_token cancel,
                                    OcrReadyCallback on_ready) {
    auto waiter = std::make_shared<Waiter>();
    waiter->on_ready = std::move(on_ready);
    PendingOcr pending = waiter->promise.get_future().share();
    if (cancel.stop_requested()) {
        waiter->settle(std::nullopt);
        return pending;
    }

    const auto key = make_key(*engine, image, params);
    std::shared_ptr<Entry> entry;
    bool start = false;
    {
        std::lock_guard lock(cache_mutex_);
        if (const auto it = cache_.find(key); it != cache_.end()) {
            entry = it->second;
        } else {
            entry = std::make_shared<Entry>();
            cache_.emplace(key, entry);
            start = true;
        }
    }

    // built outside the entry lock: it runs inline when the token is already stopped
    std::unique_ptr<CancelCallback> on_cancel;
    if (cancel.stop_possible()) {
        on_cancel = std::make_unique<CancelCallback>(cancel, [waiter, weak = std::weak_ptr<Entry>(entry)] {
            waiter->settle(std::nullopt);
            const auto e = weak.lock();
            if (!e) return;
            std::lock_guard lock(e->mtx);
            const bool abandoned = std::ranges::all_of(e->waiters, [](const auto &w) { return w->settled.load(); });
            if (!e->done && abandoned) {
                e->stop.request_stop();
            }
        });
    }

    std::optional<OcrResult> ready;
    bool already_done = false;
    {
        std::lock_guard lock(entry->mtx);
        already_done = entry->done;
        if (already_done) {
            ready = entry->result;
        } else {
            entry->waiters.push_back(waiter);
            if (on_cancel) entry->callbacks.push_back(std::move(on_cancel));
        }
    }
    if (already_done) {
        Logger::log(LogLevel::Debug, "OCR cache hit for " + image.describe(), "ocr_queue");
        waiter->settle(ready);
        return pending;
    }
    if (!start) {
        Logger::log(LogLevel::Debug, "Joining in-flight OCR request for " + image.describe(), "ocr_queue");
        return pending;
    }

    auto job = std::make_unique<Job>(Job{key, entry, std::move(engine), std::move(image_file), params});
    {
        std::lock_guard lock(jobs_mutex_);
        auto &queue = params.priority == OcrPriority::Foreground ? foreground_ : background_;
        queue.push_back(std::move(job));
    }
    pool_.enqueue([this](std::stop_token) { run_next(); });
    return pending;
}

void OcrRequestQueue::run_next() {
    std::unique_ptr<Job> job;
    {
        std::lock_guard lock(jobs_mutex_);
        if (!foreground_.empty()) {
            job = std::move(foreground_.front());
            foreground_.pop_front();
        } else if (!background_.empty()) {
            job = std::move(background_.front());
            background_.pop_front();
        } else {
            return;
        }
    }

    const auto token = job->entry->stop.get_token();
    std::stop_callback link(shutdown_.get_token(), [&job] { job->entry->stop.request_stop(); });

    std::optional<OcrResult> result;
    if (!token.stop_requested()) {
        try {
            result = job->engine->recognize(job->file.path(), job->params, token);
        } catch (const std::exception &e) {
            Logger::log(LogLevel::Error, std::string("OCR failed: ") + e.what(), "ocr_queue");
        }
        if (token.stop_requested()) {
            result.reset();
        }
    }
    finish(job->key, job->entry, std::move(result));
}

void OcrRequestQueue::finish(const std::string &key,
                             const std::shared_ptr<Entry> &entry,
                             std::optional<OcrResult> result) {
    if (!result) {
        std::lock_guard lock(cache_mutex_);
        if (const auto it = cache_.find(key); it != cache_.end() && it->second == entry) {
            cache_.erase(it);
        }
    }

    std::vector<std::shared_ptr<Waiter>> waiters;
    std::vector<std::unique_ptr<CancelCallback>> callbacks;
    {
        std::lock_guard lock(entry->mtx);
        entry->done = true;
        entry->result = result;
        waiters = std::move(entry->waiters);
        callbacks = std::move(entry->callbacks);
    }
    for (const auto &w : waiters) {
        w->settle(result);
    }
    // blocks until a concurrently running cancel callback has returned
    callbacks.clear();
}

void OcrRequestQueue::clear_cache() {
    std::lock_guard lock(cache_mutex_);
    std::erase_if(cache_, [](const auto &kv) {
        std::lock_guard entry_lock(kv.second->mtx);
        return kv.second->done;
    });
}

std::size_t OcrRequestQueue::cached_results() const {
    std::lock_guard lock(cache_mutex_);
    return static_cast<std::size_t>(std::ranges::count_if(cache_, [](const auto &kv) {
        std::lock_guard entry_lock(kv.second->mtx);
        return kv.second->done && kv.second->result.has_value();
    }));
}

} // namespace pagesmith
