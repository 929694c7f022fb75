/**
 * @file ocr_request_queue.hpp
 * @brief Asynchronous, cached OCR request scheduling.
 */

#ifndef PAGESMITH_OCR_REQUEST_QUEUE_HPP
#define PAGESMITH_OCR_REQUEST_QUEUE_HPP

#include "file_utils.hpp"
#include "ocr_engine.hpp"
#include "page_image.hpp"
#include "thread_pool.hpp"
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>

namespace pagesmith {

    using PendingOcr = std::shared_future<std::optional<OcrResult>>;
    using OcrReadyCallback = std::function<void(const std::optional<OcrResult> &)>;

    /**
     * @brief Runs OCR requests on a private worker pool and caches the results.
     *
     * @details Results are cached under (engine identity, page content
     * identity, OCR parameters). A request for a key that is already cached
     * or in flight attaches to the existing work instead of starting a new
     * recognition. Foreground requests are picked before background ones.
     *
     * Every returned PendingOcr resolves exactly once: with the result, with
     * std::nullopt when recognition failed, or with std::nullopt as soon as
     * the caller's stop token is triggered. Failed and abandoned requests are
     * not cached.
     */
    class OcrRequestQueue {
    public:
        explicit OcrRequestQueue(unsigned threads = 1);
        ~OcrRequestQueue();

        OcrRequestQueue(const OcrRequestQueue &) = delete;
        OcrRequestQueue &operator=(const OcrRequestQueue &) = delete;

        /// @brief True when a successful result for this key is cached.
        [[nodiscard]] bool has_cached_result(const IOcrEngine &engine,
                                             const PageImage &image,
                                             const OcrParams &params) const;

        /**
         * @brief Schedules recognition of @p image_file.
         * @param image_file Encoded page image. The queue owns it from now on
         * and deletes it once recognition no longer needs it.
         * @param cancel Resolves the returned handle with std::nullopt when triggered.
         * @param on_ready Called once with the outcome right after the handle
         * resolves, on whichever thread resolved it (possibly this one).
         */
        PendingOcr enqueue(std::shared_ptr<IOcrEngine> engine,
                           const PageImage &image,
                           TempFile image_file,
                           const OcrParams &params,
                           std::stop_token cancel,
                           OcrReadyCallback on_ready = {});

        /// @brief Drops every cached result. In-flight requests are unaffected.
        void clear_cache();

        /// @brief Number of successful results in the cache.
        [[nodiscard]] std::size_t cached_results() const;

    private:
        struct Waiter;
        struct Entry;
        struct Job;

        static std::string make_key(const IOcrEngine &engine, const PageImage &image, const OcrParams &params);

        void run_next();
        void finish(const std::string &key, const std::shared_ptr<Entry> &entry, std::optional<OcrResult> result);

        mutable std::mutex cache_mutex_;
        std::unordered_map<std::string, std::shared_ptr<Entry>> cache_;

        std::mutex jobs_mutex_;
        std::deque<std::unique_ptr<Job>> foreground_;
        std::deque<std::unique_ptr<Job>> background_;

        std::stop_source shutdown_;
        ThreadPool pool_;   ///< Declared last: joined before the queues above are destroyed
    };

} // namespace pagesmith

#endif // PAGESMITH_OCR_REQUEST_QUEUE_HPP
