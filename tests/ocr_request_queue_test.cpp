#include "../libpagesmith/include/ocr_request_queue.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <thread>

using namespace pagesmith;
using namespace std::chrono_literals;

namespace {

    /// Engine returning one word per call. Can be held at a gate until released.
    class FakeEngine final : public IOcrEngine {
    public:
        std::atomic<int> calls{0};
        std::atomic<bool> saw_file{false};
        bool fail = false;
        bool gated = false;

        [[nodiscard]] std::string identity() const override { return "fake"; }

        [[nodiscard]] bool is_available(const OcrParams &, std::string &) const override { return true; }

        std::optional<OcrResult> recognize(const std::filesystem::path &image_file,
                                           const OcrParams &params,
                                           const std::stop_token cancel) override {
            ++calls;
            if (!image_file.empty() && std::filesystem::exists(image_file)) saw_file = true;
            if (gated) {
                std::unique_lock lock(mtx_);
                cv_.wait(lock, cancel, [this] { return open_; });
                if (cancel.stop_requested()) return std::nullopt;
            }
            if (fail) return std::nullopt;
            OcrResult r;
            r.page_width = 100;
            r.page_height = 50;
            r.elements.push_back({Rect{1, 2, 30, 10}, params.language_code, false});
            return r;
        }

        void open_gate() {
            {
                std::lock_guard lock(mtx_);
                open_ = true;
            }
            cv_.notify_all();
        }

    private:
        std::mutex mtx_;
        std::condition_variable_any cv_;
        bool open_ = false;
    };

    TempFile scratch_file(const test_support::ScratchDir &dir) {
        TempFile f(make_temp_path(dir.path(), ".png"));
        std::ofstream(f.path()) << "pixels";
        return f;
    }

} // namespace

TEST(OcrRequestQueue, RecognizesAndCaches) {
    const test_support::ScratchDir dir;
    auto engine = std::make_shared<FakeEngine>();
    OcrRequestQueue queue(2);
    const auto page = PageImage::from_memory({1, 2, 3}, ".png");
    const OcrParams params;

    const auto first = queue.enqueue(engine, page, scratch_file(dir), params, {}).get();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->elements.at(0).text, "eng");
    EXPECT_TRUE(engine->saw_file.load());
    EXPECT_TRUE(queue.has_cached_result(*engine, page, params));
    EXPECT_EQ(queue.cached_results(), 1u);

    const auto second = queue.enqueue(engine, page, TempFile{}, params, {}).get();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(engine->calls.load(), 1);

    OcrParams other;
    other.language_code = "deu";
    EXPECT_FALSE(queue.has_cached_result(*engine, page, other));

    queue.clear_cache();
    EXPECT_EQ(queue.cached_results(), 0u);
}

TEST(OcrRequestQueue, PriorityDoesNotChangeTheCacheKey) {
    auto engine = std::make_shared<FakeEngine>();
    OcrRequestQueue queue;
    const auto page = PageImage::from_memory({9}, ".jpg");
    OcrParams fg;
    OcrParams bg;
    bg.priority = OcrPriority::Background;

    ASSERT_TRUE(queue.enqueue(engine, page, TempFile{}, bg, {}).get().has_value());
    EXPECT_TRUE(queue.has_cached_result(*engine, page, fg));
}

TEST(OcrRequestQueue, FailuresAreNotCached) {
    auto engine = std::make_shared<FakeEngine>();
    engine->fail = true;
    OcrRequestQueue queue;
    const auto page = PageImage::from_memory({4, 5}, ".png");

    EXPECT_FALSE(queue.enqueue(engine, page, TempFile{}, {}, {}).get().has_value());
    EXPECT_FALSE(queue.enqueue(engine, page, TempFile{}, {}, {}).get().has_value());
    EXPECT_EQ(engine->calls.load(), 2);
    EXPECT_EQ(queue.cached_results(), 0u);
}

TEST(OcrRequestQueue, ConcurrentRequestsShareOneRecognition) {
    auto engine = std::make_shared<FakeEngine>();
    engine->gated = true;
    OcrRequestQueue queue(2);
    const auto page = PageImage::from_memory({7, 7, 7}, ".png");

    const auto a = queue.enqueue(engine, page, TempFile{}, {}, {});
    const auto b = queue.enqueue(engine, page, TempFile{}, {}, {});
    engine->open_gate();

    EXPECT_TRUE(a.get().has_value());
    EXPECT_TRUE(b.get().has_value());
    EXPECT_EQ(engine->calls.load(), 1);
}

TEST(OcrRequestQueue, CancelResolvesWaiterWithoutResult) {
    auto engine = std::make_shared<FakeEngine>();
    engine->gated = true;
    OcrRequestQueue queue;
    const auto page = PageImage::from_memory({3, 1, 4}, ".png");
    std::stop_source stop;

    const auto pending = queue.enqueue(engine, page, TempFile{}, {}, stop.get_token());
    stop.request_stop();

    ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(pending.get().has_value());
    EXPECT_FALSE(queue.has_cached_result(*engine, page, {}));
}

TEST(OcrRequestQueue, AlreadyCancelledTokenResolvesImmediately) {
    auto engine = std::make_shared<FakeEngine>();
    OcrRequestQueue queue;
    std::stop_source stop;
    stop.request_stop();

    const auto pending = queue.enqueue(engine, PageImage::from_memory({1}, ".png"), TempFile{}, {}, stop.get_token());
    EXPECT_FALSE(pending.get().has_value());
    EXPECT_EQ(engine->calls.load(), 0);
}

TEST(OcrRequestQueue, DeletesInputFileWhenDone) {
    const test_support::ScratchDir dir;
    auto engine = std::make_shared<FakeEngine>();
    std::filesystem::path input;
    {
        OcrRequestQueue queue;
        auto file = scratch_file(dir);
        input = file.path();
        ASSERT_TRUE(std::filesystem::exists(input));
        EXPECT_TRUE(queue.enqueue(engine, PageImage::from_memory({2}, ".png"), std::move(file), {}, {})
                        .get().has_value());
    }
    EXPECT_FALSE(std::filesystem::exists(input));
}

TEST(OcrRequestQueue, ReadyCallbackSeesOutcomeOnce) {
    const test_support::ScratchDir dir;
    auto engine = std::make_shared<FakeEngine>();
    OcrRequestQueue queue(1);
    const auto page = PageImage::from_memory({4, 5, 6}, ".png");
    const OcrParams params;

    std::promise<std::string> seen;
    std::atomic<int> calls{0};
    const auto pending = queue.enqueue(engine, page, scratch_file(dir), params, {},
                                       [&](const std::optional<OcrResult> &result) {
                                           if (++calls == 1) seen.set_value(result ? result->elements.at(0).text : "");
                                       });
    auto text = seen.get_future();
    ASSERT_EQ(text.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(text.get(), "eng");
    EXPECT_TRUE(pending.get().has_value());

    // a cache hit reports before enqueue returns
    std::atomic<bool> hit{false};
    queue.enqueue(engine, page, TempFile{}, params, {},
                  [&hit](const std::optional<OcrResult> &result) { hit = result.has_value(); });
    EXPECT_TRUE(hit.load());
    EXPECT_EQ(calls.load(), 1);
}

TEST(OcrRequestQueue, ReadyCallbackRunsOnCancel) {
    const test_support::ScratchDir dir;
    auto engine = std::make_shared<FakeEngine>();
    engine->gated = true;
    OcrRequestQueue queue(1);
    const auto page = PageImage::from_memory({7, 8, 9}, ".png");
    std::stop_source stop;

    std::atomic<int> nullopts{0};
    queue.enqueue(engine, page, scratch_file(dir), OcrParams{}, stop.get_token(),
                  [&nullopts](const std::optional<OcrResult> &result) {
                      if (!result) ++nullopts;
                  });
    stop.request_stop();
    EXPECT_EQ(nullopts.load(), 1);
    engine->open_gate();
}
