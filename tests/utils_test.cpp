#include "../libpagesmith/include/event_bus.hpp"
#include "../libpagesmith/include/events.hpp"
#include "../libpagesmith/include/file_utils.hpp"
#include "../libpagesmith/include/logger.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <fstream>

using namespace pagesmith;

namespace {
    class CollectingSink final : public ILogSink {
    public:
        explicit CollectingSink(std::vector<std::string> &out) : out_(out) {}

        void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
            out_.push_back(std::string(Logger::level_to_string(level)) + " " + std::string(tag) + ": " +
                           std::string(message));
        }

    private:
        std::vector<std::string> &out_;
    };
}

TEST(FileUtils, TempPathsAreFreshAndInsideDir) {
    const test_support::ScratchDir dir;
    const auto sub = dir / "nested";
    const auto a = make_temp_path(sub, ".jpg");
    const auto b = make_temp_path(sub, ".jpg");
    EXPECT_TRUE(std::filesystem::is_directory(sub));
    EXPECT_EQ(a.parent_path(), sub);
    EXPECT_EQ(a.extension(), ".jpg");
    EXPECT_NE(a, b);
    EXPECT_FALSE(std::filesystem::exists(a));
}

TEST(FileUtils, TempFileRemovesUnlessReleased) {
    const test_support::ScratchDir dir;
    const auto removed = dir / "removed.tmp";
    const auto kept = dir / "kept.tmp";
    std::ofstream(removed) << "x";
    std::ofstream(kept) << "x";
    {
        TempFile a(removed);
        TempFile b(kept);
        TempFile moved(std::move(a));
        EXPECT_TRUE(a.path().empty());
        EXPECT_EQ(b.release(), kept);
    }
    EXPECT_FALSE(std::filesystem::exists(removed));
    EXPECT_TRUE(std::filesystem::exists(kept));
}

TEST(FileUtils, CommitReplacesDestination) {
    const test_support::ScratchDir dir;
    const auto temp = dir / "out.part";
    const auto dest = dir / "out.pdf";
    std::ofstream(dest) << "old";
    std::ofstream(temp) << "new";

    commit_temp_file(temp, dest);
    EXPECT_FALSE(std::filesystem::exists(temp));
    const auto data = read_file(dest);
    EXPECT_EQ(std::string(data.begin(), data.end()), "new");
    EXPECT_THROW(read_file(dir / "missing"), std::runtime_error);
}

TEST(EventBus, DeliversByType) {
    EventBus bus;
    std::vector<std::size_t> progress;
    int starts = 0;
    bus.subscribe<ExportProgressEvent>([&](const ExportProgressEvent &e) { progress.push_back(e.done); });
    bus.subscribe<ExportStartEvent>([&](const ExportStartEvent &) { ++starts; });

    bus.publish(ExportStartEvent{3, 1, false});
    bus.publish(ExportProgressEvent{0, 3});
    bus.publish(ExportProgressEvent{1, 3});
    bus.publish(OcrUnavailableEvent{"nobody listens"});

    EXPECT_EQ(starts, 1);
    EXPECT_EQ(progress, (std::vector<std::size_t>{0, 1}));
}

TEST(Logger, SinksCanBeRemovedById) {
    std::vector<std::string> first;
    std::vector<std::string> second;
    const auto id1 = Logger::add_sink(std::make_unique<CollectingSink>(first));
    const auto id2 = Logger::add_sink(std::make_unique<CollectingSink>(second));

    Logger::log(LogLevel::Warning, "both", "test");
    Logger::remove_sink(id1);
    Logger::log(LogLevel::Error, "only second", "test");
    Logger::remove_sink(id2);
    Logger::log(LogLevel::Error, "nobody", "test");

    EXPECT_EQ(first, std::vector<std::string>{"WARN test: both"});
    EXPECT_EQ(second, (std::vector<std::string>{"WARN test: both", "ERROR test: only second"}));
    EXPECT_EQ(Logger::string_to_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::string_to_level("bogus"), LogLevel::Error);
}
