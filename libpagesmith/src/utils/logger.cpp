#include "../../include/logger.hpp"
#include <algorithm>

std::vector<Logger::Entry> Logger::sinks_;
std::size_t Logger::next_id_ = 1;
std::mutex Logger::mtx_;

std::size_t Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (!sink) {
        return 0;
    }
    const std::size_t id = next_id_++;
    sinks_.push_back({id, std::move(sink)});
    return id;
}

void Logger::remove_sink(const std::size_t id) {
    std::lock_guard lock(mtx_);
    std::erase_if(sinks_, [id](const Entry& e) { return e.id == id; });
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    for (const auto& entry : sinks_) {
        entry.sink->log(level, msg, tag);
    }
}
