#ifndef PAGESMITH_CONSOLE_LOG_SINK_HPP
#define PAGESMITH_CONSOLE_LOG_SINK_HPP

#include "../../../libpagesmith/include/log_sink.hpp"
#include "color.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints messages at or above a threshold to stderr.
 * A disabled sink prints nothing (--log-level NONE).
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;
    bool enabled = true;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!enabled || level < log_level) return;

        std::lock_guard lock(mtx_);
        // start on a fresh line if the progress bar is showing
        std::cerr << "\r";
        switch (level) {
            case LogLevel::Debug:
                std::cerr << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cerr << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << YELLOW << "[WARN ][" << tag << "] " << message << RESET << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << RED << "[ERROR][" << tag << "] " << message << RESET << std::endl;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // PAGESMITH_CONSOLE_LOG_SINK_HPP
