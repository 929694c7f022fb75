/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Every component of the library logs through Logger::log with a
 * component tag. Messages are delivered to all registered ILogSink
 * implementations; with no sinks installed logging is a no-op.
 */

#ifndef PAGESMITH_LOGGER_HPP
#define PAGESMITH_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @return An id that can be passed to remove_sink().
     */
    static std::size_t add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove a sink previously added with add_sink().
     * Unknown ids are ignored.
     */
    static void remove_sink(std::size_t id);

    /// @brief Remove all configured sinks.
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "pagesmith").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "pagesmith");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a level name to LogLevel.
     * Case-sensitive. Returns LogLevel::Error if not matched.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    struct Entry {
        std::size_t id;
        std::unique_ptr<ILogSink> sink;
    };

    static std::vector<Entry> sinks_;
    static std::size_t next_id_;
    static std::mutex mtx_;
};

#endif // PAGESMITH_LOGGER_HPP
