#ifndef PAGESMITH_LOG_SINK_HPP
#define PAGESMITH_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (per page, per stage)
    Info,    ///< Export lifecycle messages
    Warning, ///< Recoverable problems (library warnings, skipped features)
    Error    ///< Failures that change the result of an export
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where a message ends up (console, file, the
 * observer of the public API). The Logger fans every message out to all
 * installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "pdf_exporter").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // PAGESMITH_LOG_SINK_HPP
