//
// Created by Giuseppe Francione on 14/01/26.
//

#ifndef WEBPRESS_LOG_SINK_HPP
#define WEBPRESS_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use them to filter or format output.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (argument lists, temp dirs)
    Info,    ///< Normal operation (folder started, archive written)
    Warning, ///< Recoverable problems (missing folder, stat failure)
    Error    ///< Failures recorded in a summary (encode failure, archive error)
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define where log messages go
 * (console, file, an observer bridge). The Logger facade
 * fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component (e.g. "Coordinator").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // WEBPRESS_LOG_SINK_HPP
