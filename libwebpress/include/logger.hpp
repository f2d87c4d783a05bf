//
// Created by Giuseppe Francione on 14/01/26.
//

/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade used by the whole library.
 */

#ifndef WEBPRESS_LOGGER_HPP
#define WEBPRESS_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for webpress.
 *
 * The run coordinator executes on a worker thread while the caller
 * keeps running, so every operation takes the internal mutex.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of it.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove a sink previously added with add_sink().
     * @param sink Address of the sink; unknown addresses are ignored.
     */
    static void remove_sink(const ILogSink* sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "webpress").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "webpress");

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
     * @brief Parses a level name as accepted by the CLI.
     *
     * Case-insensitive. "NONE" (or anything unknown) yields std::nullopt,
     * which sinks treat as "log nothing".
     */
    static std::optional<LogLevel> string_to_level(std::string level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

#endif // WEBPRESS_LOGGER_HPP
