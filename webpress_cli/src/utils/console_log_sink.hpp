//
// Created by Giuseppe Francione on 18/01/26.
//

#ifndef WEBPRESS_CONSOLE_LOG_SINK_HPP
#define WEBPRESS_CONSOLE_LOG_SINK_HPP

#include "../../../libwebpress/include/log_sink.hpp"
#include <iostream>
#include <optional>

// prints messages at or above log_level; std::nullopt prints nothing
class ConsoleLogSink final : public ILogSink {
public:
    std::optional<LogLevel> log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!log_level || level < *log_level) return;

        switch (level) {
            case LogLevel::Debug:
                std::cerr << "\n[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cerr << "\n[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "\n[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "\n[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }
};

#endif // WEBPRESS_CONSOLE_LOG_SINK_HPP
