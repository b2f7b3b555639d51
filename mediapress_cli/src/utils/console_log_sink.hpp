#ifndef MEDIAPRESS_CONSOLE_LOG_SINK_HPP
#define MEDIAPRESS_CONSOLE_LOG_SINK_HPP

#include "../../../libmediapress/include/log_sink.hpp"
#include "color.hpp"
#include <iostream>

/**
 * @brief Writes log lines of at least `log_level` to stderr, coloured by severity.
 */
struct ConsoleLogSink final : mediapress::ILogSink {
    using LogLevel = mediapress::LogLevel;

    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (level == LogLevel::None || level < log_level) {
            return;
        }
        const char* color = RESET;
        switch (level) {
            case LogLevel::Debug:   color = GRAY; break;
            case LogLevel::Info:    color = CYAN; break;
            case LogLevel::Warning: color = YELLOW; break;
            case LogLevel::Error:   color = RED; break;
            case LogLevel::None:    break;
        }
        // leading newline keeps the line off the progress bar
        std::cerr << "\n" << color << "[" << mediapress::to_string(level) << "] [" << tag << "] "
                  << message << RESET << std::endl;
    }
};

#endif //MEDIAPRESS_CONSOLE_LOG_SINK_HPP
