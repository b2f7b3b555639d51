#ifndef MEDIAPRESS_LOG_SINK_HPP
#define MEDIAPRESS_LOG_SINK_HPP

#include <string_view>

namespace mediapress {

/**
 * @brief Severity of a log record.
 *
 * Ordered, so a sink can keep everything at or above a threshold.
 * None is only meaningful as a threshold.
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    None
};

/// Short upper-case label written in front of each record ("WARN", ...).
constexpr std::string_view to_string(const LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::None:    return "NONE";
    }
    return "?";
}

/**
 * @brief Destination for log records (console, file, test recorder).
 *
 * Logger serializes calls, so implementations need no locking of their own.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @param level Severity of the record.
     * @param message Text of the record.
     * @param tag Component that emitted it ("scanner", "verifier", ...).
     */
    virtual void log(LogLevel level, std::string_view message, std::string_view tag) = 0;
};

} // namespace mediapress

#endif // MEDIAPRESS_LOG_SINK_HPP
