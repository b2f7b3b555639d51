/**
 * @file logger.hpp
 * @brief Process-wide logging entry point used by the library and the CLI.
 */

#ifndef MEDIAPRESS_LOGGER_HPP
#define MEDIAPRESS_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <string_view>

namespace mediapress {

/**
 * @brief Static facade forwarding every record to the installed sinks.
 *
 * With no sink installed records are dropped, which is what the library
 * tests rely on. All members are safe to call from worker threads.
 */
class Logger {
public:
    Logger() = delete;

    /// Installs @p sink; the Logger owns it until clear_sinks().
    static void add_sink(std::unique_ptr<ILogSink> sink);

    static void clear_sinks();

    /**
     * @brief Emit one record.
     * @param tag Component name (defaults to "mediapress").
     */
    static void log(LogLevel level, std::string_view msg, std::string_view tag = "mediapress");

    /**
     * @brief Parses a `--log-level` value, case-insensitively.
     *
     * Accepts DEBUG, INFO, WARNING (or WARN), ERROR and NONE. Anything
     * else yields LogLevel::Error.
     */
    static LogLevel parse_level(std::string_view name);
};

} // namespace mediapress

#endif // MEDIAPRESS_LOGGER_HPP
