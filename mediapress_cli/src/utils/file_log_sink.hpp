#ifndef MEDIAPRESS_FILE_LOG_SINK_HPP
#define MEDIAPRESS_FILE_LOG_SINK_HPP

#include "../../../libmediapress/include/log_sink.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

/**
 * @brief Appends (or truncates and writes) every log line to a file, with a timestamp.
 */
class FileLogSink final : public mediapress::ILogSink {
public:
    using LogLevel = mediapress::LogLevel;

    /**
     * @throws std::runtime_error if the file cannot be opened.
     */
    explicit FileLogSink(const std::filesystem::path& path, const bool append = true)
        : out_(path, append ? std::ios::app : std::ios::trunc) {
        if (!out_) {
            throw std::runtime_error("Cannot open log file: " + path.string());
        }
    }

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (level == LogLevel::None) return;
        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        localtime_r(&now, &tm);
        out_ << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " [" << mediapress::to_string(level) << "] ["
             << tag << "] " << message << '\n';
        out_.flush();
    }

private:
    std::ofstream out_;
};

#endif //MEDIAPRESS_FILE_LOG_SINK_HPP
