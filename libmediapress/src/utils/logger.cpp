#include "../../include/logger.hpp"
#include <cctype>
#include <mutex>
#include <string>
#include <vector>

namespace mediapress {
namespace {

    struct SinkRegistry {
        std::mutex mutex;
        std::vector<std::unique_ptr<ILogSink>> sinks;
    };

    SinkRegistry& registry() {
        static SinkRegistry instance;
        return instance;
    }

} // namespace

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) return;
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);
    reg.sinks.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);
    reg.sinks.clear();
}

void Logger::log(const LogLevel level, const std::string_view msg, const std::string_view tag) {
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);
    for (const auto& sink : reg.sinks) {
        sink->log(level, msg, tag);
    }
}

LogLevel Logger::parse_level(const std::string_view name) {
    std::string upper;
    upper.reserve(name.size());
    for (const unsigned char c : name) {
        upper.push_back(static_cast<char>(std::toupper(c)));
    }

    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::Warning;
    if (upper == "NONE") return LogLevel::None;
    return LogLevel::Error;
}

} // namespace mediapress
