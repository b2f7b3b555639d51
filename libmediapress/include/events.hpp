#ifndef MEDIAPRESS_EVENTS_HPP
#define MEDIAPRESS_EVENTS_HPP

#include "file_type.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mediapress {

/**
 * @brief Events published while the input tree is compressed.
 *
 * These are plain data carriers used with EventBus. ProcessorExecutor
 * publishes exactly one terminal event (Complete, Error or Skipped) per
 * input file.
 */

/**
 * @brief Emitted when a worker picks up a file.
 */
struct FileProcessStartEvent {
    std::filesystem::path path; ///< Input file
};

/**
 * @brief Emitted when a file has produced its output.
 */
struct FileProcessCompleteEvent {
    std::filesystem::path path;            ///< Input file
    std::filesystem::path output_path;     ///< Final output file
    MediaKind kind = MediaKind::Opaque;    ///< Classification by extension
    std::string mime;                      ///< Detected MIME type (images only)
    std::string processor;                 ///< Processor that produced the candidate, if any
    uintmax_t original_size = 0;           ///< Input size in bytes
    uintmax_t new_size = 0;                ///< Output size in bytes
    bool compressed = false;               ///< True if the output is the compressed candidate
    std::chrono::milliseconds duration{0}; ///< Wall time of the step
    std::string error;                     ///< Processor failure that led to a copy, if any
};

/**
 * @brief Emitted when the step for a file failed and no output could be placed.
 */
struct FileProcessErrorEvent {
    std::filesystem::path path; ///< Input file
    std::string error_message;  ///< Error description
};

/**
 * @brief Emitted when a file was not processed (interrupt).
 */
struct FileProcessSkippedEvent {
    std::filesystem::path path; ///< Input file
    std::string reason;         ///< Reason for skipping
};

} // namespace mediapress

#endif // MEDIAPRESS_EVENTS_HPP
