/**
 * @file processor_executor.hpp
 * @brief Defines the per-file compression step and the parallel map over the input tree.
 *
 * This file contains the ProcessorExecutor class, which turns every input
 * file into exactly one output file: the compressed candidate when it is
 * smaller, a verbatim copy otherwise.
 */

#ifndef MEDIAPRESS_PROCESSOR_EXECUTOR_HPP
#define MEDIAPRESS_PROCESSOR_EXECUTOR_HPP

#include "event_bus.hpp"
#include "processor.hpp"
#include "processor_registry.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mediapress {

/**
 * @brief Directories and settings of one run.
 */
struct ExecutorConfig {
    std::filesystem::path input_directory;  ///< Root of the tree to compress
    std::filesystem::path output_directory; ///< Mirror receiving the outputs (already created)
    std::filesystem::path temp_directory;   ///< Mirror receiving the candidates (already created)
    std::string suffix = "_RG01COMPRESS";   ///< Appended to the stem of compressed outputs
    CompressionOptions options;             ///< Encoder settings
    unsigned threads = std::thread::hardware_concurrency();
};

/**
 * @brief What the per-file step did with one input.
 */
struct FileOutcome {
    std::filesystem::path input;
    std::filesystem::path output;        ///< Final output file
    MediaKind kind = MediaKind::Opaque;
    std::string mime;                    ///< Detected (images) or assumed (videos) MIME type
    std::string processor;               ///< Processor that ran, empty if none did
    uintmax_t original_size = 0;
    uintmax_t new_size = 0;
    bool compressed = false;             ///< Output is the candidate rather than a copy
    std::string error;                   ///< Processor failure that led to a copy, if any
};

/**
 * @brief Result of choose_compressed_or_original().
 */
struct ChosenOutput {
    std::filesystem::path path; ///< File now present in the output tree
    bool compressed = false;
};

/**
 * @brief Places either the candidate or a copy of the input into the output tree.
 *
 * @param input The original file; it must still exist.
 * @param candidate Compressed temp file, or an empty path if there is none.
 * @param output Mirrored output path carrying the input's own name; it must not exist.
 * @param suffix Tag appended to the stem when the candidate is kept.
 *
 * A candidate that is strictly smaller than the input is moved to
 * `output.parent_path() / (output.stem() + suffix + candidate.extension())`.
 * Otherwise the candidate is deleted and the input is copied to @p output.
 * In both cases the result gets the input's access and modification times.
 *
 * @throws std::runtime_error if the input is missing or the destination
 * already exists (a name collision).
 * @throws std::filesystem::filesystem_error if moving or copying fails.
 */
ChosenOutput choose_compressed_or_original(const std::filesystem::path& input,
                                           const std::filesystem::path& candidate,
                                           const std::filesystem::path& output,
                                           std::string_view suffix);

/**
 * @brief Runs the compression step over a list of files on a ThreadPool.
 *
 * @details Each task publishes a FileProcessStartEvent and then exactly one
 * of FileProcessCompleteEvent, FileProcessErrorEvent or
 * FileProcessSkippedEvent on the EventBus. Exceptions never leave a task.
 */
class ProcessorExecutor {
public:
    /**
     * @brief Construct a ProcessorExecutor.
     *
     * @param registry Processors to dispatch to.
     * @param config Directories and encoder settings.
     * @param bus EventBus used to publish progress and results.
     */
    ProcessorExecutor(ProcessorRegistry& registry, ExecutorConfig config, EventBus& bus);

    /**
     * @brief Compress every file of @p inputs and wait for all of them.
     *
     * Returns early (after running tasks have finished) if request_stop() is called.
     */
    void process(const std::vector<std::filesystem::path>& inputs);

    /**
     * @brief The per-file step, run synchronously.
     *
     * @param input A file below the configured input directory.
     * @param stop Forwarded to the processor so that a long step can be interrupted.
     * @return std::nullopt if @p input is not a regular file.
     * @throws std::runtime_error / std::filesystem::filesystem_error if no
     * output could be placed. Processor failures do not throw: they fall back
     * to a copy and are reported in FileOutcome::error.
     * @throws InterruptedError if the processor failed after @p stop was
     * raised; no output is placed then.
     */
    std::optional<FileOutcome> compress_file(const std::filesystem::path& input,
                                             std::stop_token stop = {}) const;

    /**
     * @brief Checks if a stop has been requested.
     */
    [[nodiscard]] bool is_stopped() const {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Ask running tasks to stop and drop queued ones.
     *
     * Thread-safe; only sets a flag and wakes the pool, so it can be driven
     * from a signal watcher.
     */
    void request_stop();

    [[nodiscard]] const ExecutorConfig& config() const noexcept { return config_; }

private:
    /**
     * @brief Runs @p processor into @p candidate.
     * @return false (with @p error filled and the partial candidate removed) on failure.
     */
    bool run_processor(IProcessor& processor,
                       const std::filesystem::path& input,
                       const std::filesystem::path& candidate,
                       const std::stop_token& stop,
                       std::string& error) const;

    ProcessorRegistry& registry_;
    ExecutorConfig config_;
    EventBus& event_bus_;
    ThreadPool pool_;
    std::atomic<bool> stop_flag_{false};
};

} // namespace mediapress

#endif // MEDIAPRESS_PROCESSOR_EXECUTOR_HPP
