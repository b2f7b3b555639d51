#include "../../include/processor_executor.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_type.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include <chrono>
#include <future>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace mediapress {

ChosenOutput choose_compressed_or_original(const fs::path& input,
                                           const fs::path& candidate,
                                           const fs::path& output,
                                           const std::string_view suffix) {
    if (!fs::exists(input)) {
        throw std::runtime_error("Input file does not exist anymore: " + input.string());
    }
    if (fs::exists(output)) {
        throw std::runtime_error("Encountered a file collision when copying to the output directory: " +
                                 output.string());
    }

    ChosenOutput chosen;
    const bool has_candidate = !candidate.empty() && fs::is_regular_file(candidate);
    if (has_candidate && safe_file_size(candidate) < safe_file_size(input)) {
        fs::path dest = output.parent_path() /
                        (output.stem().string() + std::string(suffix) + candidate.extension().string());
        if (fs::exists(dest)) {
            throw std::runtime_error("Encountered a file collision when moving to the output directory: " +
                                     dest.string());
        }
        move_file(candidate, dest);
        chosen = {std::move(dest), true};
    } else {
        if (has_candidate) {
            std::error_code ec;
            fs::remove(candidate, ec);
            if (ec) {
                throw std::runtime_error("Cannot remove candidate " + candidate.string() + ": " + ec.message());
            }
        }
        fs::copy_file(input, output, fs::copy_options::none);
        chosen = {output, false};
    }

    if (!copy_file_times(input, chosen.path)) {
        Logger::log(LogLevel::Debug, "Keeping current timestamps on " + chosen.path.string(), "Executor");
    }
    return chosen;
}

ProcessorExecutor::ProcessorExecutor(ProcessorRegistry& registry, ExecutorConfig config, EventBus& bus)
    : registry_(registry),
      config_(std::move(config)),
      event_bus_(bus),
      pool_(config_.threads) {}

bool ProcessorExecutor::run_processor(IProcessor& processor,
                                      const fs::path& input,
                                      const fs::path& candidate,
                                      const std::stop_token& stop,
                                      std::string& error) const {
    CompressionOptions options = config_.options;
    options.stop = stop;

    std::error_code ec;
    fs::create_directories(candidate.parent_path(), ec);

    try {
        processor.recompress(input, candidate, options);
        if (safe_file_size(candidate) == 0) {
            throw std::runtime_error("processor produced an empty file");
        }
        return true;
    } catch (const std::exception& e) {
        error = std::string(processor.get_name()) + ": " + e.what();
        Logger::log(LogLevel::Error, "Compression failed for " + input.string() + " (" + error + ")", "Executor");
        fs::remove(candidate, ec);
        if (ec) {
            Logger::log(LogLevel::Warning,
                        "Cannot remove partial candidate " + candidate.string() + " (" + ec.message() + ")",
                        "Executor");
        }
        return false;
    }
}

std::optional<FileOutcome> ProcessorExecutor::compress_file(const fs::path& input, std::stop_token stop) const {
    if (!fs::is_regular_file(input)) {
        return std::nullopt;
    }

    const fs::path rel = input.lexically_relative(config_.input_directory);
    fs::path temp_path = config_.temp_directory / rel;
    const fs::path output_path = config_.output_directory / rel;

    FileOutcome outcome;
    outcome.input = input;
    outcome.kind = classify_path(input);
    outcome.original_size = safe_file_size(input);

    IProcessor* processor = nullptr;
    switch (outcome.kind) {
        case MediaKind::Opaque:
            Logger::log(LogLevel::Info, "Unimplemented file extension: " + rel.string(), "Executor");
            break;
        case MediaKind::Image:
            outcome.mime = MimeDetector::detect(input);
            processor = registry_.find_for(MediaKind::Image, outcome.mime);
            if (!processor) {
                Logger::log(LogLevel::Info,
                            "Unrecognized image content (" + outcome.mime + "): " + rel.string(),
                            "Executor");
            }
            break;
        case MediaKind::Video:
            outcome.mime = mime_from_extension(input).value_or("");
            for (auto* p : registry_.find_by_extension(lowercase_extension(input))) {
                if (p->get_kind() == MediaKind::Video) {
                    processor = p;
                    break;
                }
            }
            break;
    }

    fs::path candidate;
    if (processor) {
        // extension correction: the candidate is named after what it really is
        temp_path = with_extension(temp_path, processor->get_output_extension());
        outcome.processor = std::string(processor->get_name());
        if (run_processor(*processor, input, temp_path, stop, outcome.error)) {
            candidate = temp_path;
        } else if (stop.stop_requested()) {
            throw InterruptedError("Interrupted while compressing " + rel.string());
        }
    }

    ChosenOutput chosen;
    try {
        chosen = choose_compressed_or_original(input, candidate, output_path, config_.suffix);
    } catch (const std::exception&) {
        if (!candidate.empty()) {
            std::error_code ec;
            fs::remove(candidate, ec);
        }
        throw;
    }

    outcome.output = chosen.path;
    outcome.compressed = chosen.compressed;
    outcome.new_size = safe_file_size(chosen.path);

    Logger::log(LogLevel::Info,
                rel.string() + (outcome.compressed ? ": compressed " : ": copied ") +
                std::to_string(outcome.original_size) + " -> " + std::to_string(outcome.new_size) + " bytes",
                "Executor");
    return outcome;
}

void ProcessorExecutor::process(const std::vector<fs::path>& inputs) {
    std::vector<std::pair<fs::path, std::future<void>>> scheduled;
    scheduled.reserve(inputs.size());

    size_t next = 0;
    for (; next < inputs.size() && !is_stopped(); ++next) {
        const fs::path file = inputs[next];
        try {
            auto fut = pool_.enqueue([this, file](const std::stop_token& st) {
                if (st.stop_requested() || is_stopped()) {
                    event_bus_.publish(FileProcessSkippedEvent{file, "Interrupted"});
                    return;
                }
                event_bus_.publish(FileProcessStartEvent{file});

                const auto start = std::chrono::steady_clock::now();
                try {
                    const auto outcome = compress_file(file, st);
                    if (!outcome) {
                        event_bus_.publish(FileProcessSkippedEvent{file, "Not a regular file"});
                        return;
                    }
                    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start);
                    event_bus_.publish(FileProcessCompleteEvent{
                        file, outcome->output, outcome->kind, outcome->mime, outcome->processor,
                        outcome->original_size, outcome->new_size, outcome->compressed, duration, outcome->error
                    });
                } catch (const InterruptedError& e) {
                    Logger::log(LogLevel::Info, e.what(), "Executor");
                    event_bus_.publish(FileProcessSkippedEvent{file, "Interrupted"});
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::Error, "error on " + file.string() + ": " + e.what(), "Executor");
                    event_bus_.publish(FileProcessErrorEvent{file, e.what()});
                }
            });
            scheduled.emplace_back(file, std::move(fut));
        } catch (const std::runtime_error& e) {
            // the pool was stopped between the check and the enqueue
            Logger::log(LogLevel::Debug, e.what(), "Executor");
            break;
        }
    }

    pool_.wait_idle();

    // tasks dropped from the queue by request_stop() never ran
    for (auto& [file, fut] : scheduled) {
        try {
            fut.get();
        } catch (const std::future_error&) {
            event_bus_.publish(FileProcessSkippedEvent{file, "Interrupted"});
        }
    }
    for (; next < inputs.size(); ++next) {
        event_bus_.publish(FileProcessSkippedEvent{inputs[next], "Interrupted"});
    }
}

void ProcessorExecutor::request_stop() {
    stop_flag_.store(true, std::memory_order_relaxed);
    pool_.request_stop();
}

} // namespace mediapress
