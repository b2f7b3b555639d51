#include "runner.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include "../utils/color.hpp"
#include "../report/report_generator.hpp"
#include "../utils/console_log_sink.hpp"
#include "../utils/file_log_sink.hpp"
#include "../../../libmediapress/include/errors.hpp"
#include "../../../libmediapress/include/event_bus.hpp"
#include "../../../libmediapress/include/events.hpp"
#include "../../../libmediapress/include/file_scanner.hpp"
#include "../../../libmediapress/include/logger.hpp"
#include "../../../libmediapress/include/processor_executor.hpp"
#include "../../../libmediapress/include/processor_registry.hpp"
#include "../../../libmediapress/include/verifier.hpp"

using namespace mediapress;
namespace fs = std::filesystem;

namespace {

/**
 * @brief Single-line progress display on stderr:
 * `[=========>      ]  62.5% (5/8) elapsed: 3.4s`
 *
 * Advanced from EventBus handlers, which the bus already serializes.
 */
class ProgressBar {
public:
    ProgressBar(const size_t total, const bool visible)
        : total_(total), visible_(visible), start_(std::chrono::steady_clock::now()) {}

    void advance() {
        ++done_;
        if (visible_) draw();
    }

    void finish() const {
        if (visible_) std::cerr << std::endl;
    }

    [[nodiscard]] double elapsed_seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    void draw() const {
        const unsigned columns = get_terminal_width();
        const size_t cells = columns > 50 ? columns - 40 : 10;
        const double fraction = total_ == 0 ? 1.0 : static_cast<double>(done_) / static_cast<double>(total_);
        const auto filled = std::min(cells, static_cast<size_t>(fraction * static_cast<double>(cells)));

        std::string bar(cells, ' ');
        std::fill_n(bar.begin(), filled, '=');
        if (done_ < total_ && filled < cells) bar[filled] = '>';

        // rounding must not show 100% while files are still running
        const double percent = done_ < total_ ? std::min(fraction * 100.0, 99.9) : 100.0;

        std::cerr << "\r[" << bar << "] "
                  << std::setw(5) << std::fixed << std::setprecision(1) << percent << "% ("
                  << done_ << "/" << total_ << ") elapsed: " << elapsed_seconds() << "s"
                  << std::flush;
    }

    size_t total_;
    size_t done_ = 0;
    bool visible_;
    std::chrono::steady_clock::time_point start_;
};

Result to_result(const FileProcessCompleteEvent& e) {
    Result r;
    r.path = e.path;
    r.output_path = e.output_path;
    r.kind = kind_to_string(e.kind);
    r.mime = e.mime;
    r.processor = e.processor;
    r.size_before = e.original_size;
    r.size_after = e.new_size;
    r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
    r.success = true;
    r.compressed = e.compressed;
    r.error_msg = e.error;
    return r;
}

Result to_result(const FileProcessErrorEvent& e) {
    Result r;
    r.path = e.path;
    r.kind = kind_to_string(classify_path(e.path));
    r.success = false;
    r.error_msg = e.error_message;
    return r;
}

void check_name_collisions(std::ostream& out, const Settings& settings, const std::vector<fs::path>& inputs) {
    const auto collisions = find_name_collisions(settings.input_directory, inputs);
    if (collisions.empty()) {
        return;
    }
    for (const auto& c : collisions) {
        out << "Found multiple files (" << c.files.size() << ") with the same name! '" << c.name << "'\n";
    }
    throw ValidationError("File name collisions detected, which may cause issues when finalizing compressed output.");
}

} // namespace

void setup_logging(const Settings& settings) {
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        Logger::add_sink(std::make_unique<FileLogSink>(settings.log_file, true));
    }
    if (settings.quiet) {
        return;
    }
    auto console = std::make_unique<ConsoleLogSink>();
    console->log_level = Logger::parse_level(settings.log_level);
    if (settings.verbose) {
        console->log_level = std::min(console->log_level, LogLevel::Info);
    }
    Logger::add_sink(std::move(console));
}

int run(const Settings& settings, std::ostream& out, const std::atomic<bool>& interrupted) {
    validate_settings(settings);
    if (settings.verbose) {
        print_settings(out, settings);
    }

    mirror_directory_tree(settings.input_directory, settings.output_directory);
    mirror_directory_tree(settings.input_directory, settings.temp_directory);

    const auto inputs = collect_input_files(settings.input_directory);
    out << "Processing " << inputs.size() << " input files...\n\n";
    summarize_directory_files(out, "input_directory", settings.input_directory, inputs);
    check_name_collisions(out, settings, inputs);

    ProcessorRegistry registry;
    EventBus bus;
    std::vector<Result> results;
    results.reserve(inputs.size());
    ProgressBar progress(inputs.size(), !settings.quiet);
    const bool chatty = settings.verbose && !settings.quiet;

    bus.subscribe<FileProcessCompleteEvent>([&](const FileProcessCompleteEvent& e) {
        if (chatty) {
            std::cerr << (e.compressed ? GREEN : YELLOW) << "\n"
                      << (e.compressed ? "[COMPRESSED] " : "[COPIED] ")
                      << e.path.lexically_relative(settings.input_directory).string()
                      << " (" << format_size(static_cast<double>(e.original_size)) << " -> "
                      << format_size(static_cast<double>(e.new_size)) << ")" << RESET << std::endl;
        }
        results.push_back(to_result(e));
        progress.advance();
    });
    bus.subscribe<FileProcessErrorEvent>([&](const FileProcessErrorEvent& e) {
        Logger::log(LogLevel::Error, e.path.string() + ": " + e.error_message, "runner");
        results.push_back(to_result(e));
        progress.advance();
    });
    bus.subscribe<FileProcessSkippedEvent>([&](const FileProcessSkippedEvent&) {
        progress.advance();
    });

    ProcessorExecutor executor(registry, make_executor_config(settings), bus);
    {
        // signal handlers only set a flag; this thread turns it into a stop request
        std::jthread watcher([&executor, &interrupted](const std::stop_token& st) {
            while (!st.stop_requested()) {
                if (interrupted.load()) {
                    executor.request_stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
        executor.process(inputs);
    }
    progress.finish();
    const double total_seconds = progress.elapsed_seconds();

    if (interrupted.load()) {
        Logger::log(LogLevel::Warning,
                    "Interrupted; output and temp directories are incomplete: " +
                    settings.output_directory.string() + ", " + settings.temp_directory.string(),
                    "runner");
        return EXIT_INTERRUPTED;
    }

    const auto verification = verify_consistency(settings.input_directory,
                                                 settings.output_directory,
                                                 settings.suffix,
                                                 settings.maximum_expected_compression);
    out << "Output directory appears consistent with the input.\n\n";
    clean_up_temp_directory(settings.temp_directory);

    summarize_directory_files(out, "output_directory", settings.output_directory,
                              collect_input_files(settings.output_directory));
    print_outcome_summary(out, results, settings.num_processes, total_seconds);
    Logger::log(LogLevel::Info,
                std::to_string(verification.compressed_count()) + " of " +
                std::to_string(verification.pairs.size()) + " files kept compressed",
                "runner");

    if (!settings.report_path.empty() && !export_csv_report(results, settings.report_path, total_seconds)) {
        Logger::log(LogLevel::Error, "Cannot write report to " + settings.report_path.string(), "runner");
        return 1;
    }
    return 0;
}

