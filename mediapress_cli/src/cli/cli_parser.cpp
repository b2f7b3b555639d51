#include "cli_parser.hpp"
#include "../../../libmediapress/include/errors.hpp"
#include "../../../libmediapress/include/logger.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <thread>

namespace fs = std::filesystem;

namespace {

fs::path normalized(const fs::path& p) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(fs::absolute(p), ec);
    if (ec) {
        return fs::absolute(p).lexically_normal();
    }
    return canonical.lexically_normal();
}

void remove_existing(const fs::path& dir) {
    if (!fs::exists(dir)) return;
    mediapress::Logger::log(mediapress::LogLevel::Info, "Deleting existing directory " + dir.string(), "cli");
    fs::remove_all(dir);
}

std::string quoted(const fs::path& p) {
    return "'" + p.string() + "'";
}

} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.set_config("--config", "", "Read options from an INI or TOML file.");

    // --- Directories ---
    app.add_option("-i,--input-directory", settings.input_directory,
                   "Input media directory.")
                   ->required();

    app.add_option("-o,--output-directory", settings.output_directory,
                   "Output media directory to create.")
                   ->required();

    app.add_option("-t,--temp-directory", settings.temp_directory,
                   "Temporary directory to create for intermediate files.")
                   ->default_str(settings.temp_directory.string());

    // --- Flags (booleans) ---
    app.add_flag("-v,--verbose", settings.verbose,
                 "Print the options in use and a line per processed file.");

    app.add_flag("-d,--delete-existing", settings.delete_existing,
                 "Delete existing output and temp directories.");

    app.add_flag("--no-meta", settings.no_meta,
                 "Don't carry image metadata (EXIF, ICC, text) into compressed files.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress the progress bar and console logging.");

    // --- Compression ---
    app.add_option("-s,--suffix", settings.suffix,
                   "Suffix to append to file names when compressed.")
                   ->capture_default_str();

    app.add_option("-m,--minimum-image-dimension", settings.minimum_image_dimension,
                   "Resolution to reduce the smaller image dimension to, if needed.")
                   ->capture_default_str();

    // calculate default process count
    settings.num_processes = std::max(1U, std::thread::hardware_concurrency());
    app.add_option("-p,--processes", settings.num_processes,
                   "Maximum number of files compressed in parallel.")
                   ->default_val(settings.num_processes)
                   ->check(CLI::PositiveNumber);

    app.add_option("--jpeg-quality", settings.jpeg_quality,
                   "Quality setting for compressing JPEG images.")
                   ->capture_default_str()
                   ->check(CLI::Range(1, 100));

    app.add_option("--jpeg-subsampling", settings.jpeg_subsampling,
                   "Chroma subsampling for compressing JPEG images.")
                   ->capture_default_str()
                   ->check(CLI::IsMember({"4:4:4", "4:2:2", "4:2:0"}));

    app.add_option("--video-codec", settings.video_codec,
                   "Codec for compressing videos with ffmpeg.")
                   ->capture_default_str();

    app.add_option("--video-crf", settings.video_crf,
                   "Constant rate factor for compressing videos with ffmpeg.")
                   ->capture_default_str();

    app.add_option("--ffmpeg", settings.ffmpeg_executable,
                   "ffmpeg executable to run.")
                   ->capture_default_str();

    app.add_option("--maximum-expected-compression", settings.maximum_expected_compression,
                   "Maximum compression percentage for sanity checks. Exceeding it on any file is fatal.")
                   ->capture_default_str()
                   ->check(CLI::Range(0.0, 100.0));

    // --- Logging and reports ---
    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one
}

void validate_settings(const Settings& settings) {
    const fs::path input = normalized(settings.input_directory);
    const fs::path output = normalized(settings.output_directory);
    const fs::path temp = normalized(settings.temp_directory);

    if (input == output || input == temp || output == temp) {
        throw mediapress::ValidationError("Input, output, and temp directories should all be unique!");
    }

    if (!fs::is_directory(settings.input_directory)) {
        throw mediapress::ValidationError("Input directory does not exist: " + quoted(settings.input_directory));
    }

    if (settings.delete_existing) {
        remove_existing(settings.output_directory);
        remove_existing(settings.temp_directory);
    }

    if (fs::exists(settings.output_directory)) {
        throw mediapress::ValidationError(
            "Output directory should not exist. Did you mean to include --delete-existing? " +
            quoted(settings.output_directory));
    }

    if (fs::exists(settings.temp_directory)) {
        throw mediapress::ValidationError(
            "Temp directory should not exist. Did you mean to include --delete-existing? " +
            quoted(settings.temp_directory));
    }
}

void print_settings(std::ostream& os, const Settings& settings) {
    auto b = [](const bool v) { return v ? "true" : "false"; };
    os << "Continuing with options:\n"
       << "  input_directory: " << quoted(settings.input_directory) << "\n"
       << "  output_directory: " << quoted(settings.output_directory) << "\n"
       << "  temp_directory: " << quoted(settings.temp_directory) << "\n"
       << "  verbose: " << b(settings.verbose) << "\n"
       << "  delete_existing: " << b(settings.delete_existing) << "\n"
       << "  suffix: '" << settings.suffix << "'\n"
       << "  minimum_image_dimension: " << settings.minimum_image_dimension << "\n"
       << "  processes: " << settings.num_processes << "\n"
       << "  jpeg_quality: " << settings.jpeg_quality << "\n"
       << "  jpeg_subsampling: '" << settings.jpeg_subsampling << "'\n"
       << "  video_codec: '" << settings.video_codec << "'\n"
       << "  video_crf: '" << settings.video_crf << "'\n"
       << "  ffmpeg: '" << settings.ffmpeg_executable << "'\n"
       << "  maximum_expected_compression: " << settings.maximum_expected_compression << "\n"
       << "  no_meta: " << b(settings.no_meta) << "\n"
       << "  quiet: " << b(settings.quiet) << "\n"
       << "  log_level: '" << settings.log_level << "'\n"
       << "  log_file: " << quoted(settings.log_file) << "\n"
       << "  report: " << quoted(settings.report_path) << "\n"
       << "\n";
}

mediapress::ExecutorConfig make_executor_config(const Settings& settings) {
    mediapress::ExecutorConfig config;
    config.input_directory = settings.input_directory;
    config.output_directory = settings.output_directory;
    config.temp_directory = settings.temp_directory;
    config.suffix = settings.suffix;
    config.threads = settings.num_processes;

    auto& o = config.options;
    o.minimum_image_dimension = settings.minimum_image_dimension;
    o.jpeg_quality = settings.jpeg_quality;
    o.jpeg_subsampling = settings.jpeg_subsampling;
    o.preserve_metadata = settings.should_preserve_metadata();
    o.video_codec = settings.video_codec;
    o.video_crf = settings.video_crf;
    o.ffmpeg_executable = settings.ffmpeg_executable;
    return config;
}
