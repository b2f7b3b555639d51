#ifndef MEDIAPRESS_CLI_PARSER_HPP
#define MEDIAPRESS_CLI_PARSER_HPP

#include <filesystem>
#include <ostream>
#include <string>
#include "../../../libmediapress/include/processor_executor.hpp"

// forward declaration
namespace CLI { class App; }

inline constexpr const char* DEFAULT_COMPRESSED_FILENAME_TAG = "_RG01COMPRESS";

struct Settings {
    std::filesystem::path input_directory;
    std::filesystem::path output_directory;
    std::filesystem::path temp_directory = std::string("temp") + DEFAULT_COMPRESSED_FILENAME_TAG;

    bool verbose = false;
    bool delete_existing = false;
    bool no_meta = false;
    bool quiet = false;

    std::string suffix = DEFAULT_COMPRESSED_FILENAME_TAG;
    int minimum_image_dimension = 2160;
    unsigned num_processes = 1;
    int jpeg_quality = 95;
    std::string jpeg_subsampling = "4:4:4";
    std::string video_codec = "libx265";
    std::string video_crf = "24";
    std::string ffmpeg_executable = "ffmpeg";
    double maximum_expected_compression = 99.0;

    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path report_path;

    [[nodiscard]] bool should_preserve_metadata() const { return !no_meta; }
};

/**
 * @brief Configures the CLI11 parser with all options and flags.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

/**
 * @brief Checks the directories of a parsed command line.
 *
 * Input, output and temp directories must be pairwise distinct and the input
 * directory must exist. With `--delete-existing` the output and temp trees
 * are removed first; otherwise their existence is an error.
 *
 * @throws mediapress::ValidationError
 */
void validate_settings(const Settings& settings);

/**
 * @brief Prints "Continuing with options:" and one line per option.
 */
void print_settings(std::ostream& os, const Settings& settings);

/**
 * @brief Executor configuration matching @p settings.
 */
mediapress::ExecutorConfig make_executor_config(const Settings& settings);

#endif //MEDIAPRESS_CLI_PARSER_HPP
