#ifndef MEDIAPRESS_REPORT_GENERATOR_HPP
#define MEDIAPRESS_REPORT_GENERATOR_HPP

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Outcome of one input file, collected from the executor's events.
 */
struct Result {
    std::filesystem::path path;
    std::filesystem::path output_path;
    std::string kind;
    std::string mime;
    std::string processor;
    uintmax_t size_before = 0;
    uintmax_t size_after = 0;
    double seconds = 0.0;
    bool success = false;
    bool compressed = false;
    std::string error_msg;
};

/**
 * @brief Width of the terminal attached to stdout, 80 if unknown.
 */
unsigned get_terminal_width();

/**
 * @brief Human-readable size with decimal units ("1.5 MB" is 1.5e6 bytes).
 */
std::string format_size(double num_bytes);

/**
 * @brief Prints total size of @p files, then per directory (largest first) its
 * total and the share of each lowercase extension.
 *
 * @param label Name printed in front of every line (e.g. "input_directory").
 * @param root Directory the printed paths are relative to.
 */
void summarize_directory_files(std::ostream& os,
                               std::string_view label,
                               const std::filesystem::path& root,
                               const std::vector<std::filesystem::path>& files);

/**
 * @brief Prints compressed / copied / failed counts, the space saved and the run time.
 */
void print_outcome_summary(std::ostream& os,
                           const std::vector<Result>& results,
                           unsigned num_processes,
                           double total_seconds);

/**
 * @brief Writes one CSV row per result.
 * @return false if the file cannot be written.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

#endif //MEDIAPRESS_REPORT_GENERATOR_HPP
