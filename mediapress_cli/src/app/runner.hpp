#ifndef MEDIAPRESS_RUNNER_HPP
#define MEDIAPRESS_RUNNER_HPP

#include <atomic>
#include <ostream>
#include "../cli/cli_parser.hpp"

/// Exit code of a run cut short by SIGINT/SIGTERM.
inline constexpr int EXIT_INTERRUPTED = 130;

/**
 * @brief Installs the file sink (if any) and, unless quiet, the console sink.
 */
void setup_logging(const Settings& settings);

/**
 * @brief One complete command-line run over already parsed settings.
 *
 * Validates the directories, mirrors the input tree into the output and temp
 * trees, refuses name collisions, compresses every input with a progress bar
 * on stderr, verifies the output tree and removes the temp tree. Summaries
 * and collision listings go to @p out.
 *
 * @param interrupted Raised asynchronously, normally by a signal handler.
 *        It is polled while files are being compressed and turned into a
 *        stop request.
 * @return 0 on success, 1 if the CSV report cannot be written,
 *         EXIT_INTERRUPTED if @p interrupted was raised. The output and temp
 *         trees are then left incomplete.
 * @throws mediapress::ValidationError for bad directories or name collisions.
 * @throws mediapress::VerificationError if the output tree does not match.
 */
int run(const Settings& settings, std::ostream& out, const std::atomic<bool>& interrupted);

#endif //MEDIAPRESS_RUNNER_HPP
