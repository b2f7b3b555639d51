#include "../../include/video_processor.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace mediapress {
namespace {

const char* processor_tag() {
    return "VideoProcessor";
}

/**
 * @brief RAII holder for posix_spawn file actions.
 */
struct SpawnFileActions {
    posix_spawn_file_actions_t actions{};

    SpawnFileActions() { posix_spawn_file_actions_init(&actions); }
    ~SpawnFileActions() { posix_spawn_file_actions_destroy(&actions); }

    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;
};

/**
 * @brief Waits for @p pid, killing it if a stop is requested meanwhile.
 * @return The raw wait status.
 */
int wait_for_child(const pid_t pid, const std::stop_token& stop, bool& interrupted) {
    int status = 0;
    for (;;) {
        const pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return status;
        }
        if (r == -1) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
        if (stop.stop_requested() && !interrupted) {
            Logger::log(LogLevel::Warning, "Stop requested, terminating ffmpeg (pid " + std::to_string(pid) + ")",
                        processor_tag());
            kill(pid, SIGTERM);
            interrupted = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

} // namespace

std::vector<std::string> build_ffmpeg_arguments(const std::filesystem::path& input,
                                                const std::filesystem::path& output,
                                                const CompressionOptions& options) {
    std::vector<std::string> args = {
        options.ffmpeg_executable,
        "-hide_banner", "-loglevel", "error", "-nostats", "-nostdin",
        "-i", input.string(),
        "-vcodec", options.video_codec,
    };
    // suppress "x265 [info]:" style lines unless they are errors
    if (options.video_codec == "libx265") {
        args.insert(args.end(), {"-x265-params", "log-level=error"});
    } else if (options.video_codec == "libx264") {
        args.insert(args.end(), {"-x264-params", "log-level=error"});
    }
    args.insert(args.end(), {"-crf", options.video_crf});
    // retains most of the container metadata (creation time, location, ...)
    args.insert(args.end(), {"-movflags", "use_metadata_tags", "-map_metadata", "0"});
    args.push_back(output.string());
    return args;
}

void VideoProcessor::recompress(const std::filesystem::path& input,
                                const std::filesystem::path& output,
                                const CompressionOptions& options) {
    Logger::log(LogLevel::Info, "Start video recompression: " + input.string(), processor_tag());

    const auto args = build_ffmpeg_arguments(input, output, options);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    SpawnFileActions file_actions;
    // ffmpeg must not compete with the progress bar for the terminal
    posix_spawn_file_actions_addopen(&file_actions.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

    pid_t pid = 0;
    const int rc = posix_spawnp(&pid, argv[0], &file_actions.actions, nullptr, argv.data(), environ);
    if (rc != 0) {
        Logger::log(LogLevel::Error,
                    "Cannot start " + options.ffmpeg_executable + ": " + std::strerror(rc),
                    processor_tag());
        throw std::runtime_error("Cannot start ffmpeg: " + std::string(std::strerror(rc)));
    }
    Logger::log(LogLevel::Debug, "ffmpeg started (pid " + std::to_string(pid) + ") for " + input.string(),
                processor_tag());

    bool interrupted = false;
    const int status = wait_for_child(pid, options.stop, interrupted);

    if (interrupted) {
        throw std::runtime_error("Interrupted");
    }
    if (WIFSIGNALED(status)) {
        throw std::runtime_error("ffmpeg killed by signal " + std::to_string(WTERMSIG(status)));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        Logger::log(LogLevel::Warning,
                    "ffmpeg appears to have failed (exit " + std::to_string(code) + "), skipping compression of " +
                    input.string(),
                    processor_tag());
        throw std::runtime_error("ffmpeg exited with status " + std::to_string(code));
    }

    Logger::log(LogLevel::Info, "Video recompression completed: " + output.string(), processor_tag());
}

} // namespace mediapress
