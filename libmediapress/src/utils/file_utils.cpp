#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>

namespace fs = std::filesystem;

namespace mediapress {

    FILE* open_file(const fs::path& path, const char* mode) {
        return std::fopen(path.c_str(), mode);
    }

    uintmax_t safe_file_size(const fs::path& path) noexcept {
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        return ec ? 0 : size;
    }

    void move_file(const fs::path& from, const fs::path& to) {
        std::error_code ec;
        fs::rename(from, to, ec);
        if (!ec) return;

        // EXDEV: temp and output trees live on different filesystems
        Logger::log(LogLevel::Debug,
                    "rename failed (" + ec.message() + "), copying instead: " + from.string(),
                    "file_utils");
        fs::copy_file(from, to, fs::copy_options::none);
        fs::remove(from);
    }

    bool copy_file_times(const fs::path& source, const fs::path& target) {
        struct stat st{};
        if (::stat(source.c_str(), &st) != 0) {
            Logger::log(LogLevel::Warning,
                        "stat failed for " + source.string() + ": " + std::strerror(errno),
                        "file_utils");
            return false;
        }
        const timespec times[2] = { st.st_atim, st.st_mtim };
        if (::utimensat(AT_FDCWD, target.c_str(), times, 0) != 0) {
            Logger::log(LogLevel::Warning,
                        "utimensat failed for " + target.string() + ": " + std::strerror(errno),
                        "file_utils");
            return false;
        }
        return true;
    }

    fs::path with_extension(fs::path path, const std::string_view ext) {
        path.replace_extension(ext);
        return path;
    }

} // namespace mediapress
