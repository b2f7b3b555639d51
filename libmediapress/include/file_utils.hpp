#ifndef MEDIAPRESS_FILE_UTILS_HPP
#define MEDIAPRESS_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace mediapress {

    struct FileCloser {
        void operator()(FILE* f) const noexcept {
            if (f != nullptr) std::fclose(f);
        }
    };

    /// Owning FILE* for the stdio-based codec APIs (libjpeg, libpng).
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /// fopen() on a filesystem path; nullptr on failure, errno is left set.
    FILE* open_file(const std::filesystem::path& path, const char* mode);

    /**
     * @brief Size of a regular file, 0 if it does not exist or cannot be read.
     */
    uintmax_t safe_file_size(const std::filesystem::path& path) noexcept;

    /**
     * @brief Moves a file, falling back to copy + remove across filesystems.
     * @throws std::filesystem::filesystem_error if neither works.
     */
    void move_file(const std::filesystem::path& from, const std::filesystem::path& to);

    /**
     * @brief Gives @p target the access and modification times of @p source.
     * @return false (and logs a warning) if the times could not be applied.
     */
    bool copy_file_times(const std::filesystem::path& source, const std::filesystem::path& target);

    /**
     * @brief Replaces the extension of a path ("a/b.JPG" + ".png" -> "a/b.png").
     */
    std::filesystem::path with_extension(std::filesystem::path path, std::string_view ext);

} // namespace mediapress

#endif // MEDIAPRESS_FILE_UTILS_HPP
