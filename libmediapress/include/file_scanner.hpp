/**
 * @file file_scanner.hpp
 * @brief Enumeration of the input tree and creation of its mirrors.
 */

#ifndef MEDIAPRESS_FILE_SCANNER_HPP
#define MEDIAPRESS_FILE_SCANNER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mediapress {

/**
 * @brief Inputs that would map to the same output once extensions are corrected.
 */
struct NameCollision {
    std::string name;                        ///< Relative path without extension
    std::vector<std::filesystem::path> files; ///< Every input carrying that name
};

/**
 * @brief Every regular file below @p root, sorted by path.
 *
 * Symlinked directories are followed. Nothing is filtered out: each file
 * listed here gets exactly one output.
 * @throws std::filesystem::filesystem_error if the tree cannot be read.
 */
std::vector<std::filesystem::path> collect_input_files(const std::filesystem::path& root);

/**
 * @brief Every directory below @p root (not @p root itself), sorted by path.
 */
std::vector<std::filesystem::path> collect_directories(const std::filesystem::path& root);

/**
 * @brief Creates @p destination and an empty copy of every sub-directory of @p input below it.
 * @throws std::filesystem::filesystem_error on failure.
 */
void mirror_directory_tree(const std::filesystem::path& input, const std::filesystem::path& destination);

/**
 * @brief Relative path of @p file below @p root with the extension removed.
 *
 * When @p suffix is not empty and the result ends with it, the suffix is
 * removed too, so that "a/IMG_1_RG01COMPRESS.jpg" and "a/IMG_1.JPG" share the
 * name "a/IMG_1".
 */
std::string canonical_name(const std::filesystem::path& file,
                           const std::filesystem::path& root,
                           std::string_view suffix = {});

/**
 * @brief Groups @p files by canonical name and returns the groups with more than one member.
 * @return Collisions sorted by name.
 */
std::vector<NameCollision> find_name_collisions(const std::filesystem::path& root,
                                                const std::vector<std::filesystem::path>& files);

} // namespace mediapress

#endif // MEDIAPRESS_FILE_SCANNER_HPP
