/**
 * @file verifier.hpp
 * @brief Post-run checks that the output tree mirrors the input tree.
 */

#ifndef MEDIAPRESS_VERIFIER_HPP
#define MEDIAPRESS_VERIFIER_HPP

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

namespace mediapress {

/**
 * @brief One input file and the output it was matched with.
 */
struct VerifiedPair {
    std::filesystem::path input;
    std::filesystem::path output;
    bool compressed = false; ///< Output stem carries the compression suffix
    double rate = 0.0;       ///< Size reduction in percent, negative if the output grew
};

struct VerificationReport {
    std::vector<VerifiedPair> pairs; ///< In canonical-name order

    [[nodiscard]] size_t compressed_count() const;
};

/**
 * @brief Checks that @p output_root holds exactly one output per file of @p input_root.
 *
 * Both trees are re-walked. The file counts must match; files are paired by
 * canonical name (the compression @p suffix removed on the output side); no
 * pair may have shrunk by more than @p max_compression_pct percent; and every
 * input sub-directory must exist in the output tree.
 *
 * @throws VerificationError describing the first mismatch.
 */
VerificationReport verify_consistency(const std::filesystem::path& input_root,
                                      const std::filesystem::path& output_root,
                                      std::string_view suffix,
                                      double max_compression_pct);

/**
 * @brief Removes the temp tree, which must not contain any regular file.
 * @throws VerificationError if a file was left behind.
 * @throws std::filesystem::filesystem_error if the tree cannot be removed.
 */
void clean_up_temp_directory(const std::filesystem::path& temp_root);

} // namespace mediapress

#endif // MEDIAPRESS_VERIFIER_HPP
