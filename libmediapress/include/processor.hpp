#ifndef MEDIAPRESS_PROCESSOR_HPP
#define MEDIAPRESS_PROCESSOR_HPP

#include "file_type.hpp"
#include <filesystem>
#include <span>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>

/**
 * @namespace mediapress
 * @brief The main namespace for the mediapress library.
 *
 * @details Holds the IProcessor interface and its JPEG, PNG and video
 * implementations, the execution engine (ProcessorExecutor), the
 * directory scanner and the consistency verifier.
 */
namespace mediapress {

/**
 * @brief Encoder settings shared by every processor.
 *
 * Filled from the command line; processors only read the fields that
 * concern them.
 */
struct CompressionOptions {
    int minimum_image_dimension = 2160;     ///< Shorter image side is reduced to this (<= 0 disables)
    int jpeg_quality = 95;                  ///< libjpeg quality, 1..100
    std::string jpeg_subsampling = "4:4:4"; ///< "4:4:4", "4:2:2" or "4:2:0"
    bool preserve_metadata = true;          ///< Carry EXIF/ICC/text into compressed images
    std::string video_codec = "libx265";    ///< ffmpeg -vcodec
    std::string video_crf = "24";           ///< ffmpeg -crf
    std::string ffmpeg_executable = "ffmpeg";
    std::stop_token stop;                   ///< Set by the worker running the task
};

/**
 * @brief Interface for a compression module.
 *
 * Each implementation targets one format. It describes which MIME types and
 * extensions it handles and which extension its output carries, so that the
 * dispatcher can correct a wrong extension before the candidate is written.
 *
 * Implementations are stateless: the ProcessorRegistry owns a single
 * instance of each and the worker threads call it concurrently.
 */
class IProcessor {
public:
    virtual ~IProcessor() = default;

    // --- self-description ---

    /// @return Human-readable name of the processor (e.g. "JpegProcessor").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return List of supported MIME types (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_mime_types() const noexcept = 0;

    /// @return List of supported file extensions (e.g. ".png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_extensions() const noexcept = 0;

    /// @return Which kind of input this processor compresses.
    [[nodiscard]] virtual MediaKind get_kind() const noexcept = 0;

    /// @return Extension given to the compressed candidate (e.g. ".jpg").
    [[nodiscard]] virtual std::string_view get_output_extension() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Write a compressed version of @p input_path to @p output_path.
     * @param input_path Path to the original file.
     * @param output_path Path of the candidate to create (its parent exists).
     * @param options Encoder settings.
     * @throws std::runtime_error if the codec fails. A partially written
     * candidate may be left behind; the caller removes it.
     */
    virtual void recompress(const std::filesystem::path& input_path,
                            const std::filesystem::path& output_path,
                            const CompressionOptions& options) = 0;
};

} // namespace mediapress

#endif // MEDIAPRESS_PROCESSOR_HPP
