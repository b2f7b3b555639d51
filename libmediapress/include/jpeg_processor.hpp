/**
 * @file jpeg_processor.hpp
 * @brief Defines the IProcessor implementation for JPEG files.
 */

#ifndef MEDIAPRESS_JPEG_PROCESSOR_HPP
#define MEDIAPRESS_JPEG_PROCESSOR_HPP

#include "processor.hpp"
#include <array>
#include <span>
#include <string_view>
#include <utility>

namespace mediapress {

    /**
     * @brief Implements IProcessor for JPEG files using libjpeg.
     *
     * @details Unlike a jpegtran-style transcode this is a full decode and
     * re-encode: the image is decoded, reduced to the minimum dimension if
     * needed, and encoded again with the configured quality and chroma
     * subsampling and optimized Huffman tables. The result is "visually
     * lossless" at the default quality of 95 with 4:4:4.
     */
    class JpegProcessor final : public IProcessor {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegProcessor";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/jpeg", "image/pjpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 2> kExts = { ".jpg", ".jpeg" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] MediaKind get_kind() const noexcept override { return MediaKind::Image; }

        [[nodiscard]] std::string_view get_output_extension() const noexcept override { return ".jpg"; }

        // --- operations ---

        /**
         * @brief Re-encodes a JPEG file.
         *
         * @param input Path to the source JPEG file.
         * @param output Path to write the re-encoded JPEG file.
         * @param options Quality, subsampling, minimum dimension and whether
         * APPn (EXIF, ICC, XMP) and COM markers are carried over.
         * @throws std::runtime_error if libjpeg reports a fatal error, the
         * subsampling string is unknown, or the colour space is CMYK/YCCK.
         */
        void recompress(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        const CompressionOptions& options) override;
    };

    /**
     * @brief Horizontal and vertical luma sampling factors for a
     * subsampling string such as "4:2:0".
     * @throws std::invalid_argument for anything but 4:4:4, 4:2:2 and 4:2:0.
     */
    std::pair<int, int> luma_sampling_factors(std::string_view subsampling);

} // namespace mediapress

#endif // MEDIAPRESS_JPEG_PROCESSOR_HPP
