/**
 * @file png_processor.hpp
 * @brief Defines the IProcessor implementation for PNG files.
 */

#ifndef MEDIAPRESS_PNG_PROCESSOR_HPP
#define MEDIAPRESS_PNG_PROCESSOR_HPP

#include "processor.hpp"
#include <array>
#include <span>
#include <string_view>

namespace mediapress {

    /**
     * @brief Implements IProcessor for PNG files using libpng and zlib.
     *
     * @details The image is decoded to 8-bit RGBA, reduced to the minimum
     * dimension if needed, then written with the smallest colour type that
     * represents it exactly (palette, gray, gray+alpha, RGB or RGBA), zlib
     * level 9 and adaptive filtering.
     */
    class PngProcessor final : public IProcessor {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngProcessor";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/png", "image/x-png" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".png" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] MediaKind get_kind() const noexcept override { return MediaKind::Image; }

        [[nodiscard]] std::string_view get_output_extension() const noexcept override { return ".png"; }

        /**
         * @brief Re-encodes a PNG file.
         * @param input Path to the source PNG file.
         * @param output Path to write the re-encoded PNG file.
         * @param options Minimum dimension and whether ancillary chunks
         * (iCCP, sRGB, gAMA, cHRM, pHYs, text, tIME, eXIf) are carried over.
         * @throws std::runtime_error on any libpng error.
         */
        void recompress(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        const CompressionOptions& options) override;
    };

} // namespace mediapress

#endif // MEDIAPRESS_PNG_PROCESSOR_HPP
