/**
 * @file video_processor.hpp
 * @brief Defines the IProcessor implementation for videos, delegating to ffmpeg.
 */

#ifndef MEDIAPRESS_VIDEO_PROCESSOR_HPP
#define MEDIAPRESS_VIDEO_PROCESSOR_HPP

#include "processor.hpp"
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mediapress {

    /**
     * @brief Implements IProcessor for MP4, MOV and 3GP videos.
     *
     * @details Encoding is done entirely by an ffmpeg child process (H.265 at
     * CRF 24 by default). The candidate is always an MP4 container, which is
     * what libx265 output needs; most container metadata is carried over with
     * `-map_metadata 0`.
     */
    class VideoProcessor final : public IProcessor {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "VideoProcessor";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 3> kMimes = {
                "video/mp4", "video/quicktime", "video/3gpp"
            };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 3> kExts = { ".mp4", ".mov", ".3gp" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] MediaKind get_kind() const noexcept override { return MediaKind::Video; }

        [[nodiscard]] std::string_view get_output_extension() const noexcept override { return ".mp4"; }

        /**
         * @brief Runs ffmpeg and waits for it.
         *
         * The child is killed if options.stop is triggered while it runs.
         * @throws std::runtime_error if ffmpeg cannot be started, exits with a
         * non-zero status, is killed by a signal, or was interrupted.
         */
        void recompress(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        const CompressionOptions& options) override;
    };

    /**
     * @brief Full ffmpeg argument vector (argv[0] included) for one video.
     *
     * Codec-specific log suppression (`-x265-params log-level=error` or
     * `-x264-params log-level=error`) is only added for libx265 and libx264.
     */
    std::vector<std::string> build_ffmpeg_arguments(const std::filesystem::path& input,
                                                    const std::filesystem::path& output,
                                                    const CompressionOptions& options);

} // namespace mediapress

#endif // MEDIAPRESS_VIDEO_PROCESSOR_HPP
