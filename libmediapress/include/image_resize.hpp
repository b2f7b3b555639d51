/**
 * @file image_resize.hpp
 * @brief Decoded pixel buffers and the down-scaling shared by image processors.
 */

#ifndef MEDIAPRESS_IMAGE_RESIZE_HPP
#define MEDIAPRESS_IMAGE_RESIZE_HPP

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace mediapress {

/**
 * @brief Interleaved 8-bit pixels, row-major, no padding between rows.
 */
struct ImageData {
    std::vector<uint8_t> pixels;
    int width = 0;
    int height = 0;
    int channels = 0; ///< 1 (gray), 3 (RGB) or 4 (RGBA)
};

/**
 * @brief Size an image must be reduced to so that its shorter side equals
 * @p minimum_dimension.
 *
 * Both sides are scaled by `minimum_dimension / min(width, height)` and
 * rounded to the nearest integer (ties to even). A 8652x3708 image with a
 * minimum of 2160 becomes 5040x2160.
 *
 * @return std::nullopt if the shorter side is already <= @p minimum_dimension
 * or @p minimum_dimension <= 0.
 */
std::optional<std::pair<int, int>> target_size_for_minimum_dimension(int width,
                                                                      int height,
                                                                      int minimum_dimension);

/**
 * @brief Resamples an image to @p new_width x @p new_height with
 * stb_image_resize2's box filter, so a shrink averages the source area under
 * each output pixel. Four-channel images are treated as RGBA with straight alpha.
 * @throws std::invalid_argument on empty input, non-positive target size or
 * a channel count other than 1..4.
 * @throws std::runtime_error if stb_image_resize2 fails.
 */
ImageData resize_area(const ImageData& image, int new_width, int new_height);

/**
 * @brief Applies target_size_for_minimum_dimension() in place.
 * @return true if the image was resized.
 */
bool resize_to_minimum_dimension(ImageData& image, int minimum_dimension);

} // namespace mediapress

#endif // MEDIAPRESS_IMAGE_RESIZE_HPP
