#include "../../include/image_resize.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb_image_resize2.h>

namespace mediapress {
namespace {

    stbir_pixel_layout layout_for(const int channels) {
        switch (channels) {
            case 1: return STBIR_1CHANNEL;
            case 2: return STBIR_2CHANNEL;
            case 3: return STBIR_RGB;
            case 4: return STBIR_RGBA; // alpha-weighted, so transparent pixels do not bleed colour
            default:
                throw std::invalid_argument("resize_area: unsupported channel count " + std::to_string(channels));
        }
    }

} // namespace

std::optional<std::pair<int, int>> target_size_for_minimum_dimension(const int width,
                                                                      const int height,
                                                                      const int minimum_dimension) {
    if (minimum_dimension <= 0 || width <= 0 || height <= 0) {
        return std::nullopt;
    }
    const int shorter = std::min(width, height);
    if (shorter <= minimum_dimension) {
        return std::nullopt;
    }
    const double scaling = static_cast<double>(minimum_dimension) / static_cast<double>(shorter);
    const int new_width = std::max(1, static_cast<int>(std::nearbyint(scaling * width)));
    const int new_height = std::max(1, static_cast<int>(std::nearbyint(scaling * height)));
    return std::make_pair(new_width, new_height);
}

ImageData resize_area(const ImageData& image, const int new_width, const int new_height) {
    if (image.width <= 0 || image.height <= 0 || image.channels <= 0 || image.pixels.empty()) {
        throw std::invalid_argument("resize_area: empty image");
    }
    if (new_width <= 0 || new_height <= 0) {
        throw std::invalid_argument("resize_area: invalid target size");
    }

    ImageData out;
    out.width = new_width;
    out.height = new_height;
    out.channels = image.channels;
    out.pixels.resize(static_cast<size_t>(new_width) * new_height * image.channels);

    // the box filter averages the covered source area when shrinking
    const void* done = stbir_resize(image.pixels.data(), image.width, image.height, image.width * image.channels,
                                    out.pixels.data(), new_width, new_height, new_width * image.channels,
                                    layout_for(image.channels), STBIR_TYPE_UINT8,
                                    STBIR_EDGE_CLAMP, STBIR_FILTER_BOX);
    if (done == nullptr) {
        throw std::runtime_error("stb_image_resize failed for " + std::to_string(image.width) + "x" +
                                 std::to_string(image.height) + " -> " + std::to_string(new_width) + "x" +
                                 std::to_string(new_height));
    }
    return out;
}

bool resize_to_minimum_dimension(ImageData& image, const int minimum_dimension) {
    const auto target = target_size_for_minimum_dimension(image.width, image.height, minimum_dimension);
    if (!target) {
        return false;
    }
    Logger::log(LogLevel::Debug,
                "Resizing " + std::to_string(image.width) + "x" + std::to_string(image.height) +
                " -> " + std::to_string(target->first) + "x" + std::to_string(target->second),
                "image_resize");
    image = resize_area(image, target->first, target->second);
    return true;
}

} // namespace mediapress
