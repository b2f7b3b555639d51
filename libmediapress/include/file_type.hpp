/**
 * @file file_type.hpp
 * @brief Classification of input files into images, videos and opaque files.
 *
 * The claimed type of a file comes from its (lowercased) extension. Only
 * images are re-checked by content, through MimeDetector, before a
 * processor is chosen.
 */

#ifndef MEDIAPRESS_FILE_TYPE_HPP
#define MEDIAPRESS_FILE_TYPE_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

/**
 * @brief What the dispatcher does with a file.
 */
enum class MediaKind {
    Image,  ///< Re-encoded through libjpeg / libpng
    Video,  ///< Re-encoded through ffmpeg
    Opaque  ///< Never compressed, copied verbatim
};

///< Extensions for which image compression is attempted.
inline constexpr std::array<std::string_view, 3> implemented_image_extensions = {
    ".jpg", ".jpeg", ".png"
};

///< Extensions for which video compression is attempted.
inline constexpr std::array<std::string_view, 3> implemented_video_extensions = {
    ".mp4", ".mov", ".3gp"
};

///< Fallback map used when content detection is unavailable.
inline const std::unordered_map<std::string, std::string> ext_to_mime = {
    { ".jpg",  "image/jpeg" },
    { ".jpeg", "image/jpeg" },
    { ".png",  "image/png" },
    { ".mp4",  "video/mp4" },
    { ".mov",  "video/quicktime" },
    { ".3gp",  "video/3gpp" },
};

/**
 * @brief Lowercase extension of a path, including the leading dot.
 *
 * Extensions are never compared without going through this helper.
 * @param path Any path.
 * @return e.g. ".jpg" for "IMG_01.JPG", empty string if there is none.
 */
inline std::string lowercase_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

/**
 * @brief Classifies a lowercased or mixed-case extension.
 * @param ext Extension including the dot.
 * @return MediaKind::Opaque for anything that is not implemented.
 */
inline MediaKind classify_extension(const std::string_view ext) {
    std::string lower(ext);
    std::ranges::transform(lower, lower.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (std::ranges::find(implemented_image_extensions, lower) != implemented_image_extensions.end()) {
        return MediaKind::Image;
    }
    if (std::ranges::find(implemented_video_extensions, lower) != implemented_video_extensions.end()) {
        return MediaKind::Video;
    }
    return MediaKind::Opaque;
}

inline MediaKind classify_path(const std::filesystem::path& path) {
    return classify_extension(lowercase_extension(path));
}

inline std::string kind_to_string(const MediaKind kind) {
    switch (kind) {
        case MediaKind::Image:  return "image";
        case MediaKind::Video:  return "video";
        case MediaKind::Opaque: return "opaque";
    }
    return "unknown";
}

inline std::optional<std::string> mime_from_extension(const std::filesystem::path& path) {
    const auto it = ext_to_mime.find(lowercase_extension(path));
    if (it == ext_to_mime.end()) return std::nullopt;
    return it->second;
}

#endif // MEDIAPRESS_FILE_TYPE_HPP
