#ifndef MEDIAPRESS_MIME_DETECTOR_HPP
#define MEDIAPRESS_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace mediapress {

    /**
     * @brief Content-based file type detection.
     *
     * Used to find out what an image really is before choosing a processor,
     * so that a PNG saved as ".jpg" is handled (and renamed) as a PNG.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return A MIME type string (e.g., "image/jpeg").
         *
         * @note Uses libmagic with the system database. If libmagic cannot be
         * initialised, falls back to the extension map in file_type.hpp, and
         * finally to "application/octet-stream".
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace mediapress

#endif // MEDIAPRESS_MIME_DETECTOR_HPP
