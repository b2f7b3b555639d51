#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/file_type.hpp"
#include "../../include/logger.hpp"
#include <filesystem>
#include <memory>
#include <type_traits>

namespace mediapress {
namespace {

struct MagicCloser {
    void operator()(const magic_t m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

std::string fallback_mime(const std::filesystem::path& path) {
    if (auto mime = mime_from_extension(path)) {
        return *mime;
    }
    return "application/octet-stream";
}

} // namespace

std::string MimeDetector::detect(const std::filesystem::path& path)
{
    // magic_t is not thread-safe, so every call gets its own cookie
    const unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) {
        Logger::log(LogLevel::Warning, "magic_open failed, using extension for " + path.string(), "libmagic");
        return fallback_mime(path);
    }
    if (magic_load(magic.get(), nullptr) != 0) {
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + magic_error(magic.get()), "libmagic");
        return fallback_mime(path);
    }
    const char* mime = magic_file(magic.get(), path.string().c_str());
    if (!mime) {
        const char* err = magic_error(magic.get());
        Logger::log(LogLevel::Warning,
                    "magic_file failed for " + path.string() + (err ? std::string(": ") + err : std::string()),
                    "libmagic");
        return fallback_mime(path);
    }
    return mime;
}

} // namespace mediapress
