#ifndef MEDIAPRESS_TEST_UTILS_HPP
#define MEDIAPRESS_TEST_UTILS_HPP

#include "../libmediapress/include/file_utils.hpp"
#include "../libmediapress/include/processor.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <jpeglib.h>
#include <png.h>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace mediapress::test {

namespace fs = std::filesystem;

// 16 hex digits, distinct across threads and runs
inline std::string random_hex_suffix() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(engine()));
    return buf;
}

/**
 * @brief Creates `<system temp>/mediapress-test/<name>_<random>` and returns it.
 */
inline fs::path make_scratch_dir(const std::string& name) {
    const auto dir = fs::temp_directory_path() / "mediapress-test" / (name + "_" + random_hex_suffix());
    fs::create_directories(dir);
    return dir;
}

/**
 * @brief Fixture giving each test its own scratch directory.
 */
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = make_scratch_dir(std::string(info->test_suite_name()) + "_" + info->name());
        ASSERT_TRUE(fs::is_directory(root_));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
        EXPECT_FALSE(ec) << "cannot remove " << root_ << ": " << ec.message();
    }

    fs::path root_;
};

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

/**
 * @brief Smooth RGB gradient, compresses well and decodes predictably.
 */
inline std::vector<uint8_t> gradient_rgb(const int width, const int height) {
    std::vector<uint8_t> px(static_cast<size_t>(width) * height * 3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            uint8_t* p = &px[(static_cast<size_t>(y) * width + x) * 3];
            p[0] = static_cast<uint8_t>(x * 255 / std::max(1, width - 1));
            p[1] = static_cast<uint8_t>(y * 255 / std::max(1, height - 1));
            p[2] = 128;
        }
    }
    return px;
}

/**
 * @brief Writes a baseline RGB JPEG with libjpeg, optionally with a COM marker
 * and an APP1 segment holding @p exif verbatim.
 */
inline void write_test_jpeg(const fs::path& path, const int width, const int height,
                            const int quality = 100, const std::string& comment = {},
                            const std::string& exif = {}) {
    fs::create_directories(path.parent_path());
    const unique_FILE fp(open_file(path, "wb"));
    if (!fp) throw std::runtime_error("cannot create " + path.string());

    jpeg_compress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);
    jpeg_stdio_dest(&cinfo, fp.get());
    cinfo.image_width = static_cast<JDIMENSION>(width);
    cinfo.image_height = static_cast<JDIMENSION>(height);
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);
    if (!exif.empty()) {
        jpeg_write_marker(&cinfo, JPEG_APP0 + 1, reinterpret_cast<const JOCTET*>(exif.data()),
                          static_cast<unsigned>(exif.size()));
    }
    if (!comment.empty()) {
        jpeg_write_marker(&cinfo, JPEG_COM, reinterpret_cast<const JOCTET*>(comment.data()),
                          static_cast<unsigned>(comment.size()));
    }

    const auto px = gradient_rgb(width, height);
    while (cinfo.next_scanline < cinfo.image_height) {
        auto* row = const_cast<JSAMPLE*>(&px[static_cast<size_t>(cinfo.next_scanline) * width * 3]);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
}

struct JpegInfo {
    int width = 0;
    int height = 0;
    int components = 0;
    int luma_h_samp = 0;
    int luma_v_samp = 0;
    std::vector<std::string> comments;
    std::vector<std::string> app1; ///< Payloads of the APP1 (EXIF/XMP) segments
};

inline JpegInfo read_jpeg_info(const fs::path& path) {
    const unique_FILE fp(open_file(path, "rb"));
    if (!fp) throw std::runtime_error("cannot open " + path.string());

    jpeg_decompress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_decompress(&cinfo);
    jpeg_stdio_src(&cinfo, fp.get());
    jpeg_save_markers(&cinfo, JPEG_COM, 0xFFFF);
    jpeg_save_markers(&cinfo, JPEG_APP0 + 1, 0xFFFF);
    jpeg_read_header(&cinfo, TRUE);

    JpegInfo info;
    info.width = static_cast<int>(cinfo.image_width);
    info.height = static_cast<int>(cinfo.image_height);
    info.components = cinfo.num_components;
    info.luma_h_samp = cinfo.comp_info[0].h_samp_factor;
    info.luma_v_samp = cinfo.comp_info[0].v_samp_factor;
    for (auto m = cinfo.marker_list; m; m = m->next) {
        if (m->marker == JPEG_COM) {
            info.comments.emplace_back(reinterpret_cast<const char*>(m->data), m->data_length);
        } else if (m->marker == JPEG_APP0 + 1) {
            info.app1.emplace_back(reinterpret_cast<const char*>(m->data), m->data_length);
        }
    }
    jpeg_destroy_decompress(&cinfo);
    return info;
}

/**
 * @brief Writes an 8-bit PNG with libpng. @p pixels holds `channels` bytes per pixel.
 */
inline void write_test_png(const fs::path& path, const int width, const int height, const int color_type,
                           const std::vector<uint8_t>& pixels, const std::string& text = {}) {
    fs::create_directories(path.parent_path());
    const unique_FILE fp(open_file(path, "wb"));
    if (!fp) throw std::runtime_error("cannot create " + path.string());

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png_create_info_struct(png);
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("libpng write error");
    }
    png_init_io(png, fp.get());
    // no compression so that the re-encoded file is reliably smaller
    png_set_compression_level(png, 0);
    png_set_IHDR(png, info, static_cast<png_uint_32>(width), static_cast<png_uint_32>(height), 8, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
    std::string key = "Comment";
    png_text txt{};
    if (!text.empty()) {
        txt.compression = PNG_TEXT_COMPRESSION_NONE;
        txt.key = key.data();
        txt.text = const_cast<char*>(text.c_str());
        png_set_text(png, info, &txt, 1);
    }
    png_write_info(png, info);

    const int channels = png_get_channels(png, info);
    for (int y = 0; y < height; ++y) {
        png_write_row(png, const_cast<png_bytep>(&pixels[static_cast<size_t>(y) * width * channels]));
    }
    png_write_end(png, info);
    png_destroy_write_struct(&png, &info);
}

/**
 * @brief Writes an 8-bit palette PNG whose bKGD chunk names @p background_index.
 */
inline void write_test_palette_png(const fs::path& path, const int width, const int height,
                                   const std::vector<png_color>& palette, const std::vector<uint8_t>& indices,
                                   const png_byte background_index) {
    fs::create_directories(path.parent_path());
    const unique_FILE fp(open_file(path, "wb"));
    if (!fp) throw std::runtime_error("cannot create " + path.string());

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png_create_info_struct(png);
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("libpng write error");
    }
    png_init_io(png, fp.get());
    png_set_IHDR(png, info, static_cast<png_uint_32>(width), static_cast<png_uint_32>(height), 8,
                 PNG_COLOR_TYPE_PALETTE, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
    png_set_PLTE(png, info, palette.data(), static_cast<int>(palette.size()));
    png_color_16 background{};
    background.index = background_index;
    png_set_bKGD(png, info, &background);
    png_write_info(png, info);
    for (int y = 0; y < height; ++y) {
        png_write_row(png, const_cast<png_bytep>(&indices[static_cast<size_t>(y) * width]));
    }
    png_write_end(png, info);
    png_destroy_write_struct(&png, &info);
}

struct PngInfo {
    int width = 0;
    int height = 0;
    int color_type = 0;
    int bit_depth = 0;
    std::vector<std::string> texts;
    std::optional<std::array<uint8_t, 3>> background; ///< bKGD resolved to RGB (palette entries looked up)
    std::vector<uint8_t> rgba; ///< Decoded pixels, expanded to 8-bit RGBA
};

inline PngInfo read_png(const fs::path& path) {
    const unique_FILE fp(open_file(path, "rb"));
    if (!fp) throw std::runtime_error("cannot open " + path.string());

    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png_create_info_struct(png);
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_read_struct(&png, &info, nullptr);
        throw std::runtime_error("libpng read error");
    }
    png_init_io(png, fp.get());
    png_read_info(png, info);

    PngInfo result;
    result.width = static_cast<int>(png_get_image_width(png, info));
    result.height = static_cast<int>(png_get_image_height(png, info));
    result.color_type = png_get_color_type(png, info);
    result.bit_depth = png_get_bit_depth(png, info);

    png_textp texts = nullptr;
    int num_text = 0;
    if (png_get_text(png, info, &texts, &num_text) > 0) {
        for (int i = 0; i < num_text; ++i) {
            result.texts.emplace_back(texts[i].text ? texts[i].text : "");
        }
    }

    png_color_16p background = nullptr;
    if (png_get_bKGD(png, info, &background) == PNG_INFO_bKGD) {
        png_colorp palette = nullptr;
        int palette_size = 0;
        if (result.color_type == PNG_COLOR_TYPE_PALETTE) {
            if (png_get_PLTE(png, info, &palette, &palette_size) == PNG_INFO_PLTE &&
                background->index < palette_size) {
                const png_color& c = palette[background->index];
                result.background = std::array<uint8_t, 3>{c.red, c.green, c.blue};
            }
        } else if ((result.color_type & PNG_COLOR_MASK_COLOR) != 0) {
            result.background = std::array<uint8_t, 3>{static_cast<uint8_t>(background->red),
                                                       static_cast<uint8_t>(background->green),
                                                       static_cast<uint8_t>(background->blue)};
        } else {
            const auto g = static_cast<uint8_t>(background->gray);
            result.background = std::array<uint8_t, 3>{g, g, g};
        }
    }

    png_set_expand(png);
    png_set_strip_16(png);
    png_set_gray_to_rgb(png);
    png_set_add_alpha(png, 0xFF, PNG_FILLER_AFTER);
    png_read_update_info(png, info);

    result.rgba.resize(static_cast<size_t>(result.width) * result.height * 4);
    std::vector<png_bytep> rows(static_cast<size_t>(result.height));
    for (int y = 0; y < result.height; ++y) {
        rows[static_cast<size_t>(y)] = &result.rgba[static_cast<size_t>(y) * result.width * 4];
    }
    png_read_image(png, rows.data());
    png_read_end(png, nullptr);
    png_destroy_read_struct(&png, &info, nullptr);
    return result;
}

/**
 * @brief Writes a POSIX shell script and makes it executable.
 */
inline fs::path write_script(const fs::path& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
    return path;
}

/**
 * @brief Image processor with scripted behaviour, for dispatcher tests.
 */
class FakeImageProcessor final : public IProcessor {
public:
    enum class Behaviour { WriteSmall, WriteLarge, Throw };

    explicit FakeImageProcessor(const Behaviour behaviour) : behaviour_(behaviour) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "FakeImageProcessor"; }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 2> kMimes = {"image/jpeg", "image/png"};
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 1> kExts = {".png"};
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] MediaKind get_kind() const noexcept override { return MediaKind::Image; }

    [[nodiscard]] std::string_view get_output_extension() const noexcept override { return ".png"; }

    void recompress(const std::filesystem::path&, const std::filesystem::path& output_path,
                    const CompressionOptions&) override {
        switch (behaviour_) {
            case Behaviour::WriteSmall:
                write_file(output_path, "s");
                break;
            case Behaviour::WriteLarge:
                write_file(output_path, std::string(1 << 20, 'L'));
                break;
            case Behaviour::Throw:
                write_file(output_path, "partial");
                throw std::runtime_error("scripted failure");
        }
    }

private:
    Behaviour behaviour_;
};

} // namespace mediapress::test

#endif // MEDIAPRESS_TEST_UTILS_HPP
