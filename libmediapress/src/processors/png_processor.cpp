#include "../../include/png_processor.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_resize.hpp"
#include "../../include/logger.hpp"
#include <cstdint>
#include <cstring>
#include <map>
#include <optional>
#include <png.h>
#include <stdexcept>
#include <vector>
#include <zlib.h>

namespace mediapress {
namespace {

    constexpr const char* kTag = "png_processor";

    // libpng reports fatal errors through this callback; throwing unwinds
    // past png_read_*/png_write_* and the handles below release the structs.
    [[noreturn]] void on_png_error(png_structp, const png_const_charp what) {
        Logger::log(LogLevel::Error, std::string("libpng error: ") + what, kTag);
        throw std::runtime_error(std::string("libpng: ") + what);
    }

    void on_png_warning(png_structp, const png_const_charp what) {
        Logger::log(LogLevel::Debug, std::string("libpng warning: ") + what, kTag);
    }

    /// Owns a png_struct/png_info pair for decoding.
    class PngDecoder {
    public:
        PngDecoder() {
            png_ = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, on_png_error, on_png_warning);
            if (!png_) throw std::runtime_error("Cannot allocate PNG decoder");
            info_ = png_create_info_struct(png_);
            if (!info_) {
                png_destroy_read_struct(&png_, nullptr, nullptr);
                throw std::runtime_error("Cannot allocate PNG decoder info");
            }
        }
        PngDecoder(const PngDecoder&) = delete;
        PngDecoder& operator=(const PngDecoder&) = delete;
        ~PngDecoder() { png_destroy_read_struct(&png_, &info_, nullptr); }

        [[nodiscard]] png_structp png() const { return png_; }
        [[nodiscard]] png_infop info() const { return info_; }

    private:
        png_structp png_ = nullptr;
        png_infop info_ = nullptr;
    };

    /// Owns a png_struct/png_info pair for encoding.
    class PngEncoder {
    public:
        PngEncoder() {
            png_ = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, on_png_error, on_png_warning);
            if (!png_) throw std::runtime_error("Cannot allocate PNG encoder");
            info_ = png_create_info_struct(png_);
            if (!info_) {
                png_destroy_write_struct(&png_, nullptr);
                throw std::runtime_error("Cannot allocate PNG encoder info");
            }
        }
        PngEncoder(const PngEncoder&) = delete;
        PngEncoder& operator=(const PngEncoder&) = delete;
        ~PngEncoder() { png_destroy_write_struct(&png_, &info_); }

        [[nodiscard]] png_structp png() const { return png_; }
        [[nodiscard]] png_infop info() const { return info_; }

    private:
        png_structp png_ = nullptr;
        png_infop info_ = nullptr;
    };

    // Colour management chunks describe how samples map to colours and
    // stay valid whatever layout the encoder picks.
    void carry_color_chunks(const PngDecoder& from, const PngEncoder& to) {
        const png_structp rp = from.png();
        const png_infop ri = from.info();

        png_charp profile_name = nullptr;
        int compression = 0;
        png_bytep profile = nullptr;
        png_uint_32 profile_size = 0;
        if (png_get_iCCP(rp, ri, &profile_name, &compression, &profile, &profile_size) == PNG_INFO_iCCP) {
            png_set_iCCP(to.png(), to.info(), profile_name, compression, profile, profile_size);
        }

        int rendering_intent = 0;
        if (png_get_sRGB(rp, ri, &rendering_intent) == PNG_INFO_sRGB) {
            png_set_sRGB(to.png(), to.info(), rendering_intent);
        }

        double file_gamma = 0.0;
        if (png_get_gAMA(rp, ri, &file_gamma) == PNG_INFO_gAMA) {
            png_set_gAMA(to.png(), to.info(), file_gamma);
        }

        double c[8] = {};
        if (png_get_cHRM(rp, ri, &c[0], &c[1], &c[2], &c[3], &c[4], &c[5], &c[6], &c[7]) == PNG_INFO_cHRM) {
            png_set_cHRM(to.png(), to.info(), c[0], c[1], c[2], c[3], c[4], c[5], c[6], c[7]);
        }
    }

    // Textual and descriptive chunks: tEXt/zTXt/iTXt, tIME, eXIf.
    // pHYs is dropped after a resize since the density no longer matches.
    void carry_descriptive_chunks(const PngDecoder& from, const PngEncoder& to, const bool resized) {
        const png_structp rp = from.png();
        const png_infop ri = from.info();

        png_textp entries = nullptr;
        const int entry_count = png_get_text(rp, ri, &entries, nullptr);
        if (entry_count > 0 && entries != nullptr) {
            png_set_text(to.png(), to.info(), entries, entry_count);
        }

        png_timep stamp = nullptr;
        if (png_get_tIME(rp, ri, &stamp) == PNG_INFO_tIME && stamp != nullptr) {
            png_set_tIME(to.png(), to.info(), stamp);
        }

#ifdef PNG_eXIf_SUPPORTED
        png_bytep exif = nullptr;
        png_uint_32 exif_size = 0;
        if (png_get_eXIf_1(rp, ri, &exif_size, &exif) == PNG_INFO_eXIf && exif_size > 0) {
            png_set_eXIf_1(to.png(), to.info(), exif_size, exif);
        }
#endif

        if (resized) return;

        png_uint_32 res_x = 0, res_y = 0;
        int res_unit = 0;
        if (png_get_pHYs(rp, ri, &res_x, &res_y, &res_unit) == PNG_INFO_pHYs) {
            png_set_pHYs(to.png(), to.info(), res_x, res_y, res_unit);
        }
    }

    uint32_t rgba_key(const uint8_t* px) {
        uint32_t key = 0;
        std::memcpy(&key, px, 4);
        return key;
    }

    /// IHDR facts and the bKGD chunk as stored, captured before the RGBA8
    /// transforms rewrite the decoder's png_info.
    struct SourceHeader {
        int color_type = 0;
        int bit_depth = 8;
        std::optional<png_color_16> background;
        std::optional<uint32_t> background_rgba; ///< Palette entry named by bKGD
    };

    SourceHeader read_source_header(const PngDecoder& dec) {
        const png_structp png = dec.png();
        const png_infop info = dec.info();

        SourceHeader header;
        header.color_type = png_get_color_type(png, info);
        header.bit_depth = png_get_bit_depth(png, info);

        png_color_16p background = nullptr;
        if (png_get_bKGD(png, info, &background) != PNG_INFO_bKGD || background == nullptr) {
            return header;
        }
        header.background = *background;

        png_colorp palette = nullptr;
        int palette_size = 0;
        if (header.color_type != PNG_COLOR_TYPE_PALETTE ||
            png_get_PLTE(png, info, &palette, &palette_size) != PNG_INFO_PLTE ||
            background->index >= palette_size) {
            return header;
        }
        png_bytep alpha = nullptr;
        int alpha_count = 0;
        if (png_get_tRNS(png, info, &alpha, &alpha_count, nullptr) != PNG_INFO_tRNS || alpha == nullptr) {
            alpha_count = 0;
        }
        const png_color& entry = palette[background->index];
        const uint8_t px[4] = {entry.red, entry.green, entry.blue,
                               background->index < alpha_count ? alpha[background->index] : png_byte{0xFF}};
        header.background_rgba = rgba_key(px);
        return header;
    }

    /**
     * @brief Decodes the whole image, expanding every layout to 8-bit RGBA.
     * @param dec Decoder positioned after png_read_info().
     * @param header What read_source_header() found in IHDR.
     */
    ImageData decode_rgba8(const PngDecoder& dec, const SourceHeader& header) {
        const png_structp png = dec.png();
        const png_infop info = dec.info();

        const png_uint_32 width = png_get_image_width(png, info);
        const png_uint_32 height = png_get_image_height(png, info);
        const int depth = header.bit_depth;

        const bool is_gray = (header.color_type & PNG_COLOR_MASK_COLOR) == 0;
        const bool has_alpha = (header.color_type & PNG_COLOR_MASK_ALPHA) != 0;

        if (depth == 16) png_set_strip_16(png);
        if (depth < 8) png_set_packing(png);
        if (header.color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
        if (is_gray && depth < 8) png_set_expand_gray_1_2_4_to_8(png);
        if (is_gray) png_set_gray_to_rgb(png);
        if (png_get_valid(png, info, PNG_INFO_tRNS)) {
            png_set_tRNS_to_alpha(png);
        } else if (!has_alpha) {
            png_set_add_alpha(png, 0xFF, PNG_FILLER_AFTER);
        }
        png_set_interlace_handling(png);
        png_read_update_info(png, info);

        const size_t stride = static_cast<size_t>(width) * 4;
        if (png_get_rowbytes(png, info) != stride) {
            throw std::runtime_error("Unexpected PNG row size after RGBA expansion");
        }

        ImageData image;
        image.width = static_cast<int>(width);
        image.height = static_cast<int>(height);
        image.channels = 4;
        image.pixels.resize(stride * height);

        std::vector<png_bytep> rows;
        rows.reserve(height);
        for (png_uint_32 y = 0; y < height; ++y) {
            rows.push_back(image.pixels.data() + y * stride);
        }
        png_read_image(png, rows.data());
        png_read_end(png, nullptr);
        return image;
    }

    /**
     * @brief Cheapest lossless layout for an RGBA8 buffer.
     *
     * Gray beats a palette when the image is opaque gray since both cost one
     * byte per pixel and gray carries no PLTE chunk.
     */
    struct Layout {
        int color_type = PNG_COLOR_TYPE_RGBA;
        int channels = 4;
        std::map<uint32_t, png_byte> index_of;
        std::vector<png_color> palette;
        std::vector<png_byte> palette_alpha;
        bool translucent = false;
    };

    Layout choose_layout(const ImageData& image) {
        bool gray = true;
        bool opaque = true;
        bool fits_palette = true;
        Layout layout;

        const size_t pixel_count = static_cast<size_t>(image.width) * static_cast<size_t>(image.height);
        for (size_t i = 0; i < pixel_count; ++i) {
            const uint8_t* px = &image.pixels[i * 4];
            gray = gray && px[0] == px[1] && px[1] == px[2];
            opaque = opaque && px[3] == 0xFF;

            if (!fits_palette) continue;
            const auto [it, inserted] = layout.index_of.try_emplace(
                    rgba_key(px), static_cast<png_byte>(layout.palette.size()));
            if (!inserted) continue;
            if (layout.palette.size() == 256) {
                fits_palette = false;
                layout.index_of.clear();
                layout.palette.clear();
                layout.palette_alpha.clear();
                continue;
            }
            layout.palette.push_back(png_color{px[0], px[1], px[2]});
            layout.palette_alpha.push_back(px[3]);
        }

        layout.translucent = !opaque;
        if (gray && opaque) {
            layout.color_type = PNG_COLOR_TYPE_GRAY;
            layout.channels = 1;
        } else if (fits_palette) {
            layout.color_type = PNG_COLOR_TYPE_PALETTE;
            layout.channels = 1;
        } else if (gray) {
            layout.color_type = PNG_COLOR_TYPE_GRAY_ALPHA;
            layout.channels = 2;
        } else if (opaque) {
            layout.color_type = PNG_COLOR_TYPE_RGB;
            layout.channels = 3;
        }
        if (layout.color_type != PNG_COLOR_TYPE_PALETTE) {
            layout.index_of.clear();
            layout.palette.clear();
            layout.palette_alpha.clear();
        }
        return layout;
    }

    // Converts one RGBA8 row into the chosen layout.
    void pack_row(const uint8_t* rgba, const int width, const Layout& layout, std::vector<png_byte>& out) {
        png_byte* dst = out.data();
        for (int x = 0; x < width; ++x, rgba += 4) {
            switch (layout.color_type) {
                case PNG_COLOR_TYPE_PALETTE:
                    *dst++ = layout.index_of.at(rgba_key(rgba));
                    break;
                case PNG_COLOR_TYPE_GRAY:
                    *dst++ = rgba[0];
                    break;
                case PNG_COLOR_TYPE_GRAY_ALPHA:
                    *dst++ = rgba[0];
                    *dst++ = rgba[3];
                    break;
                case PNG_COLOR_TYPE_RGB:
                    *dst++ = rgba[0];
                    *dst++ = rgba[1];
                    *dst++ = rgba[2];
                    break;
                default:
                    std::memcpy(dst, rgba, 4);
                    dst += 4;
                    break;
            }
        }
    }

    void encode(const PngEncoder& enc, const ImageData& image, const Layout& layout) {
        const png_structp png = enc.png();
        const png_infop info = enc.info();

        png_set_compression_level(png, Z_BEST_COMPRESSION);
        png_set_compression_mem_level(png, MAX_MEM_LEVEL);
        // indexed samples do not predict well, everything else uses adaptive filters
        png_set_filter(png, PNG_FILTER_TYPE_BASE,
                       layout.color_type == PNG_COLOR_TYPE_PALETTE ? PNG_FILTER_NONE : PNG_ALL_FILTERS);

        png_set_IHDR(png, info,
                     static_cast<png_uint_32>(image.width), static_cast<png_uint_32>(image.height),
                     8, layout.color_type, PNG_INTERLACE_NONE,
                     PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

        if (layout.color_type == PNG_COLOR_TYPE_PALETTE) {
            png_set_PLTE(png, info, layout.palette.data(), static_cast<int>(layout.palette.size()));
            if (layout.translucent) {
                png_set_tRNS(png, info, layout.palette_alpha.data(),
                             static_cast<int>(layout.palette_alpha.size()), nullptr);
            }
        }
    }

    // sBIT and bKGD are expressed in the sample layout of the colour type.
    // Palette indices are renumbered by choose_layout(), so bKGD follows its
    // colour to the new index and is dropped when no pixel uses that colour.
    void carry_layout_chunks(const PngDecoder& from, const PngEncoder& to,
                             const SourceHeader& source, const Layout& layout) {
        // samples were stripped to 8 bits
        if (source.bit_depth == 16) return;

        png_color_8p significant = nullptr;
        if (png_get_sBIT(from.png(), from.info(), &significant) == PNG_INFO_sBIT && significant != nullptr) {
            png_set_sBIT(to.png(), to.info(), significant);
        }

        if (!source.background) return;
        if (layout.color_type == PNG_COLOR_TYPE_PALETTE) {
            if (!source.background_rgba) return;
            const auto it = layout.index_of.find(*source.background_rgba);
            if (it == layout.index_of.end()) return;
            png_color_16 background{};
            background.index = it->second;
            png_set_bKGD(to.png(), to.info(), &background);
        } else if (source.bit_depth == 8) {
            png_color_16 background = *source.background;
            png_set_bKGD(to.png(), to.info(), &background);
        }
    }

} // namespace

    void PngProcessor::recompress(const std::filesystem::path& input,
                                  const std::filesystem::path& output,
                                  const CompressionOptions& options) {
        Logger::log(LogLevel::Debug, "Encoding " + input.string(), kTag);

        const unique_FILE in(open_file(input, "rb"));
        if (!in) {
            throw std::runtime_error("Cannot open PNG input: " + input.string());
        }

        PngDecoder dec;
        png_init_io(dec.png(), in.get());
        png_read_info(dec.png(), dec.info());

        const SourceHeader header = read_source_header(dec);
        ImageData image = decode_rgba8(dec, header);

        if (options.stop.stop_requested()) {
            throw std::runtime_error("Interrupted");
        }

        const bool resized = resize_to_minimum_dimension(image, options.minimum_image_dimension);
        const Layout layout = choose_layout(image);

        const unique_FILE out(open_file(output, "wb"));
        if (!out) {
            throw std::runtime_error("Cannot open PNG output: " + output.string());
        }

        PngEncoder enc;
        png_init_io(enc.png(), out.get());
        encode(enc, image, layout);

        // ancillary chunks have to be registered before png_write_info
        if (options.preserve_metadata) {
            carry_color_chunks(dec, enc);
            carry_descriptive_chunks(dec, enc, resized);
            if (!resized && layout.color_type == header.color_type) {
                carry_layout_chunks(dec, enc, header, layout);
            }
        }

        png_write_info(enc.png(), enc.info());

        std::vector<png_byte> row(static_cast<size_t>(image.width) * layout.channels);
        const size_t stride = static_cast<size_t>(image.width) * 4;
        for (int y = 0; y < image.height; ++y) {
            pack_row(image.pixels.data() + static_cast<size_t>(y) * stride, image.width, layout, row);
            png_write_row(enc.png(), row.data());
        }
        png_write_end(enc.png(), nullptr);

        Logger::log(LogLevel::Debug, "Wrote " + output.string(), kTag);
    }

} // namespace mediapress
