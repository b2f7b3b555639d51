#include "../../include/jpeg_processor.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_resize.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <cstring>
#include <jpeglib.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace mediapress {
namespace {

// libjpeg error manager with room for the formatted message
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief Replaces libjpeg's exit() on fatal errors; the throw unwinds to the
 * JpegReader/JpegWriter that own the codec state.
 */
[[noreturn]] void throw_on_jpeg_error(const j_common_ptr cinfo) {
    auto* mgr = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, mgr->msg);
    Logger::log(LogLevel::Warning, std::string("libjpeg error: ") + mgr->msg, "jpeg_processor");
    throw std::runtime_error(std::string("libjpeg: ") + mgr->msg);
}

/**
 * @brief libjpeg warnings (corrupt data that could be recovered) go to the debug log.
 */
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, "jpeg_processor");
}

/**
 * @brief RAII wrapper for a libjpeg decompressor.
 */
struct JpegReader {
    jpeg_decompress_struct info{};
    JpegErrorMgr err{};

    JpegReader() {
        info.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = throw_on_jpeg_error;
        err.pub.output_message = jpeg_output_message_log;
        jpeg_create_decompress(&info);
    }
    ~JpegReader() { jpeg_destroy_decompress(&info); }

    JpegReader(const JpegReader&) = delete;
    JpegReader& operator=(const JpegReader&) = delete;
};

/**
 * @brief RAII wrapper for a libjpeg compressor.
 */
struct JpegWriter {
    jpeg_compress_struct info{};
    JpegErrorMgr err{};

    JpegWriter() {
        info.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = throw_on_jpeg_error;
        err.pub.output_message = jpeg_output_message_log;
        jpeg_create_compress(&info);
    }
    ~JpegWriter() { jpeg_destroy_compress(&info); }

    JpegWriter(const JpegWriter&) = delete;
    JpegWriter& operator=(const JpegWriter&) = delete;
};

struct MarkerData {
    int marker;
    std::vector<JOCTET> data;
};

bool starts_with_bytes(const std::vector<JOCTET>& data, const char* tag) {
    const size_t len = std::strlen(tag);
    return data.size() >= len && std::memcmp(data.data(), tag, len) == 0;
}

/**
 * @brief Collects the APPn and COM markers saved while reading the header.
 *
 * JFIF APP0 and Adobe APP14 are dropped: the encoder writes its own JFIF
 * header, and an Adobe transform flag copied from the source would
 * contradict the colour space of the new stream.
 */
std::vector<MarkerData> collect_markers(const j_decompress_ptr srcinfo) {
    std::vector<MarkerData> markers;
    for (jpeg_saved_marker_ptr m = srcinfo->marker_list; m; m = m->next) {
        if (!m->data || m->data_length == 0) continue;
        MarkerData md{m->marker, {m->data, m->data + m->data_length}};
        if (md.marker == JPEG_APP0 && starts_with_bytes(md.data, "JFIF")) continue;
        if (md.marker == JPEG_APP0 + 14 && starts_with_bytes(md.data, "Adobe")) continue;
        markers.push_back(std::move(md));
    }
    return markers;
}

ImageData decode_jpeg(const std::filesystem::path& input,
                      const bool keep_markers,
                      std::vector<MarkerData>& markers) {
    unique_FILE infile(open_file(input, "rb"));
    if (!infile) {
        throw std::runtime_error("Cannot open JPEG input: " + input.string());
    }

    JpegReader rd;
    jpeg_stdio_src(&rd.info, infile.get());
    if (keep_markers) {
        for (int m = 0; m < 16; ++m) {
            jpeg_save_markers(&rd.info, JPEG_APP0 + m, 0xFFFF);
        }
        jpeg_save_markers(&rd.info, JPEG_COM, 0xFFFF);
    }

    if (jpeg_read_header(&rd.info, TRUE) != JPEG_HEADER_OK) {
        throw std::runtime_error("Invalid JPEG header");
    }
    if (rd.info.jpeg_color_space == JCS_CMYK || rd.info.jpeg_color_space == JCS_YCCK) {
        throw std::runtime_error("CMYK/YCCK JPEG is not supported");
    }
    if (rd.info.num_components != 1) {
        rd.info.out_color_space = JCS_RGB;
    }

    Logger::log(LogLevel::Debug,
                std::string("JPEG ") + (rd.info.progressive_mode ? "progressive" : "baseline") +
                " " + std::to_string(rd.info.image_width) + "x" + std::to_string(rd.info.image_height),
                "jpeg_processor");

    jpeg_start_decompress(&rd.info);

    ImageData image;
    image.width = static_cast<int>(rd.info.output_width);
    image.height = static_cast<int>(rd.info.output_height);
    image.channels = static_cast<int>(rd.info.output_components);
    image.pixels.resize(static_cast<size_t>(image.width) * image.height * image.channels);

    const size_t row_stride = static_cast<size_t>(image.width) * image.channels;
    while (rd.info.output_scanline < rd.info.output_height) {
        JSAMPROW row = image.pixels.data() + rd.info.output_scanline * row_stride;
        jpeg_read_scanlines(&rd.info, &row, 1);
    }

    if (keep_markers) {
        markers = collect_markers(&rd.info);
    }
    jpeg_finish_decompress(&rd.info);
    return image;
}

void encode_jpeg(const ImageData& image,
                 const std::filesystem::path& output,
                 const CompressionOptions& options,
                 const std::vector<MarkerData>& markers) {
    const auto [h_samp, v_samp] = luma_sampling_factors(options.jpeg_subsampling);

    unique_FILE outfile(open_file(output, "wb"));
    if (!outfile) {
        throw std::runtime_error("Cannot open JPEG output: " + output.string());
    }

    JpegWriter wr;
    jpeg_stdio_dest(&wr.info, outfile.get());

    wr.info.image_width = static_cast<JDIMENSION>(image.width);
    wr.info.image_height = static_cast<JDIMENSION>(image.height);
    wr.info.input_components = image.channels;
    wr.info.in_color_space = image.channels == 1 ? JCS_GRAYSCALE : JCS_RGB;

    jpeg_set_defaults(&wr.info);
    jpeg_set_quality(&wr.info, options.jpeg_quality, TRUE);
    wr.info.optimize_coding = TRUE;
    if (image.channels != 1) {
        wr.info.comp_info[0].h_samp_factor = h_samp;
        wr.info.comp_info[0].v_samp_factor = v_samp;
        for (int c = 1; c < wr.info.num_components; ++c) {
            wr.info.comp_info[c].h_samp_factor = 1;
            wr.info.comp_info[c].v_samp_factor = 1;
        }
    }

    jpeg_start_compress(&wr.info, TRUE);

    // markers go right after SOI/JFIF, before the first scan
    for (const auto& m : markers) {
        jpeg_write_marker(&wr.info, m.marker, m.data.data(), static_cast<unsigned int>(m.data.size()));
    }

    const size_t row_stride = static_cast<size_t>(image.width) * image.channels;
    while (wr.info.next_scanline < wr.info.image_height) {
        auto row = const_cast<JSAMPROW>(image.pixels.data() + wr.info.next_scanline * row_stride);
        jpeg_write_scanlines(&wr.info, &row, 1);
    }
    jpeg_finish_compress(&wr.info);

    if (std::fflush(outfile.get()) != 0) {
        throw std::runtime_error("fflush failed for " + output.string());
    }
}

} // namespace

std::pair<int, int> luma_sampling_factors(const std::string_view subsampling) {
    if (subsampling == "4:4:4") return {1, 1};
    if (subsampling == "4:2:2") return {2, 1};
    if (subsampling == "4:2:0") return {2, 2};
    throw std::invalid_argument("Unsupported JPEG subsampling: " + std::string(subsampling));
}

void JpegProcessor::recompress(const std::filesystem::path& input,
                               const std::filesystem::path& output,
                               const CompressionOptions& options) {
    Logger::log(LogLevel::Debug, "Encoding " + input.string(), "jpeg_processor");

    std::vector<MarkerData> markers;
    ImageData image = decode_jpeg(input, options.preserve_metadata, markers);

    if (options.stop.stop_requested()) {
        throw std::runtime_error("Interrupted");
    }

    resize_to_minimum_dimension(image, options.minimum_image_dimension);
    encode_jpeg(image, output, options, markers);

    Logger::log(LogLevel::Debug, "Wrote " + output.string(), "jpeg_processor");
}

} // namespace mediapress
