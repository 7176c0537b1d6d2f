#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

// corrupt-data warnings are not fatal, keep them out of the default log
void jpeg_output_message_quiet(j_common_ptr) {}

/**
 * @brief RAII owner of a jpeg_decompress_struct.
 */
struct JpegDecompress {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr err{};

    JpegDecompress() {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        err.pub.output_message = jpeg_output_message_quiet;
        jpeg_create_decompress(&cinfo);
    }
    ~JpegDecompress() { jpeg_destroy_decompress(&cinfo); }
    JpegDecompress(const JpegDecompress&) = delete;
    JpegDecompress& operator=(const JpegDecompress&) = delete;
};

/**
 * @brief RAII owner of a jpeg_compress_struct and its memory destination.
 */
struct JpegCompress {
    jpeg_compress_struct cinfo{};
    JpegErrorMgr err{};
    unsigned char* out_buf = nullptr;
    unsigned long out_size = 0;

    JpegCompress() {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        jpeg_create_compress(&cinfo);
    }
    ~JpegCompress() {
        jpeg_destroy_compress(&cinfo);
        std::free(out_buf);
    }
    JpegCompress(const JpegCompress&) = delete;
    JpegCompress& operator=(const JpegCompress&) = delete;
};

void read_header(JpegDecompress& d, const std::span<const std::uint8_t> data) {
    if (data.empty()) throw std::runtime_error("empty JPEG buffer");
    jpeg_mem_src(&d.cinfo, const_cast<unsigned char*>(data.data()), static_cast<unsigned long>(data.size()));
    if (jpeg_read_header(&d.cinfo, TRUE) != JPEG_HEADER_OK) {
        throw std::runtime_error("Invalid JPEG header");
    }
}

inline std::uint8_t blend_over_white(const std::uint8_t c, const std::uint8_t a) {
    return static_cast<std::uint8_t>((c * a + 255 * (255 - a) + 127) / 255);
}

} // namespace

namespace rehost {

ImageInfo JpegDecoder::probe(const std::span<const std::uint8_t> data) const {
    JpegDecompress d;
    read_header(d, data);
    return ImageInfo{static_cast<int>(d.cinfo.image_width),
                     static_cast<int>(d.cinfo.image_height),
                     false};
}

RasterImage JpegDecoder::decode(const std::span<const std::uint8_t> data) const {
    JpegDecompress d;
    read_header(d, data);

    const bool cmyk = d.cinfo.jpeg_color_space == JCS_CMYK || d.cinfo.jpeg_color_space == JCS_YCCK;
    if (cmyk) {
        d.cinfo.out_color_space = JCS_CMYK;
    } else if (d.cinfo.jpeg_color_space == JCS_GRAYSCALE) {
        d.cinfo.out_color_space = JCS_GRAYSCALE;
    } else {
        d.cinfo.out_color_space = JCS_RGB;
    }

    jpeg_start_decompress(&d.cinfo);

    RasterImage img;
    img.width = static_cast<int>(d.cinfo.output_width);
    img.height = static_cast<int>(d.cinfo.output_height);
    const int channels = d.cinfo.output_components;
    // Adobe writes inverted CMYK
    const bool inverted = cmyk && d.cinfo.saw_Adobe_marker;

    img.pixels.resize(img.stride() * img.height);
    std::vector<unsigned char> row(static_cast<size_t>(img.width) * channels);

    while (d.cinfo.output_scanline < d.cinfo.output_height) {
        unsigned char* row_ptr = row.data();
        const auto y = d.cinfo.output_scanline;
        jpeg_read_scanlines(&d.cinfo, &row_ptr, 1);

        std::uint8_t* dst = img.pixels.data() + static_cast<size_t>(y) * img.stride();
        const unsigned char* src = row.data();
        for (int x = 0; x < img.width; ++x, dst += 4, src += channels) {
            if (channels == 1) {
                dst[0] = dst[1] = dst[2] = src[0];
            } else if (channels == 4) {
                const int c = inverted ? src[0] : 255 - src[0];
                const int m = inverted ? src[1] : 255 - src[1];
                const int yy = inverted ? src[2] : 255 - src[2];
                const int k = inverted ? src[3] : 255 - src[3];
                dst[0] = static_cast<std::uint8_t>(c * k / 255);
                dst[1] = static_cast<std::uint8_t>(m * k / 255);
                dst[2] = static_cast<std::uint8_t>(yy * k / 255);
            } else {
                dst[0] = src[0];
                dst[1] = src[1];
                dst[2] = src[2];
            }
            dst[3] = 0xFF;
        }
    }

    jpeg_finish_decompress(&d.cinfo);
    return img;
}

JpegEncoder::JpegEncoder(std::string name, const int quality, const bool progressive, const bool chroma_subsampling)
    : name_(std::move(name)),
      quality_(std::clamp(quality, 1, 100)),
      progressive_(progressive),
      chroma_subsampling_(chroma_subsampling) {}

Bytes JpegEncoder::encode(const RasterImage& image) const {
    if (image.empty()) throw std::runtime_error("JpegEncoder: empty raster");

    JpegCompress c;
    jpeg_mem_dest(&c.cinfo, &c.out_buf, &c.out_size);

    c.cinfo.image_width = static_cast<JDIMENSION>(image.width);
    c.cinfo.image_height = static_cast<JDIMENSION>(image.height);
    c.cinfo.input_components = 3;
    c.cinfo.in_color_space = JCS_RGB;

    jpeg_set_defaults(&c.cinfo);
    jpeg_set_quality(&c.cinfo, quality_, TRUE);
    c.cinfo.optimize_coding = TRUE;

    if (progressive_) {
        jpeg_simple_progression(&c.cinfo);
    } else {
        // mozjpeg installs a progressive script in jpeg_set_defaults
        c.cinfo.num_scans = 0;
        c.cinfo.scan_info = nullptr;
    }

    const int luma_factor = chroma_subsampling_ ? 2 : 1;
    c.cinfo.comp_info[0].h_samp_factor = luma_factor;
    c.cinfo.comp_info[0].v_samp_factor = luma_factor;
    for (int i = 1; i < 3; ++i) {
        c.cinfo.comp_info[i].h_samp_factor = 1;
        c.cinfo.comp_info[i].v_samp_factor = 1;
    }

    jpeg_start_compress(&c.cinfo, TRUE);

    std::vector<unsigned char> row(static_cast<size_t>(image.width) * 3);
    while (c.cinfo.next_scanline < c.cinfo.image_height) {
        const std::uint8_t* src = image.pixels.data() + static_cast<size_t>(c.cinfo.next_scanline) * image.stride();
        for (int x = 0; x < image.width; ++x) {
            const std::uint8_t a = src[x * 4 + 3];
            row[x * 3 + 0] = blend_over_white(src[x * 4 + 0], a);
            row[x * 3 + 1] = blend_over_white(src[x * 4 + 1], a);
            row[x * 3 + 2] = blend_over_white(src[x * 4 + 2], a);
        }
        JSAMPROW row_ptr = row.data();
        jpeg_write_scanlines(&c.cinfo, &row_ptr, 1);
    }

    jpeg_finish_compress(&c.cinfo);

    if (Logger::enabled(LogLevel::Debug)) {
        Logger::log(LogLevel::Debug,
                    name_ + ": " + std::to_string(image.width) + "x" + std::to_string(image.height) +
                    " q" + std::to_string(quality_) + " -> " + std::to_string(c.out_size) + " bytes",
                    "jpeg_encoder");
    }

    return Bytes(c.out_buf, c.out_buf + c.out_size);
}

} // namespace rehost
