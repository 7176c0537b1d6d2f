#include "../../include/png_codec.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <cstdint>
#include <cstring>
#include <map>
#include <stdexcept>
#include <vector>

namespace {

/**
 * @brief libpng error handler that throws a C++ exception.
 */
void png_error_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
    throw std::runtime_error(msg);
}

void png_warning_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Debug, std::string("libpng warning: ") + msg, "libpng");
}

/**
 * @brief RAII wrapper for libpng read structs.
 */
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    PngRead() {
        png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
        if (!png) throw std::runtime_error("png_create_read_struct failed");
        info = png_create_info_struct(png);
        if (!info) {
            png_destroy_read_struct(&png, nullptr, nullptr);
            throw std::runtime_error("png_create_info_struct failed");
        }
    }
    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }
    PngRead(const PngRead&) = delete;
    PngRead& operator=(const PngRead&) = delete;
};

/**
 * @brief RAII wrapper for libpng write structs.
 */
struct PngWrite {
    png_structp png = nullptr;
    png_infop info = nullptr;

    PngWrite() {
        png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
        if (!png) throw std::runtime_error("png_create_write_struct failed");
        info = png_create_info_struct(png);
        if (!info) {
            png_destroy_write_struct(&png, nullptr);
            throw std::runtime_error("png_create_info_struct failed");
        }
    }
    ~PngWrite() {
        if (png || info) png_destroy_write_struct(&png, &info);
    }
    PngWrite(const PngWrite&) = delete;
    PngWrite& operator=(const PngWrite&) = delete;
};

// memory source for png_set_read_fn
struct MemoryReader {
    std::span<const std::uint8_t> data;
    std::size_t offset = 0;
};

void read_from_memory(png_structp png, png_bytep out, const png_size_t length) {
    auto* src = static_cast<MemoryReader*>(png_get_io_ptr(png));
    if (src->offset + length > src->data.size()) {
        png_error(png, "read past end of PNG buffer");
    }
    std::memcpy(out, src->data.data() + src->offset, length);
    src->offset += length;
}

void write_to_vector(png_structp png, png_bytep in, const png_size_t length) {
    auto* dst = static_cast<rehost::Bytes*>(png_get_io_ptr(png));
    dst->insert(dst->end(), in, in + length);
}

void flush_noop(png_structp) {}

void begin_read(PngRead& rd, MemoryReader& src) {
    if (src.data.size() < 8 || png_sig_cmp(src.data.data(), 0, 8) != 0) {
        throw std::runtime_error("not a PNG signature");
    }
    png_set_read_fn(rd.png, &src, read_from_memory);
    png_read_info(rd.png, rd.info);
}

inline uint32_t pack_rgba(const unsigned char r, const unsigned char g, const unsigned char b, const unsigned char a) {
    return (static_cast<uint32_t>(r) << 24) |
           (static_cast<uint32_t>(g) << 16) |
           (static_cast<uint32_t>(b) << 8)  |
           (static_cast<uint32_t>(a));
}

} // namespace

namespace rehost {

ImageInfo PngDecoder::probe(const std::span<const std::uint8_t> data) const {
    PngRead rd;
    MemoryReader src{data};
    begin_read(rd, src);

    png_uint_32 width = 0, height = 0;
    int bit_depth = 0, color_type = 0;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    const bool alpha = (color_type & PNG_COLOR_MASK_ALPHA) != 0 ||
                       png_get_valid(rd.png, rd.info, PNG_INFO_tRNS) != 0;
    return ImageInfo{static_cast<int>(width), static_cast<int>(height), alpha};
}

RasterImage PngDecoder::decode(const std::span<const std::uint8_t> data) const {
    PngRead rd;
    MemoryReader src{data};
    begin_read(rd, src);

    png_uint_32 width = 0, height = 0;
    int bit_depth = 0, color_type = 0;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    if (bit_depth == 16) png_set_strip_16(rd.png);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
    if (png_get_valid(rd.png, rd.info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(rd.png);
    if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(rd.png, 0xFF, PNG_FILLER_AFTER);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(rd.png);
    png_set_interlace_handling(rd.png);

    png_read_update_info(rd.png, rd.info);

    const size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
    if (rowbytes != static_cast<size_t>(width) * 4) {
        throw std::runtime_error("Rowbytes mismatch, expected RGBA8");
    }

    RasterImage img;
    img.width = static_cast<int>(width);
    img.height = static_cast<int>(height);
    img.pixels.resize(rowbytes * height);

    std::vector<png_bytep> row_pointers(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        row_pointers[y] = img.pixels.data() + y * rowbytes;
    }
    png_read_image(rd.png, row_pointers.data());
    png_read_end(rd.png, nullptr);
    return img;
}

Bytes PngEncoder::encode(const RasterImage& image) const {
    if (image.empty()) throw std::runtime_error("PngEncoder: empty raster");

    const auto width = static_cast<png_uint_32>(image.width);
    const auto height = static_cast<png_uint_32>(image.height);

    // analyse the raster to pick the smallest lossless colour type
    bool all_gray = true;
    bool all_opaque = true;
    bool can_use_palette = true;
    std::map<uint32_t, uint8_t> color_to_index;
    std::vector<png_color> palette;
    std::vector<png_byte> transparency;

    const std::uint8_t* p = image.pixels.data();
    const std::size_t count = static_cast<std::size_t>(width) * height;
    for (std::size_t i = 0; i < count; ++i, p += 4) {
        const unsigned char r = p[0], g = p[1], b = p[2], a = p[3];
        if (r != g || g != b) all_gray = false;
        if (a != 0xFF) all_opaque = false;

        if (can_use_palette) {
            const uint32_t color = pack_rgba(r, g, b, a);
            if (!color_to_index.contains(color)) {
                if (color_to_index.size() >= 256) {
                    can_use_palette = false;
                } else {
                    color_to_index[color] = static_cast<uint8_t>(color_to_index.size());
                    palette.push_back({r, g, b});
                    transparency.push_back(a);
                }
            }
        }
    }

    int out_color_type;
    if (can_use_palette) {
        out_color_type = PNG_COLOR_TYPE_PALETTE;
    } else if (all_gray && all_opaque) {
        out_color_type = PNG_COLOR_TYPE_GRAY;
    } else if (all_gray) {
        out_color_type = PNG_COLOR_TYPE_GA;
    } else if (all_opaque) {
        out_color_type = PNG_COLOR_TYPE_RGB;
    } else {
        out_color_type = PNG_COLOR_TYPE_RGBA;
    }

    Bytes out;
    out.reserve(image.pixels.size() / 2);

    PngWrite wr;
    png_set_write_fn(wr.png, &out, write_to_vector, flush_noop);

    png_set_compression_level(wr.png, 9);
    png_set_compression_mem_level(wr.png, 9);
    png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
    png_set_filter(wr.png, PNG_FILTER_TYPE_BASE,
                   out_color_type == PNG_COLOR_TYPE_PALETTE ? PNG_FILTER_NONE : PNG_ALL_FILTERS);

    png_set_IHDR(wr.png, wr.info, width, height, 8, out_color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

    if (out_color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_PLTE(wr.png, wr.info, palette.data(), static_cast<int>(palette.size()));
        if (!all_opaque) {
            png_set_tRNS(wr.png, wr.info, transparency.data(), static_cast<int>(transparency.size()), nullptr);
        }
    }

    png_write_info(wr.png, wr.info);

    const png_size_t channels = png_get_channels(wr.png, wr.info);
    std::vector<unsigned char> out_row(static_cast<size_t>(width) * channels);
    png_bytep row_ptr = out_row.data();

    p = image.pixels.data();
    for (png_uint_32 y = 0; y < height; ++y) {
        const std::uint8_t* src = p;
        unsigned char* dst = out_row.data();

        switch (out_color_type) {
            case PNG_COLOR_TYPE_PALETTE:
                for (png_uint_32 x = 0; x < width; ++x, src += 4) {
                    *dst++ = color_to_index.at(pack_rgba(src[0], src[1], src[2], src[3]));
                }
                break;
            case PNG_COLOR_TYPE_GRAY:
                for (png_uint_32 x = 0; x < width; ++x, src += 4) {
                    *dst++ = src[0];
                }
                break;
            case PNG_COLOR_TYPE_GA:
                for (png_uint_32 x = 0; x < width; ++x, src += 4) {
                    *dst++ = src[0];
                    *dst++ = src[3];
                }
                break;
            case PNG_COLOR_TYPE_RGB:
                for (png_uint_32 x = 0; x < width; ++x, src += 4) {
                    *dst++ = src[0];
                    *dst++ = src[1];
                    *dst++ = src[2];
                }
                break;
            default:
                std::memcpy(dst, src, static_cast<size_t>(width) * 4);
                break;
        }

        png_write_rows(wr.png, &row_ptr, 1);
        p += image.stride();
    }

    png_write_end(wr.png, nullptr);

    Logger::log(LogLevel::Debug,
                "PNG written: " + std::to_string(width) + "x" + std::to_string(height) +
                " color_type=" + std::to_string(out_color_type) + " -> " + std::to_string(out.size()) + " bytes",
                "png_encoder");
    return out;
}

} // namespace rehost
