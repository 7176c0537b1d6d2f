#ifndef REHOST_TEST_IMAGES_HPP
#define REHOST_TEST_IMAGES_HPP

#include "../../librehost/include/jpeg_codec.hpp"
#include "../../librehost/include/png_codec.hpp"
#include "../../librehost/include/types.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <zlib.h>

// Rasters and encoded images synthesized with the project's own encoders.

inline rehost::RasterImage solid_raster(const int w, const int h,
                                        const std::uint8_t r, const std::uint8_t g, const std::uint8_t b,
                                        const std::uint8_t a = 255) {
    rehost::RasterImage img;
    img.width = w;
    img.height = h;
    img.pixels.resize(static_cast<std::size_t>(w) * h * 4);
    for (std::size_t i = 0; i < img.pixels.size(); i += 4) {
        img.pixels[i] = r;
        img.pixels[i + 1] = g;
        img.pixels[i + 2] = b;
        img.pixels[i + 3] = a;
    }
    return img;
}

// Opaque raster with a diagonal gradient, so encoders produce non-trivial output
inline rehost::RasterImage gradient_raster(const int w, const int h) {
    rehost::RasterImage img = solid_raster(w, h, 0, 0, 0);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const std::size_t i = (static_cast<std::size_t>(y) * w + x) * 4;
            img.pixels[i] = static_cast<std::uint8_t>(x * 255 / (w > 1 ? w - 1 : 1));
            img.pixels[i + 1] = static_cast<std::uint8_t>(y * 255 / (h > 1 ? h - 1 : 1));
            img.pixels[i + 2] = static_cast<std::uint8_t>((x + y) & 0xFF);
        }
    }
    return img;
}

inline rehost::Bytes png_bytes(const rehost::RasterImage& img) {
    return rehost::PngEncoder().encode(img);
}

// A valid 1x1 PNG whose header claims @p w x @p h; only the pixel data is missing
inline rehost::Bytes png_with_declared_size(const std::uint32_t w, const std::uint32_t h) {
    rehost::Bytes png = png_bytes(solid_raster(1, 1, 0, 0, 0));
    const auto put_be32 = [&png](const std::size_t at, const std::uint32_t v) {
        png[at] = static_cast<std::uint8_t>(v >> 24);
        png[at + 1] = static_cast<std::uint8_t>(v >> 16);
        png[at + 2] = static_cast<std::uint8_t>(v >> 8);
        png[at + 3] = static_cast<std::uint8_t>(v);
    };
    // IHDR: length at 8, type at 12, width at 16, height at 20, CRC at 29
    put_be32(16, w);
    put_be32(20, h);
    put_be32(29, static_cast<std::uint32_t>(crc32(0L, png.data() + 12, 17)));
    return png;
}

inline rehost::Bytes jpeg_bytes(const rehost::RasterImage& img, const int quality = 90) {
    return rehost::JpegEncoder("TestJpegEncoder", quality, false, false).encode(img);
}

inline std::string base64_encode(const rehost::Bytes& data) {
    static constexpr std::string_view kAlphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    std::size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        const std::uint32_t v = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out += kAlphabet[(v >> 18) & 63];
        out += kAlphabet[(v >> 12) & 63];
        out += kAlphabet[(v >> 6) & 63];
        out += kAlphabet[v & 63];
    }
    if (const std::size_t rest = data.size() - i; rest > 0) {
        std::uint32_t v = data[i] << 16;
        if (rest == 2) v |= data[i + 1] << 8;
        out += kAlphabet[(v >> 18) & 63];
        out += kAlphabet[(v >> 12) & 63];
        out += rest == 2 ? kAlphabet[(v >> 6) & 63] : '=';
        out += '=';
    }
    return out;
}

inline std::string data_uri(const std::string& mime, const rehost::Bytes& data) {
    return "data:" + mime + ";base64," + base64_encode(data);
}

#endif // REHOST_TEST_IMAGES_HPP
