#include "../../include/raster_decoders.hpp"
#include "../../include/logger.hpp"
#include <tiffio.h>
#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace {

// read-only in-memory stream for TIFFClientOpen
struct MemoryStream {
    std::span<const std::uint8_t> data;
    toff_t pos = 0;
};

tsize_t mem_read(thandle_t h, tdata_t buf, tsize_t size) {
    auto* s = static_cast<MemoryStream*>(h);
    if (s->pos >= s->data.size()) return 0;
    const auto n = std::min<toff_t>(static_cast<toff_t>(size), s->data.size() - s->pos);
    std::memcpy(buf, s->data.data() + s->pos, n);
    s->pos += n;
    return static_cast<tsize_t>(n);
}

tsize_t mem_write(thandle_t, tdata_t, tsize_t) {
    return 0;
}

toff_t mem_seek(thandle_t h, toff_t off, int whence) {
    auto* s = static_cast<MemoryStream*>(h);
    toff_t base = 0;
    switch (whence) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = s->pos; break;
        case SEEK_END: base = s->data.size(); break;
        default: return static_cast<toff_t>(-1);
    }
    s->pos = base + off;
    return s->pos;
}

int mem_close(thandle_t) {
    return 0;
}

toff_t mem_size(thandle_t h) {
    return static_cast<MemoryStream*>(h)->data.size();
}

int mem_map(thandle_t, tdata_t*, toff_t*) {
    return 0;
}

void mem_unmap(thandle_t, tdata_t, toff_t) {}

void tiff_log_handler(const char* module, const char* fmt, va_list ap) {
    char buf[512];
    std::vsnprintf(buf, sizeof(buf), fmt, ap);
    Logger::log(LogLevel::Debug, std::string(module ? module : "tiff") + ": " + buf, "libtiff");
}

// libtiff's handlers are process-global; route them to the logger once
void install_tiff_handlers() {
    static std::once_flag once;
    std::call_once(once, [] {
        TIFFSetErrorHandler(tiff_log_handler);
        TIFFSetWarningHandler(tiff_log_handler);
    });
}

struct TiffCloser {
    void operator()(TIFF* t) const { if (t) TIFFClose(t); }
};
using unique_TIFF = std::unique_ptr<TIFF, TiffCloser>;

unique_TIFF open_memory(MemoryStream& stream) {
    install_tiff_handlers();
    unique_TIFF tif(TIFFClientOpen("memory", "rm", &stream,
                                   mem_read, mem_write, mem_seek, mem_close,
                                   mem_size, mem_map, mem_unmap));
    if (!tif) throw std::runtime_error("TIFFClientOpen failed");
    return tif;
}

} // namespace

namespace rehost {

ImageInfo TiffDecoder::probe(const std::span<const std::uint8_t> data) const {
    MemoryStream stream{data};
    const auto tif = open_memory(stream);

    uint32_t width = 0, height = 0;
    TIFFGetField(tif.get(), TIFFTAG_IMAGEWIDTH, &width);
    TIFFGetField(tif.get(), TIFFTAG_IMAGELENGTH, &height);
    if (width == 0 || height == 0) throw std::runtime_error("TIFF has no image dimensions");

    uint16_t extra_count = 0;
    uint16_t* extra_types = nullptr;
    TIFFGetFieldDefaulted(tif.get(), TIFFTAG_EXTRASAMPLES, &extra_count, &extra_types);

    return ImageInfo{static_cast<int>(width), static_cast<int>(height), extra_count > 0};
}

RasterImage TiffDecoder::decode(const std::span<const std::uint8_t> data) const {
    MemoryStream stream{data};
    const auto tif = open_memory(stream);

    uint32_t width = 0, height = 0;
    TIFFGetField(tif.get(), TIFFTAG_IMAGEWIDTH, &width);
    TIFFGetField(tif.get(), TIFFTAG_IMAGELENGTH, &height);
    if (width == 0 || height == 0) throw std::runtime_error("TIFF has no image dimensions");

    std::vector<uint32_t> raster(static_cast<size_t>(width) * height);
    if (!TIFFReadRGBAImageOriented(tif.get(), width, height, raster.data(), ORIENTATION_TOPLEFT, 0)) {
        throw std::runtime_error("TIFFReadRGBAImageOriented failed");
    }

    RasterImage img;
    img.width = static_cast<int>(width);
    img.height = static_cast<int>(height);
    img.pixels.resize(raster.size() * 4);
    for (size_t i = 0; i < raster.size(); ++i) {
        img.pixels[i * 4 + 0] = static_cast<std::uint8_t>(TIFFGetR(raster[i]));
        img.pixels[i * 4 + 1] = static_cast<std::uint8_t>(TIFFGetG(raster[i]));
        img.pixels[i * 4 + 2] = static_cast<std::uint8_t>(TIFFGetB(raster[i]));
        img.pixels[i * 4 + 3] = static_cast<std::uint8_t>(TIFFGetA(raster[i]));
    }
    return img;
}

} // namespace rehost
