#include "../../include/raster_decoders.hpp"
#include "../../include/logger.hpp"
#include <stb/stb_image.h>
#include <climits>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace {

// stbi_failure_reason() is a process-wide string
std::mutex stb_failure_mutex;

struct StbiDeleter {
    void operator()(stbi_uc* p) const { if (p) stbi_image_free(p); }
};

int checked_length(const std::span<const std::uint8_t> data) {
    if (data.empty() || data.size() > static_cast<size_t>(INT_MAX)) {
        throw std::runtime_error("GIF buffer size out of range");
    }
    return static_cast<int>(data.size());
}

} // namespace

namespace rehost {

ImageInfo GifDecoder::probe(const std::span<const std::uint8_t> data) const {
    int w = 0, h = 0, comp = 0;
    std::lock_guard lock(stb_failure_mutex);
    if (!stbi_info_from_memory(data.data(), checked_length(data), &w, &h, &comp)) {
        throw std::runtime_error(std::string("GIF header: ") + stbi_failure_reason());
    }
    return ImageInfo{w, h, true};
}

RasterImage GifDecoder::decode(const std::span<const std::uint8_t> data) const {
    int w = 0, h = 0, comp = 0;
    std::unique_ptr<stbi_uc, StbiDeleter> pixels;
    {
        std::lock_guard lock(stb_failure_mutex);
        pixels.reset(stbi_load_from_memory(data.data(), checked_length(data), &w, &h, &comp, 4));
        if (!pixels) {
            throw std::runtime_error(std::string("GIF decode: ") + stbi_failure_reason());
        }
    }

    RasterImage img;
    img.width = w;
    img.height = h;
    img.pixels.resize(img.stride() * h);
    std::memcpy(img.pixels.data(), pixels.get(), img.pixels.size());
    return img;
}

} // namespace rehost
