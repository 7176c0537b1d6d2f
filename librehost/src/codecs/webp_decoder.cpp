#include "../../include/raster_decoders.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace {

struct WebPBufferDeleter {
    void operator()(uint8_t* p) const { if (p) WebPFree(p); }
};

} // namespace

namespace rehost {

ImageInfo WebpDecoder::probe(const std::span<const std::uint8_t> data) const {
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data.data(), data.size(), &features) != VP8_STATUS_OK) {
        throw std::runtime_error("WebPGetFeatures failed");
    }
    return ImageInfo{features.width, features.height, features.has_alpha != 0};
}

RasterImage WebpDecoder::decode(const std::span<const std::uint8_t> data) const {
    int width = 0, height = 0;
    const std::unique_ptr<uint8_t, WebPBufferDeleter> decoded(
        WebPDecodeRGBA(data.data(), data.size(), &width, &height));
    if (!decoded) {
        throw std::runtime_error("WebPDecodeRGBA failed");
    }

    RasterImage img;
    img.width = width;
    img.height = height;
    img.pixels.resize(img.stride() * height);
    std::memcpy(img.pixels.data(), decoded.get(), img.pixels.size());
    return img;
}

} // namespace rehost
