#include "../../include/image_ops.hpp"
#include <stb/stb_image_resize2.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rehost {

RasterImage resize_rgba(const RasterImage& src, const int target_width, const int target_height) {
    if (src.empty()) throw std::runtime_error("resize: empty source raster");
    if (target_width <= 0 || target_height <= 0) throw std::runtime_error("resize: invalid target size");

    RasterImage dst;
    dst.width = target_width;
    dst.height = target_height;
    dst.pixels.resize(dst.stride() * target_height);

    if (!stbir_resize_uint8_srgb(src.pixels.data(), src.width, src.height, static_cast<int>(src.stride()),
                                 dst.pixels.data(), dst.width, dst.height, static_cast<int>(dst.stride()),
                                 STBIR_RGBA)) {
        throw std::runtime_error("stbir_resize_uint8_srgb failed");
    }
    return dst;
}

bool has_translucent_sample(const RasterImage& image, const int sample_target) {
    if (image.empty()) return false;

    const auto total = static_cast<long long>(image.width) * image.height;
    if (sample_target <= 0 || total <= sample_target) {
        for (size_t i = 3; i < image.pixels.size(); i += 4) {
            if (image.pixels[i] < 255) return true;
        }
        return false;
    }

    // grid with the image's aspect ratio and ~sample_target points
    const double per_axis = std::sqrt(static_cast<double>(sample_target));
    const double aspect = static_cast<double>(image.width) / image.height;
    const int cols = std::clamp(static_cast<int>(std::lround(per_axis * std::sqrt(aspect))), 1, image.width);
    const int rows = std::clamp(static_cast<int>(std::lround(per_axis / std::sqrt(aspect))), 1, image.height);

    for (int r = 0; r < rows; ++r) {
        const int y = static_cast<int>((static_cast<long long>(2 * r + 1) * image.height) / (2LL * rows));
        for (int c = 0; c < cols; ++c) {
            const int x = static_cast<int>((static_cast<long long>(2 * c + 1) * image.width) / (2LL * cols));
            if (image.pixels[static_cast<size_t>(y) * image.stride() + static_cast<size_t>(x) * 4 + 3] < 255) {
                return true;
            }
        }
    }
    return false;
}

} // namespace rehost
