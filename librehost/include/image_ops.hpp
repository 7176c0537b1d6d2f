#ifndef REHOST_IMAGE_OPS_HPP
#define REHOST_IMAGE_OPS_HPP

#include "types.hpp"

namespace rehost {

    /**
     * @brief Resamples an RGBA raster (sRGB-aware, alpha-weighted) with stb_image_resize2.
     * @throws std::runtime_error on invalid target dimensions or resize failure.
     */
    RasterImage resize_rgba(const RasterImage& src, int target_width, int target_height);

    /**
     * @brief Samples a uniform grid of roughly @p sample_target pixels and
     * reports whether any has alpha below 255.
     *
     * Rasters with fewer pixels than the target are scanned exhaustively.
     */
    [[nodiscard]] bool has_translucent_sample(const RasterImage& image, int sample_target);

} // namespace rehost

#endif // REHOST_IMAGE_OPS_HPP
