#ifndef REHOST_ZOPFLIPNG_OPTIMIZER_HPP
#define REHOST_ZOPFLIPNG_OPTIMIZER_HPP

#include "image_codec.hpp"

namespace rehost {

    /**
     * @brief Lossless PNG optimizer backed by ZopfliPNG.
     *
     * Tries several filter strategies and re-deflates with Zopfli. Pixel data
     * is never altered (no lossy transparency or 8-bit reduction) and all
     * ancillary chunks are dropped.
     */
    class ZopfliPngOptimizer final : public IPngOptimizer {
    public:
        ZopfliPngOptimizer(int iterations, int iterations_large)
            : iterations_(iterations), iterations_large_(iterations_large) {}

        [[nodiscard]] std::string_view get_name() const noexcept override { return "ZopfliPngOptimizer"; }

        [[nodiscard]] Bytes optimize(std::span<const std::uint8_t> png) const override;

    private:
        int iterations_;
        int iterations_large_;
    };

} // namespace rehost

#endif // REHOST_ZOPFLIPNG_OPTIMIZER_HPP
