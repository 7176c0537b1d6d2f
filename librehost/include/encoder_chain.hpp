/**
 * @file encoder_chain.hpp
 * @brief Resize + encode with fallbacks, producing the final stored bytes.
 */

#ifndef REHOST_ENCODER_CHAIN_HPP
#define REHOST_ENCODER_CHAIN_HPP

#include "encoder_registry.hpp"
#include "types.hpp"
#include <optional>
#include <span>

namespace rehost {

    /**
     * @brief Applies a ProcessingDecision to image bytes.
     *
     * @details
     * - Pass-through: the input is decoded once to confirm it is valid and
     *   returned unchanged.
     * - Otherwise the image is decoded and resized when the target size
     *   differs from the source.
     * - JPEG: the registry's JPEG encoders are tried in order; if all fail
     *   the pre-encode bytes (the input when not resized, else a lossless
     *   PNG of the resized raster) are returned, provided they are JPEG or PNG.
     * - PNG: the first working PNG writer produces the bytes, then every
     *   optimizer is tried; an optimizer result is kept only when it is
     *   non-empty and smaller.
     *
     * Sub-failures are absorbed and logged; only the total inability to
     * produce valid image bytes raises RehostError(EncodingFailed).
     */
    class EncoderChain {
    public:
        explicit EncoderChain(const EncoderRegistry& registry) : registry_(registry) {}

        /**
         * @param data Original image bytes.
         * @param decision Output of FormatDecider::decide for the same bytes.
         * @param predecoded Raster already decoded by the decider, if any.
         */
        [[nodiscard]] EncodedImage encode(std::span<const std::uint8_t> data,
                                          const ProcessingDecision& decision,
                                          std::optional<RasterImage> predecoded = std::nullopt) const;

    private:
        EncodedImage encode_jpeg(std::span<const std::uint8_t> data,
                                 const ProcessingDecision& decision,
                                 const RasterImage& raster) const;
        EncodedImage encode_png(const RasterImage& raster) const;

        const EncoderRegistry& registry_;
    };

} // namespace rehost

#endif // REHOST_ENCODER_CHAIN_HPP
