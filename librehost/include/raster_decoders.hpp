/**
 * @file raster_decoders.hpp
 * @brief Decoders for the input-only containers: WebP, TIFF and GIF.
 *
 * None of these formats is ever produced; their images always leave the
 * pipeline as JPEG or PNG.
 */

#ifndef REHOST_RASTER_DECODERS_HPP
#define REHOST_RASTER_DECODERS_HPP

#include "image_codec.hpp"
#include <array>

namespace rehost {

    /**
     * @brief libwebp decoder (lossy, lossless and animated-first-frame).
     */
    class WebpDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "WebpDecoder"; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/webp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] ImageInfo probe(std::span<const std::uint8_t> data) const override;
        [[nodiscard]] RasterImage decode(std::span<const std::uint8_t> data) const override;
    };

    /**
     * @brief libtiff decoder reading the first directory from memory.
     */
    class TiffDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "TiffDecoder"; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/tiff" };
            return {kMimes.data(), kMimes.size()};
        }

        /**
         * @brief Alpha is declared by an ExtraSamples tag.
         */
        [[nodiscard]] ImageInfo probe(std::span<const std::uint8_t> data) const override;
        [[nodiscard]] RasterImage decode(std::span<const std::uint8_t> data) const override;
    };

    /**
     * @brief stb_image GIF decoder (first frame only).
     */
    class GifDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "GifDecoder"; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/gif" };
            return {kMimes.data(), kMimes.size()};
        }

        /**
         * @brief GIF can always carry a transparent palette index, so alpha
         * is reported as declared and settled by sampling.
         */
        [[nodiscard]] ImageInfo probe(std::span<const std::uint8_t> data) const override;
        [[nodiscard]] RasterImage decode(std::span<const std::uint8_t> data) const override;
    };

} // namespace rehost

#endif // REHOST_RASTER_DECODERS_HPP
