/**
 * @file png_codec.hpp
 * @brief libpng backed PNG decoder and encoder.
 */

#ifndef REHOST_PNG_CODEC_HPP
#define REHOST_PNG_CODEC_HPP

#include "image_codec.hpp"
#include <array>

namespace rehost {

    /**
     * @brief Decodes any PNG colour type / bit depth to RGBA8.
     */
    class PngDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngDecoder";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/png" };
            return {kMimes.data(), kMimes.size()};
        }

        /**
         * @brief Reads IHDR. Alpha is declared by an alpha colour type or a tRNS chunk.
         */
        [[nodiscard]] ImageInfo probe(std::span<const std::uint8_t> data) const override;

        [[nodiscard]] RasterImage decode(std::span<const std::uint8_t> data) const override;
    };

    /**
     * @brief Lossless PNG writer choosing the smallest colour type.
     *
     * @details The raster is analysed once: up to 256 distinct colours give a
     * palette image (with tRNS only when some entry is translucent), otherwise
     * grey, grey+alpha, RGB or RGBA is chosen. Deflate runs at level 9 with
     * adaptive filtering. No ancillary chunks are written.
     */
    class PngEncoder final : public IImageEncoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "PngEncoder"; }
        [[nodiscard]] OutputFormat get_output_format() const noexcept override { return OutputFormat::PNG; }

        [[nodiscard]] Bytes encode(const RasterImage& image) const override;
    };

} // namespace rehost

#endif // REHOST_PNG_CODEC_HPP
