/**
 * @file jpeg_codec.hpp
 * @brief libjpeg (mozjpeg) backed JPEG decoder and encoders.
 */

#ifndef REHOST_JPEG_CODEC_HPP
#define REHOST_JPEG_CODEC_HPP

#include "image_codec.hpp"
#include <array>
#include <string>

namespace rehost {

    /**
     * @brief Decodes baseline and progressive JPEG, including CMYK/YCCK.
     */
    class JpegDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegDecoder";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/jpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        /**
         * @brief Reads the SOF header. JPEG never declares alpha.
         */
        [[nodiscard]] ImageInfo probe(std::span<const std::uint8_t> data) const override;

        [[nodiscard]] RasterImage decode(std::span<const std::uint8_t> data) const override;
    };

    /**
     * @brief Encodes an RGBA raster as JPEG, alpha composited over white.
     *
     * @details Two configurations are registered by the encoder registry:
     * the primary progressive encoder (quality 92, 4:4:4, optimized
     * Huffman tables) and the baseline fallback (quality 85, 4:2:0).
     */
    class JpegEncoder final : public IImageEncoder {
    public:
        /**
         * @param name Name used in logs.
         * @param quality libjpeg quality, clamped to [1, 100].
         * @param progressive Emit a progressive scan script.
         * @param chroma_subsampling Use 4:2:0 instead of 4:4:4.
         */
        JpegEncoder(std::string name, int quality, bool progressive, bool chroma_subsampling);

        [[nodiscard]] std::string_view get_name() const noexcept override { return name_; }
        [[nodiscard]] OutputFormat get_output_format() const noexcept override { return OutputFormat::JPEG; }

        [[nodiscard]] Bytes encode(const RasterImage& image) const override;

        [[nodiscard]] int quality() const noexcept { return quality_; }
        [[nodiscard]] bool progressive() const noexcept { return progressive_; }

    private:
        std::string name_;
        int quality_;
        bool progressive_;
        bool chroma_subsampling_;
    };

} // namespace rehost

#endif // REHOST_JPEG_CODEC_HPP
