/**
 * @file image_codec.hpp
 * @brief Capability-abstracted decoder and encoder interfaces.
 *
 * Every supported container has an IImageDecoder that can read its header
 * cheaply (probe) and produce an RGBA raster (decode). Output formats are
 * produced by IImageEncoder implementations, tried in priority order by
 * the EncoderChain, and PNG output may be post-processed by an
 * IPngOptimizer.
 */

#ifndef REHOST_IMAGE_CODEC_HPP
#define REHOST_IMAGE_CODEC_HPP

#include "types.hpp"
#include <cstdint>
#include <span>
#include <string_view>

namespace rehost {

    /**
     * @brief Reads one image container.
     */
    class IImageDecoder {
    public:
        virtual ~IImageDecoder() = default;

        [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

        /**
         * @brief MIME types this decoder accepts.
         */
        [[nodiscard]] virtual std::span<const std::string_view> get_supported_mime_types() const noexcept = 0;

        /**
         * @brief Read dimensions and declared alpha without decoding pixels.
         * @throws std::runtime_error on a malformed header.
         */
        [[nodiscard]] virtual ImageInfo probe(std::span<const std::uint8_t> data) const = 0;

        /**
         * @brief Full decode to 8-bit RGBA (first frame / first directory).
         * @throws std::runtime_error on any decoder error.
         */
        [[nodiscard]] virtual RasterImage decode(std::span<const std::uint8_t> data) const = 0;
    };

    /**
     * @brief Produces one output container from a raster.
     */
    class IImageEncoder {
    public:
        virtual ~IImageEncoder() = default;

        [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;
        [[nodiscard]] virtual OutputFormat get_output_format() const noexcept = 0;

        /**
         * @brief Encode the raster. Metadata is never written.
         * @throws std::runtime_error if the underlying library fails.
         */
        [[nodiscard]] virtual Bytes encode(const RasterImage& image) const = 0;
    };

    /**
     * @brief Lossless re-compression of already encoded PNG bytes.
     */
    class IPngOptimizer {
    public:
        virtual ~IPngOptimizer() = default;

        [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

        /**
         * @throws std::runtime_error when optimization fails.
         */
        [[nodiscard]] virtual Bytes optimize(std::span<const std::uint8_t> png) const = 0;
    };

    /**
     * @brief Returns the decoder registered for a normalized MIME type.
     * @return nullptr if the type is not supported.
     */
    [[nodiscard]] const IImageDecoder* find_decoder(std::string_view mime);

} // namespace rehost

#endif // REHOST_IMAGE_CODEC_HPP
