/**
 * @file types.hpp
 * @brief Value types passed between pipeline stages.
 */

#ifndef REHOST_TYPES_HPP
#define REHOST_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rehost {

    using Bytes = std::vector<std::uint8_t>;

    /**
     * @brief Image bytes together with their (declared or sniffed) MIME type.
     *
     * All three fetch paths (URL, data URI, raw upload) converge on this.
     */
    struct SourceImage {
        Bytes bytes;
        std::string content_type;
    };

    /**
     * @brief One input of a rehost request: an https URL, a data URI or raw bytes.
     */
    struct SourceDescriptor {
        enum class Kind {
            Url,
            DataUri,
            Bytes
        };

        Kind kind = Kind::Url;
        std::string reference;    ///< URL or data URI
        Bytes bytes;              ///< Raw upload (Kind::Bytes)
        std::string content_type; ///< Declared type of the raw upload, may be empty

        static SourceDescriptor url(std::string url) {
            return {Kind::Url, std::move(url), {}, {}};
        }
        static SourceDescriptor data_uri(std::string uri) {
            return {Kind::DataUri, std::move(uri), {}, {}};
        }
        static SourceDescriptor raw(Bytes data, std::string declared_type = {}) {
            return {Kind::Bytes, {}, std::move(data), std::move(declared_type)};
        }
    };

    /**
     * @brief Cheap metadata read from an image header.
     */
    struct ImageInfo {
        int width = 0;
        int height = 0;
        bool has_alpha_channel = false; ///< Container declares alpha (or tRNS)
    };

    /**
     * @brief Decoded 8-bit RGBA raster, rows tightly packed.
     */
    struct RasterImage {
        int width = 0;
        int height = 0;
        Bytes pixels;

        [[nodiscard]] std::size_t stride() const noexcept { return static_cast<std::size_t>(width) * 4; }
        [[nodiscard]] bool empty() const noexcept { return width <= 0 || height <= 0 || pixels.empty(); }
    };

    enum class OutputFormat {
        JPEG,
        PNG
    };

    [[nodiscard]] constexpr std::string_view mime_for(const OutputFormat format) noexcept {
        return format == OutputFormat::PNG ? "image/png" : "image/jpeg";
    }

    /**
     * @brief Outcome of the FormatDecider for one input. Never persisted.
     */
    struct ProcessingDecision {
        std::string source_mime;          ///< Normalized input type
        int source_width = 0;
        int source_height = 0;
        bool pass_through = false;        ///< Store input bytes unchanged
        bool needs_resize = false;
        int target_width = 0;
        int target_height = 0;
        bool has_meaningful_transparency = false;
        OutputFormat output_format = OutputFormat::JPEG;
    };

    /**
     * @brief Final bytes leaving the encoder chain.
     */
    struct EncodedImage {
        Bytes bytes;
        std::string mime;
        int width = 0;
        int height = 0;
    };

    /**
     * @brief A stored, content-addressed image.
     */
    struct Asset {
        std::string public_url;
        std::string mime;
        int width = 0;
        int height = 0;
        std::size_t byte_size = 0;
        std::string content_digest; ///< "sha256:<64 hex>"
        std::string storage_key;    ///< "xx/<24 chars>.jpg|.png"
        bool deduplicated = false;
    };

    struct TransformStats {
        int images_processed = 0;
        int images_rehosted = 0;
        int styles_removed = 0;
        int scripts_removed = 0;
    };

    /**
     * @brief Result of one HTML transform call.
     */
    struct TransformResult {
        std::string html;
        std::vector<std::string> messages;
        TransformStats stats;
    };

} // namespace rehost

#endif // REHOST_TYPES_HPP
