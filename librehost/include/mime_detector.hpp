#ifndef REHOST_MIME_DETECTOR_HPP
#define REHOST_MIME_DETECTOR_HPP

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace rehost {

    /**
     * @brief Content-type sniffing and normalization.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of an in-memory buffer.
         *
         * libmagic is consulted first. When it cannot classify the buffer
         * (or reports a generic type), a signature table covering the
         * supported image containers is used.
         *
         * @return Normalized MIME type, or "application/octet-stream".
         */
        static std::string detect(std::span<const std::uint8_t> data);

        /**
         * @brief Signature-table lookup only (JPEG, PNG, GIF, WebP, TIFF).
         * @return The MIME type, or an empty string if nothing matches.
         */
        static std::string detect_by_signature(std::span<const std::uint8_t> data);

        /**
         * @brief Strips parameters, lower-cases, and maps aliases
         * ("image/jpg", "image/pjpeg") to their canonical type.
         */
        static std::string normalize(std::string_view content_type);

        /**
         * @brief True for the containers the codec layer can decode.
         */
        [[nodiscard]] static bool is_supported_image(std::string_view mime) noexcept;
    };

} // namespace rehost

#endif // REHOST_MIME_DETECTOR_HPP
