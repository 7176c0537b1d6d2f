/**
 * @file format_decider.hpp
 * @brief Decides resize, pass-through and output container for one image.
 */

#ifndef REHOST_FORMAT_DECIDER_HPP
#define REHOST_FORMAT_DECIDER_HPP

#include "config.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace rehost {

    /**
     * @brief Pure policy over image metadata.
     *
     * @details
     * - Images above max_pixels are refused with PayloadTooLarge before
     *   any pixel data is decoded.
     * - Resize triggers when either edge exceeds max_edge or the input is
     *   larger than resize_byte_threshold. Both edges scale by the same
     *   factor, clamped to 1.0 (no upscaling).
     * - JPEG and PNG inputs within max_edge and below
     *   passthrough_byte_threshold are passed through unmodified.
     * - PNG output is chosen only when the container declares alpha AND a
     *   sampled pixel is actually translucent; everything else becomes JPEG.
     */
    class FormatDecider {
    public:
        explicit FormatDecider(DeciderConfig config) : config_(config) {}

        /**
         * @brief Decide how to process @p data.
         *
         * @param data Image bytes.
         * @param content_type Declared type; re-sniffed when unsupported or
         * when it does not match the bytes.
         * @param decoded If non-null, receives the raster decoded for
         * transparency sampling so the encoder does not decode twice.
         * @throws RehostError(UnsupportedFormat) for unrecognized bytes or
         * unreadable metadata.
         */
        [[nodiscard]] ProcessingDecision decide(std::span<const std::uint8_t> data,
                                                std::string_view content_type,
                                                std::optional<RasterImage>* decoded = nullptr) const;

        /**
         * @brief Aspect-preserving dimensions with the longest edge at most
         * @p max_edge. Never larger than the input.
         */
        [[nodiscard]] static std::pair<int, int> target_dimensions(int width, int height, int max_edge);

        [[nodiscard]] const DeciderConfig& config() const noexcept { return config_; }

    private:
        DeciderConfig config_;
    };

} // namespace rehost

#endif // REHOST_FORMAT_DECIDER_HPP
