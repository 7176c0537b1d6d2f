/**
 * @file config.hpp
 * @brief Tunables of the rehosting pipeline, grouped per component.
 */

#ifndef REHOST_CONFIG_HPP
#define REHOST_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rehost {

    /**
     * @brief Thresholds used by the FormatDecider.
     */
    struct DeciderConfig {
        int max_edge = 3840;                                     ///< Longest allowed edge in pixels
        std::uint64_t max_pixels = 100'000'000;                  ///< Larger images are refused before decoding
        std::size_t resize_byte_threshold = 5 * 1024 * 1024;     ///< Inputs above this are re-encoded at reduced size
        std::size_t passthrough_byte_threshold = 1024 * 1024;    ///< JPEG/PNG below this are stored untouched (0 disables)
        int transparency_sample_target = 400;                    ///< Approximate number of alpha samples
    };

    /**
     * @brief Encoder chain parameters.
     */
    struct EncoderConfig {
        int jpeg_quality = 92;          ///< Primary progressive encoder, 4:4:4
        int jpeg_fallback_quality = 85; ///< Baseline fallback, 4:2:0
        bool jpeg_progressive = true;   ///< When false the primary encoder emits baseline scans
        bool png_optimize = true;       ///< Run the lossless ZopfliPNG pass
        int zopfli_iterations = 15;     ///< ZopfliPNG iterations for small images
        int zopfli_iterations_large = 5;///< ZopfliPNG iterations for large images
    };

    /**
     * @brief Network limits for remote fetches.
     */
    struct FetchConfig {
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds request_timeout{30};
        std::size_t max_fetch_bytes = 30 * 1024 * 1024;
        int max_redirects = 5;
        std::string user_agent = "rehost/1.0";
    };

    /**
     * @brief Content store parameters.
     */
    struct StoreConfig {
        std::string cache_control = "public, max-age=31536000, immutable";
    };

    /**
     * @brief HTML transform parameters.
     */
    struct HtmlConfig {
        std::size_t max_html_bytes = 1'500'000;
        unsigned image_workers = 1;                  ///< 1 processes images sequentially
        std::vector<std::string> extra_asset_hosts;  ///< Hosts treated as already rehosted
    };

    /**
     * @brief Complete pipeline configuration.
     */
    struct PipelineConfig {
        DeciderConfig decider;
        EncoderConfig encoder;
        FetchConfig fetch;
        StoreConfig store;
        HtmlConfig html;
        std::size_t max_batch_size = 20;
    };

} // namespace rehost

#endif // REHOST_CONFIG_HPP
