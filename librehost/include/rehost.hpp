/**
 * @file rehost.hpp
 * @brief Public API of the rehost library.
 */

#ifndef REHOST_HPP
#define REHOST_HPP

#include "config.hpp"
#include "object_store.hpp"
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace rehost {

/**
 * @brief Main interface of the rehost library.
 *
 * @details Wraps the asset pipeline and the HTML transformer behind a
 * blocking API. Every call either returns its full result or throws a
 * RehostError; no partial Asset is ever returned. Uses the PIMPL idiom
 * to hide the codec and network dependencies.
 *
 * Calls may run concurrently, also with the setters: a setter affects
 * requests started after it returns, and requests already running finish
 * with the configuration they started with.
 */
class Rehost {
public:
    explicit Rehost(std::shared_ptr<IObjectStore> store, PipelineConfig config = {});
    ~Rehost();

    Rehost(const Rehost&) = delete;
    Rehost& operator=(const Rehost&) = delete;
    Rehost(Rehost&&) noexcept;
    Rehost& operator=(Rehost&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Longest allowed edge in pixels.
     * Default: 3840.
     */
    Rehost& maxEdge(int pixels);

    /**
     * @brief Inputs larger than this are re-encoded at reduced size.
     * Default: 5 MiB.
     */
    Rehost& resizeThreshold(std::size_t bytes);

    /**
     * @brief Small JPEG/PNG inputs below this are stored unchanged; 0 disables.
     * Default: 1 MiB.
     */
    Rehost& passthroughThreshold(std::size_t bytes);

    /**
     * @brief Quality of the primary JPEG encoder.
     * Default: 92.
     */
    Rehost& jpegQuality(int quality);

    Rehost& jpegProgressive(bool val);

    /**
     * @brief Enable or disable the lossless ZopfliPNG pass.
     * Default: true.
     */
    Rehost& pngOptimize(bool val);

    /**
     * @brief Byte cap of remote fetches.
     * Default: 30 MiB.
     */
    Rehost& maxFetchBytes(std::size_t bytes);

    /**
     * @brief Maximum number of inputs of process_batch().
     * Default: 20.
     */
    Rehost& maxBatchSize(std::size_t items);

    /**
     * @brief Number of images of one document processed concurrently.
     * Default: 1 (sequential).
     */
    Rehost& imageWorkers(unsigned workers);

    /**
     * @brief Extra hosts whose images are treated as already rehosted.
     */
    Rehost& assetHosts(std::vector<std::string> hosts);

    /**
     * @brief Copy of the current configuration.
     */
    [[nodiscard]] PipelineConfig config() const;

    // --- Execution ---

    /**
     * @brief Fetch an https:// URL and rehost the image.
     */
    [[nodiscard]] Asset process_from_url(const std::string& url, std::stop_token stop = {});

    /**
     * @brief Decode a data: URI and rehost the image.
     */
    [[nodiscard]] Asset process_from_data_uri(const std::string& data_uri, std::stop_token stop = {});

    /**
     * @brief Rehost raw image bytes. An empty @p declared_type is sniffed.
     */
    [[nodiscard]] Asset process_from_bytes(std::vector<std::uint8_t> bytes,
                                           const std::string& declared_type = {},
                                           std::stop_token stop = {});

    /**
     * @brief Fail-fast batch of up to maxBatchSize inputs.
     * @throws RehostError(InvalidRequest) for an empty or oversized batch.
     * @throws BatchItemError naming the first failing index.
     */
    [[nodiscard]] std::vector<Asset> process_batch(const std::vector<SourceDescriptor>& sources,
                                                   std::stop_token stop = {});

    /**
     * @brief Rehost the images of @p html and rewrite it to the Gmail-safe subset.
     * @throws RehostError(PayloadTooLarge) for oversized input, before parsing.
     */
    [[nodiscard]] TransformResult transform_html(std::string_view html, std::stop_token stop = {});

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rehost

#endif // REHOST_HPP
