/**
 * @file asset_pipeline.hpp
 * @brief fetch -> decide -> encode -> store for a single image.
 */

#ifndef REHOST_ASSET_PIPELINE_HPP
#define REHOST_ASSET_PIPELINE_HPP

#include "config.hpp"
#include "content_store.hpp"
#include "encoder_chain.hpp"
#include "encoder_registry.hpp"
#include "fetcher.hpp"
#include "format_decider.hpp"
#include "object_store.hpp"
#include "types.hpp"
#include <memory>
#include <stop_token>
#include <vector>

namespace rehost {

    /**
     * @brief Owns one instance of every pipeline stage.
     *
     * Each call is independent; the only shared mutable state is the
     * object store behind the ContentStore. A failed call never returns
     * a partial Asset.
     */
    class AssetPipeline {
    public:
        AssetPipeline(const PipelineConfig& config, std::shared_ptr<IObjectStore> store);

        /**
         * @brief Test hook: use @p registry instead of building one from the config.
         */
        AssetPipeline(const PipelineConfig& config, std::shared_ptr<IObjectStore> store,
                      std::unique_ptr<EncoderRegistry> registry);

        AssetPipeline(const AssetPipeline&) = delete;
        AssetPipeline& operator=(const AssetPipeline&) = delete;

        /**
         * @brief Resolve @p source to bytes and rehost them.
         * @throws RehostError of the failing stage.
         */
        [[nodiscard]] Asset process(const SourceDescriptor& source, std::stop_token stop = {});

        /**
         * @brief Rehost already fetched bytes.
         */
        [[nodiscard]] Asset process_image(const SourceImage& image, std::stop_token stop = {});

        /**
         * @brief Fail-fast batch.
         * @throws RehostError(InvalidRequest) for an empty or oversized batch,
         * before anything is processed.
         * @throws BatchItemError naming the first failing index.
         */
        [[nodiscard]] std::vector<Asset> process_batch(const std::vector<SourceDescriptor>& sources,
                                                       std::stop_token stop = {});

        [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }
        [[nodiscard]] const Fetcher& fetcher() const noexcept { return fetcher_; }

    private:
        Asset run_stages(const SourceImage& image, std::stop_token stop);

        PipelineConfig config_;
        Fetcher fetcher_;
        FormatDecider decider_;
        std::unique_ptr<EncoderRegistry> registry_;
        EncoderChain chain_;
        ContentStore store_;
    };

} // namespace rehost

#endif // REHOST_ASSET_PIPELINE_HPP
