/**
 * @file encoder_registry.hpp
 * @brief Priority-ordered encoders per output format, probed once at startup.
 */

#ifndef REHOST_ENCODER_REGISTRY_HPP
#define REHOST_ENCODER_REGISTRY_HPP

#include "config.hpp"
#include "image_codec.hpp"
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace rehost {

    using EncoderFactory = std::function<std::unique_ptr<IImageEncoder>()>;
    using OptimizerFactory = std::function<std::unique_ptr<IPngOptimizer>()>;
    using EncoderFactories = std::map<OutputFormat, std::vector<EncoderFactory>>;

    /**
     * @brief Builds the default factories.
     *
     * JPEG: progressive (quality, 4:4:4) then baseline fallback (fallback
     * quality, 4:2:0). PNG: the colour-type optimizing libpng writer.
     */
    EncoderFactories build_encoder_factories(const EncoderConfig& config);

    /**
     * @brief Builds the PNG optimizer chain (ZopfliPNG unless disabled).
     */
    std::vector<OptimizerFactory> build_optimizer_factories(const EncoderConfig& config);

    /**
     * @brief Holds the encoders that passed their availability probe.
     *
     * Each factory is instantiated once and asked to encode a tiny test
     * raster (optimizers: to optimize a tiny PNG). Failures drop the
     * encoder and are logged as a configuration fact.
     */
    class EncoderRegistry {
    public:
        explicit EncoderRegistry(const EncoderConfig& config);

        EncoderRegistry(const EncoderFactories& encoders,
                        const std::vector<OptimizerFactory>& optimizers);

        EncoderRegistry(const EncoderRegistry&) = delete;
        EncoderRegistry& operator=(const EncoderRegistry&) = delete;

        /**
         * @brief Available encoders for a format, highest priority first.
         */
        [[nodiscard]] const std::vector<std::unique_ptr<IImageEncoder>>& encoders_for(OutputFormat format) const;

        [[nodiscard]] const std::vector<std::unique_ptr<IPngOptimizer>>& png_optimizers() const noexcept {
            return optimizers_;
        }

    private:
        std::vector<std::unique_ptr<IImageEncoder>> jpeg_;
        std::vector<std::unique_ptr<IImageEncoder>> png_;
        std::vector<std::unique_ptr<IPngOptimizer>> optimizers_;
    };

} // namespace rehost

#endif // REHOST_ENCODER_REGISTRY_HPP
