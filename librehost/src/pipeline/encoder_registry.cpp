#include "../../include/encoder_registry.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/zopflipng_optimizer.hpp"

namespace {

// 2x2 raster with one translucent pixel, exercises every colour path
rehost::RasterImage probe_raster() {
    rehost::RasterImage img;
    img.width = 2;
    img.height = 2;
    img.pixels = {255, 0, 0, 255,   0, 255, 0, 255,
                  0, 0, 255, 255,   255, 255, 255, 128};
    return img;
}

} // namespace

namespace rehost {

EncoderFactories build_encoder_factories(const EncoderConfig& config) {
    EncoderFactories factories;

    factories[OutputFormat::JPEG] = {
        [config] {
            return std::make_unique<JpegEncoder>("ProgressiveJpegEncoder", config.jpeg_quality,
                                                 config.jpeg_progressive, false);
        },
        [config] {
            return std::make_unique<JpegEncoder>("BaselineJpegEncoder", config.jpeg_fallback_quality,
                                                 false, true);
        }
    };

    factories[OutputFormat::PNG] = {
        [] { return std::make_unique<PngEncoder>(); }
    };

    return factories;
}

std::vector<OptimizerFactory> build_optimizer_factories(const EncoderConfig& config) {
    std::vector<OptimizerFactory> factories;
    if (config.png_optimize) {
        factories.emplace_back([config] {
            return std::make_unique<ZopfliPngOptimizer>(config.zopfli_iterations, config.zopfli_iterations_large);
        });
    }
    return factories;
}

EncoderRegistry::EncoderRegistry(const EncoderConfig& config)
    : EncoderRegistry(build_encoder_factories(config), build_optimizer_factories(config)) {}

EncoderRegistry::EncoderRegistry(const EncoderFactories& encoders,
                                 const std::vector<OptimizerFactory>& optimizers) {
    const RasterImage sample = probe_raster();

    for (const auto& [format, list] : encoders) {
        auto& target = format == OutputFormat::PNG ? png_ : jpeg_;
        for (const auto& factory : list) {
            auto encoder = factory();
            if (!encoder) continue;
            try {
                if (encoder->encode(sample).empty()) {
                    throw std::runtime_error("empty output");
                }
                Logger::log(LogLevel::Debug, std::string("Encoder available: ") + std::string(encoder->get_name()),
                            "encoder_registry");
                target.push_back(std::move(encoder));
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Warning,
                            std::string("Encoder ") + std::string(encoder->get_name()) + " unavailable: " + e.what(),
                            "encoder_registry");
            }
        }
    }

    Bytes sample_png;
    try {
        sample_png = PngEncoder().encode(sample);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, std::string("Cannot build optimizer probe image: ") + e.what(),
                    "encoder_registry");
    }

    for (const auto& factory : optimizers) {
        auto optimizer = factory();
        if (!optimizer) continue;
        if (sample_png.empty()) {
            Logger::log(LogLevel::Warning,
                        std::string("Optimizer ") + std::string(optimizer->get_name()) + " not probed, skipped",
                        "encoder_registry");
            continue;
        }
        try {
            if (optimizer->optimize(sample_png).empty()) {
                throw std::runtime_error("empty output");
            }
            optimizers_.push_back(std::move(optimizer));
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning,
                        std::string("Optimizer ") + std::string(optimizer->get_name()) + " unavailable: " + e.what(),
                        "encoder_registry");
        }
    }

    Logger::log(LogLevel::Info,
                "Encoders ready: jpeg=" + std::to_string(jpeg_.size()) + " png=" + std::to_string(png_.size()) +
                " png_optimizers=" + std::to_string(optimizers_.size()),
                "encoder_registry");
}

const std::vector<std::unique_ptr<IImageEncoder>>& EncoderRegistry::encoders_for(const OutputFormat format) const {
    return format == OutputFormat::PNG ? png_ : jpeg_;
}

} // namespace rehost
