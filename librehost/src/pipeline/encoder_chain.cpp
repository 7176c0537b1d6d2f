#include "../../include/encoder_chain.hpp"
#include "../../include/errors.hpp"
#include "../../include/image_codec.hpp"
#include "../../include/image_ops.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/png_codec.hpp"

namespace {

constexpr auto kTag = "encoder_chain";

std::string dims(const int w, const int h) {
    return std::to_string(w) + "x" + std::to_string(h);
}

} // namespace

namespace rehost {

EncodedImage EncoderChain::encode(const std::span<const std::uint8_t> data,
                                  const ProcessingDecision& decision,
                                  std::optional<RasterImage> predecoded) const {
    const IImageDecoder* decoder = find_decoder(decision.source_mime);
    if (!decoder) {
        throw RehostError(ErrorKind::EncodingFailed, "no decoder for " + decision.source_mime);
    }

    RasterImage raster;
    if (predecoded && !predecoded->empty()) {
        raster = std::move(*predecoded);
    } else {
        try {
            raster = decoder->decode(data);
        } catch (const std::exception& e) {
            throw RehostError(ErrorKind::EncodingFailed, std::string("failed to decode image: ") + e.what());
        }
    }

    if (decision.pass_through) {
        Logger::log(LogLevel::Info, "Pass-through confirmed (" + dims(raster.width, raster.height) + ")", kTag);
        return EncodedImage{Bytes(data.begin(), data.end()), decision.source_mime, raster.width, raster.height};
    }

    if (decision.target_width > 0 && decision.target_height > 0 &&
        (decision.target_width != raster.width || decision.target_height != raster.height)) {
        try {
            raster = resize_rgba(raster, decision.target_width, decision.target_height);
        } catch (const std::exception& e) {
            throw RehostError(ErrorKind::EncodingFailed, std::string("resize failed: ") + e.what());
        }
        Logger::log(LogLevel::Info,
                    "Resized " + dims(decision.source_width, decision.source_height) + " -> " +
                    dims(raster.width, raster.height),
                    kTag);
    }

    if (decision.output_format == OutputFormat::PNG) {
        return encode_png(raster);
    }
    return encode_jpeg(data, decision, raster);
}

EncodedImage EncoderChain::encode_jpeg(const std::span<const std::uint8_t> data,
                                       const ProcessingDecision& decision,
                                       const RasterImage& raster) const {
    for (const auto& encoder : registry_.encoders_for(OutputFormat::JPEG)) {
        try {
            Bytes out = encoder->encode(raster);
            if (out.empty()) throw std::runtime_error("empty output");
            Logger::log(LogLevel::Info,
                        std::string(encoder->get_name()) + ": " + std::to_string(out.size()) + " bytes", kTag);
            return EncodedImage{std::move(out), "image/jpeg", raster.width, raster.height};
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning,
                        std::string(encoder->get_name()) + " failed, trying next: " + e.what(), kTag);
        }
    }

    // last resort: the pre-encode bytes, if they are a container we may store
    const bool resized = raster.width != decision.source_width || raster.height != decision.source_height;
    Bytes fallback;
    if (!resized) {
        fallback.assign(data.begin(), data.end());
    } else {
        try {
            fallback = PngEncoder().encode(raster);
        } catch (const std::exception& e) {
            throw RehostError(ErrorKind::EncodingFailed,
                              std::string("all JPEG encoders failed and lossless fallback failed: ") + e.what());
        }
    }

    const std::string mime = MimeDetector::detect_by_signature(fallback);
    if (mime != "image/jpeg" && mime != "image/png") {
        throw RehostError(ErrorKind::EncodingFailed,
                          "all JPEG encoders failed and source " + decision.source_mime + " cannot be stored as-is");
    }
    Logger::log(LogLevel::Warning, "All JPEG encoders failed, storing pre-encode bytes as " + mime, kTag);
    return EncodedImage{std::move(fallback), mime, raster.width, raster.height};
}

EncodedImage EncoderChain::encode_png(const RasterImage& raster) const {
    Bytes best;
    for (const auto& encoder : registry_.encoders_for(OutputFormat::PNG)) {
        try {
            best = encoder->encode(raster);
            if (!best.empty()) {
                Logger::log(LogLevel::Info,
                            std::string(encoder->get_name()) + ": " + std::to_string(best.size()) + " bytes", kTag);
                break;
            }
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning,
                        std::string(encoder->get_name()) + " failed, trying next: " + e.what(), kTag);
        }
    }
    if (best.empty()) {
        throw RehostError(ErrorKind::EncodingFailed, "no PNG encoder produced output");
    }

    for (const auto& optimizer : registry_.png_optimizers()) {
        try {
            Bytes optimized = optimizer->optimize(best);
            if (optimized.empty()) {
                Logger::log(LogLevel::Warning,
                            std::string(optimizer->get_name()) + " returned no data, keeping previous bytes", kTag);
                continue;
            }
            if (optimized.size() < best.size()) {
                Logger::log(LogLevel::Info,
                            std::string(optimizer->get_name()) + ": " + std::to_string(best.size()) + " -> " +
                            std::to_string(optimized.size()) + " bytes",
                            kTag);
                best = std::move(optimized);
            }
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning,
                        std::string(optimizer->get_name()) + " failed, keeping previous bytes: " + e.what(), kTag);
        }
    }

    return EncodedImage{std::move(best), "image/png", raster.width, raster.height};
}

} // namespace rehost
