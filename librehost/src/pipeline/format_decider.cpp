#include "../../include/format_decider.hpp"
#include "../../include/errors.hpp"
#include "../../include/image_codec.hpp"
#include "../../include/image_ops.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace {

constexpr auto kTag = "format_decider";

struct Probed {
    std::string mime;
    const rehost::IImageDecoder* decoder = nullptr;
    rehost::ImageInfo info;
};

} // namespace

namespace rehost {

std::pair<int, int> FormatDecider::target_dimensions(const int width, const int height, const int max_edge) {
    const int longest = std::max(width, height);
    if (max_edge <= 0 || longest <= max_edge) {
        return {width, height};
    }
    const double scale = static_cast<double>(max_edge) / longest;
    if (width >= height) {
        return {max_edge, std::clamp(static_cast<int>(std::lround(height * scale)), 1, height)};
    }
    return {std::clamp(static_cast<int>(std::lround(width * scale)), 1, width), max_edge};
}

ProcessingDecision FormatDecider::decide(const std::span<const std::uint8_t> data,
                                         const std::string_view content_type,
                                         std::optional<RasterImage>* decoded) const {
    if (data.empty()) {
        throw RehostError(ErrorKind::UnsupportedFormat, "empty image payload");
    }

    const std::string declared = MimeDetector::normalize(content_type);
    std::string sniffed;
    auto sniff = [&]() -> const std::string& {
        if (sniffed.empty()) sniffed = MimeDetector::detect(data);
        return sniffed;
    };

    // try the declared type first, then what the bytes say
    std::vector<std::string> candidates;
    if (MimeDetector::is_supported_image(declared)) candidates.push_back(declared);
    if (const auto& s = sniff(); MimeDetector::is_supported_image(s) && s != declared) candidates.push_back(s);

    if (candidates.empty()) {
        throw RehostError(ErrorKind::UnsupportedFormat,
                          "unsupported content type: " + (declared.empty() ? sniffed : declared));
    }

    Probed probed;
    std::string last_error;
    for (const auto& mime : candidates) {
        const IImageDecoder* decoder = find_decoder(mime);
        if (!decoder) continue;
        try {
            probed = Probed{mime, decoder, decoder->probe(data)};
            break;
        } catch (const std::exception& e) {
            last_error = e.what();
            Logger::log(LogLevel::Debug, "Metadata read as " + mime + " failed: " + last_error, kTag);
        }
    }
    if (!probed.decoder || probed.info.width <= 0 || probed.info.height <= 0) {
        throw RehostError(ErrorKind::UnsupportedFormat, "failed to read image metadata: " + last_error);
    }
    // decoding allocates width * height * 4 bytes up front
    const auto pixels = static_cast<std::uint64_t>(probed.info.width) * static_cast<std::uint64_t>(probed.info.height);
    if (pixels > config_.max_pixels) {
        throw RehostError(ErrorKind::PayloadTooLarge,
                          "image of " + std::to_string(probed.info.width) + "x" +
                          std::to_string(probed.info.height) + " exceeds the limit of " +
                          std::to_string(config_.max_pixels) + " pixels");
    }
    if (probed.mime != declared && !declared.empty()) {
        Logger::log(LogLevel::Info, "Declared type " + declared + " overridden by sniffed " + probed.mime, kTag);
    }

    ProcessingDecision d;
    d.source_mime = probed.mime;
    d.source_width = probed.info.width;
    d.source_height = probed.info.height;

    const bool over_edge = d.source_width > config_.max_edge || d.source_height > config_.max_edge;
    const bool over_bytes = data.size() > config_.resize_byte_threshold;
    const bool reusable_container = d.source_mime == "image/jpeg" || d.source_mime == "image/png";

    if (reusable_container && !over_edge && data.size() < config_.passthrough_byte_threshold) {
        d.pass_through = true;
        d.target_width = d.source_width;
        d.target_height = d.source_height;
        d.output_format = d.source_mime == "image/png" ? OutputFormat::PNG : OutputFormat::JPEG;
        Logger::log(LogLevel::Info,
                    "Pass-through: " + d.source_mime + " " + std::to_string(d.source_width) + "x" +
                    std::to_string(d.source_height) + ", " + std::to_string(data.size()) + " bytes",
                    kTag);
        return d;
    }

    d.needs_resize = over_edge || over_bytes;
    std::tie(d.target_width, d.target_height) =
        target_dimensions(d.source_width, d.source_height, config_.max_edge);

    Logger::log(LogLevel::Info,
                std::string(d.needs_resize ? "Resize triggered: " : "Resize skipped: ") +
                std::to_string(d.source_width) + "x" + std::to_string(d.source_height) + ", " +
                std::to_string(data.size()) + " bytes (max " + std::to_string(config_.max_edge) + "px or " +
                std::to_string(config_.resize_byte_threshold) + " bytes)",
                kTag);

    if (probed.info.has_alpha_channel) {
        try {
            RasterImage raster = probed.decoder->decode(data);
            d.has_meaningful_transparency = has_translucent_sample(raster, config_.transparency_sample_target);
            if (decoded) *decoded = std::move(raster);
        } catch (const std::exception& e) {
            // cannot prove opacity, keep the alpha
            d.has_meaningful_transparency = true;
            Logger::log(LogLevel::Warning,
                        std::string("Decode for transparency sampling failed, assuming transparent: ") + e.what(),
                        kTag);
        }
    }

    d.output_format = d.has_meaningful_transparency ? OutputFormat::PNG : OutputFormat::JPEG;
    Logger::log(LogLevel::Info,
                "Format decision: " + d.source_mime + " -> " + std::string(mime_for(d.output_format)) +
                " (alpha declared: " + (probed.info.has_alpha_channel ? "yes" : "no") +
                ", translucent: " + (d.has_meaningful_transparency ? "yes" : "no") + ")",
                kTag);
    return d;
}

} // namespace rehost
