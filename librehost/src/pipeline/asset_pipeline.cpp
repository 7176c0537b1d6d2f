#include "../../include/asset_pipeline.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <new>
#include <optional>
#include <utility>

namespace {

constexpr auto kTag = "asset_pipeline";

void throw_if_cancelled(const std::stop_token& stop) {
    if (stop.stop_requested()) {
        throw rehost::RehostError(rehost::ErrorKind::Cancelled, "request cancelled");
    }
}

// Stages report their failures as RehostError; anything else that escapes
// them still leaves with a kind.
template<class F>
rehost::Asset typed_failures(F&& stage) {
    try {
        return stage();
    } catch (const rehost::RehostError&) {
        throw;
    } catch (const std::bad_alloc&) {
        throw rehost::RehostError(rehost::ErrorKind::PayloadTooLarge, "out of memory while processing the image");
    } catch (const std::exception& e) {
        throw rehost::RehostError(rehost::ErrorKind::EncodingFailed, e.what());
    }
}

} // namespace

namespace rehost {

AssetPipeline::AssetPipeline(const PipelineConfig& config, std::shared_ptr<IObjectStore> store)
    : AssetPipeline(config, std::move(store), std::make_unique<EncoderRegistry>(config.encoder)) {}

AssetPipeline::AssetPipeline(const PipelineConfig& config, std::shared_ptr<IObjectStore> store,
                             std::unique_ptr<EncoderRegistry> registry)
    : config_(config),
      fetcher_(config.fetch),
      decider_(config.decider),
      registry_(std::move(registry)),
      chain_(*registry_),
      store_(std::move(store), config.store) {}

Asset AssetPipeline::process(const SourceDescriptor& source, const std::stop_token stop) {
    throw_if_cancelled(stop);
    return typed_failures([&] {
        switch (source.kind) {
            case SourceDescriptor::Kind::Url:
                return process_image(fetcher_.fetch_url(source.reference, stop), stop);
            case SourceDescriptor::Kind::DataUri:
                return process_image(parse_data_uri(source.reference), stop);
            case SourceDescriptor::Kind::Bytes:
                return process_image(Fetcher::from_bytes(source.bytes, source.content_type), stop);
        }
        throw RehostError(ErrorKind::InvalidRequest, "unknown source kind");
    });
}

Asset AssetPipeline::process_image(const SourceImage& image, const std::stop_token stop) {
    return typed_failures([&] { return run_stages(image, stop); });
}

Asset AssetPipeline::run_stages(const SourceImage& image, const std::stop_token stop) {
    throw_if_cancelled(stop);
    if (image.bytes.empty()) {
        throw RehostError(ErrorKind::UnsupportedFormat, "empty input");
    }

    std::optional<RasterImage> decoded;
    const ProcessingDecision decision = decider_.decide(image.bytes, image.content_type, &decoded);
    throw_if_cancelled(stop);

    const EncodedImage encoded = chain_.encode(image.bytes, decision, std::move(decoded));
    throw_if_cancelled(stop);

    Asset asset = store_.put(encoded);
    Logger::log(LogLevel::Info,
                std::string(asset.deduplicated ? "Deduplicated " : "Rehosted ") + decision.source_mime + " " +
                std::to_string(decision.source_width) + "x" + std::to_string(decision.source_height) + " -> " +
                asset.mime + " " + std::to_string(asset.width) + "x" + std::to_string(asset.height) + " at " +
                asset.public_url,
                kTag);
    return asset;
}

std::vector<Asset> AssetPipeline::process_batch(const std::vector<SourceDescriptor>& sources,
                                                const std::stop_token stop) {
    if (sources.empty()) {
        throw RehostError(ErrorKind::InvalidRequest, "batch is empty");
    }
    if (sources.size() > config_.max_batch_size) {
        throw RehostError(ErrorKind::InvalidRequest,
                          "batch of " + std::to_string(sources.size()) + " exceeds the maximum of " +
                          std::to_string(config_.max_batch_size));
    }

    std::vector<Asset> assets;
    assets.reserve(sources.size());
    for (std::size_t i = 0; i < sources.size(); ++i) {
        try {
            assets.push_back(process(sources[i], stop));
        } catch (const RehostError& e) {
            if (e.kind() == ErrorKind::Cancelled) throw;
            Logger::log(LogLevel::Error, "Batch item " + std::to_string(i) + " failed: " + e.what(), kTag);
            throw BatchItemError(i, e.kind(), e.what());
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "Batch item " + std::to_string(i) + " failed: " + e.what(), kTag);
            throw BatchItemError(i, ErrorKind::EncodingFailed, e.what());
        }
    }
    return assets;
}

} // namespace rehost
