/**
 * @file rehost.cpp
 * @brief Implementation of the public Rehost API.
 */

#include "../../include/rehost.hpp"
#include "../../include/asset_pipeline.hpp"
#include "../../include/html_transformer.hpp"
#include "../../include/url.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace rehost {

struct Rehost::Impl {
    const std::shared_ptr<IObjectStore> store;

    mutable std::mutex mutex;                ///< Guards config and pipeline
    PipelineConfig config;
    std::shared_ptr<AssetPipeline> pipeline; ///< Requests hold their own reference

    Impl(std::shared_ptr<IObjectStore> s, PipelineConfig c) : store(std::move(s)), config(std::move(c)) {
        if (!store) {
            throw std::invalid_argument("Rehost requires an object store");
        }
    }

    // Stages are built on first use so the encoder probe runs with the final configuration
    std::shared_ptr<AssetPipeline> get_pipeline() {
        std::lock_guard lock(mutex);
        if (!pipeline) {
            pipeline = std::make_shared<AssetPipeline>(config, store);
        }
        return pipeline;
    }

    // A rebuilt pipeline only serves later requests; running ones keep the old one alive
    template<class F>
    void configure(F&& change, const bool rebuild = true) {
        std::lock_guard lock(mutex);
        change(config);
        if (rebuild) pipeline.reset();
    }

    [[nodiscard]] PipelineConfig snapshot() const {
        std::lock_guard lock(mutex);
        return config;
    }

    [[nodiscard]] std::vector<std::string> asset_hosts() const {
        std::vector<std::string> hosts;
        if (const auto url = parse_url(store->public_url_for("probe"))) {
            hosts.push_back(url->host);
        }
        return hosts;
    }
};

Rehost::Rehost(std::shared_ptr<IObjectStore> store, PipelineConfig config)
    : impl_(std::make_unique<Impl>(std::move(store), std::move(config))) {}

Rehost::~Rehost() = default;

Rehost::Rehost(Rehost&&) noexcept = default;
Rehost& Rehost::operator=(Rehost&&) noexcept = default;

Rehost& Rehost::maxEdge(const int pixels) {
    impl_->configure([pixels](PipelineConfig& c) { c.decider.max_edge = pixels > 0 ? pixels : 3840; });
    return *this;
}

Rehost& Rehost::resizeThreshold(const std::size_t bytes) {
    impl_->configure([bytes](PipelineConfig& c) { c.decider.resize_byte_threshold = bytes; });
    return *this;
}

Rehost& Rehost::passthroughThreshold(const std::size_t bytes) {
    impl_->configure([bytes](PipelineConfig& c) { c.decider.passthrough_byte_threshold = bytes; });
    return *this;
}

Rehost& Rehost::jpegQuality(const int quality) {
    impl_->configure([quality](PipelineConfig& c) { c.encoder.jpeg_quality = std::clamp(quality, 1, 100); });
    return *this;
}

Rehost& Rehost::jpegProgressive(const bool val) {
    impl_->configure([val](PipelineConfig& c) { c.encoder.jpeg_progressive = val; });
    return *this;
}

Rehost& Rehost::pngOptimize(const bool val) {
    impl_->configure([val](PipelineConfig& c) { c.encoder.png_optimize = val; });
    return *this;
}

Rehost& Rehost::maxFetchBytes(const std::size_t bytes) {
    impl_->configure([bytes](PipelineConfig& c) { c.fetch.max_fetch_bytes = bytes; });
    return *this;
}

Rehost& Rehost::maxBatchSize(const std::size_t items) {
    impl_->configure([items](PipelineConfig& c) { c.max_batch_size = items; });
    return *this;
}

Rehost& Rehost::imageWorkers(const unsigned workers) {
    impl_->configure([workers](PipelineConfig& c) { c.html.image_workers = workers > 0 ? workers : 1; }, false);
    return *this;
}

Rehost& Rehost::assetHosts(std::vector<std::string> hosts) {
    impl_->configure([&hosts](PipelineConfig& c) { c.html.extra_asset_hosts = std::move(hosts); }, false);
    return *this;
}

PipelineConfig Rehost::config() const {
    return impl_->snapshot();
}

Asset Rehost::process_from_url(const std::string& url, const std::stop_token stop) {
    return impl_->get_pipeline()->process(SourceDescriptor::url(url), stop);
}

Asset Rehost::process_from_data_uri(const std::string& data_uri, const std::stop_token stop) {
    return impl_->get_pipeline()->process(SourceDescriptor::data_uri(data_uri), stop);
}

Asset Rehost::process_from_bytes(std::vector<std::uint8_t> bytes, const std::string& declared_type,
                                 const std::stop_token stop) {
    return impl_->get_pipeline()->process(SourceDescriptor::raw(std::move(bytes), declared_type), stop);
}

std::vector<Asset> Rehost::process_batch(const std::vector<SourceDescriptor>& sources, const std::stop_token stop) {
    return impl_->get_pipeline()->process_batch(sources, stop);
}

TransformResult Rehost::transform_html(const std::string_view html, const std::stop_token stop) {
    std::shared_ptr<AssetPipeline> pipeline = impl_->get_pipeline();
    const HtmlTransformer transformer(
        impl_->snapshot().html, impl_->asset_hosts(),
        [pipeline = std::move(pipeline)](const std::string& src, const std::stop_token st) {
            std::string scheme = src.substr(0, 5);
            std::ranges::transform(scheme, scheme.begin(), [](const unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return pipeline->process(scheme == "data:" ? SourceDescriptor::data_uri(src) : SourceDescriptor::url(src), st);
        });
    return transformer.transform(html, stop);
}

} // namespace rehost
