#include <catch2/catch_test_macros.hpp>
#include "../../librehost/include/memory_object_store.hpp"
#include "../../librehost/include/rehost.hpp"
#include "test_images.hpp"
#include <atomic>
#include <memory>
#include <thread>

using namespace rehost;

TEST_CASE("Setters update the configuration", "[Rehost]") {
    Rehost rehost(std::make_shared<MemoryObjectStore>("https://assets.example.com"));
    rehost.maxEdge(0).jpegQuality(150).imageWorkers(0).maxBatchSize(7).assetHosts({"cdn.example.net"});

    const PipelineConfig config = rehost.config();
    REQUIRE(config.decider.max_edge == 3840);
    REQUIRE(config.encoder.jpeg_quality == 100);
    REQUIRE(config.html.image_workers == 1);
    REQUIRE(config.max_batch_size == 7);
    REQUIRE(config.html.extra_asset_hosts == std::vector<std::string>{"cdn.example.net"});
}

TEST_CASE("Reconfiguring while requests run", "[Rehost]") {
    auto objects = std::make_shared<MemoryObjectStore>("https://assets.example.com");
    Rehost rehost(objects);
    rehost.pngOptimize(false);
    const std::string image = data_uri("image/png", png_bytes(gradient_raster(24, 24)));

    std::atomic<bool> done{false};
    std::atomic<int> processed{0};
    std::atomic<int> failed{0};
    std::thread worker([&] {
        for (int i = 0; i < 40; ++i) {
            try {
                const TransformResult result = rehost.transform_html("<img src=\"" + image + "\">");
                if (result.stats.images_rehosted == 1) processed.fetch_add(1);
                else failed.fetch_add(1);
                (void)rehost.process_from_data_uri(image);
            } catch (const std::exception&) {
                failed.fetch_add(1);
            }
        }
        done.store(true);
    });

    // every setter drops the current pipeline while the worker may be inside it
    int round = 0;
    while (!done.load()) {
        rehost.jpegQuality(80 + round % 10).passthroughThreshold(round % 2 ? 0 : 1024 * 1024);
        ++round;
        std::this_thread::yield();
    }
    worker.join();

    REQUIRE(failed.load() == 0);
    REQUIRE(processed.load() == 40);
    REQUIRE(objects->object_count() >= 1);
}
