#include <catch2/catch_test_macros.hpp>
#include "report/json_report.hpp"

using namespace rehost;

TEST_CASE("Assets are reported with their public fields", "[JsonReport]") {
    Asset asset;
    asset.public_url = "https://assets.example.com/xj/4bnp4pahh6uqkbidpf3lrceo.png";
    asset.mime = "image/png";
    asset.width = 10;
    asset.height = 20;
    asset.byte_size = 1234;
    asset.content_digest = "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    asset.storage_key = "xj/4bnp4pahh6uqkbidpf3lrceo.png";
    asset.deduplicated = true;

    const auto json = asset_to_json(asset);
    REQUIRE(json["url"] == asset.public_url);
    REQUIRE(json["mime"] == "image/png");
    REQUIRE(json["width"] == 10);
    REQUIRE(json["height"] == 20);
    REQUIRE(json["bytes"] == 1234);
    REQUIRE(json["hash"] == asset.content_digest);
    REQUIRE(json["deduped"] == true);
    REQUIRE(json["key"] == asset.storage_key);

    const auto list = assets_to_json({asset, asset});
    REQUIRE(list.is_array());
    REQUIRE(list.size() == 2);
    REQUIRE(assets_to_json({}).is_array());
}

TEST_CASE("Transform results", "[JsonReport]") {
    TransformResult result;
    result.html = "<div>x</div>";
    result.messages = {"Image rehosted: a -> b"};
    result.stats.images_processed = 2;
    result.stats.images_rehosted = 1;
    result.stats.scripts_removed = 3;

    const auto full = transform_to_json(result);
    REQUIRE(full["html"] == "<div>x</div>");
    REQUIRE(full["messages"].size() == 1);
    REQUIRE(full["stats"]["images_processed"] == 2);
    REQUIRE(full["stats"]["images_rehosted"] == 1);
    REQUIRE(full["stats"]["styles_removed"] == 0);
    REQUIRE(full["stats"]["scripts_removed"] == 3);

    const auto without_html = transform_to_json(result, false);
    REQUIRE_FALSE(without_html.contains("html"));
    REQUIRE(without_html["messages"][0] == "Image rehosted: a -> b");
}

TEST_CASE("Errors name their kind", "[JsonReport]") {
    SECTION("Plain error") {
        const auto json = error_to_json(RehostError(ErrorKind::ForbiddenDestination, "blocked 10.0.0.1"));
        REQUIRE(json["error"]["kind"] == "ForbiddenDestination");
        REQUIRE(json["error"]["message"] == "blocked 10.0.0.1");
        REQUIRE_FALSE(json["error"].contains("index"));
    }

    SECTION("Batch item") {
        const auto json = error_to_json(BatchItemError(2, ErrorKind::UnsupportedFormat, "not an image"));
        REQUIRE(json["error"]["kind"] == "BatchItemFailed");
        REQUIRE(json["error"]["index"] == 2);
        REQUIRE(json["error"]["cause"] == "UnsupportedFormat");
        REQUIRE(json["error"]["message"] == "failed to process item 2: not an image");
    }
}
