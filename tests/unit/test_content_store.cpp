#include <catch2/catch_test_macros.hpp>
#include "../../librehost/include/content_digest.hpp"
#include "../../librehost/include/content_store.hpp"
#include "../../librehost/include/errors.hpp"
#include "../../librehost/include/memory_object_store.hpp"

using namespace rehost;

namespace {

EncodedImage image_of(const Bytes& bytes, const std::string& mime) {
    return EncodedImage{bytes, mime, 3, 2};
}

} // namespace

TEST_CASE("ContentStore deduplicates identical bytes", "[ContentStore]") {
    auto objects = std::make_shared<MemoryObjectStore>("https://assets.example.com/");
    ContentStore store(objects, StoreConfig{});
    const Bytes bytes = {1, 2, 3, 4, 5};

    const Asset first = store.put(image_of(bytes, "image/jpeg"));
    REQUIRE_FALSE(first.deduplicated);
    REQUIRE(first.storage_key == storage_key(sha256(bytes), "image/jpeg"));
    REQUIRE(first.public_url == "https://assets.example.com/" + first.storage_key);
    REQUIRE(first.content_digest == digest_string(sha256(bytes)));
    REQUIRE(first.byte_size == bytes.size());
    REQUIRE(first.width == 3);
    REQUIRE(first.height == 2);
    REQUIRE(objects->put_count() == 1);

    const auto stored = objects->get(first.storage_key);
    REQUIRE(stored.has_value());
    REQUIRE(stored->bytes == bytes);
    REQUIRE(stored->content_type == "image/jpeg");
    REQUIRE(stored->cache_control == "public, max-age=31536000, immutable");

    const Asset second = store.put(image_of(bytes, "image/jpeg"));
    REQUIRE(second.deduplicated);
    REQUIRE(second.storage_key == first.storage_key);
    REQUIRE(second.public_url == first.public_url);
    REQUIRE(objects->put_count() == 1);
    REQUIRE(objects->exists_count() == 2);
}

TEST_CASE("Different bytes get different keys", "[ContentStore]") {
    auto objects = std::make_shared<MemoryObjectStore>("https://assets.example.com");
    ContentStore store(objects, StoreConfig{});

    const Asset a = store.put(image_of({1, 2, 3}, "image/png"));
    const Asset b = store.put(image_of({1, 2, 4}, "image/png"));
    REQUIRE(a.storage_key != b.storage_key);
    REQUIRE(a.storage_key.ends_with(".png"));
    REQUIRE(objects->object_count() == 2);
}

TEST_CASE("Storage failures are typed", "[ContentStore]") {
    auto objects = std::make_shared<MemoryObjectStore>("https://assets.example.com");
    ContentStore store(objects, StoreConfig{});

    SECTION("Existence check failure") {
        objects->fail_exists(true);
        try {
            (void)store.put(image_of({9, 9, 9}, "image/jpeg"));
            FAIL("put succeeded with a failing existence check");
        } catch (const RehostError& e) {
            REQUIRE(e.kind() == ErrorKind::StorageUnavailable);
        }
        REQUIRE(objects->put_count() == 0);
    }

    SECTION("Upload failure") {
        objects->fail_put(true);
        try {
            (void)store.put(image_of({9, 9, 9}, "image/jpeg"));
            FAIL("put succeeded with a failing upload");
        } catch (const RehostError& e) {
            REQUIRE(e.kind() == ErrorKind::StorageWriteFailed);
        }
        REQUIRE(objects->object_count() == 0);
    }
}
