#include <catch2/catch_test_macros.hpp>
#include "../../librehost/include/content_digest.hpp"
#include <string>

using namespace rehost;

namespace {

std::span<const std::uint8_t> as_bytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

} // namespace

TEST_CASE("SHA-256 digests", "[ContentDigest]") {
    const std::string abc = "abc";
    const Sha256 digest = sha256(as_bytes(abc));

    REQUIRE(to_hex(digest) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(digest_string(digest) == "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    const std::string empty;
    REQUIRE(to_hex(sha256(as_bytes(empty))) ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("Base32 uses the lowercase RFC 4648 alphabet without padding", "[ContentDigest]") {
    REQUIRE(base32_lower(as_bytes("")).empty());
    REQUIRE(base32_lower(as_bytes("f")) == "my");
    REQUIRE(base32_lower(as_bytes("fo")) == "mzxq");
    REQUIRE(base32_lower(as_bytes("foobar")) == "mzxw6ytboi");
}

TEST_CASE("Storage keys are sharded and typed", "[ContentDigest]") {
    const Sha256 digest = sha256(as_bytes("abc"));

    SECTION("PNG") {
        REQUIRE(storage_key(digest, "image/png") == "xj/4bnp4pahh6uqkbidpf3lrceo.png");
    }

    SECTION("JPEG and anything else") {
        REQUIRE(storage_key(digest, "image/jpeg") == "xj/4bnp4pahh6uqkbidpf3lrceo.jpg");
        REQUIRE(storage_key(digest, "image/gif") == "xj/4bnp4pahh6uqkbidpf3lrceo.jpg");
    }

    SECTION("Key length") {
        // 2 shard chars, '/', 24 chars, extension
        REQUIRE(storage_key(digest, "image/png").size() == 2 + 1 + 24 + 4);
    }
}
