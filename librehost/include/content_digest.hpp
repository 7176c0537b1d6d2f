/**
 * @file content_digest.hpp
 * @brief SHA-256 digests and the content-addressed storage key derived from them.
 */

#ifndef REHOST_CONTENT_DIGEST_HPP
#define REHOST_CONTENT_DIGEST_HPP

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace rehost {

    using Sha256 = std::array<std::uint8_t, 32>;

    /**
     * @brief SHA-256 of a buffer (OpenSSL EVP).
     * @throws std::runtime_error if the digest context cannot be created.
     */
    [[nodiscard]] Sha256 sha256(std::span<const std::uint8_t> data);

    [[nodiscard]] std::string to_hex(std::span<const std::uint8_t> data);

    /**
     * @brief RFC 4648 base32, lowercase alphabet, no padding.
     */
    [[nodiscard]] std::string base32_lower(std::span<const std::uint8_t> data);

    /**
     * @brief "sha256:" followed by the 64-char lowercase hex digest.
     */
    [[nodiscard]] std::string digest_string(const Sha256& digest);

    /**
     * @brief Sharded storage key for a digest.
     *
     * The first 26 base32 characters (130 bits) of the digest become
     * "xx/yyyyyyyyyyyyyyyyyyyyyyyy" followed by ".png" for image/png and
     * ".jpg" for everything else.
     */
    [[nodiscard]] std::string storage_key(const Sha256& digest, std::string_view mime);

} // namespace rehost

#endif // REHOST_CONTENT_DIGEST_HPP
