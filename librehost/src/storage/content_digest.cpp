#include "../../include/content_digest.hpp"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

constexpr std::string_view kBase32Alphabet = "abcdefghijklmnopqrstuvwxyz234567";
constexpr std::size_t kKeyChars = 26;

} // namespace

namespace rehost {

Sha256 sha256(const std::span<const std::uint8_t> data) {
    const std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

    Sha256 out{};
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size()) {
        throw std::runtime_error("SHA-256 computation failed");
    }
    return out;
}

std::string to_hex(const std::span<const std::uint8_t> data) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (const auto b : data) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

std::string base32_lower(const std::span<const std::uint8_t> data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (const auto b : data) {
        buffer = (buffer << 8) | b;
        bits += 8;
        while (bits >= 5) {
            out.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

std::string digest_string(const Sha256& digest) {
    return "sha256:" + to_hex(digest);
}

std::string storage_key(const Sha256& digest, const std::string_view mime) {
    const std::string encoded = base32_lower(digest).substr(0, kKeyChars);
    const std::string_view ext = mime == "image/png" ? ".png" : ".jpg";
    return encoded.substr(0, 2) + "/" + encoded.substr(2) + std::string(ext);
}

} // namespace rehost
