#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>

namespace {

struct Signature {
    std::size_t offset;
    std::string_view magic;
    std::string_view mime;
};

constexpr std::array<Signature, 7> kSignatures = {{
    {0, std::string_view("\xFF\xD8\xFF", 3), "image/jpeg"},
    {0, std::string_view("\x89PNG\r\n\x1A\n", 8), "image/png"},
    {0, "GIF87a", "image/gif"},
    {0, "GIF89a", "image/gif"},
    {8, "WEBP", "image/webp"},
    {0, std::string_view("II*\0", 4), "image/tiff"},
    {0, std::string_view("MM\0*", 4), "image/tiff"},
}};

bool matches(const std::span<const std::uint8_t> data, const Signature& sig) {
    if (data.size() < sig.offset + sig.magic.size()) return false;
    if (sig.mime == "image/webp" &&
        std::memcmp(data.data(), "RIFF", 4) != 0) {
        return false;
    }
    return std::memcmp(data.data() + sig.offset, sig.magic.data(), sig.magic.size()) == 0;
}

// libmagic handle with guaranteed close
struct MagicHandle {
    magic_t cookie = nullptr;
    MagicHandle() : cookie(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR)) {}
    ~MagicHandle() { if (cookie) magic_close(cookie); }
    MagicHandle(const MagicHandle&) = delete;
    MagicHandle& operator=(const MagicHandle&) = delete;
};

std::string detect_with_libmagic(const std::span<const std::uint8_t> data) {
    MagicHandle magic;
    if (!magic.cookie) return {};
    if (magic_load(magic.cookie, nullptr) != 0) {
        Logger::log(LogLevel::Debug, std::string("magic_load failed: ") + magic_error(magic.cookie), "libmagic");
        return {};
    }
    const char* mime = magic_buffer(magic.cookie, data.data(), data.size());
    return mime ? mime : "";
}

} // namespace

namespace rehost {

std::string MimeDetector::detect(const std::span<const std::uint8_t> data) {
    if (data.empty()) return "application/octet-stream";

    std::string mime = normalize(detect_with_libmagic(data));
    if (!mime.empty() && mime != "application/octet-stream" && mime != "text/plain") {
        return mime;
    }
    if (auto by_sig = detect_by_signature(data); !by_sig.empty()) {
        return by_sig;
    }
    return mime.empty() ? "application/octet-stream" : mime;
}

std::string MimeDetector::detect_by_signature(const std::span<const std::uint8_t> data) {
    for (const auto& sig : kSignatures) {
        if (matches(data, sig)) return std::string(sig.mime);
    }
    return {};
}

std::string MimeDetector::normalize(const std::string_view content_type) {
    auto end = content_type.find(';');
    std::string_view base = content_type.substr(0, end);
    while (!base.empty() && std::isspace(static_cast<unsigned char>(base.front()))) base.remove_prefix(1);
    while (!base.empty() && std::isspace(static_cast<unsigned char>(base.back()))) base.remove_suffix(1);

    std::string out(base);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (out == "image/jpg" || out == "image/pjpeg") return "image/jpeg";
    if (out == "image/x-png") return "image/png";
    if (out == "image/tif") return "image/tiff";
    return out;
}

bool MimeDetector::is_supported_image(const std::string_view mime) noexcept {
    return mime == "image/jpeg" || mime == "image/png" || mime == "image/gif" ||
           mime == "image/webp" || mime == "image/tiff";
}

} // namespace rehost
