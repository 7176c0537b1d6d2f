#include "../../include/fetcher.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/url.hpp"
#include <httplib.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <map>
#include <memory>
#include <vector>

namespace {

constexpr auto kTag = "fetcher";

struct AddrInfoDeleter {
    void operator()(addrinfo* ai) const noexcept { if (ai) freeaddrinfo(ai); }
};
using unique_addrinfo = std::unique_ptr<addrinfo, AddrInfoDeleter>;

bool forbidden_v4(const std::uint32_t host_order) noexcept {
    const auto in = [host_order](const std::uint32_t net, const int bits) {
        const std::uint32_t mask = bits == 0 ? 0 : ~0u << (32 - bits);
        return (host_order & mask) == net;
    };
    return in(0x00000000, 8)      // 0.0.0.0/8
        || in(0x0A000000, 8)      // 10.0.0.0/8
        || in(0x64400000, 10)     // 100.64.0.0/10
        || in(0x7F000000, 8)      // 127.0.0.0/8
        || in(0xA9FE0000, 16)     // 169.254.0.0/16
        || in(0xAC100000, 12)     // 172.16.0.0/12
        || in(0xC0A80000, 16)     // 192.168.0.0/16
        || in(0xE0000000, 24);    // 224.0.0.0/24
}

std::uint32_t embedded_v4(const std::uint8_t (&b)[16], const std::size_t at) noexcept {
    return (static_cast<std::uint32_t>(b[at]) << 24) | (static_cast<std::uint32_t>(b[at + 1]) << 16) |
           (static_cast<std::uint32_t>(b[at + 2]) << 8) | b[at + 3];
}

bool forbidden_v6(const std::uint8_t (&b)[16]) noexcept {
    static constexpr std::uint8_t kZero[16] = {};
    static constexpr std::uint8_t kNat64[12] = {0x00, 0x64, 0xFF, 0x9B};

    if ((b[0] & 0xFE) == 0xFC) return true;                 // fc00::/7
    if (b[0] == 0xFE && (b[1] & 0xC0) == 0x80) return true; // fe80::/10
    if (b[0] == 0xFF && b[1] == 0x02) return true;          // ff02::/16

    // forms that carry an IPv4 address a gateway may route to
    if (std::memcmp(b, kZero, 12) == 0) {
        return forbidden_v4(embedded_v4(b, 12));            // ::a.b.c.d, also :: and ::1
    }
    if (std::memcmp(b, kZero, 10) == 0 && b[10] == 0xFF && b[11] == 0xFF) {
        return forbidden_v4(embedded_v4(b, 12));            // ::ffff:a.b.c.d
    }
    if (std::memcmp(b, kNat64, 12) == 0) {
        return forbidden_v4(embedded_v4(b, 12));            // 64:ff9b::a.b.c.d
    }
    if (b[0] == 0x20 && b[1] == 0x02) {
        return forbidden_v4(embedded_v4(b, 2));             // 2002:a.b.c.d::/48
    }
    return false;
}

std::string address_to_string(const sockaddr* addr) {
    char buf[INET6_ADDRSTRLEN] = {};
    if (addr->sa_family == AF_INET) {
        inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in*>(addr)->sin_addr, buf, sizeof(buf));
    } else if (addr->sa_family == AF_INET6) {
        inet_ntop(AF_INET6, &reinterpret_cast<const sockaddr_in6*>(addr)->sin6_addr, buf, sizeof(buf));
    }
    return buf;
}

// Resolves the host and vets every answer. Returns the address to pin.
std::string resolve_and_vet(const std::string& host) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    if (const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &raw); rc != 0) {
        throw rehost::RehostError(rehost::ErrorKind::InvalidSource,
                                  "cannot resolve host " + host + ": " + gai_strerror(rc));
    }
    const unique_addrinfo list(raw);

    std::string pinned;
    for (const addrinfo* ai = list.get(); ai; ai = ai->ai_next) {
        if (ai->ai_family != AF_INET && ai->ai_family != AF_INET6) continue;
        const std::string ip = address_to_string(ai->ai_addr);
        if (rehost::is_forbidden_address(ai->ai_addr)) {
            Logger::log(LogLevel::Warning, "Blocked fetch of " + host + " (resolves to " + ip + ")", kTag);
            throw rehost::RehostError(rehost::ErrorKind::ForbiddenDestination,
                                      "host " + host + " resolves to forbidden address " + ip);
        }
        if (pinned.empty()) pinned = ip;
    }
    if (pinned.empty()) {
        throw rehost::RehostError(rehost::ErrorKind::InvalidSource, "no usable address for host " + host);
    }
    return pinned;
}

bool is_redirect(const int status) noexcept {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

int base64_value(const char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

std::optional<rehost::Bytes> base64_decode(const std::string_view text) {
    std::string clean;
    clean.reserve(text.size());
    for (const char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) clean.push_back(c);
    }
    while (!clean.empty() && clean.back() == '=') clean.pop_back();
    if (clean.size() % 4 == 1) return std::nullopt;

    rehost::Bytes out;
    out.reserve(clean.size() * 3 / 4);
    std::uint32_t acc = 0;
    int bits = 0;
    for (const char c : clean) {
        const int v = base64_value(c);
        if (v < 0) return std::nullopt;
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return std::string(s);
}

} // namespace

namespace rehost {

bool BoundedBodyCollector::append(const char* data, const std::size_t size) {
    if (exceeded_) return false;
    if (size > max_bytes_ - body_.size()) {
        exceeded_ = true;
        return false;
    }
    body_.insert(body_.end(), reinterpret_cast<const std::uint8_t*>(data),
                 reinterpret_cast<const std::uint8_t*>(data) + size);
    return true;
}

bool is_forbidden_address(const sockaddr* addr) noexcept {
    if (!addr) return true;
    if (addr->sa_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(addr);
        return forbidden_v4(ntohl(in->sin_addr.s_addr));
    }
    if (addr->sa_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
        std::uint8_t bytes[16];
        std::memcpy(bytes, &in6->sin6_addr, sizeof(bytes));
        return forbidden_v6(bytes);
    }
    return true;
}

std::optional<bool> is_forbidden_ip_literal(const std::string_view ip) {
    const std::string text(ip);
    sockaddr_in v4{};
    if (inet_pton(AF_INET, text.c_str(), &v4.sin_addr) == 1) {
        v4.sin_family = AF_INET;
        return is_forbidden_address(reinterpret_cast<const sockaddr*>(&v4));
    }
    sockaddr_in6 v6{};
    if (inet_pton(AF_INET6, text.c_str(), &v6.sin6_addr) == 1) {
        v6.sin6_family = AF_INET6;
        return is_forbidden_address(reinterpret_cast<const sockaddr*>(&v6));
    }
    return std::nullopt;
}

SourceImage parse_data_uri(const std::string_view uri) {
    if (uri.size() < 5 || lower(uri.substr(0, 5)) != "data:") {
        throw RehostError(ErrorKind::MalformedInput, "not a data URI");
    }
    const auto comma = uri.find(',');
    if (comma == std::string_view::npos) {
        throw RehostError(ErrorKind::MalformedInput, "data URI has no ',' separator");
    }

    const std::string_view meta = uri.substr(5, comma - 5);
    std::vector<std::string> params;
    std::size_t start = 0;
    while (start <= meta.size()) {
        const auto semi = meta.find(';', start);
        const auto end = semi == std::string_view::npos ? meta.size() : semi;
        params.push_back(trim(meta.substr(start, end - start)));
        if (semi == std::string_view::npos) break;
        start = semi + 1;
    }

    bool base64 = false;
    if (params.size() > 1 && lower(params.back()) == "base64") {
        base64 = true;
        params.pop_back();
    }

    std::string media_type = params.empty() ? std::string() : params.front();
    if (!media_type.empty() && media_type.find('/') == std::string::npos) {
        throw RehostError(ErrorKind::MalformedInput, "invalid media type in data URI: " + media_type);
    }
    if (media_type.empty()) media_type = "text/plain";

    const auto decoded = url_decode(uri.substr(comma + 1));
    if (!decoded) {
        throw RehostError(ErrorKind::MalformedInput, "invalid percent-encoding in data URI");
    }

    SourceImage out;
    out.content_type = MimeDetector::normalize(media_type);
    if (base64) {
        auto bytes = base64_decode(*decoded);
        if (!bytes) {
            throw RehostError(ErrorKind::MalformedInput, "invalid base64 payload in data URI");
        }
        out.bytes = std::move(*bytes);
    } else {
        out.bytes.assign(decoded->begin(), decoded->end());
    }
    if (out.bytes.empty()) {
        throw RehostError(ErrorKind::MalformedInput, "data URI has an empty payload");
    }
    return out;
}

SourceImage Fetcher::from_bytes(Bytes bytes, const std::string_view declared_type) {
    SourceImage out;
    out.content_type = declared_type.empty() ? MimeDetector::detect(bytes) : MimeDetector::normalize(declared_type);
    out.bytes = std::move(bytes);
    return out;
}

SourceImage Fetcher::fetch_url(const std::string& url, const std::stop_token stop) const {
    auto current = parse_url(url);
    if (!current) {
        throw RehostError(ErrorKind::InvalidSource, "invalid URL: " + url);
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.request_timeout;

    for (int hop = 0; hop <= config_.max_redirects; ++hop) {
        if (current->scheme != "https") {
            throw RehostError(ErrorKind::InvalidSource, "only https URLs are allowed: " + current->str());
        }
        if (stop.stop_requested()) {
            throw RehostError(ErrorKind::Cancelled, "fetch cancelled");
        }

        const std::string pinned = resolve_and_vet(current->host);

        httplib::SSLClient cli(current->host, current->port);
        cli.set_hostname_addr_map({{current->host, pinned}});
        cli.enable_server_certificate_verification(true);
        cli.set_follow_location(false);
        cli.set_connection_timeout(static_cast<time_t>(config_.connect_timeout.count()), 0);
        cli.set_read_timeout(static_cast<time_t>(config_.request_timeout.count()), 0);
        cli.set_write_timeout(static_cast<time_t>(config_.request_timeout.count()), 0);

        const httplib::Headers headers{
            {"User-Agent", config_.user_agent},
            {"Accept", "image/*,*/*;q=0.8"}
        };

        int status = 0;
        std::string location;
        std::string content_type;
        bool declared_too_large = false;
        bool cancelled = false;
        bool timed_out = false;
        BoundedBodyCollector body(config_.max_fetch_bytes);

        const auto res = cli.Get(
            current->target(), headers,
            [&](const httplib::Response& response) {
                status = response.status;
                if (is_redirect(status)) {
                    location = response.get_header_value("Location");
                    return false;
                }
                if (status != 200) return false;
                if (response.has_header("Content-Length")) {
                    const auto length = std::strtoull(response.get_header_value("Content-Length").c_str(), nullptr, 10);
                    if (length > config_.max_fetch_bytes) {
                        declared_too_large = true;
                        return false;
                    }
                }
                content_type = response.get_header_value("Content-Type");
                return true;
            },
            [&](const char* data, const size_t length) {
                if (stop.stop_requested()) {
                    cancelled = true;
                    return false;
                }
                if (std::chrono::steady_clock::now() > deadline) {
                    timed_out = true;
                    return false;
                }
                return body.append(data, length);
            });

        if (cancelled || stop.stop_requested()) {
            throw RehostError(ErrorKind::Cancelled, "fetch cancelled: " + current->str());
        }
        if (declared_too_large || body.exceeded()) {
            Logger::log(LogLevel::Warning, "Response from " + current->host + " exceeds " +
                        std::to_string(config_.max_fetch_bytes) + " bytes", kTag);
            throw RehostError(ErrorKind::PayloadTooLarge,
                              "response exceeds " + std::to_string(config_.max_fetch_bytes) + " bytes");
        }
        if (timed_out) {
            throw RehostError(ErrorKind::InvalidSource, "request timed out: " + current->str());
        }
        if (status == 0) {
            throw RehostError(ErrorKind::InvalidSource,
                              "request to " + current->host + " failed: " + httplib::to_string(res.error()));
        }

        if (is_redirect(status)) {
            if (location.empty()) {
                throw RehostError(ErrorKind::InvalidSource, "redirect without Location from " + current->str());
            }
            auto next = resolve_reference(*current, location);
            if (!next) {
                throw RehostError(ErrorKind::InvalidSource, "invalid redirect target: " + location);
            }
            Logger::log(LogLevel::Debug, "Redirect " + std::to_string(status) + " -> " + next->str(), kTag);
            current = std::move(next);
            continue;
        }

        if (status != 200) {
            throw RehostError(ErrorKind::InvalidSource, "HTTP " + std::to_string(status) + " from " + current->str());
        }
        if (!res) {
            throw RehostError(ErrorKind::InvalidSource,
                              "request to " + current->host + " failed: " + httplib::to_string(res.error()));
        }

        SourceImage out;
        out.bytes = body.take();
        out.content_type = content_type.empty() ? MimeDetector::detect(out.bytes) : MimeDetector::normalize(content_type);
        Logger::log(LogLevel::Info, "Fetched " + current->host + current->path + " (" +
                    std::to_string(out.bytes.size()) + " bytes, " + out.content_type + ")", kTag);
        return out;
    }

    throw RehostError(ErrorKind::InvalidSource,
                      "too many redirects (max " + std::to_string(config_.max_redirects) + ")");
}

} // namespace rehost
