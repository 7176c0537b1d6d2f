#include "../../include/s3_object_store.hpp"
#include "../../include/content_digest.hpp"
#include "../../include/logger.hpp"
#include <httplib.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace {

constexpr auto kTag = "s3_store";

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), out, &len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return {reinterpret_cast<const char*>(out), len};
}

std::string sha256_hex(const std::string_view data) {
    return rehost::to_hex(rehost::sha256({reinterpret_cast<const std::uint8_t*>(data.data()), data.size()}));
}

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim_value(const std::string& s) {
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// Host header exactly as cpp-httplib sends it
std::string host_header(const rehost::Url& url) {
    const bool default_port = (url.scheme == "https" && url.port == 443) || (url.scheme == "http" && url.port == 80);
    const std::string host = url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host;
    return default_port ? host : host + ":" + std::to_string(url.port);
}

} // namespace

namespace rehost {

SigV4Signer::SigV4Signer(std::string access_key_id, std::string secret_access_key,
                         std::string region, std::string service)
    : access_key_id_(std::move(access_key_id)),
      secret_access_key_(std::move(secret_access_key)),
      region_(std::move(region)),
      service_(std::move(service)) {}

std::string SigV4Signer::amz_date_now() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[17];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

std::string SigV4Signer::authorization(const SigV4Request& request, const std::string& amz_date) const {
    auto headers = request.headers;
    for (auto& [name, value] : headers) {
        name = lower(name);
        value = trim_value(value);
    }
    std::ranges::sort(headers, {}, &std::pair<std::string, std::string>::first);

    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : headers) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    const std::string canonical_request =
        request.method + "\n" +
        request.canonical_uri + "\n" +
        request.canonical_query + "\n" +
        canonical_headers + "\n" +
        signed_headers + "\n" +
        request.payload_sha256_hex;

    const std::string date = amz_date.substr(0, 8);
    const std::string scope = date + "/" + region_ + "/" + service_ + "/aws4_request";
    const std::string string_to_sign =
        "AWS4-HMAC-SHA256\n" + amz_date + "\n" + scope + "\n" + sha256_hex(canonical_request);

    const std::string k_date = hmac_sha256("AWS4" + secret_access_key_, date);
    const std::string k_region = hmac_sha256(k_date, region_);
    const std::string k_service = hmac_sha256(k_region, service_);
    const std::string k_signing = hmac_sha256(k_service, "aws4_request");
    const std::string signature = hmac_sha256(k_signing, string_to_sign);

    return "AWS4-HMAC-SHA256 Credential=" + access_key_id_ + "/" + scope +
           ", SignedHeaders=" + signed_headers +
           ", Signature=" + to_hex({reinterpret_cast<const std::uint8_t*>(signature.data()), signature.size()});
}

S3ObjectStore::S3ObjectStore(S3Config config)
    : config_(std::move(config)),
      signer_(config_.access_key_id, config_.secret_access_key, config_.region) {
    auto endpoint = parse_url(config_.endpoint);
    if (!endpoint || (endpoint->scheme != "https" && endpoint->scheme != "http")) {
        throw std::invalid_argument("invalid S3 endpoint: " + config_.endpoint);
    }
    if (config_.bucket.empty() || config_.access_key_id.empty() || config_.secret_access_key.empty()) {
        throw std::invalid_argument("S3 bucket and credentials are required");
    }
    if (config_.public_base_url.empty()) {
        throw std::invalid_argument("public base URL is required");
    }
    endpoint_ = std::move(*endpoint);
}

std::string S3ObjectStore::object_path(const std::string& key) const {
    return "/" + url_encode(config_.bucket, false) + "/" + url_encode(key, true);
}

bool S3ObjectStore::exists(const std::string& key) {
    const std::string path = object_path(key);
    const std::string amz_date = SigV4Signer::amz_date_now();
    const std::string payload_hash = sha256_hex("");

    SigV4Request req{"HEAD", path, "",
                     {{"host", host_header(endpoint_)},
                      {"x-amz-content-sha256", payload_hash},
                      {"x-amz-date", amz_date}},
                     payload_hash};

    httplib::Client cli(endpoint_.origin());
    cli.set_connection_timeout(static_cast<time_t>(config_.connect_timeout.count()), 0);
    cli.set_read_timeout(static_cast<time_t>(config_.request_timeout.count()), 0);
    cli.set_write_timeout(static_cast<time_t>(config_.request_timeout.count()), 0);

    const httplib::Headers headers{
        {"x-amz-content-sha256", payload_hash},
        {"x-amz-date", amz_date},
        {"Authorization", signer_.authorization(req, amz_date)}
    };

    const auto res = cli.Head(path, headers);
    if (!res) {
        throw std::runtime_error("HEAD " + key + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status == 404) {
        return false;
    }
    if (res->status >= 200 && res->status < 300) {
        return true;
    }
    throw std::runtime_error("HEAD " + key + " returned HTTP " + std::to_string(res->status));
}

std::string S3ObjectStore::put(const std::string& key,
                               const std::span<const std::uint8_t> bytes,
                               const std::string& content_type,
                               const std::string& cache_control) {
    const std::string path = object_path(key);
    const std::string amz_date = SigV4Signer::amz_date_now();
    const std::string payload_hash = to_hex(sha256(bytes));

    SigV4Request req{"PUT", path, "",
                     {{"host", host_header(endpoint_)},
                      {"cache-control", cache_control},
                      {"x-amz-content-sha256", payload_hash},
                      {"x-amz-date", amz_date},
                      {"x-amz-meta-source", config_.metadata_source}},
                     payload_hash};

    httplib::Client cli(endpoint_.origin());
    cli.set_connection_timeout(static_cast<time_t>(config_.connect_timeout.count()), 0);
    cli.set_read_timeout(static_cast<time_t>(config_.request_timeout.count()), 0);
    cli.set_write_timeout(static_cast<time_t>(config_.request_timeout.count()), 0);

    const httplib::Headers headers{
        {"Cache-Control", cache_control},
        {"x-amz-content-sha256", payload_hash},
        {"x-amz-date", amz_date},
        {"x-amz-meta-source", config_.metadata_source},
        {"Authorization", signer_.authorization(req, amz_date)}
    };

    const auto res = cli.Put(path, headers,
                             reinterpret_cast<const char*>(bytes.data()), bytes.size(),
                             content_type);
    if (!res) {
        throw std::runtime_error("PUT " + key + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw std::runtime_error("PUT " + key + " returned HTTP " + std::to_string(res->status));
    }

    Logger::log(LogLevel::Debug, "PUT " + path + " (" + std::to_string(bytes.size()) + " bytes)", kTag);
    return public_url_for(key);
}

} // namespace rehost
