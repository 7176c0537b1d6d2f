/**
 * @file s3_object_store.hpp
 * @brief S3-compatible object store (Cloudflare R2, AWS S3, MinIO) over cpp-httplib.
 */

#ifndef REHOST_S3_OBJECT_STORE_HPP
#define REHOST_S3_OBJECT_STORE_HPP

#include "object_store.hpp"
#include "url.hpp"
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace rehost {

    /**
     * @brief Connection settings for an S3-compatible endpoint.
     */
    struct S3Config {
        std::string endpoint;          ///< e.g. https://<account>.r2.cloudflarestorage.com
        std::string bucket = "format-assets";
        std::string access_key_id;
        std::string secret_access_key;
        std::string region = "auto";
        std::string public_base_url;   ///< CDN base the objects are served from
        std::string metadata_source = "rehost";
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds request_timeout{30};
    };

    /**
     * @brief Request fields covered by an AWS Signature Version 4.
     */
    struct SigV4Request {
        std::string method;
        std::string canonical_uri;    ///< Already URI-encoded
        std::string canonical_query;  ///< Already sorted and encoded
        std::vector<std::pair<std::string, std::string>> headers; ///< Signed headers
        std::string payload_sha256_hex;
    };

    /**
     * @brief AWS Signature Version 4 (HMAC-SHA256) request signer.
     */
    class SigV4Signer {
    public:
        SigV4Signer(std::string access_key_id, std::string secret_access_key,
                    std::string region, std::string service = "s3");

        /**
         * @brief Value of the Authorization header.
         * @param amz_date Request time as YYYYMMDD'T'HHMMSS'Z'.
         */
        [[nodiscard]] std::string authorization(const SigV4Request& request, const std::string& amz_date) const;

        /**
         * @brief Current UTC time in x-amz-date format.
         */
        [[nodiscard]] static std::string amz_date_now();

    private:
        std::string access_key_id_;
        std::string secret_access_key_;
        std::string region_;
        std::string service_;
    };

    /**
     * @brief IObjectStore speaking the S3 REST API (path-style HEAD/PUT).
     *
     * HEAD 404 means absent; any other non-2xx status or transport error
     * is thrown. PUT sends Cache-Control, Content-Type and
     * x-amz-meta-source and is never retried.
     */
    class S3ObjectStore final : public IObjectStore {
    public:
        /**
         * @throws std::invalid_argument for a malformed endpoint or missing credentials.
         */
        explicit S3ObjectStore(S3Config config);

        [[nodiscard]] bool exists(const std::string& key) override;

        std::string put(const std::string& key,
                        std::span<const std::uint8_t> bytes,
                        const std::string& content_type,
                        const std::string& cache_control) override;

        [[nodiscard]] std::string public_url_for(const std::string& key) const override {
            return join_public_url(config_.public_base_url, key);
        }

    private:
        [[nodiscard]] std::string object_path(const std::string& key) const;

        S3Config config_;
        Url endpoint_;
        SigV4Signer signer_;
    };

} // namespace rehost

#endif // REHOST_S3_OBJECT_STORE_HPP
