/**
 * @file fetcher.hpp
 * @brief Turns a source descriptor (HTTPS URL, data URI, raw bytes) into bytes plus content type.
 */

#ifndef REHOST_FETCHER_HPP
#define REHOST_FETCHER_HPP

#include "config.hpp"
#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <sys/socket.h>

namespace rehost {

    /**
     * @brief Accumulates a response body and refuses to grow past a cap.
     *
     * append() returns false (and sets exceeded()) on the first chunk that
     * would cross the cap; the chunk is not stored, so memory never exceeds
     * the cap however large the remote body is.
     */
    class BoundedBodyCollector {
    public:
        explicit BoundedBodyCollector(const std::size_t max_bytes) : max_bytes_(max_bytes) {}

        [[nodiscard]] bool append(const char* data, std::size_t size);

        [[nodiscard]] bool exceeded() const noexcept { return exceeded_; }
        [[nodiscard]] std::size_t size() const noexcept { return body_.size(); }
        [[nodiscard]] Bytes take() noexcept { return std::move(body_); }

    private:
        std::size_t max_bytes_;
        bool exceeded_ = false;
        Bytes body_;
    };

    /**
     * @brief True for addresses a fetch must never connect to.
     *
     * Covers loopback, private, link-local, unspecified and link-local
     * multicast ranges of both families, and IPv4-mapped IPv6 addresses
     * whose embedded IPv4 address is forbidden.
     */
    [[nodiscard]] bool is_forbidden_address(const sockaddr* addr) noexcept;

    /**
     * @brief Same check for a numeric address literal ("10.0.0.1", "::1").
     * @return std::nullopt when the text is not an IP literal.
     */
    [[nodiscard]] std::optional<bool> is_forbidden_ip_literal(std::string_view ip);

    /**
     * @brief Decode "data:[mediatype][;base64],<data>".
     *
     * The payload is percent-decoded first; base64 payloads are then
     * decoded strictly (whitespace ignored, padding optional). A missing
     * media type yields "text/plain", which the decider re-sniffs.
     *
     * @throws RehostError(MalformedInput) for anything else.
     */
    [[nodiscard]] SourceImage parse_data_uri(std::string_view uri);

    /**
     * @brief Retrieves source images over HTTPS with SSRF protection.
     *
     * Each hop resolves the host, rejects the request if any resolved
     * address is forbidden and pins the TLS connection to the vetted
     * address. Redirects are followed manually so every hop is vetted.
     */
    class Fetcher {
    public:
        explicit Fetcher(FetchConfig config) : config_(std::move(config)) {}

        /**
         * @brief GET an https:// URL.
         *
         * @throws RehostError(InvalidSource) for non-HTTPS URLs, resolution
         * failures, transport errors, timeouts and non-200 statuses.
         * @throws RehostError(ForbiddenDestination) if the host resolves to a
         * forbidden address.
         * @throws RehostError(PayloadTooLarge) if the declared length or the
         * body read so far crosses max_fetch_bytes.
         * @throws RehostError(Cancelled) if @p stop is triggered mid-transfer.
         */
        [[nodiscard]] SourceImage fetch_url(const std::string& url, std::stop_token stop = {}) const;

        /**
         * @brief Raw upload. An empty @p declared_type is sniffed.
         */
        [[nodiscard]] static SourceImage from_bytes(Bytes bytes, std::string_view declared_type);

        [[nodiscard]] const FetchConfig& config() const noexcept { return config_; }

    private:
        FetchConfig config_;
    };

} // namespace rehost

#endif // REHOST_FETCHER_HPP
