/**
 * @file url.hpp
 * @brief Minimal absolute-URL parsing and encoding helpers.
 */

#ifndef REHOST_URL_HPP
#define REHOST_URL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rehost {

    /**
     * @brief Components of an absolute hierarchical URL.
     *
     * scheme and host are lower-cased; IPv6 literals are stored without
     * brackets. port is the explicit port or the scheme default.
     */
    struct Url {
        std::string scheme;
        std::string userinfo;
        std::string host;
        int port = 0;
        bool explicit_port = false;
        std::string path;      ///< Always starts with '/'
        std::string query;     ///< Without the leading '?'
        bool has_query = false;
        std::string fragment;  ///< Without the leading '#'
        bool has_fragment = false;

        /**
         * @brief Path plus query, as sent on the request line.
         */
        [[nodiscard]] std::string target() const;

        /**
         * @brief Host (bracketed for IPv6) plus ":port" when explicit.
         */
        [[nodiscard]] std::string authority() const;

        /**
         * @brief scheme://authority
         */
        [[nodiscard]] std::string origin() const;

        /**
         * @brief Reassemble the full URL.
         */
        [[nodiscard]] std::string str() const;
    };

    /**
     * @brief Parse an absolute http(s)-style URL.
     * @return std::nullopt when there is no scheme, no host or a bad port.
     */
    [[nodiscard]] std::optional<Url> parse_url(std::string_view text);

    /**
     * @brief Resolve a redirect Location against the URL it came from.
     */
    [[nodiscard]] std::optional<Url> resolve_reference(const Url& base, std::string_view reference);

    /**
     * @brief RFC 3986 percent-encoding of everything but unreserved characters.
     * @param keep_slash Leave '/' untouched (S3 object keys).
     */
    [[nodiscard]] std::string url_encode(std::string_view text, bool keep_slash);

    /**
     * @brief Decode %XX escapes. '+' is left as is.
     * @return std::nullopt on a truncated or non-hex escape.
     */
    [[nodiscard]] std::optional<std::string> url_decode(std::string_view text);

    /**
     * @brief Split "a=1&b=2" into ordered raw (still encoded) pairs.
     * A parameter without '=' has an empty value and has_value == false.
     */
    struct QueryParam {
        std::string name;
        std::string value;
        bool has_value = true;
    };
    [[nodiscard]] std::vector<QueryParam> split_query(std::string_view query);
    [[nodiscard]] std::string join_query(const std::vector<QueryParam>& params);

} // namespace rehost

#endif // REHOST_URL_HPP
