/**
 * @file html_transformer.hpp
 * @brief Rehosts the images of pasted HTML and rewrites it into the Gmail-safe subset.
 */

#ifndef REHOST_HTML_TRANSFORMER_HPP
#define REHOST_HTML_TRANSFORMER_HPP

#include "config.hpp"
#include "html_dom.hpp"
#include "types.hpp"
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace rehost {

    /**
     * @brief Rehosts one image reference (https URL or data URI).
     */
    using ImageRehoster = std::function<Asset(const std::string& src, std::stop_token stop)>;

    /**
     * @brief How an <img src> is treated.
     */
    enum class ImageAction {
        Keep,            ///< Own asset or a stable https URL
        Rehost,
        BlobUrl,         ///< Browser-local, cannot be fetched
        MailAttachment   ///< Needs the mail provider's per-user auth
    };

    /**
     * @brief Document-level transform.
     *
     * @details Steps, in order:
     * 1. every <img> with a src is classified and, when worth it, rehosted
     *    (optionally on a worker pool; rewrites stay on the calling thread
     *    in document order);
     * 2. <script> and <style> elements are removed and counted;
     * 3. p, div, h1-h6 and blockquote are rewritten to Gmail-styled markup
     *    and links get the Gmail link colour;
     * 4. on* attributes and non-gmail class/id attributes are stripped and
     *    link targets with any other scheme than http, https, mailto or tel
     *    (javascript:, vbscript:, data:) become "#";
     * 5. link targets are normalized (mailto:, https, tracking parameters).
     *
     * A failing image never aborts the document; it is left untouched and
     * reported in the messages.
     */
    class HtmlTransformer {
    public:
        /**
         * @param asset_hosts Hosts whose images are already rehosted.
         */
        HtmlTransformer(HtmlConfig config, std::vector<std::string> asset_hosts, ImageRehoster rehoster);

        /**
         * @throws RehostError(PayloadTooLarge) if @p html exceeds max_html_bytes.
         * @throws RehostError(Cancelled) if @p stop is triggered.
         */
        [[nodiscard]] TransformResult transform(std::string_view html, std::stop_token stop = {}) const;

        [[nodiscard]] ImageAction classify(std::string_view src) const;

        /**
         * @brief data: URIs, non-https URLs and signed/expiring URLs.
         */
        [[nodiscard]] static bool should_rehost(std::string_view src);

        /**
         * @brief Whether a browser following @p target (an attribute value with
         * its references decoded) stays on http, https, mailto or tel, or on a
         * relative URL.
         */
        [[nodiscard]] static bool is_safe_link(std::string_view target);

        /**
         * @brief Normalize a link target: bare e-mail -> mailto:, http -> https,
         * tracking parameters removed. Anything unparseable is returned as is.
         */
        [[nodiscard]] static std::string clean_link(std::string_view href);

    private:
        void rehost_images(HtmlDocument& doc, TransformResult& result, std::stop_token stop) const;

        HtmlConfig config_;
        std::vector<std::string> asset_hosts_;
        ImageRehoster rehoster_;
    };

} // namespace rehost

#endif // REHOST_HTML_TRANSFORMER_HPP
