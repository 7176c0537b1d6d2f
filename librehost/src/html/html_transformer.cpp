#include "../../include/html_transformer.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/thread_pool.hpp"
#include "../../include/url.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <future>
#include <optional>
#include <regex>
#include <sstream>

namespace {

constexpr auto kTag = "html_transformer";

constexpr std::string_view kParagraphStyle =
    "color: rgb(34, 34, 34); font-family: Arial, Helvetica, sans-serif; font-size: small; "
    "font-style: normal; font-variant-ligatures: normal; font-variant-caps: normal; font-weight: 400; "
    "letter-spacing: normal; orphans: 2; text-align: start; text-indent: 0px; text-transform: none; "
    "widows: 2; word-spacing: 0px; -webkit-text-stroke-width: 0px; white-space: normal; "
    "text-decoration-thickness: initial; text-decoration-style: initial; text-decoration-color: initial;";

// Paragraph style without font-size and font-weight; headings append their own.
constexpr std::string_view kHeadingBaseStyle =
    "color: rgb(34, 34, 34); font-family: Arial, Helvetica, sans-serif; "
    "font-style: normal; font-variant-ligatures: normal; font-variant-caps: normal; "
    "letter-spacing: normal; orphans: 2; text-align: start; text-indent: 0px; text-transform: none; "
    "widows: 2; word-spacing: 0px; -webkit-text-stroke-width: 0px; white-space: normal; "
    "text-decoration-thickness: initial; text-decoration-style: initial; text-decoration-color: initial;";

constexpr std::string_view kQuoteExtraStyle =
    " margin: 0px 0px 0px 0.8ex; border-left: 1px solid rgb(204, 204, 204); padding-left: 1ex;";

constexpr std::string_view kLinkStyle = "color: rgb(17, 85, 204);";
constexpr std::string_view kImageStyle = "max-width:100%;height:auto;display:block;";
constexpr std::string_view kGmailMarker = "color: rgb(34, 34, 34)";

constexpr std::array<std::string_view, 6> kRehostHosts = {
    "amazonaws.com", "googleusercontent.com", "mail.google.com",
    "notion.so", "dropbox.com", "onedrive.com"
};

constexpr std::array<std::string_view, 5> kSignedQueryMarkers = {
    "Expires=", "expires=", "X-Amz-", "sig=", "token="
};

constexpr std::array<std::string_view, 7> kTrackingParams = {
    "utm_source", "utm_medium", "utm_campaign", "utm_term", "utm_content", "gclid", "fbclid"
};

// Attributes a browser navigates to.
constexpr std::array<std::string_view, 5> kLinkAttributes = {
    "href", "xlink:href", "action", "formaction", "data"
};

constexpr std::array<std::string_view, 4> kSafeSchemes = {"http", "https", "mailto", "tel"};

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool starts_with_icase(const std::string_view text, const std::string_view prefix) {
    if (text.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](const char a, const char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::string quote_source(const std::string& src) {
    return src.substr(0, std::min<std::size_t>(50, src.size()));
}

// Keeps only the gmail_* tokens of a class attribute.
std::string gmail_classes(const std::string& value) {
    std::istringstream in(value);
    std::string token;
    std::string out;
    while (in >> token) {
        if (token.starts_with("gmail_")) {
            if (!out.empty()) out += ' ';
            out += token;
        }
    }
    return out;
}

// Turns @p node into a <tag> carrying only @p style and a gmail_* class.
void restyle(rehost::HtmlNode& node, std::string tag, std::string style, std::string css_class = {}) {
    node.rename(std::move(tag));
    std::erase_if(node.attributes(), [](const rehost::HtmlAttribute& a) {
        return a.name != "class" || gmail_classes(a.value.value_or("")).empty();
    });
    if (!css_class.empty()) {
        node.set_attribute("class", std::move(css_class));
    }
    node.set_attribute("style", std::move(style));
}

std::string heading_style(const std::string& tag) {
    std::string size = "small";
    if (tag == "h1") size = "large";
    else if (tag == "h2") size = "medium";
    return std::string(kHeadingBaseStyle) + " font-size: " + size + "; font-weight: bold;";
}

bool is_heading(const std::string& name) {
    return name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6';
}

struct ImageSlot {
    rehost::HtmlNode* node = nullptr;
    std::string src;
    std::string notice; ///< Set for images that are reported but not processed
    bool rehost = false;
};

struct ImageOutcome {
    std::optional<rehost::Asset> asset;
    std::string error;
};

} // namespace

namespace rehost {

HtmlTransformer::HtmlTransformer(HtmlConfig config, std::vector<std::string> asset_hosts, ImageRehoster rehoster)
    : config_(std::move(config)), asset_hosts_(std::move(asset_hosts)), rehoster_(std::move(rehoster)) {
    for (const auto& host : config_.extra_asset_hosts) {
        asset_hosts_.push_back(host);
    }
    for (auto& host : asset_hosts_) {
        std::ranges::transform(host, host.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
}

bool HtmlTransformer::should_rehost(std::string_view src) {
    src = trim(src);
    if (starts_with_icase(src, "data:")) return true;
    if (starts_with_icase(src, "blob:")) return false;

    const auto url = parse_url(src);
    if (!url) return false;
    if (url->scheme != "https") return true;

    if (std::ranges::any_of(kRehostHosts, [&](const std::string_view h) {
            return url->host.find(h) != std::string::npos;
        })) {
        return true;
    }
    return std::ranges::any_of(kSignedQueryMarkers, [&](const std::string_view m) {
        return url->query.find(m) != std::string::npos;
    });
}

ImageAction HtmlTransformer::classify(std::string_view src) const {
    src = trim(src);
    if (starts_with_icase(src, "blob:")) return ImageAction::BlobUrl;
    if (const auto url = parse_url(src)) {
        if (std::ranges::find(asset_hosts_, url->host) != asset_hosts_.end()) return ImageAction::Keep;
    }
    if (src.find("mail.google.com") != std::string_view::npos && src.find("attid=") != std::string_view::npos) {
        return ImageAction::MailAttachment;
    }
    return should_rehost(src) ? ImageAction::Rehost : ImageAction::Keep;
}

bool HtmlTransformer::is_safe_link(const std::string_view target) {
    // browsers drop tabs and newlines anywhere and controls and spaces at the
    // ends before reading the scheme; dropping them everywhere is stricter
    std::string url;
    for (const char c : target) {
        const auto u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u == 0x7F) continue;
        url.push_back(static_cast<char>(std::tolower(u)));
    }

    const auto end = url.find_first_of(":/?#");
    if (end == std::string::npos || url[end] != ':') {
        // relative, unless a reference left undecoded could still spell a scheme
        return url.find('&') >= end;
    }
    return std::ranges::find(kSafeSchemes, std::string_view(url).substr(0, end)) != kSafeSchemes.end();
}

std::string HtmlTransformer::clean_link(const std::string_view href) {
    static const std::regex kEmail(R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");

    const std::string original(href);
    const std::string trimmed(trim(href));
    if (trimmed.empty()) return original;
    if (std::regex_match(trimmed, kEmail)) return "mailto:" + trimmed;
    if (starts_with_icase(trimmed, "mailto:")) return original;

    auto url = parse_url(trimmed);
    if (!url || (url->scheme != "http" && url->scheme != "https")) return original;

    bool changed = false;
    if (url->scheme == "http") {
        url->scheme = "https";
        if (!url->explicit_port) url->port = 443;
        changed = true;
    }
    if (url->has_query) {
        auto params = split_query(url->query);
        const auto removed = std::erase_if(params, [](const QueryParam& p) {
            return std::ranges::find(kTrackingParams, p.name) != kTrackingParams.end();
        });
        if (removed > 0) {
            url->query = join_query(params);
            url->has_query = !params.empty();
            changed = true;
        }
    }
    return changed ? url->str() : original;
}

void HtmlTransformer::rehost_images(HtmlDocument& doc, TransformResult& result, const std::stop_token stop) const {
    std::vector<ImageSlot> slots;
    for (HtmlNode* img : doc.elements("img")) {
        const auto src = img->attribute("src");
        if (!src || trim(*src).empty()) continue;
        ++result.stats.images_processed;

        ImageSlot slot{img, std::string(trim(*src)), {}, false};
        switch (classify(slot.src)) {
            case ImageAction::Keep:
                continue;
            case ImageAction::BlobUrl:
                slot.notice = "Browser-local (blob:) image detected - please download and re-upload images "
                              "manually for rehosting";
                break;
            case ImageAction::MailAttachment:
                slot.notice = "Gmail attachment image detected - please download and re-upload manually "
                              "for rehosting";
                break;
            case ImageAction::Rehost:
                slot.rehost = true;
                break;
        }
        slots.push_back(std::move(slot));
    }

    const auto jobs = static_cast<std::size_t>(std::ranges::count_if(slots, &ImageSlot::rehost));
    std::vector<ImageOutcome> outcomes(slots.size());

    const auto run_one = [this, &stop](const std::string& src) -> ImageOutcome {
        try {
            return {rehoster_(src, stop), {}};
        } catch (const RehostError& e) {
            if (e.kind() == ErrorKind::Cancelled) throw;
            return {std::nullopt, e.what()};
        } catch (const std::exception& e) {
            return {std::nullopt, e.what()};
        }
    };

    if (config_.image_workers <= 1 || jobs <= 1) {
        for (std::size_t i = 0; i < slots.size(); ++i) {
            if (!slots[i].rehost) continue;
            if (stop.stop_requested()) {
                throw RehostError(ErrorKind::Cancelled, "transform cancelled");
            }
            outcomes[i] = run_one(slots[i].src);
        }
    } else {
        ThreadPool pool(static_cast<unsigned>(std::min<std::size_t>(config_.image_workers, jobs)));
        std::vector<std::pair<std::size_t, std::future<ImageOutcome>>> futures;
        for (std::size_t i = 0; i < slots.size(); ++i) {
            if (!slots[i].rehost) continue;
            futures.emplace_back(i, pool.enqueue([&run_one, src = slots[i].src](std::stop_token) {
                return run_one(src);
            }));
        }
        for (auto& [index, future] : futures) {
            try {
                outcomes[index] = future.get();
            } catch (const RehostError&) {
                pool.request_stop();
                throw;
            } catch (const std::future_error&) {
                // dropped from the queue by request_stop
                throw RehostError(ErrorKind::Cancelled, "transform cancelled");
            }
        }
    }
    if (stop.stop_requested()) {
        throw RehostError(ErrorKind::Cancelled, "transform cancelled");
    }

    // rewrites and messages in document order
    for (std::size_t i = 0; i < slots.size(); ++i) {
        ImageSlot& slot = slots[i];
        if (!slot.rehost) {
            result.messages.push_back(slot.notice);
            continue;
        }
        const ImageOutcome& outcome = outcomes[i];
        if (!outcome.asset) {
            Logger::log(LogLevel::Warning, "Image left untouched: " + quote_source(slot.src) + ": " + outcome.error,
                        kTag);
            result.messages.push_back("Failed to rehost image " + quote_source(slot.src) + ": " + outcome.error);
            continue;
        }
        const Asset& asset = *outcome.asset;
        slot.node->set_attribute("src", asset.public_url);
        if (!slot.node->has_attribute("alt")) {
            slot.node->set_attribute("alt", "");
        }
        slot.node->set_attribute("style", std::string(kImageStyle));
        ++result.stats.images_rehosted;
        result.messages.push_back(std::string(asset.deduplicated ? "Image deduplicated: " : "Image rehosted: ") +
                                  quote_source(slot.src) + " -> " + asset.public_url);
    }
}

TransformResult HtmlTransformer::transform(const std::string_view html, const std::stop_token stop) const {
    if (html.size() > config_.max_html_bytes) {
        throw RehostError(ErrorKind::PayloadTooLarge,
                          "HTML of " + std::to_string(html.size()) + " bytes exceeds the limit of " +
                          std::to_string(config_.max_html_bytes));
    }
    if (stop.stop_requested()) {
        throw RehostError(ErrorKind::Cancelled, "transform cancelled");
    }

    TransformResult result;
    HtmlDocument doc = HtmlDocument::parse(html);

    rehost_images(doc, result, stop);

    // script and style blocks hold no element children, so removing them
    // keeps the other collected pointers valid
    for (HtmlNode* node : doc.elements()) {
        if (node->is_element("script")) {
            ++result.stats.scripts_removed;
            node->remove();
        } else if (node->is_element("style")) {
            ++result.stats.styles_removed;
            node->remove();
        }
    }

    const auto elements = doc.elements();
    for (HtmlNode* node : elements) {
        const std::string name = node->name();
        if (name == "p") {
            restyle(*node, "div", std::string(kParagraphStyle));
        } else if (name == "div") {
            const auto style = node->attribute("style").value_or("");
            if (style.find(kGmailMarker) != std::string::npos || node->has_descendant("ol") ||
                node->has_descendant("ul") || node->has_descendant("blockquote")) {
                continue;
            }
            restyle(*node, "div", std::string(kParagraphStyle));
        } else if (is_heading(name)) {
            restyle(*node, "div", heading_style(name));
        } else if (name == "blockquote") {
            restyle(*node, "blockquote", std::string(kParagraphStyle) + std::string(kQuoteExtraStyle), "gmail_quote");
        } else if (name == "a" && !node->has_attribute("style")) {
            node->set_attribute("style", std::string(kLinkStyle));
        }
    }

    for (HtmlNode* node : elements) {
        auto& attrs = node->attributes();
        std::erase_if(attrs, [](const HtmlAttribute& a) { return a.name.starts_with("on") || a.name == "id"; });

        if (const auto cls = node->attribute("class")) {
            const std::string kept = gmail_classes(*cls);
            if (kept.empty()) {
                node->remove_attribute("class");
            } else if (kept != *cls) {
                node->set_attribute("class", kept);
            }
        }

        for (const std::string_view attr : kLinkAttributes) {
            if (const auto target = node->attribute(attr); target && !is_safe_link(*target)) {
                node->set_attribute(attr, "#");
            }
        }
        if (const auto src = node->attribute("src");
            src && !node->is_element("img") && !node->is_element("source") && !is_safe_link(*src)) {
            node->set_attribute("src", "#");
        }

        if (const auto href = node->attribute("href")) {
            if (node->is_element("a")) {
                if (std::string cleaned = clean_link(*href); cleaned != *href) {
                    node->set_attribute("href", std::move(cleaned));
                }
            }
        }
    }

    result.html = doc.serialize();
    Logger::log(LogLevel::Info,
                "Transformed HTML: " + std::to_string(result.stats.images_processed) + " images, " +
                std::to_string(result.stats.images_rehosted) + " rehosted, " +
                std::to_string(result.stats.scripts_removed) + " scripts and " +
                std::to_string(result.stats.styles_removed) + " style blocks removed",
                kTag);
    return result;
}

} // namespace rehost
