#include "../../include/url.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

int default_port(const std::string_view scheme) {
    if (scheme == "https") return 443;
    if (scheme == "http") return 80;
    return 0;
}

bool is_scheme_char(const char c, const bool first) {
    const auto u = static_cast<unsigned char>(c);
    if (std::isalpha(u)) return true;
    return !first && (std::isdigit(u) || c == '+' || c == '-' || c == '.');
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && static_cast<unsigned char>(s.front()) <= 0x20) s.remove_prefix(1);
    while (!s.empty() && static_cast<unsigned char>(s.back()) <= 0x20) s.remove_suffix(1);
    return s;
}

} // namespace

namespace rehost {

std::string Url::target() const {
    return has_query ? path + "?" + query : path;
}

std::string Url::authority() const {
    std::string out = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (explicit_port) out += ":" + std::to_string(port);
    return out;
}

std::string Url::origin() const {
    return scheme + "://" + authority();
}

std::string Url::str() const {
    std::string out = scheme + "://";
    if (!userinfo.empty()) out += userinfo + "@";
    out += authority() + target();
    if (has_fragment) out += "#" + fragment;
    return out;
}

std::optional<Url> parse_url(std::string_view text) {
    text = trim(text);
    const auto colon = text.find("://");
    if (colon == std::string_view::npos || colon == 0) return std::nullopt;
    for (std::size_t i = 0; i < colon; ++i) {
        if (!is_scheme_char(text[i], i == 0)) return std::nullopt;
    }
    for (const char c : text) {
        if (static_cast<unsigned char>(c) < 0x20 || c == ' ' || c == '\\') return std::nullopt;
    }

    Url url;
    url.scheme = to_lower(text.substr(0, colon));
    std::string_view rest = text.substr(colon + 3);

    const auto auth_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, auth_end);
    rest = auth_end == std::string_view::npos ? std::string_view{} : rest.substr(auth_end);

    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        url.userinfo = std::string(authority.substr(0, at));
        authority.remove_prefix(at + 1);
    }

    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        url.host = to_lower(authority.substr(1, close - 1));
        const auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return std::nullopt;
            port_text = after.substr(1);
        }
    } else {
        const auto pc = authority.rfind(':');
        if (pc != std::string_view::npos) {
            url.host = to_lower(authority.substr(0, pc));
            port_text = authority.substr(pc + 1);
        } else {
            url.host = to_lower(authority);
        }
    }
    if (url.host.empty()) return std::nullopt;

    url.port = default_port(url.scheme);
    if (!port_text.empty()) {
        int port = 0;
        const auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || port <= 0 || port > 65535) {
            return std::nullopt;
        }
        url.port = port;
        url.explicit_port = true;
    }

    if (const auto hash = rest.find('#'); hash != std::string_view::npos) {
        url.fragment = std::string(rest.substr(hash + 1));
        url.has_fragment = true;
        rest = rest.substr(0, hash);
    }
    if (const auto q = rest.find('?'); q != std::string_view::npos) {
        url.query = std::string(rest.substr(q + 1));
        url.has_query = true;
        rest = rest.substr(0, q);
    }
    url.path = rest.empty() ? "/" : std::string(rest);
    return url;
}

std::optional<Url> resolve_reference(const Url& base, std::string_view reference) {
    reference = trim(reference);
    if (reference.empty()) return base;
    if (reference.find("://") != std::string_view::npos) {
        if (auto absolute = parse_url(reference)) return absolute;
    }
    if (reference.starts_with("//")) {
        return parse_url(base.scheme + ":" + std::string(reference));
    }
    if (reference.front() == '/') {
        return parse_url(base.origin() + std::string(reference));
    }
    if (reference.front() == '?') {
        return parse_url(base.origin() + base.path + std::string(reference));
    }
    const auto slash = base.path.rfind('/');
    const std::string dir = slash == std::string::npos ? "/" : base.path.substr(0, slash + 1);
    return parse_url(base.origin() + dir + std::string(reference));
}

std::string url_encode(const std::string_view text, const bool keep_slash) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (keep_slash && c == '/')) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::optional<std::string> url_decode(const std::string_view text) {
    const auto hex = [](const char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out.push_back(text[i]);
            continue;
        }
        if (i + 2 >= text.size()) return std::nullopt;
        const int hi = hex(text[i + 1]);
        const int lo = hex(text[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

std::vector<QueryParam> split_query(const std::string_view query) {
    std::vector<QueryParam> params;
    std::size_t start = 0;
    while (start <= query.size()) {
        auto end = query.find('&', start);
        if (end == std::string_view::npos) end = query.size();
        const auto part = query.substr(start, end - start);
        if (!part.empty()) {
            if (const auto eq = part.find('='); eq != std::string_view::npos) {
                params.push_back({std::string(part.substr(0, eq)), std::string(part.substr(eq + 1)), true});
            } else {
                params.push_back({std::string(part), {}, false});
            }
        }
        start = end + 1;
    }
    return params;
}

std::string join_query(const std::vector<QueryParam>& params) {
    std::string out;
    for (const auto& p : params) {
        if (!out.empty()) out.push_back('&');
        out += p.name;
        if (p.has_value) {
            out.push_back('=');
            out += p.value;
        }
    }
    return out;
}

} // namespace rehost
