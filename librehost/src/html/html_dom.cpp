#include "../../include/html_dom.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <functional>

namespace {

// Elements that never have content or an end tag.
constexpr std::array<std::string_view, 14> kVoidTags = {
    "area", "base", "br", "col", "embed", "hr", "img",
    "input", "link", "meta", "param", "source", "track", "wbr"
};

// Text inside these is kept literally up to the matching end tag. noscript
// is included because mail clients render with scripting enabled.
constexpr std::array<std::string_view, 9> kRawTextTags = {
    "iframe", "noembed", "noframes", "noscript", "script", "style", "textarea", "title", "xmp"
};

// Start tags that imply the end of an open <p>.
constexpr std::array<std::string_view, 28> kParagraphClosers = {
    "address", "article", "aside", "blockquote", "details", "dialog", "div",
    "dl", "fieldset", "figcaption", "figure", "footer", "form", "h1", "h2",
    "h3", "h4", "h5", "h6", "header", "hr", "main", "nav", "ol", "p", "pre",
    "section", "table"
};

constexpr std::array<std::string_view, 8> kButtonScope = {
    "applet", "button", "caption", "html", "marquee", "object", "td", "th"
};

template<std::size_t N>
bool in_set(const std::array<std::string_view, N>& set, const std::string_view name) {
    return std::ranges::find(set, name) != set.end();
}

bool is_space(const char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals_prefix(const std::string_view text, const std::size_t pos, const std::string_view prefix) {
    if (text.size() - pos < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[pos + i])) != prefix[i]) return false;
    }
    return true;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

struct NamedEntity {
    std::string_view name;
    std::uint32_t code_point;
};

// Named references a link or a pasted mail body realistically carries.
// Names are case-sensitive ("Tab", "NewLine").
constexpr std::array<NamedEntity, 58> kNamedEntities = {{
    {"amp", '&'}, {"AMP", '&'}, {"lt", '<'}, {"LT", '<'}, {"gt", '>'}, {"GT", '>'},
    {"quot", '"'}, {"QUOT", '"'}, {"apos", '\''}, {"nbsp", 0xA0},
    {"Tab", '\t'}, {"NewLine", '\n'}, {"excl", '!'}, {"num", '#'}, {"dollar", '$'},
    {"percnt", '%'}, {"lpar", '('}, {"rpar", ')'}, {"ast", '*'}, {"midast", '*'},
    {"plus", '+'}, {"comma", ','}, {"period", '.'}, {"sol", '/'}, {"colon", ':'},
    {"semi", ';'}, {"equals", '='}, {"quest", '?'}, {"commat", '@'}, {"lsqb", '['},
    {"lbrack", '['}, {"bsol", '\\'}, {"rsqb", ']'}, {"rbrack", ']'}, {"Hat", '^'},
    {"lowbar", '_'}, {"grave", '`'}, {"lcub", '{'}, {"lbrace", '{'}, {"verbar", '|'},
    {"vert", '|'}, {"rcub", '}'}, {"rbrace", '}'}, {"shy", 0xAD}, {"copy", 0xA9},
    {"reg", 0xAE}, {"deg", 0xB0}, {"middot", 0xB7}, {"ndash", 0x2013}, {"mdash", 0x2014},
    {"lsquo", 0x2018}, {"rsquo", 0x2019}, {"ldquo", 0x201C}, {"rdquo", 0x201D},
    {"bull", 0x2022}, {"hellip", 0x2026}, {"euro", 0x20AC}, {"trade", 0x2122}
}};

// Legacy names that are decoded even without the trailing ';'.
constexpr std::array<std::string_view, 5> kBareEntities = {"amp", "lt", "gt", "quot", "nbsp"};

bool is_alnum(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// Decodes the numeric reference at text[i] == '&', '#' following. The ';' is
// optional. Returns the length consumed, 0 when there are no digits.
std::size_t decode_numeric(const std::string_view text, const std::size_t i, std::string& out) {
    std::size_t p = i + 2;
    const bool hex = p < text.size() && (text[p] == 'x' || text[p] == 'X');
    if (hex) ++p;
    const std::size_t first_digit = p;
    std::uint32_t cp = 0;
    for (; p < text.size(); ++p) {
        const auto c = static_cast<unsigned char>(text[p]);
        int digit;
        if (std::isdigit(c)) digit = c - '0';
        else if (hex && std::isxdigit(c)) digit = std::tolower(c) - 'a' + 10;
        else break;
        // saturate; anything past U+10FFFF becomes U+FFFD
        cp = std::min<std::uint32_t>(cp * (hex ? 16 : 10) + static_cast<std::uint32_t>(digit), 0x110000);
    }
    if (p == first_digit) return 0;
    if (p < text.size() && text[p] == ';') ++p;
    append_utf8(out, cp);
    return p - i;
}

// Decodes the named reference at text[i] == '&'. Returns the length
// consumed, 0 when the name is unknown.
std::size_t decode_named(const std::string_view text, const std::size_t i, std::string& out) {
    std::size_t p = i + 1;
    while (p < text.size() && is_alnum(text[p])) ++p;
    const std::string_view name = text.substr(i + 1, p - i - 1);
    if (name.empty()) return 0;
    if (p < text.size() && text[p] == ';') {
        for (const auto& [entity, cp] : kNamedEntities) {
            if (name == entity) {
                append_utf8(out, cp);
                return p + 1 - i;
            }
        }
        return 0;
    }
    // "&amp" without ';' but not "&ampx" or "&amp="
    if (p < text.size() && text[p] == '=') return 0;
    if (in_set(kBareEntities, name)) {
        for (const auto& [entity, cp] : kNamedEntities) {
            if (name == entity) {
                append_utf8(out, cp);
                return p - i;
            }
        }
    }
    return 0;
}

} // namespace

namespace rehost {

std::string decode_entities(const std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out.push_back(text[i++]);
            continue;
        }
        const bool numeric = i + 1 < text.size() && text[i + 1] == '#';
        const std::size_t used = numeric ? decode_numeric(text, i, out) : decode_named(text, i, out);
        if (used == 0) {
            out.push_back(text[i++]);
        } else {
            i += used;
        }
    }
    return out;
}

std::string escape_attribute(const std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '"': out += "&quot;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

// ---------------------------------------------------------------- HtmlNode

HtmlNode::HtmlNode(const Type type, std::string name_or_text) : type_(type) {
    if (type == Type::Element) {
        name_ = std::move(name_or_text);
    } else {
        text_ = std::move(name_or_text);
    }
}

void HtmlNode::rename(std::string name) {
    name_ = std::move(name);
    if (close_style_ == CloseStyle::Unclosed || close_style_ == CloseStyle::Brief) {
        close_style_ = CloseStyle::Explicit;
    }
}

const HtmlAttribute* HtmlNode::find_attribute(const std::string_view name) const {
    const auto it = std::ranges::find(attributes_, name, &HtmlAttribute::name);
    return it == attributes_.end() ? nullptr : &*it;
}

std::optional<std::string> HtmlNode::attribute(const std::string_view name) const {
    const HtmlAttribute* attr = find_attribute(name);
    if (!attr) return std::nullopt;
    return attr->value.value_or(std::string());
}

void HtmlNode::set_attribute(const std::string_view name, std::string value) {
    const auto it = std::ranges::find(attributes_, name, &HtmlAttribute::name);
    if (it != attributes_.end()) {
        it->value = std::move(value);
        it->raw.clear();
        return;
    }
    attributes_.push_back({std::string(name), std::move(value), {}});
}

bool HtmlNode::remove_attribute(const std::string_view name) {
    return std::erase_if(attributes_, [name](const HtmlAttribute& a) { return a.name == name; }) > 0;
}

HtmlNode* HtmlNode::append_child(std::unique_ptr<HtmlNode> child) {
    child->parent_ = this;
    children_.push_back(std::move(child));
    return children_.back().get();
}

void HtmlNode::remove() {
    if (!parent_) return;
    auto& siblings = parent_->children_;
    std::erase_if(siblings, [this](const std::unique_ptr<HtmlNode>& n) { return n.get() == this; });
}

bool HtmlNode::has_descendant(const std::string_view tag) const {
    for (const auto& child : children_) {
        if (child->is_element(tag) || child->has_descendant(tag)) return true;
    }
    return false;
}

// -------------------------------------------------------------- HtmlParser

class HtmlParser {
public:
    HtmlParser(const std::string_view input, HtmlNode& root) : in_(input), root_(root) {
        stack_.push_back(&root_);
    }

    void run() {
        while (pos_ < in_.size()) {
            if (in_[pos_] == '<' && try_markup()) continue;
            const auto next = in_.find('<', pos_ + 1);
            const auto end = next == std::string_view::npos ? in_.size() : next;
            add_text(in_.substr(pos_, end - pos_));
            pos_ = end;
        }
        for (std::size_t i = stack_.size(); i-- > 1;) {
            stack_[i]->close_style_ = HtmlNode::CloseStyle::Unclosed;
        }
    }

private:
    HtmlNode* current() const { return stack_.back(); }

    void add_text(const std::string_view text) {
        if (text.empty()) return;
        // merge adjacent text so a stray '<' does not fragment the node
        auto& children = current()->children_;
        if (!children.empty() && children.back()->type() == HtmlNode::Type::Text) {
            children.back()->text_ += text;
            return;
        }
        current()->append_child(std::make_unique<HtmlNode>(HtmlNode::Type::Text, std::string(text)));
    }

    // Returns false when the '<' at pos_ does not start markup.
    bool try_markup() {
        if (in_.compare(pos_, 4, "<!--") == 0) {
            const auto stop = comment_end(pos_ + 4);
            current()->append_child(std::make_unique<HtmlNode>(HtmlNode::Type::Comment,
                                                               std::string(in_.substr(pos_, stop - pos_))));
            pos_ = stop;
            return true;
        }
        if (pos_ + 1 >= in_.size()) return false;
        const char c = in_[pos_ + 1];
        if (c == '!' || c == '?') {
            const auto end = in_.find('>', pos_ + 2);
            const auto stop = end == std::string_view::npos ? in_.size() : end + 1;
            current()->append_child(std::make_unique<HtmlNode>(HtmlNode::Type::Directive,
                                                               std::string(in_.substr(pos_, stop - pos_))));
            pos_ = stop;
            return true;
        }
        if (c == '/' && pos_ + 2 < in_.size() && std::isalpha(static_cast<unsigned char>(in_[pos_ + 2]))) {
            end_tag();
            return true;
        }
        if (std::isalpha(static_cast<unsigned char>(c))) {
            start_tag();
            return true;
        }
        return false;
    }

    // Position just past the comment whose body starts at @p body. "<!-->" and
    // "<!--->" are complete empty comments, and "--!>" also closes one.
    std::size_t comment_end(const std::size_t body) const {
        if (in_.compare(body, 1, ">") == 0) return body + 1;
        if (in_.compare(body, 2, "->") == 0) return body + 2;
        for (auto dash = in_.find("--", body); dash != std::string_view::npos; dash = in_.find("--", dash + 1)) {
            if (in_.compare(dash + 2, 1, ">") == 0) return dash + 3;
            if (in_.compare(dash + 2, 2, "!>") == 0) return dash + 4;
        }
        return in_.size();
    }

    std::string read_name() {
        const auto begin = pos_;
        while (pos_ < in_.size() && !is_space(in_[pos_]) && in_[pos_] != '>' && in_[pos_] != '/' &&
               in_[pos_] != '=') {
            ++pos_;
        }
        return to_lower(in_.substr(begin, pos_ - begin));
    }

    void skip_space() {
        while (pos_ < in_.size() && is_space(in_[pos_])) ++pos_;
    }

    void end_tag() {
        pos_ += 2;
        const std::string name = read_name();
        const auto gt = in_.find('>', pos_);
        pos_ = gt == std::string_view::npos ? in_.size() : gt + 1;

        for (std::size_t i = stack_.size(); i-- > 1;) {
            if (stack_[i]->name_ == name) {
                for (std::size_t j = stack_.size() - 1; j > i; --j) {
                    stack_[j]->close_style_ = HtmlNode::CloseStyle::Unclosed;
                }
                stack_[i]->close_style_ = HtmlNode::CloseStyle::Explicit;
                stack_.resize(i);
                return;
            }
        }
        // unmatched end tag: dropped
    }

    void start_tag() {
        ++pos_;
        auto element = std::make_unique<HtmlNode>(HtmlNode::Type::Element, read_name());
        bool brief = false;

        while (pos_ < in_.size()) {
            skip_space();
            if (pos_ >= in_.size()) break;
            if (in_[pos_] == '>') {
                ++pos_;
                break;
            }
            if (in_[pos_] == '/') {
                ++pos_;
                if (pos_ < in_.size() && in_[pos_] == '>') {
                    brief = true;
                    ++pos_;
                    break;
                }
                continue;
            }
            const auto attr_begin = pos_;
            HtmlAttribute attr;
            attr.name = read_name();
            if (attr.name.empty()) {
                // lone '=' or similar junk
                ++pos_;
                continue;
            }
            skip_space();
            if (pos_ < in_.size() && in_[pos_] == '=') {
                ++pos_;
                skip_space();
                if (pos_ < in_.size() && (in_[pos_] == '"' || in_[pos_] == '\'')) {
                    const char quote = in_[pos_];
                    const auto close = in_.find(quote, pos_ + 1);
                    const auto stop = close == std::string_view::npos ? in_.size() : close;
                    attr.value = decode_entities(in_.substr(pos_ + 1, stop - pos_ - 1));
                    pos_ = close == std::string_view::npos ? in_.size() : close + 1;
                } else {
                    const auto begin = pos_;
                    while (pos_ < in_.size() && !is_space(in_[pos_]) && in_[pos_] != '>') ++pos_;
                    attr.value = decode_entities(in_.substr(begin, pos_ - begin));
                }
            }
            attr.raw = std::string(in_.substr(attr_begin, pos_ - attr_begin));
            if (!element->find_attribute(attr.name)) {
                element->attributes_.push_back(std::move(attr));
            }
        }

        const std::string name = element->name_;
        apply_implied_ends(name);

        if (in_set(kVoidTags, name)) {
            element->close_style_ = brief ? HtmlNode::CloseStyle::Brief : HtmlNode::CloseStyle::Implicit;
            current()->append_child(std::move(element));
            return;
        }
        if (brief) {
            element->close_style_ = HtmlNode::CloseStyle::Brief;
            current()->append_child(std::move(element));
            return;
        }

        HtmlNode* node = current()->append_child(std::move(element));
        if (in_set(kRawTextTags, name)) {
            read_raw_text(node);
            return;
        }
        node->close_style_ = HtmlNode::CloseStyle::Unclosed;
        stack_.push_back(node);
    }

    void read_raw_text(HtmlNode* node) {
        const std::string close = "</" + node->name_;
        std::size_t end = pos_;
        while (true) {
            end = in_.find("</", end);
            if (end == std::string_view::npos) break;
            // "</scriptx" does not close <script>
            const auto after = end + close.size();
            if (iequals_prefix(in_, end, close) &&
                (after == in_.size() || is_space(in_[after]) || in_[after] == '/' || in_[after] == '>')) {
                break;
            }
            end += 2;
        }
        if (end == std::string_view::npos) {
            if (pos_ < in_.size()) {
                node->append_child(std::make_unique<HtmlNode>(HtmlNode::Type::Text, std::string(in_.substr(pos_))));
            }
            node->close_style_ = HtmlNode::CloseStyle::Unclosed;
            pos_ = in_.size();
            return;
        }
        if (end > pos_) {
            node->append_child(std::make_unique<HtmlNode>(HtmlNode::Type::Text,
                                                          std::string(in_.substr(pos_, end - pos_))));
        }
        const auto gt = in_.find('>', end);
        pos_ = gt == std::string_view::npos ? in_.size() : gt + 1;
        node->close_style_ = HtmlNode::CloseStyle::Explicit;
    }

    // Pops to (and including) the nearest open element named in @p targets,
    // unless an element in @p boundaries is found first.
    template<std::size_t N, std::size_t M>
    void close_open(const std::array<std::string_view, N>& targets,
                    const std::array<std::string_view, M>& boundaries) {
        for (std::size_t i = stack_.size(); i-- > 1;) {
            const std::string& open = stack_[i]->name_;
            if (in_set(targets, open)) {
                for (std::size_t j = i; j < stack_.size(); ++j) {
                    stack_[j]->close_style_ = HtmlNode::CloseStyle::Unclosed;
                }
                stack_.resize(i);
                return;
            }
            if (in_set(boundaries, open)) return;
        }
    }

    void apply_implied_ends(const std::string& name) {
        static constexpr std::array<std::string_view, 1> kP = {"p"};
        static constexpr std::array<std::string_view, 1> kLi = {"li"};
        static constexpr std::array<std::string_view, 2> kListScope = {"ol", "ul"};
        static constexpr std::array<std::string_view, 2> kDtDd = {"dd", "dt"};
        static constexpr std::array<std::string_view, 1> kDl = {"dl"};
        static constexpr std::array<std::string_view, 1> kOption = {"option"};
        static constexpr std::array<std::string_view, 2> kSelect = {"select", "datalist"};

        if (in_set(kParagraphClosers, name) || name == "li" || name == "dd" || name == "dt") {
            close_open(kP, kButtonScope);
        }
        if (name == "li") {
            close_open(kLi, kListScope);
        } else if (name == "dd" || name == "dt") {
            close_open(kDtDd, kDl);
        } else if (name == "option") {
            close_open(kOption, kSelect);
        }
    }

    std::string_view in_;
    std::size_t pos_ = 0;
    HtmlNode& root_;
    std::vector<HtmlNode*> stack_;
};

// ------------------------------------------------------------ HtmlDocument

HtmlDocument::HtmlDocument()
    : root_(std::make_unique<HtmlNode>(HtmlNode::Type::Document, std::string())) {}

HtmlDocument HtmlDocument::parse(const std::string_view html) {
    HtmlDocument doc;
    HtmlParser parser(html, *doc.root_);
    parser.run();
    return doc;
}

std::vector<HtmlNode*> HtmlDocument::elements(const std::string_view tag) const {
    std::vector<HtmlNode*> out;
    const std::function<void(const HtmlNode&)> visit = [&](const HtmlNode& node) {
        for (const auto& child : node.children()) {
            if (child->is_element() && (tag.empty() || child->name() == tag)) {
                out.push_back(child.get());
            }
            visit(*child);
        }
    };
    visit(*root_);
    return out;
}

namespace {

void serialize_node(const HtmlNode& node, std::string& out) {
    switch (node.type()) {
        case HtmlNode::Type::Text:
        case HtmlNode::Type::Comment:
        case HtmlNode::Type::Directive:
            out += node.text();
            return;
        case HtmlNode::Type::Document:
            for (const auto& child : node.children()) serialize_node(*child, out);
            return;
        case HtmlNode::Type::Element:
            break;
    }

    out += '<';
    out += node.name();
    for (const auto& attr : node.attributes()) {
        out += ' ';
        if (!attr.raw.empty()) {
            out += attr.raw;
        } else if (attr.value) {
            out += attr.name + "=\"" + escape_attribute(*attr.value) + "\"";
        } else {
            out += attr.name;
        }
    }

    switch (node.close_style()) {
        case HtmlNode::CloseStyle::Implicit:
            out += '>';
            return;
        case HtmlNode::CloseStyle::Brief:
            out += "/>";
            return;
        case HtmlNode::CloseStyle::Explicit:
        case HtmlNode::CloseStyle::Unclosed:
            out += '>';
            for (const auto& child : node.children()) serialize_node(*child, out);
            if (node.close_style() == HtmlNode::CloseStyle::Explicit) {
                out += "</" + node.name() + ">";
            }
            return;
    }
}

} // namespace

std::string HtmlDocument::serialize() const {
    std::string out;
    serialize_node(*root_, out);
    return out;
}

} // namespace rehost
