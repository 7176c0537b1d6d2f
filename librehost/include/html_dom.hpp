/**
 * @file html_dom.hpp
 * @brief Tolerant HTML tokenizer, tree builder and serializer.
 */

#ifndef REHOST_HTML_DOM_HPP
#define REHOST_HTML_DOM_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rehost {

    /**
     * @brief One attribute of an element.
     *
     * value is entity-decoded. raw keeps the source text of the attribute
     * so untouched attributes serialize byte for byte; it is cleared as
     * soon as the attribute is modified.
     */
    struct HtmlAttribute {
        std::string name;                 ///< Lower-cased
        std::optional<std::string> value; ///< std::nullopt for a bare attribute
        std::string raw;
    };

    /**
     * @brief Node of the parse tree.
     *
     * Text, comments and directives keep their source text verbatim.
     */
    class HtmlNode {
    public:
        enum class Type {
            Document,
            Element,
            Text,
            Comment,
            Directive
        };

        /**
         * @brief How the element was (or was not) closed in the source.
         */
        enum class CloseStyle {
            Implicit, ///< Void element: <img ...>, <br>
            Brief,    ///< <br/>, <div/>
            Explicit, ///< <a ...>...</a>
            Unclosed  ///< End tag implied or missing
        };

        HtmlNode(const Type type, std::string name_or_text);

        [[nodiscard]] Type type() const noexcept { return type_; }
        [[nodiscard]] bool is_element() const noexcept { return type_ == Type::Element; }
        [[nodiscard]] bool is_element(std::string_view tag) const noexcept {
            return type_ == Type::Element && name_ == tag;
        }

        /// Lower-cased tag name of an element.
        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        void rename(std::string name);

        /// Source text of a text, comment or directive node.
        [[nodiscard]] const std::string& text() const noexcept { return text_; }

        [[nodiscard]] CloseStyle close_style() const noexcept { return close_style_; }
        void set_close_style(const CloseStyle style) noexcept { close_style_ = style; }

        [[nodiscard]] std::vector<HtmlAttribute>& attributes() noexcept { return attributes_; }
        [[nodiscard]] const std::vector<HtmlAttribute>& attributes() const noexcept { return attributes_; }

        [[nodiscard]] const HtmlAttribute* find_attribute(std::string_view name) const;
        [[nodiscard]] bool has_attribute(std::string_view name) const { return find_attribute(name) != nullptr; }

        /**
         * @brief Decoded value; "" for a bare attribute, std::nullopt if absent.
         */
        [[nodiscard]] std::optional<std::string> attribute(std::string_view name) const;

        /**
         * @brief Replace the value of @p name, appending the attribute if absent.
         */
        void set_attribute(std::string_view name, std::string value);

        bool remove_attribute(std::string_view name);

        [[nodiscard]] HtmlNode* parent() const noexcept { return parent_; }
        [[nodiscard]] const std::vector<std::unique_ptr<HtmlNode>>& children() const noexcept { return children_; }

        HtmlNode* append_child(std::unique_ptr<HtmlNode> child);

        /**
         * @brief Detach this node (and its subtree) from its parent and destroy it.
         */
        void remove();

        /**
         * @brief True if an element named @p tag occurs anywhere below this node.
         */
        [[nodiscard]] bool has_descendant(std::string_view tag) const;

    private:
        friend class HtmlParser;

        Type type_;
        std::string name_;
        std::string text_;
        CloseStyle close_style_ = CloseStyle::Explicit;
        std::vector<HtmlAttribute> attributes_;
        std::vector<std::unique_ptr<HtmlNode>> children_;
        HtmlNode* parent_ = nullptr;
    };

    /**
     * @brief A parsed document.
     *
     * Parsing never fails: stray '<' becomes text, unmatched end tags are
     * dropped, elements left open at the end are Unclosed. Void elements,
     * raw-text elements (script, style, textarea, iframe, xmp) and the
     * implied ends of p, li, dt, dd and option are handled.
     */
    class HtmlDocument {
    public:
        [[nodiscard]] static HtmlDocument parse(std::string_view html);

        HtmlDocument();
        HtmlDocument(HtmlDocument&&) noexcept = default;
        HtmlDocument& operator=(HtmlDocument&&) noexcept = default;

        [[nodiscard]] HtmlNode& root() noexcept { return *root_; }
        [[nodiscard]] const HtmlNode& root() const noexcept { return *root_; }

        /**
         * @brief Elements in document (pre-)order, optionally filtered by tag.
         *
         * The returned pointers stay valid until the node or an ancestor is removed.
         */
        [[nodiscard]] std::vector<HtmlNode*> elements(std::string_view tag = {}) const;

        [[nodiscard]] std::string serialize() const;

    private:
        std::unique_ptr<HtmlNode> root_;
    };

    /**
     * @brief Decode character references (&amp;, &#39;, &#x2F;, &nbsp;, ...).
     * Unknown references are kept literally.
     */
    [[nodiscard]] std::string decode_entities(std::string_view text);

    /**
     * @brief Escape '&', '"', '<' and '>' for a double-quoted attribute value.
     */
    [[nodiscard]] std::string escape_attribute(std::string_view value);

} // namespace rehost

#endif // REHOST_HTML_DOM_HPP
