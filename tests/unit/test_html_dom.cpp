#include <catch2/catch_test_macros.hpp>
#include "../../librehost/include/html_dom.hpp"
#include <string>

using namespace rehost;

TEST_CASE("Untouched documents serialize byte for byte", "[HtmlDom]") {
    const std::string html =
        "<!DOCTYPE html><html><head><title>T</title></head><body>"
        "<!-- note --><div class=\"a\" data-x='1' hidden>Hello &amp; <b>bye</b></div>"
        "<img src=\"https://example.com/a.png\" alt=x><br/>"
        "<p>one<p>two"
        "</body></html>";
    REQUIRE(HtmlDocument::parse(html).serialize() == html);
}

TEST_CASE("Attributes", "[HtmlDom]") {
    HtmlDocument doc = HtmlDocument::parse(R"(<A HREF="/x?a=1&amp;b=2" Title='it&#39;s' disabled>go</A>)");
    const auto links = doc.elements("a");
    REQUIRE(links.size() == 1);
    HtmlNode& a = *links.front();

    SECTION("Names are lower-cased and values decoded") {
        REQUIRE(a.name() == "a");
        REQUIRE(a.attribute("href") == "/x?a=1&b=2");
        REQUIRE(a.attribute("title") == "it's");
        REQUIRE(a.attribute("disabled") == "");
        REQUIRE_FALSE(a.attribute("style").has_value());
    }

    SECTION("Modified attributes are re-escaped, others keep their source text") {
        a.set_attribute("title", "say \"hi\"");
        a.set_attribute("style", "color: red;");
        REQUIRE(a.remove_attribute("disabled"));
        REQUIRE_FALSE(a.remove_attribute("disabled"));
        REQUIRE(doc.serialize() ==
                R"(<a HREF="/x?a=1&amp;b=2" title="say &quot;hi&quot;" style="color: red;">go</a>)");
    }
}

TEST_CASE("Raw text elements are not parsed", "[HtmlDom]") {
    const HtmlDocument doc = HtmlDocument::parse(
        "<script>if (a < b) { document.write('<p>x</p>'); }</script><p>after</p>");
    const auto scripts = doc.elements("script");
    REQUIRE(scripts.size() == 1);
    REQUIRE(scripts.front()->children().size() == 1);
    REQUIRE(scripts.front()->children().front()->text() == "if (a < b) { document.write('<p>x</p>'); }");
    REQUIRE(doc.elements("p").size() == 1);
}

TEST_CASE("Implied end tags", "[HtmlDom]") {
    SECTION("Paragraph closed by a block") {
        const HtmlDocument doc = HtmlDocument::parse("<p>text<div>block</div>");
        const auto divs = doc.elements("div");
        REQUIRE(divs.size() == 1);
        REQUIRE(divs.front()->parent() == &doc.root());
    }

    SECTION("List items") {
        const HtmlDocument doc = HtmlDocument::parse("<ul><li>a<li>b<li>c</ul>");
        const auto items = doc.elements("li");
        REQUIRE(items.size() == 3);
        for (const HtmlNode* li : items) {
            REQUIRE(li->parent()->name() == "ul");
        }
        REQUIRE(doc.serialize() == "<ul><li>a<li>b<li>c</ul>");
    }

    SECTION("Nested lists keep their items") {
        const HtmlDocument doc = HtmlDocument::parse("<ul><li>a<ol><li>b</ol></ul>");
        const auto items = doc.elements("li");
        REQUIRE(items.size() == 2);
        REQUIRE(items[1]->parent()->name() == "ol");
    }
}

TEST_CASE("Malformed markup is tolerated", "[HtmlDom]") {
    SECTION("Unmatched end tags are dropped") {
        REQUIRE(HtmlDocument::parse("<b>x</i></b>").serialize() == "<b>x</b>");
    }

    SECTION("Unclosed elements get no end tag") {
        REQUIRE(HtmlDocument::parse("<div><span>open").serialize() == "<div><span>open");
    }

    SECTION("Stray angle brackets stay text") {
        const HtmlDocument doc = HtmlDocument::parse("1 < 2 and 3 > 2");
        REQUIRE(doc.root().children().size() == 1);
        REQUIRE(doc.serialize() == "1 < 2 and 3 > 2");
    }

    SECTION("Inner end tag closes the elements above it") {
        const HtmlDocument doc = HtmlDocument::parse("<div><b>bold</div>tail");
        REQUIRE(doc.serialize() == "<div><b>bold</div>tail");
        REQUIRE(doc.elements("b").front()->close_style() == HtmlNode::CloseStyle::Unclosed);
    }
}

TEST_CASE("Tree edits", "[HtmlDom]") {
    HtmlDocument doc = HtmlDocument::parse("<div><h1>Title</h1><blockquote><ul><li>x</ul></blockquote></div>");

    SECTION("Rename keeps content") {
        doc.elements("h1").front()->rename("div");
        REQUIRE(doc.serialize() == "<div><div>Title</div><blockquote><ul><li>x</ul></blockquote></div>");
    }

    SECTION("Remove detaches the subtree") {
        doc.elements("blockquote").front()->remove();
        REQUIRE(doc.serialize() == "<div><h1>Title</h1></div>");
        REQUIRE(doc.elements("li").empty());
    }

    SECTION("Descendant lookup") {
        const HtmlNode& outer = *doc.elements("div").front();
        REQUIRE(outer.has_descendant("ul"));
        REQUIRE(outer.has_descendant("li"));
        REQUIRE_FALSE(outer.has_descendant("ol"));
    }

    SECTION("Pre-order element list") {
        const auto all = doc.elements();
        REQUIRE(all.size() == 5);
        REQUIRE(all[0]->name() == "div");
        REQUIRE(all[1]->name() == "h1");
        REQUIRE(all[2]->name() == "blockquote");
        REQUIRE(all[3]->name() == "ul");
        REQUIRE(all[4]->name() == "li");
    }
}

TEST_CASE("Character references", "[HtmlDom]") {
    REQUIRE(decode_entities("a &amp; b &lt;c&gt; &quot;d&quot; &apos;") == "a & b <c> \"d\" '");
    REQUIRE(decode_entities("&#65;&#x42;&#X43;") == "ABC");
    REQUIRE(decode_entities("&nbsp;") == "\xC2\xA0");
    REQUIRE(decode_entities("&unknown; & &#xZZ;") == "&unknown; & &#xZZ;");
    REQUIRE(decode_entities("a&colon;b&Tab;c&NewLine;d&lpar;e&rpar;") == "a:b\tc\nd(e)");
    REQUIRE(decode_entities("&#106avascript&#58") == "javascript:");
    REQUIRE(decode_entities("&#x110000;&#99999999999;") == "\xEF\xBF\xBD\xEF\xBF\xBD");
    REQUIRE(decode_entities("&amp b &lt") == "& b <");
    REQUIRE(decode_entities("?a=1&ampx=2&amp=3") == "?a=1&ampx=2&amp=3");
    REQUIRE(escape_attribute(R"(a&b"c<d>)") == "a&amp;b&quot;c&lt;d&gt;");
}

TEST_CASE("Comments end where a browser ends them", "[HtmlDom]") {
    SECTION("Empty comments") {
        for (const std::string opener : {"<!-->", "<!--->"}) {
            const HtmlDocument doc = HtmlDocument::parse(opener + "<b>x</b>-->");
            REQUIRE(doc.root().children().front()->type() == HtmlNode::Type::Comment);
            REQUIRE(doc.root().children().front()->text() == opener);
            REQUIRE(doc.elements("b").size() == 1);
        }
    }

    SECTION("Closed by --!>") {
        const HtmlDocument doc = HtmlDocument::parse("<!-- a -- b --!><i>x</i>");
        REQUIRE(doc.root().children().front()->text() == "<!-- a -- b --!>");
        REQUIRE(doc.elements("i").size() == 1);
    }

    SECTION("Unterminated") {
        const HtmlDocument doc = HtmlDocument::parse("<!-- <b>x</b>");
        REQUIRE(doc.root().children().size() == 1);
        REQUIRE(doc.elements().empty());
    }
}

TEST_CASE("Raw text ends only at its own end tag", "[HtmlDom]") {
    const HtmlDocument doc = HtmlDocument::parse("<textarea></textareax><b>x</b></textarea><i>y</i>");
    REQUIRE(doc.elements("textarea").size() == 1);
    REQUIRE(doc.elements("b").empty());
    REQUIRE(doc.elements("i").size() == 1);
}
