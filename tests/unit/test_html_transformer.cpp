#include <catch2/catch_test_macros.hpp>
#include "../../librehost/include/asset_pipeline.hpp"
#include "../../librehost/include/errors.hpp"
#include "../../librehost/include/html_transformer.hpp"
#include "../../librehost/include/memory_object_store.hpp"
#include "test_images.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

using namespace rehost;

namespace {

constexpr auto kAssetHost = "assets.example.com";

// Pretends to rehost: the asset is named after the last path segment of the source
Asset fake_asset(const std::string& src) {
    Asset asset;
    asset.public_url = "https://assets.example.com/" + src.substr(src.rfind('/') + 1) + ".jpg";
    asset.mime = "image/jpeg";
    return asset;
}

struct RecordingRehoster {
    std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);

    ImageRehoster fn() const {
        return [calls = calls](const std::string& src, std::stop_token) {
            calls->fetch_add(1);
            return fake_asset(src);
        };
    }
};

HtmlTransformer make_transformer(ImageRehoster rehoster, HtmlConfig config = {}) {
    return HtmlTransformer(std::move(config), {kAssetHost}, std::move(rehoster));
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Browser-local images are reported, not touched", "[HtmlTransformer]") {
    RecordingRehoster rehoster;
    const auto transformer = make_transformer(rehoster.fn());

    const TransformResult result = transformer.transform(R"(<div>Hi</div><img src="blob:abc">)");

    REQUIRE(result.stats.images_processed == 1);
    REQUIRE(result.stats.images_rehosted == 0);
    REQUIRE(result.messages.size() == 1);
    REQUIRE(contains(result.messages.front(), "re-upload"));
    REQUIRE(contains(result.html, R"(<img src="blob:abc">)"));
    REQUIRE(rehoster.calls->load() == 0);
}

TEST_CASE("Mail attachment images need a manual upload", "[HtmlTransformer]") {
    RecordingRehoster rehoster;
    const auto transformer = make_transformer(rehoster.fn());
    const std::string img = R"(<img src="https://mail.google.com/mail/u/0?ui=2&amp;attid=0.1&amp;disp=emb">)";

    const TransformResult result = transformer.transform(img);

    REQUIRE(result.messages.size() == 1);
    REQUIRE(contains(result.messages.front(), "Gmail attachment"));
    REQUIRE(result.html == img);
    REQUIRE(rehoster.calls->load() == 0);
}

TEST_CASE("Identical images share one stored object", "[HtmlTransformer]") {
    auto objects = std::make_shared<MemoryObjectStore>("https://assets.example.com");
    AssetPipeline pipeline(PipelineConfig{}, objects);
    const Bytes png = png_bytes(solid_raster(10, 10, 40, 80, 120));

    const auto transformer = make_transformer([&](const std::string&, const std::stop_token stop) {
        return pipeline.process_image(SourceImage{png, "image/png"}, stop);
    });

    const TransformResult result = transformer.transform(
        R"(<img src="https://lh3.googleusercontent.com/abc"><img src="https://lh3.googleusercontent.com/abc">)");

    REQUIRE(result.stats.images_processed == 2);
    REQUIRE(result.stats.images_rehosted == 2);
    REQUIRE(objects->put_count() == 1);
    REQUIRE(result.messages.size() == 2);
    REQUIRE(result.messages[0].starts_with("Image rehosted: https://lh3.googleusercontent.com/abc -> "));
    REQUIRE(result.messages[1].starts_with("Image deduplicated: https://lh3.googleusercontent.com/abc -> "));

    const HtmlDocument out = HtmlDocument::parse(result.html);
    const auto imgs = out.elements("img");
    REQUIRE(imgs.size() == 2);
    REQUIRE(imgs[0]->attribute("src") == imgs[1]->attribute("src"));
    REQUIRE(imgs[0]->attribute("src")->starts_with("https://assets.example.com/"));
    REQUIRE(imgs[0]->attribute("src")->ends_with(".png"));
    REQUIRE(imgs[0]->attribute("alt") == "");
    REQUIRE(imgs[0]->attribute("style") == "max-width:100%;height:auto;display:block;");
}

TEST_CASE("Scripts and event handlers are removed", "[HtmlTransformer]") {
    RecordingRehoster rehoster;
    const auto transformer = make_transformer(rehoster.fn());

    const TransformResult result = transformer.transform(
        R"(<div onclick="steal()" id="x">Hello</div><script>alert(1)</script><style>p { color: red }</style>)");

    REQUIRE(result.stats.scripts_removed == 1);
    REQUIRE(result.stats.styles_removed == 1);
    REQUIRE_FALSE(contains(result.html, "onclick"));
    REQUIRE_FALSE(contains(result.html, "steal"));
    REQUIRE_FALSE(contains(result.html, "script"));
    REQUIRE_FALSE(contains(result.html, "alert"));
    REQUIRE_FALSE(contains(result.html, "color: red"));
    REQUIRE_FALSE(contains(result.html, "id="));
    REQUIRE(contains(result.html, ">Hello</div>"));
}

TEST_CASE("Scripts hidden behind comment tricks are removed", "[HtmlTransformer]") {
    RecordingRehoster rehoster;
    const auto transformer = make_transformer(rehoster.fn());

    SECTION("Abruptly closed comments") {
        for (const std::string opener : {"<!-->", "<!--->"}) {
            const TransformResult result =
                transformer.transform("<div>hi</div>" + opener + "<script>alert(1)</script>-->");
            REQUIRE(result.stats.scripts_removed == 1);
            REQUIRE_FALSE(contains(result.html, "<script"));
            REQUIRE_FALSE(contains(result.html, "alert"));
        }
    }

    SECTION("Comment closed by --!>") {
        const TransformResult result = transformer.transform("<!-- x --!><script>alert(1)</script>");
        REQUIRE(result.stats.scripts_removed == 1);
        REQUIRE(result.html == "<!-- x --!>");
    }

    SECTION("End tag inside a noscript attribute") {
        const TransformResult result = transformer.transform(
            R"(<noscript><p title="</noscript><script>alert(1)</script>"></p></noscript>)");
        REQUIRE(result.stats.scripts_removed == 1);
        REQUIRE_FALSE(contains(result.html, "<script"));
    }
}

TEST_CASE("Only web and mail link targets survive", "[HtmlTransformer]") {
    RecordingRehoster rehoster;
    const auto transformer = make_transformer(rehoster.fn());

    SECTION("Encoded and split javascript: schemes") {
        for (const std::string href : {
                 "javascript&colon;alert(1)",
                 "java&Tab;script:alert(1)",
                 "java&NewLine;script:alert(1)",
                 "java&#9;script:alert(1)",
                 "java&#x0A;script:alert(1)",
                 "&#106avascript:alert(1)",
                 "&#x6A;avascript&#58alert(1)",
                 "&#0000106;avascript:alert(1)",
                 "\x01javascript:alert(1)",
                 "JAVA\tSCRIPT:alert(1)",
                 "vbscript:msgbox(1)",
                 "data:text/html;base64,PHNjcmlwdD4="}) {
            const TransformResult result = transformer.transform(R"(<a href=")" + href + R"(">x</a>)");
            INFO(href);
            REQUIRE(result.html == R"(<a href="#" style="color: rgb(17, 85, 204);">x</a>)");
        }
    }

    SECTION("Other link attributes") {
        const TransformResult result = transformer.transform(
            R"(<form action="javascript:alert(1)"><button formaction="java&#9;script:x">go</button></form>)"
            R"(<iframe src="javascript:alert(2)"></iframe><object data="javascript:alert(3)"></object>)");
        REQUIRE_FALSE(contains(result.html, "script:"));
        REQUIRE(contains(result.html, R"(action="#")"));
        REQUIRE(contains(result.html, R"(formaction="#")"));
        REQUIRE(contains(result.html, R"(<iframe src="#">)"));
        REQUIRE(contains(result.html, R"(data="#")"));
    }

    SECTION("Ordinary targets are kept") {
        const std::string html =
            R"(<a href="https://example.com/?a=1&amp;b=2" style="x">a</a><a href="/docs#top" style="x">b</a>)"
            R"(<a href="mailto:jane@example.com" style="x">c</a><a href="tel:+123" style="x">d</a>)";
        REQUIRE(transformer.transform(html).html == html);
    }
}

TEST_CASE("is_safe_link", "[HtmlTransformer]") {
    REQUIRE(HtmlTransformer::is_safe_link("https://example.com/a"));
    REQUIRE(HtmlTransformer::is_safe_link("HTTP://example.com/a"));
    REQUIRE(HtmlTransformer::is_safe_link("//example.com/a"));
    REQUIRE(HtmlTransformer::is_safe_link("relative/path?x=a:b"));
    REQUIRE(HtmlTransformer::is_safe_link("#top"));
    REQUIRE(HtmlTransformer::is_safe_link(""));
    REQUIRE(HtmlTransformer::is_safe_link("mailto:jane@example.com"));
    REQUIRE_FALSE(HtmlTransformer::is_safe_link(" javascript:alert(1)"));
    REQUIRE_FALSE(HtmlTransformer::is_safe_link("java\nscript:alert(1)"));
    REQUIRE_FALSE(HtmlTransformer::is_safe_link("file:///etc/passwd"));
    REQUIRE_FALSE(HtmlTransformer::is_safe_link("javascript&unknownref;alert(1)"));
}

TEST_CASE("Stable images are kept", "[HtmlTransformer]") {
    RecordingRehoster rehoster;
    const auto transformer = make_transformer(rehoster.fn());
    const std::string html =
        R"(<img src="https://example.com/logo.png" alt="logo"><img src="https://assets.example.com/ab/cd.jpg"><img src="/relative.png"><img>)";

    const TransformResult result = transformer.transform(html);

    REQUIRE(result.stats.images_processed == 3);
    REQUIRE(result.stats.images_rehosted == 0);
    REQUIRE(result.messages.empty());
    REQUIRE(result.html == html);
    REQUIRE(rehoster.calls->load() == 0);
}

TEST_CASE("Failed images degrade to a message", "[HtmlTransformer]") {
    const auto transformer = make_transformer([](const std::string& src, std::stop_token) -> Asset {
        if (src.ends_with("bad")) throw RehostError(ErrorKind::InvalidSource, "HTTP 404 from " + src);
        return fake_asset(src);
    });

    const TransformResult result = transformer.transform(
        R"(<img src="http://example.com/bad"><img src="http://example.com/good">)");

    REQUIRE(result.stats.images_processed == 2);
    REQUIRE(result.stats.images_rehosted == 1);
    REQUIRE(result.messages.size() == 2);
    REQUIRE(result.messages[0] == "Failed to rehost image http://example.com/bad: HTTP 404 from http://example.com/bad");
    REQUIRE(result.messages[1] == "Image rehosted: http://example.com/good -> https://assets.example.com/good.jpg");
    REQUIRE(contains(result.html, R"(<img src="http://example.com/bad">)"));
    REQUIRE(contains(result.html, R"(src="https://assets.example.com/good.jpg")"));
}

TEST_CASE("Long sources are shortened in messages", "[HtmlTransformer]") {
    const std::string src = "https://bucket.s3.amazonaws.com/" + std::string(80, 'x');
    const auto transformer = make_transformer([](const std::string&, std::stop_token) -> Asset {
        throw RehostError(ErrorKind::PayloadTooLarge, "too big");
    });

    const TransformResult result = transformer.transform("<img src=\"" + src + "\">");

    REQUIRE(result.messages.size() == 1);
    REQUIRE(result.messages.front() == "Failed to rehost image " + src.substr(0, 50) + ": too big");
}

TEST_CASE("Cancellation aborts the document", "[HtmlTransformer]") {
    SECTION("Raised by the rehoster") {
        const auto transformer = make_transformer([](const std::string&, std::stop_token) -> Asset {
            throw RehostError(ErrorKind::Cancelled, "fetch cancelled");
        });
        try {
            (void)transformer.transform(R"(<img src="http://example.com/a.png">)");
            FAIL("cancelled transform returned");
        } catch (const RehostError& e) {
            REQUIRE(e.kind() == ErrorKind::Cancelled);
        }
    }

    SECTION("Requested by the caller") {
        RecordingRehoster rehoster;
        const auto transformer = make_transformer(rehoster.fn());
        std::stop_source source;
        source.request_stop();
        try {
            (void)transformer.transform(R"(<img src="http://example.com/a.png">)", source.get_token());
            FAIL("cancelled transform returned");
        } catch (const RehostError& e) {
            REQUIRE(e.kind() == ErrorKind::Cancelled);
        }
        REQUIRE(rehoster.calls->load() == 0);
    }
}

TEST_CASE("Oversized documents are rejected before parsing", "[HtmlTransformer]") {
    RecordingRehoster rehoster;
    HtmlConfig config;
    config.max_html_bytes = 16;
    const auto transformer = make_transformer(rehoster.fn(), config);

    try {
        (void)transformer.transform(R"(<img src="http://example.com/a.png">)");
        FAIL("oversized document accepted");
    } catch (const RehostError& e) {
        REQUIRE(e.kind() == ErrorKind::PayloadTooLarge);
    }
    REQUIRE(rehoster.calls->load() == 0);
}

TEST_CASE("Blocks are rewritten to Gmail markup", "[HtmlTransformer]") {
    RecordingRehoster rehoster;
    const auto transformer = make_transformer(rehoster.fn());

    SECTION("Paragraphs become styled divs and keep gmail classes only") {
        const TransformResult result = transformer.transform(
            R"(<p class="lead gmail_signature" id="p1" align="left">Text</p>)");
        REQUIRE(result.html.starts_with(R"(<div class="gmail_signature" style="color: rgb(34, 34, 34); font-family: Arial, Helvetica, sans-serif; font-size: small;)"));
        REQUIRE(result.html.ends_with(R"(text-decoration-color: initial;">Text</div>)"));
        REQUIRE_FALSE(contains(result.html, "align"));
        REQUIRE_FALSE(contains(result.html, "lead"));
    }

    SECTION("Headings") {
        const TransformResult result = transformer.transform("<h1>Big</h1><h2>Medium</h2><h5>Small</h5>");
        REQUIRE_FALSE(contains(result.html, "<h"));
        REQUIRE(contains(result.html, R"(font-size: large; font-weight: bold;">Big</div>)"));
        REQUIRE(contains(result.html, R"(font-size: medium; font-weight: bold;">Medium</div>)"));
        REQUIRE(contains(result.html, R"(font-size: small; font-weight: bold;">Small</div>)"));
    }

    SECTION("Quotes") {
        const TransformResult result = transformer.transform(R"(<blockquote cite="x">Quoted</blockquote>)");
        REQUIRE(result.html.starts_with(R"(<blockquote class="gmail_quote" style="color: rgb(34, 34, 34);)"));
        REQUIRE(result.html.ends_with(
            R"(margin: 0px 0px 0px 0.8ex; border-left: 1px solid rgb(204, 204, 204); padding-left: 1ex;">Quoted</blockquote>)"));
    }

    SECTION("Divs holding lists or quotes are left alone") {
        const std::string html = R"(<div class="gmail_x"><ul><li>one</li></ul></div>)";
        REQUIRE(transformer.transform(html).html == html);
    }
}

TEST_CASE("Links are normalized", "[HtmlTransformer]") {
    RecordingRehoster rehoster;
    const auto transformer = make_transformer(rehoster.fn());

    SECTION("Tracking parameters and plain http") {
        const TransformResult result = transformer.transform(
            R"(<a href="http://example.com/page?utm_source=news&amp;id=3&amp;fbclid=abc">link</a>)");
        REQUIRE(result.html ==
                R"(<a href="https://example.com/page?id=3" style="color: rgb(17, 85, 204);">link</a>)");
    }

    SECTION("Existing link style is kept") {
        const std::string html = R"(<a href="https://example.com/" style="color: green">x</a>)";
        REQUIRE(transformer.transform(html).html == html);
    }

    SECTION("javascript: targets are neutralized") {
        const TransformResult result = transformer.transform(R"(<a href=" JavaScript:alert(1)">x</a>)");
        REQUIRE(contains(result.html, R"(href="#")"));
        REQUIRE_FALSE(contains(result.html, "alert"));
    }

    SECTION("Bare e-mail addresses") {
        const TransformResult result = transformer.transform(R"(<a href="jane.doe@example.com">mail</a>)");
        REQUIRE(contains(result.html, R"(href="mailto:jane.doe@example.com")"));
    }
}

TEST_CASE("clean_link", "[HtmlTransformer]") {
    REQUIRE(HtmlTransformer::clean_link("someone@example.org") == "mailto:someone@example.org");
    REQUIRE(HtmlTransformer::clean_link("mailto:someone@example.org") == "mailto:someone@example.org");
    REQUIRE(HtmlTransformer::clean_link("http://example.com/a") == "https://example.com/a");
    REQUIRE(HtmlTransformer::clean_link("http://example.com:8080/a") == "https://example.com:8080/a");
    REQUIRE(HtmlTransformer::clean_link("https://example.com/a?gclid=1") == "https://example.com/a");
    REQUIRE(HtmlTransformer::clean_link("https://example.com/a?b=1&utm_medium=x#top") ==
            "https://example.com/a?b=1#top");
    REQUIRE(HtmlTransformer::clean_link("https://Example.com/unchanged?x=1") == "https://Example.com/unchanged?x=1");
    REQUIRE(HtmlTransformer::clean_link("#anchor") == "#anchor");
    REQUIRE(HtmlTransformer::clean_link("tel:+123") == "tel:+123");
    REQUIRE(HtmlTransformer::clean_link("") == "");
}

TEST_CASE("Rehost heuristics", "[HtmlTransformer]") {
    REQUIRE(HtmlTransformer::should_rehost("data:image/png;base64,iVBORw0KGgo="));
    REQUIRE(HtmlTransformer::should_rehost("http://example.com/a.png"));
    REQUIRE(HtmlTransformer::should_rehost("https://bucket.s3.amazonaws.com/a.png"));
    REQUIRE(HtmlTransformer::should_rehost("https://www.dropbox.com/s/abc/a.png"));
    REQUIRE(HtmlTransformer::should_rehost("https://cdn.example.com/a.png?Expires=1700000000&Signature=x"));
    REQUIRE(HtmlTransformer::should_rehost("https://cdn.example.com/a.png?X-Amz-Signature=abc"));
    REQUIRE_FALSE(HtmlTransformer::should_rehost("https://cdn.example.com/a.png"));
    REQUIRE_FALSE(HtmlTransformer::should_rehost("blob:https://app.example.com/123"));
    REQUIRE_FALSE(HtmlTransformer::should_rehost("/images/a.png"));

    RecordingRehoster rehoster;
    HtmlConfig config;
    config.extra_asset_hosts = {"CDN.Example.NET"};
    const auto transformer = make_transformer(rehoster.fn(), config);
    REQUIRE(transformer.classify("https://assets.example.com/ab/x.jpg") == ImageAction::Keep);
    REQUIRE(transformer.classify("http://cdn.example.net/ab/x.jpg") == ImageAction::Keep);
    REQUIRE(transformer.classify("http://other.example.net/x.jpg") == ImageAction::Rehost);
    REQUIRE(transformer.classify(" blob:abc ") == ImageAction::BlobUrl);
}

TEST_CASE("Transforming Gmail-safe output again changes nothing", "[HtmlTransformer]") {
    RecordingRehoster rehoster;
    const auto transformer = make_transformer(rehoster.fn());
    const std::string input =
        R"(<h2>Update</h2><p>Hello <a href="http://example.com?utm_campaign=x">there</a></p>)"
        R"(<blockquote>Earlier</blockquote><img src="http://example.com/pic"><div><ol><li>a</li></ol></div>)";

    const TransformResult first = transformer.transform(input);
    REQUIRE(first.stats.images_rehosted == 1);
    REQUIRE(rehoster.calls->load() == 1);

    const TransformResult second = transformer.transform(first.html);
    REQUIRE(second.stats.images_processed == 1);
    REQUIRE(second.stats.images_rehosted == 0);
    REQUIRE(second.messages.empty());
    REQUIRE(second.html == first.html);
    REQUIRE(rehoster.calls->load() == 1);
}

TEST_CASE("Parallel rehosting keeps document order", "[HtmlTransformer]") {
    std::mutex mtx;
    std::map<std::string, int> seen;
    HtmlConfig config;
    config.image_workers = 4;
    const auto transformer = make_transformer([&](const std::string& src, std::stop_token) {
        {
            std::lock_guard lock(mtx);
            ++seen[src];
        }
        return fake_asset(src);
    }, config);

    std::string html;
    for (int i = 0; i < 8; ++i) {
        html += "<img src=\"http://example.com/" + std::to_string(i) + "\">";
    }
    const TransformResult result = transformer.transform(html);

    REQUIRE(result.stats.images_rehosted == 8);
    REQUIRE(seen.size() == 8);
    REQUIRE(result.messages.size() == 8);
    for (int i = 0; i < 8; ++i) {
        const std::string n = std::to_string(i);
        REQUIRE(result.messages[i] ==
                "Image rehosted: http://example.com/" + n + " -> https://assets.example.com/" + n + ".jpg");
    }
}
