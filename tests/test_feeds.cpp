#include <catch2/catch.hpp>
#include "tools/feeds.hpp"
#include "mock_http_client.hpp"
#include "util.hpp"

using namespace browsetrail;

// ── Zenn (RSS 2.0) ───────────────────────────────────────────────

static const char* kZennRss = R"(<?xml version="1.0" encoding="UTF-8"?>
<rss xmlns:dc="http://purl.org/dc/elements/1.1/" version="2.0">
  <channel>
    <title><![CDATA[Zenn: Rust]]></title>
    <link>https://zenn.dev/topics/rust</link>
    <item>
      <title><![CDATA[Rust async]]></title>
      <description><![CDATA[<p>Intro</p><p>to   <b>futures</b> &amp; more</p>]]></description>
      <link>https://zenn.dev/alice/articles/rust-async</link>
      <guid isPermaLink="true">https://zenn.dev/alice/articles/rust-async</guid>
      <pubDate>Thu, 02 Jan 2025 00:00:00 GMT</pubDate>
      <dc:creator>Alice</dc:creator>
    </item>
    <item>
      <title>No description</title>
      <link>https://zenn.dev/bob/articles/x</link>
      <pubDate>Wed, 01 Jan 2025 00:00:00 GMT</pubDate>
    </item>
  </channel>
</rss>)";

TEST_CASE("ZennFeedTool: feed url with and without topic", "[feeds]") {
    REQUIRE(ZennFeedTool::feed_url("") == "https://zenn.dev/feed");
    REQUIRE(ZennFeedTool::feed_url("c++") == "https://zenn.dev/topics/c%2B%2B/feed");
}

TEST_CASE("ZennFeedTool: formats articles with creator", "[feeds]") {
    MockHttpClient http;
    http.next_response = {200, kZennRss, ""};
    ZennFeedTool tool(FeedConfig{}, http);

    auto result = tool.execute(R"({"topic":"rust"})");
    REQUIRE(result.success);
    REQUIRE(http.last_method == "GET");
    REQUIRE(http.last_url == "https://zenn.dev/topics/rust/feed");
    REQUIRE(result.output ==
            "## Rust async\n"
            "  - URL: https://zenn.dev/alice/articles/rust-async\n"
            "  - Published: Thu, 02 Jan 2025 00:00:00 GMT\n"
            "  - Creator: Alice\n"
            "  - Snippet: Intro to futures & more\n"
            "\n"
            "## No description\n"
            "  - URL: https://zenn.dev/bob/articles/x\n"
            "  - Published: Wed, 01 Jan 2025 00:00:00 GMT\n"
            "  - Creator: \n"
            "  - Snippet: \n");
}

TEST_CASE("ZennFeedTool: empty feed names the topic", "[feeds]") {
    MockHttpClient http;
    http.next_response = {200, R"(<rss version="2.0"><channel><title>t</title></channel></rss>)", ""};
    ZennFeedTool tool(FeedConfig{}, http);
    auto result = tool.execute(R"({"topic":"cobol"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "No articles found for topic: cobol");
}

TEST_CASE("ZennFeedTool: fetch failure is text", "[feeds]") {
    MockHttpClient http;
    http.next_response = {503, "", ""};
    ZennFeedTool tool(FeedConfig{}, http);
    auto result = tool.execute(R"({"topic":"go"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Error fetching articles for topic \"go\": HTTP 503");
}

// ── Qiita (Atom) ─────────────────────────────────────────────────

static const char* kQiitaAtom = R"(<?xml version="1.0" encoding="UTF-8"?>
<feed xml:lang="ja-JP" xmlns="http://www.w3.org/2005/Atom">
  <title>Qiita - 人気の記事</title>
  <updated>2025-02-03T12:00:00+09:00</updated>
  <entry>
    <id>tag:qiita.com,2005:PublicArticle/1</id>
    <published>2025-02-03T10:00:00+09:00</published>
    <updated>2025-02-03T11:00:00+09:00</updated>
    <link rel="alternate" type="text/html" href="https://qiita.com/carol/items/abc"/>
    <url>https://qiita.com/carol/items/abc</url>
    <title>CMake tips</title>
    <content type="html">&lt;h1&gt;Heading&lt;/h1&gt;&lt;p&gt;Some body text&lt;/p&gt;</content>
    <author><name>carol</name></author>
  </entry>
  <entry>
    <updated>2025-02-02T09:00:00+09:00</updated>
    <link rel="related" href="https://example.com/related"/>
    <link href="https://qiita.com/dave/items/def"/>
    <title>日本語の記事</title>
    <summary>要約です</summary>
  </entry>
</feed>)";

TEST_CASE("QiitaFeedTool: popular feed by default, tag feed per topic", "[feeds]") {
    REQUIRE(QiitaFeedTool::feed_url("") == "https://qiita.com/popular-items/feed.atom");
    REQUIRE(QiitaFeedTool::feed_url("cmake") == "https://qiita.com/tags/cmake/feed");
}

TEST_CASE("QiitaFeedTool: formats articles without creator", "[feeds]") {
    MockHttpClient http;
    http.next_response = {200, kQiitaAtom, ""};
    QiitaFeedTool tool(FeedConfig{}, http);

    auto result = tool.execute("{}");
    REQUIRE(result.success);
    REQUIRE(http.last_url == "https://qiita.com/popular-items/feed.atom");
    REQUIRE(result.output ==
            "## CMake tips\n"
            "  - URL: https://qiita.com/carol/items/abc\n"
            "  - Published: 2025-02-03T10:00:00+09:00\n"
            "  - Snippet: Heading Some body text\n"
            "\n"
            "## 日本語の記事\n"
            "  - URL: https://qiita.com/dave/items/def\n"
            "  - Published: 2025-02-02T09:00:00+09:00\n"
            "  - Snippet: 要約です\n");
}

TEST_CASE("QiitaFeedTool: empty and failing feeds", "[feeds]") {
    MockHttpClient http;
    http.response_queue = {
        {200, R"(<feed xmlns="http://www.w3.org/2005/Atom"><title>t</title></feed>)", ""},
        {0, "", "Timeout was reached"},
        {200, "<html><body>not a feed", ""},
        {200, "<html><body>maintenance</body></html>", ""},
    };
    QiitaFeedTool tool(FeedConfig{}, http);

    REQUIRE(tool.execute("{}").output == "No articles found from Qiita.");

    auto timeout = tool.execute("{}");
    REQUIRE_FALSE(timeout.success);
    REQUIRE(timeout.output == "Error fetching articles from Qiita: Timeout was reached");

    auto broken = tool.execute("{}");
    REQUIRE_FALSE(broken.success);
    REQUIRE(broken.output.rfind("Error fetching articles from Qiita: Invalid feed XML", 0) == 0);

    auto html = tool.execute("{}");
    REQUIRE_FALSE(html.success);
    REQUIRE(html.output == "Error fetching articles from Qiita: Unrecognized feed format: <html>");
}

// ── parse_feed ───────────────────────────────────────────────────

TEST_CASE("parse_feed: max_items and snippet_length apply", "[feeds]") {
    FeedConfig cfg;
    cfg.max_items = 1;
    cfg.snippet_length = 5;
    auto articles = parse_feed(kZennRss, cfg);
    REQUIRE(articles.size() == 1);
    REQUIRE(articles[0].snippet == "Intro");

    // 4 bytes would split the second 3-byte character
    cfg.max_items = 2;
    cfg.snippet_length = 4;
    auto atom = parse_feed(kQiitaAtom, cfg);
    REQUIRE(atom.size() == 2);
    REQUIRE(atom[1].snippet == "要");
    REQUIRE(atom[1].creator.empty());
    REQUIRE(atom[0].creator == "carol");
}

TEST_CASE("parse_feed: RSS 1.0 items with dc:date", "[feeds]") {
    const char* rdf = R"(<?xml version="1.0"?>
<rdf:RDF xmlns:rdf="http://www.w3.org/1999/02/22-rdf-syntax-ns#"
         xmlns="http://purl.org/rss/1.0/" xmlns:dc="http://purl.org/dc/elements/1.1/">
  <channel rdf:about="https://example.com/"><title>t</title></channel>
  <item rdf:about="https://example.com/a">
    <title>First</title>
    <link>https://example.com/a</link>
    <description>Plain text</description>
    <dc:date>2025-03-01T00:00:00Z</dc:date>
    <dc:creator>erin</dc:creator>
  </item>
</rdf:RDF>)";
    auto articles = parse_feed(rdf, FeedConfig{});
    REQUIRE(articles.size() == 1);
    REQUIRE(articles[0].title == "First");
    REQUIRE(articles[0].published == "2025-03-01T00:00:00Z");
    REQUIRE(articles[0].creator == "erin");
    REQUIRE(articles[0].snippet == "Plain text");
}

TEST_CASE("html_to_text: strips markup and decodes entities", "[feeds]") {
    REQUIRE(html_to_text("").empty());
    REQUIRE(collapse_whitespace(html_to_text("<p>a &lt; b</p><script>x()</script>")) == "a < b");
    REQUIRE(collapse_whitespace(html_to_text("line<br>next")) == "line next");
}
