#pragma once
#include "../tool.hpp"
#include "../config.hpp"
#include "../http.hpp"
#include <vector>

namespace browsetrail {

struct FeedArticle {
    std::string title;
    std::string link;
    std::string published;
    std::string creator;   // empty when the entry names no author
    std::string snippet;
};

// Parse an RSS 2.0, RSS 1.0 (RDF) or Atom document. At most
// config.max_items entries are returned. Snippets are the item
// description (RSS) or content/summary (Atom) with markup stripped,
// whitespace collapsed and cut at config.snippet_length bytes.
// Throws std::runtime_error on malformed XML or an unknown root element.
std::vector<FeedArticle> parse_feed(const std::string& xml, const FeedConfig& config);

// Text content of an HTML fragment, entities decoded, block elements
// separated by whitespace.
std::string html_to_text(const std::string& html);

// "## title\n  - URL: ...\n  - Published: ...\n[  - Creator: ...\n]  - Snippet: ...\n"
// blocks joined by "\n"
std::string format_articles(const std::vector<FeedArticle>& articles, bool with_creator);

// Latest Zenn articles, optionally filtered by topic.
class ZennFeedTool : public Tool {
public:
    ZennFeedTool(FeedConfig config, HttpClient& http);

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "zenn-feed"; }
    std::string title() const override { return "fetch-zenn-feed"; }
    std::string description() const override;
    std::string parameters_json() const override;
    bool open_world() const override { return true; }

    static std::string feed_url(const std::string& topic);

private:
    FeedConfig config_;
    HttpClient& http_;
};

// Popular Qiita items, or the latest items for a tag.
class QiitaFeedTool : public Tool {
public:
    QiitaFeedTool(FeedConfig config, HttpClient& http);

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "qiita-feed"; }
    std::string title() const override { return "fetch-qiita-feed"; }
    std::string description() const override;
    std::string parameters_json() const override;
    bool open_world() const override { return true; }

    static std::string feed_url(const std::string& topic);

private:
    FeedConfig config_;
    HttpClient& http_;
};

} // namespace browsetrail
