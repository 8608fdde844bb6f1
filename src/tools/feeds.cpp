#include "feeds.hpp"
#include "tool_util.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <climits>
#include <iostream>
#include <stdexcept>
#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

static browsetrail::ToolRegistrar reg_zenn("zenn-feed",
    [](const browsetrail::Config& config, browsetrail::HttpClient& http) {
        return std::make_unique<browsetrail::ZennFeedTool>(config.feeds, http);
    });

static browsetrail::ToolRegistrar reg_qiita("qiita-feed",
    [](const browsetrail::Config& config, browsetrail::HttpClient& http) {
        return std::make_unique<browsetrail::QiitaFeedTool>(config.feeds, http);
    });

using json = nlohmann::json;

namespace browsetrail {

namespace {

struct XmlDocGuard {
    xmlDocPtr doc = nullptr;
    ~XmlDocGuard() { if (doc) xmlFreeDoc(doc); }
};

// Matches on the local name, so "dc:creator" is "creator"
bool is_element(const xmlNode* n, const char* name) {
    return n->type == XML_ELEMENT_NODE &&
           xmlStrcmp(n->name, reinterpret_cast<const xmlChar*>(name)) == 0;
}

xmlNode* first_child(xmlNode* parent, const char* name) {
    for (xmlNode* c = parent->children; c; c = c->next) {
        if (is_element(c, name)) return c;
    }
    return nullptr;
}

std::string node_text(xmlNode* n) {
    xmlChar* content = xmlNodeGetContent(n);
    if (!content) return {};
    std::string s = reinterpret_cast<const char*>(content);
    xmlFree(content);
    return s;
}

std::string child_text(xmlNode* parent, const char* name) {
    xmlNode* c = first_child(parent, name);
    return c ? trim(node_text(c)) : std::string();
}

std::string attribute(xmlNode* n, const char* name) {
    xmlChar* v = xmlGetProp(n, reinterpret_cast<const xmlChar*>(name));
    if (!v) return {};
    std::string s = reinterpret_cast<const char*>(v);
    xmlFree(v);
    return s;
}

bool is_block(const xmlNode* n) {
    static const char* const kBlocks[] = {
        "p", "br", "div", "li", "ul", "ol", "h1", "h2", "h3", "h4", "h5", "h6",
        "blockquote", "section", "table", "tr", "td", "th", "pre", "hr"
    };
    for (const char* name : kBlocks) {
        if (is_element(n, name)) return true;
    }
    return false;
}

void collect_text(const xmlNode* node, std::string& out) {
    for (const xmlNode* n = node; n; n = n->next) {
        if (n->type == XML_TEXT_NODE || n->type == XML_CDATA_SECTION_NODE) {
            if (n->content) out += reinterpret_cast<const char*>(n->content);
        } else if (n->type == XML_ELEMENT_NODE) {
            if (is_element(n, "script") || is_element(n, "style")) continue;
            collect_text(n->children, out);
            if (is_block(n)) out += ' ';
        }
    }
}

std::string make_snippet(const std::string& html, const FeedConfig& config) {
    return utf8_truncate(collapse_whitespace(html_to_text(html)), config.snippet_length);
}

FeedArticle rss_item(xmlNode* item, const FeedConfig& config) {
    FeedArticle a;
    a.title = child_text(item, "title");
    a.link = child_text(item, "link");
    a.published = child_text(item, "pubDate");
    if (a.published.empty()) a.published = child_text(item, "date");  // dc:date (RSS 1.0)
    a.creator = child_text(item, "creator");
    if (a.creator.empty()) a.creator = child_text(item, "author");
    if (xmlNode* d = first_child(item, "description")) a.snippet = make_snippet(node_text(d), config);
    return a;
}

// rel="alternate" (or no rel) wins over other links
std::string atom_link(xmlNode* entry) {
    std::string fallback;
    for (xmlNode* c = entry->children; c; c = c->next) {
        if (!is_element(c, "link")) continue;
        std::string href = attribute(c, "href");
        std::string rel = attribute(c, "rel");
        if (rel.empty() || rel == "alternate") return href;
        if (fallback.empty()) fallback = href;
    }
    return fallback;
}

FeedArticle atom_entry(xmlNode* entry, const FeedConfig& config) {
    FeedArticle a;
    a.title = child_text(entry, "title");
    a.link = atom_link(entry);
    a.published = child_text(entry, "published");
    if (a.published.empty()) a.published = child_text(entry, "updated");
    if (xmlNode* author = first_child(entry, "author")) a.creator = child_text(author, "name");
    xmlNode* body = first_child(entry, "content");
    if (!body) body = first_child(entry, "summary");
    if (body) a.snippet = make_snippet(node_text(body), config);
    return a;
}

// GET url; throws std::runtime_error with a readable reason on failure
std::string fetch_body(HttpClient& http, const std::string& url) {
    std::vector<Header> headers = {
        {"Accept", "application/rss+xml, application/atom+xml, application/xml;q=0.9, */*;q=0.8"}
    };
    auto response = http.get(url, headers);
    if (response.status_code == 0) {
        throw std::runtime_error(response.error.empty() ? "no response" : response.error);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw std::runtime_error("HTTP " + std::to_string(response.status_code));
    }
    return response.body;
}

} // namespace

std::string html_to_text(const std::string& html) {
    if (html.empty() || html.size() > static_cast<size_t>(INT_MAX)) return html;
    XmlDocGuard g;
    g.doc = htmlReadMemory(html.data(), static_cast<int>(html.size()), nullptr, "UTF-8",
                           HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
    if (!g.doc) return html;
    std::string out;
    collect_text(xmlDocGetRootElement(g.doc), out);
    return out;
}

std::vector<FeedArticle> parse_feed(const std::string& xml, const FeedConfig& config) {
    if (xml.size() > static_cast<size_t>(INT_MAX)) throw std::runtime_error("Feed too large");

    XmlDocGuard g;
    g.doc = xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                          XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
    if (!g.doc) {
        const xmlError* err = xmlGetLastError();
        std::string reason = err && err->message ? trim(err->message) : "unknown error";
        throw std::runtime_error("Invalid feed XML: " + reason);
    }
    xmlNode* root = xmlDocGetRootElement(g.doc);
    if (!root) throw std::runtime_error("Invalid feed XML: empty document");

    std::vector<FeedArticle> articles;
    auto collect = [&](xmlNode* parent, const char* tag, bool atom) {
        for (xmlNode* c = parent->children; c; c = c->next) {
            if (articles.size() >= config.max_items) break;
            if (!is_element(c, tag)) continue;
            articles.push_back(atom ? atom_entry(c, config) : rss_item(c, config));
        }
    };

    if (is_element(root, "feed")) {
        collect(root, "entry", true);
    } else if (is_element(root, "rss")) {
        if (xmlNode* channel = first_child(root, "channel")) collect(channel, "item", false);
    } else if (is_element(root, "RDF")) {
        collect(root, "item", false);
    } else {
        throw std::runtime_error(std::string("Unrecognized feed format: <") +
                                 reinterpret_cast<const char*>(root->name) + ">");
    }
    return articles;
}

std::string format_articles(const std::vector<FeedArticle>& articles, bool with_creator) {
    std::string out;
    for (size_t i = 0; i < articles.size(); ++i) {
        const auto& a = articles[i];
        if (i > 0) out += "\n";
        out += "## " + a.title + "\n";
        out += "  - URL: " + a.link + "\n";
        out += "  - Published: " + a.published + "\n";
        if (with_creator) out += "  - Creator: " + a.creator + "\n";
        out += "  - Snippet: " + a.snippet + "\n";
    }
    return out;
}

// ── Zenn ─────────────────────────────────────────────────────────

ZennFeedTool::ZennFeedTool(FeedConfig config, HttpClient& http)
    : config_(std::move(config)), http_(http) {
    xmlInitParser();
}

std::string ZennFeedTool::feed_url(const std::string& topic) {
    if (topic.empty()) return "https://zenn.dev/feed";
    return "https://zenn.dev/topics/" + url_encode(topic) + "/feed";
}

ToolResult ZennFeedTool::execute(const std::string& args_json) {
    json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    std::string topic = optional_string(args, "topic").value_or("");

    try {
        auto articles = parse_feed(fetch_body(http_, feed_url(topic)), config_);
        std::string text = format_articles(articles, true);
        if (text.empty()) text = "No articles found for topic: " + topic;
        return ToolResult{true, text};
    } catch (const std::exception& e) {
        std::cerr << "[feeds] zenn: " << e.what() << "\n";
        return ToolResult{false, "Error fetching articles for topic \"" + topic + "\": " + e.what()};
    }
}

std::string ZennFeedTool::description() const {
    return "Fetches the latest articles from a Zenn topic.";
}

std::string ZennFeedTool::parameters_json() const {
    return R"({"type":"object","properties":{"topic":{"type":"string","description":"The Zenn topic to fetch articles from (e.g., 'python', 'aws', 'typescript'). If not provided, fetches from the general feed."}}})";
}

// ── Qiita ────────────────────────────────────────────────────────

QiitaFeedTool::QiitaFeedTool(FeedConfig config, HttpClient& http)
    : config_(std::move(config)), http_(http) {
    xmlInitParser();
}

std::string QiitaFeedTool::feed_url(const std::string& topic) {
    if (topic.empty()) return "https://qiita.com/popular-items/feed.atom";
    return "https://qiita.com/tags/" + url_encode(topic) + "/feed";
}

ToolResult QiitaFeedTool::execute(const std::string& args_json) {
    json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    std::string topic = optional_string(args, "topic").value_or("");

    try {
        auto articles = parse_feed(fetch_body(http_, feed_url(topic)), config_);
        std::string text = format_articles(articles, false);
        if (text.empty()) text = "No articles found from Qiita.";
        return ToolResult{true, text};
    } catch (const std::exception& e) {
        std::cerr << "[feeds] qiita: " << e.what() << "\n";
        return ToolResult{false, std::string("Error fetching articles from Qiita: ") + e.what()};
    }
}

std::string QiitaFeedTool::description() const {
    return "Fetches the latest articles from Qiita.";
}

std::string QiitaFeedTool::parameters_json() const {
    return R"({"type":"object","properties":{"topic":{"type":"string","description":"The qiita feed topic (like \"typescript\", \"python\", \"aws\", \"react\"). If not provided, fetches from the general feed."}}})";
}

} // namespace browsetrail
