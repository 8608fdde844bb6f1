#include "web_search.hpp"
#include "tool_util.hpp"
#include "../plugin.hpp"
#include <iostream>

static browsetrail::ToolRegistrar reg_web_search("grounding-search-gemini",
    [](const browsetrail::Config& config, browsetrail::HttpClient& http) {
        return std::make_unique<browsetrail::WebSearchTool>(config.search, http);
    });

using json = nlohmann::json;

namespace browsetrail {

WebSearchTool::WebSearchTool(SearchConfig config, HttpClient& http)
    : config_(std::move(config)), http_(http) {}

ToolResult WebSearchTool::execute(const std::string& args_json) {
    json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "query")) return *err;

    if (config_.api_key.empty()) {
        return ToolResult{false, "Search is not configured: set GOOGLE_GENAI_API_KEY "
                                 "or search.api_key in the config file"};
    }

    std::string query = args["query"].get<std::string>();

    json prompt;
    prompt["text"] = "Search results for query: " + query;
    json content;
    content["parts"] = json::array({prompt});
    json grounding;
    grounding["google_search"] = json::object();

    json request;
    request["contents"] = json::array({content});
    request["tools"] = json::array({grounding});

    std::string url = config_.base_url + "/models/" + config_.model + ":generateContent";
    std::vector<Header> headers = {
        {"Content-Type", "application/json"},
        {"x-goog-api-key", config_.api_key}
    };

    auto response = http_.post(url, request.dump(), headers);
    if (response.status_code == 0) {
        return ToolResult{false, "Gemini search request failed: " +
                                 (response.error.empty() ? std::string("no response") : response.error)};
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        return ToolResult{false, "Gemini API error (HTTP " +
                                 std::to_string(response.status_code) + "): " + response.body};
    }

    std::string text;
    try {
        auto resp = json::parse(response.body);
        if (resp.contains("candidates") && resp["candidates"].is_array() &&
            !resp["candidates"].empty()) {
            json answer = resp["candidates"][0].value("content", json::object());
            if (answer.contains("parts") && answer["parts"].is_array()) {
                for (const auto& part : answer["parts"]) {
                    if (part.contains("text") && part["text"].is_string()) {
                        text += part["text"].get<std::string>();
                    }
                }
            }
        }
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to parse Gemini response: ") + e.what()};
    }

    if (text.empty()) text = "No results found.";
    std::cerr << "[search] " << text.size() << " bytes for query: " << query << "\n";
    return ToolResult{true, text};
}

std::string WebSearchTool::description() const {
    return "Search the web using Gemini API.";
}

std::string WebSearchTool::parameters_json() const {
    return R"({"type":"object","properties":{"query":{"type":"string","description":"The search query."}},"required":["query"]})";
}

} // namespace browsetrail
