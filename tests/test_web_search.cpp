#include <catch2/catch.hpp>
#include "tools/web_search.hpp"
#include "mock_http_client.hpp"
#include <nlohmann/json.hpp>

using namespace browsetrail;

static SearchConfig search_config() {
    SearchConfig cfg;
    cfg.api_key = "test-key";
    return cfg;
}

TEST_CASE("WebSearchTool: metadata", "[web_search]") {
    MockHttpClient http;
    WebSearchTool tool(search_config(), http);
    REQUIRE(tool.tool_name() == "grounding-search-gemini");
    REQUIRE(tool.open_world());
    auto schema = nlohmann::json::parse(tool.parameters_json());
    REQUIRE(schema["required"][0] == "query");
}

TEST_CASE("WebSearchTool: builds grounded generateContent request", "[web_search]") {
    MockHttpClient http;
    http.next_response = {200, R"({"candidates":[{"content":{"parts":[{"text":"answer"}]}}]})", ""};
    WebSearchTool tool(search_config(), http);

    auto result = tool.execute(R"({"query":"c++ modules"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "answer");

    REQUIRE(http.last_method == "POST");
    REQUIRE(http.last_url ==
            "https://generativelanguage.googleapis.com/v1beta/models/gemini-2.5-flash:generateContent");
    REQUIRE(http.header("x-goog-api-key") == "test-key");

    auto body = nlohmann::json::parse(http.last_body);
    REQUIRE(body["contents"][0]["parts"][0]["text"] == "Search results for query: c++ modules");
    REQUIRE(body["tools"][0].contains("google_search"));
}

TEST_CASE("WebSearchTool: concatenates all text parts", "[web_search]") {
    MockHttpClient http;
    http.next_response = {200,
        R"({"candidates":[{"content":{"parts":[{"text":"one "},{"inlineData":{}},{"text":"two"}]}}]})", ""};
    WebSearchTool tool(search_config(), http);
    REQUIRE(tool.execute(R"({"query":"q"})").output == "one two");
}

TEST_CASE("WebSearchTool: empty candidates", "[web_search]") {
    MockHttpClient http;
    http.next_response = {200, R"({"candidates":[]})", ""};
    WebSearchTool tool(search_config(), http);
    auto result = tool.execute(R"({"query":"q"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "No results found.");
}

TEST_CASE("WebSearchTool: missing query", "[web_search]") {
    MockHttpClient http;
    WebSearchTool tool(search_config(), http);
    auto result = tool.execute("{}");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Missing required parameter: query");
    REQUIRE(http.call_count == 0);
}

TEST_CASE("WebSearchTool: missing api key", "[web_search]") {
    MockHttpClient http;
    WebSearchTool tool(SearchConfig{}, http);
    auto result = tool.execute(R"({"query":"q"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("GOOGLE_GENAI_API_KEY") != std::string::npos);
    REQUIRE(http.call_count == 0);
}

TEST_CASE("WebSearchTool: HTTP and transport errors are text", "[web_search]") {
    MockHttpClient http;
    http.response_queue = {
        {403, R"({"error":"denied"})", ""},
        {0, "", "Couldn't resolve host name"},
        {200, "not json", ""},
    };
    WebSearchTool tool(search_config(), http);

    auto r1 = tool.execute(R"({"query":"q"})");
    REQUIRE_FALSE(r1.success);
    REQUIRE(r1.output.find("HTTP 403") != std::string::npos);

    auto r2 = tool.execute(R"({"query":"q"})");
    REQUIRE_FALSE(r2.success);
    REQUIRE(r2.output.find("Couldn't resolve host name") != std::string::npos);

    auto r3 = tool.execute(R"({"query":"q"})");
    REQUIRE_FALSE(r3.success);
    REQUIRE(r3.output.find("Failed to parse Gemini response") != std::string::npos);
}
