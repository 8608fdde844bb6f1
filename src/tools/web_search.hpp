#pragma once
#include "../tool.hpp"
#include "../config.hpp"
#include "../http.hpp"

namespace browsetrail {

// Web search through Gemini with Google Search grounding.
class WebSearchTool : public Tool {
public:
    WebSearchTool(SearchConfig config, HttpClient& http);

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "grounding-search-gemini"; }
    std::string description() const override;
    std::string parameters_json() const override;
    bool open_world() const override { return true; }

private:
    SearchConfig config_;
    HttpClient& http_;
};

} // namespace browsetrail
