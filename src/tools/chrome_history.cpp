#include "chrome_history.hpp"
#include "tool_util.hpp"
#include "../history/history_error.hpp"
#include "../history/history_reader.hpp"
#include "../plugin.hpp"
#include <ctime>
#include <iostream>

static browsetrail::ToolRegistrar reg_chrome_history("chrome-hist-tool",
    [](const browsetrail::Config& config, browsetrail::HttpClient&) {
        return std::make_unique<browsetrail::ChromeHistoryTool>(config.history);
    });

namespace browsetrail {

ChromeHistoryTool::ChromeHistoryTool(HistoryConfig config,
                                     std::unique_ptr<HostIdentity> identity)
    : config_(std::move(config)), identity_(std::move(identity)) {}

ToolResult ChromeHistoryTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;

    uint32_t limit = optional_positive_int(args, "limit").value_or(0);

    try {
        HistoryReader reader(config_, *identity_);
        auto entries = reader.read_today(limit, std::time(nullptr));
        return ToolResult{true, format_history(entries)};
    } catch (const HistoryError& e) {
        std::cerr << "[history] " << history_error_name(e.code()) << ": " << e.what() << "\n";
        return ToolResult{false, e.what()};
    } catch (const std::exception& e) {
        std::cerr << "[history] Unexpected failure: " << e.what() << "\n";
        return ToolResult{false, std::string("Failed to read Chrome history: ") + e.what()};
    }
}

std::string ChromeHistoryTool::description() const {
    return "Fetches browsing history from Google Chrome.";
}

std::string ChromeHistoryTool::parameters_json() const {
    return R"({"type":"object","properties":{"limit":{"type":"number","description":"The number of recent history entries to fetch. Defaults to 10."}}})";
}

} // namespace browsetrail
