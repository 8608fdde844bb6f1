#include "config.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include "tool.hpp"
#include "history/snapshot.hpp"
#include "mcp/server.hpp"
#include "mcp/http_server.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: browsetrail [options]\n"
              << "\n"
              << "Serves Chrome browsing history, web search and tech feeds as MCP tools.\n"
              << "\n"
              << "Options:\n"
              << "  --listen HOST:PORT   Serve MCP over HTTP on this address (default: 127.0.0.1:3000)\n"
              << "  --stdio              Serve MCP as newline-delimited JSON-RPC on stdin/stdout\n"
              << "  --call TOOL          Run one tool, print its text result and exit\n"
              << "  --args JSON          Arguments for --call (default: {})\n"
              << "  --list               List available tools and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  GOOGLE_GENAI_API_KEY API key for grounding-search-gemini\n"
              << "  BROWSETRAIL_LISTEN   Listen address (overrides config)\n"
              << "  CHROME_HISTORY_PATH  Explicit Chrome History file (skips platform detection)\n"
              << "\n"
              << "Config file: ~/.browsetrail/config.json\n";
}

static int run_http(const browsetrail::Config& config, const browsetrail::McpServer& server) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    browsetrail::HttpServer http_server(
        config.server.listen, config.server.max_body,
        browsetrail::make_mcp_handler(server, config.server.path));

    std::string error;
    if (!http_server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    std::cerr << "[mcp] Endpoint: POST http://" << config.server.listen
              << config.server.path << "\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[mcp] Shutting down.\n";
    http_server.stop();
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string listen;
    std::string call_tool;
    std::string call_args = "{}";
    bool stdio = false;
    bool list = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--stdio") == 0) {
            stdio = true;
        } else if (std::strcmp(argv[i], "--call") == 0 && i + 1 < argc) {
            call_tool = argv[++i];
        } else if (std::strcmp(argv[i], "--args") == 0 && i + 1 < argc) {
            call_args = argv[++i];
        } else if (std::strcmp(argv[i], "--list") == 0) {
            list = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    browsetrail::http_init();
    auto config = browsetrail::Config::load();
    if (!listen.empty()) {
        config.server.listen = listen;
    }

    // Leftover snapshots from a process that died before its cleanup ran
    browsetrail::sweep_stale_snapshots(
        browsetrail::snapshot_temp_dir(config.history.temp_dir),
        config.history.sweep_max_age);

    browsetrail::http_set_abort_flag(&g_shutdown);
    browsetrail::CurlHttpClient http_client;
    browsetrail::McpServer server(
        browsetrail::PluginRegistry::instance().create_all_tools(config, http_client));

    int rc = 0;
    if (list) {
        for (const auto& tool : server.tools()) {
            std::cout << tool->tool_name() << "  " << tool->description() << "\n";
        }
    } else if (!call_tool.empty()) {
        auto result = server.call_tool(call_tool, call_args);
        (result.success ? std::cout : std::cerr) << result.output << "\n";
        rc = result.success ? 0 : 1;
    } else if (stdio) {
        std::cerr << "[mcp] Serving on stdio (" << server.tools().size() << " tools)\n";
        server.run_stdio(std::cin, std::cout);
    } else {
        rc = run_http(config, server);
    }

    browsetrail::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
