#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace browsetrail {

struct ServerConfig {
    std::string listen = "127.0.0.1:3000";
    uint32_t max_body = 65536;
    std::string path = "/mcp";
};

struct HistoryConfig {
    std::string path;                  // empty = auto-detect from the platform
    std::string temp_dir;              // empty = system temp directory
    uint32_t default_limit = 10;
    uint32_t sweep_max_age = 86400;    // 0 = never sweep stale snapshots
};

struct SearchConfig {
    std::string api_key;
    std::string model = "gemini-2.5-flash";
    std::string base_url = "https://generativelanguage.googleapis.com/v1beta";
};

struct FeedConfig {
    uint32_t max_items = 100;
    uint32_t snippet_length = 300;
};

struct Config {
    ServerConfig server;
    HistoryConfig history;
    SearchConfig search;
    FeedConfig feeds;

    // Load from ~/.browsetrail/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults when missing)
    static Config load_from(const std::string& config_path);

    // Parse an already-merged JSON document; absent or mistyped keys keep defaults
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply environment variable overrides
    void apply_env();
};

// Recursively add keys from defaults that are missing in existing
nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults);

} // namespace browsetrail
