#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace browsetrail {

nlohmann::json Config::defaults_json() {
    return {
        {"server", {
            {"listen", "127.0.0.1:3000"},
            {"max_body", 65536},
            {"path", "/mcp"}
        }},
        {"history", {
            {"path", ""},
            {"temp_dir", ""},
            {"default_limit", 10},
            {"sweep_max_age", 86400}
        }},
        {"search", {
            {"api_key", ""},
            {"model", "gemini-2.5-flash"},
            {"base_url", "https://generativelanguage.googleapis.com/v1beta"}
        }},
        {"feeds", {
            {"max_items", 100},
            {"snippet_length", 300}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load() {
    Config cfg = load_from(expand_home("~/.browsetrail/config.json"));
    cfg.apply_env();
    return cfg;
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            if (!original.is_object()) {
                throw std::runtime_error("top-level value is not an object");
            }
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    return from_json(j);
}

// Unsigned integer that fits in uint32_t; anything else leaves `out` alone
static bool read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return false;
    auto v = obj[key].get<uint64_t>();
    if (v > std::numeric_limits<uint32_t>::max()) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("listen") && s["listen"].is_string())
            cfg.server.listen = s["listen"].get<std::string>();
        read_u32(s, "max_body", cfg.server.max_body);
        if (s.contains("path") && s["path"].is_string())
            cfg.server.path = s["path"].get<std::string>();
    }

    if (j.contains("history") && j["history"].is_object()) {
        auto& h = j["history"];
        if (h.contains("path") && h["path"].is_string())
            cfg.history.path = expand_home(h["path"].get<std::string>());
        if (h.contains("temp_dir") && h["temp_dir"].is_string())
            cfg.history.temp_dir = expand_home(h["temp_dir"].get<std::string>());
        uint32_t limit = 0;
        if (read_u32(h, "default_limit", limit) && limit > 0)
            cfg.history.default_limit = limit;
        read_u32(h, "sweep_max_age", cfg.history.sweep_max_age);
    }

    if (j.contains("search") && j["search"].is_object()) {
        auto& s = j["search"];
        if (s.contains("api_key") && s["api_key"].is_string())
            cfg.search.api_key = s["api_key"].get<std::string>();
        if (s.contains("model") && s["model"].is_string())
            cfg.search.model = s["model"].get<std::string>();
        if (s.contains("base_url") && s["base_url"].is_string())
            cfg.search.base_url = s["base_url"].get<std::string>();
    }

    if (j.contains("feeds") && j["feeds"].is_object()) {
        auto& f = j["feeds"];
        read_u32(f, "max_items", cfg.feeds.max_items);
        read_u32(f, "snippet_length", cfg.feeds.snippet_length);
    }

    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("GOOGLE_GENAI_API_KEY"))
        search.api_key = v;
    if (const char* v = std::getenv("BROWSETRAIL_LISTEN"))
        server.listen = v;
    if (const char* v = std::getenv("CHROME_HISTORY_PATH"))
        history.path = v;
}

} // namespace browsetrail
