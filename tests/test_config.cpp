#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <iterator>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace browsetrail;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.server.listen == "127.0.0.1:3000");
    REQUIRE(cfg.server.path == "/mcp");
    REQUIRE(cfg.server.max_body == 65536);
    REQUIRE(cfg.history.path.empty());
    REQUIRE(cfg.history.default_limit == 10);
    REQUIRE(cfg.history.sweep_max_age == 86400);
    REQUIRE(cfg.search.api_key.empty());
    REQUIRE(cfg.search.model == "gemini-2.5-flash");
    REQUIRE(cfg.feeds.max_items == 100);
}

TEST_CASE("Config::from_json: defaults_json matches struct defaults", "[config]") {
    Config a;
    Config b = Config::from_json(Config::defaults_json());
    REQUIRE(a.server.listen == b.server.listen);
    REQUIRE(a.server.max_body == b.server.max_body);
    REQUIRE(a.history.default_limit == b.history.default_limit);
    REQUIRE(a.search.base_url == b.search.base_url);
    REQUIRE(a.feeds.snippet_length == b.feeds.snippet_length);
}

TEST_CASE("Config::from_json: mistyped values keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "server": {"listen": 42, "max_body": "big"},
        "history": {"default_limit": 0, "sweep_max_age": -1},
        "feeds": "nope"
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.server.listen == "127.0.0.1:3000");
    REQUIRE(cfg.server.max_body == 65536);
    REQUIRE(cfg.history.default_limit == 10);
    REQUIRE(cfg.history.sweep_max_age == 86400);
    REQUIRE(cfg.feeds.max_items == 100);
}

TEST_CASE("Config::from_json: values beyond uint32 range keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "server": {"max_body": 4294967301},
        "history": {"default_limit": 4294967306, "sweep_max_age": 18446744073709551615},
        "feeds": {"max_items": 4294967296, "snippet_length": 4294967295}
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.server.max_body == 65536);
    REQUIRE(cfg.history.default_limit == 10);
    REQUIRE(cfg.history.sweep_max_age == 86400);
    REQUIRE(cfg.feeds.max_items == 100);
    REQUIRE(cfg.feeds.snippet_length == 4294967295u);
}

TEST_CASE("merge_defaults: adds missing keys recursively, keeps user values", "[config]") {
    auto existing = nlohmann::json::parse(R"({"server": {"listen": "0.0.0.0:9000"}, "extra": 1})");
    auto merged = merge_defaults(existing, Config::defaults_json());
    REQUIRE(merged["server"]["listen"] == "0.0.0.0:9000");
    REQUIRE(merged["server"]["path"] == "/mcp");
    REQUIRE(merged["extra"] == 1);
    REQUIRE(merged.contains("feeds"));
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "browsetrail_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("GOOGLE_GENAI_API_KEY");
        unsetenv("BROWSETRAIL_LISTEN");
        unsetenv("CHROME_HISTORY_PATH");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("GOOGLE_GENAI_API_KEY");
        unsetenv("BROWSETRAIL_LISTEN");
        unsetenv("CHROME_HISTORY_PATH");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.browsetrail/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.browsetrail");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "server": {"listen": "127.0.0.1:4100", "path": "/rpc"},
        "history": {"path": "~/chrome/History", "default_limit": 25},
        "search": {"api_key": "file-key", "model": "gemini-2.0-flash"},
        "feeds": {"max_items": 30}
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.server.listen == "127.0.0.1:4100");
    REQUIRE(cfg.server.path == "/rpc");
    REQUIRE(cfg.history.path == g.dir + "/chrome/History");
    REQUIRE(cfg.history.default_limit == 25);
    REQUIRE(cfg.search.api_key == "file-key");
    REQUIRE(cfg.search.model == "gemini-2.0-flash");
    REQUIRE(cfg.feeds.max_items == 30);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"search": {"api_key": "from-file"}, "server": {"listen": "127.0.0.1:1"}})");
    setenv("GOOGLE_GENAI_API_KEY", "from-env", 1);
    setenv("BROWSETRAIL_LISTEN", "127.0.0.1:5555", 1);
    setenv("CHROME_HISTORY_PATH", "/data/History", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.search.api_key == "from-env");
    REQUIRE(cfg.server.listen == "127.0.0.1:5555");
    REQUIRE(cfg.history.path == "/data/History");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.server.listen == "127.0.0.1:3000");
    REQUIRE(cfg.search.api_key.empty());
    // The broken file is left for the user to fix
    REQUIRE(g.read_config() == "not valid json {{{");
}

TEST_CASE("Config::load: non-object top level falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("[1, 2, 3]");
    Config cfg = Config::load();
    REQUIRE(cfg.history.default_limit == 10);
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();

    REQUIRE(std::filesystem::exists(g.config_path()));
    auto j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["server"]["listen"] == "127.0.0.1:3000");
    REQUIRE(j["history"]["default_limit"] == 10);
    REQUIRE(j["search"]["api_key"] == "");
    REQUIRE(j["feeds"].contains("snippet_length"));
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"search": {"api_key": "sk-test"}})");

    Config cfg = Config::load();
    REQUIRE(cfg.search.api_key == "sk-test");

    auto j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["search"]["api_key"] == "sk-test");
    REQUIRE(j["search"]["model"] == "gemini-2.5-flash");
    REQUIRE(j["server"]["path"] == "/mcp");
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["server"]["listen"] = "127.0.0.1:8123";
    full["history"]["default_limit"] = 3;
    g.write_config(full.dump(4) + "\n");

    std::string before = g.read_config();
    Config cfg = Config::load();
    REQUIRE(cfg.server.listen == "127.0.0.1:8123");
    REQUIRE(cfg.history.default_limit == 3);
    REQUIRE(g.read_config() == before);
}

TEST_CASE("Config::load: defaults roundtrip without re-migration", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();
    std::string first = g.read_config();
    Config::load();
    REQUIRE(g.read_config() == first);
}
