#include "test_common.hpp"
#include "config_utils.hpp"

using ghbackup::test_support::TempDir;

static fs::path write_file(const fs::path& p, const std::string& text) {
    std::ofstream ofs(p);
    ofs << text;
    return p;
}

TEST_CASE("YAML config loading") {
    TempDir dir("ghbackup_cfg_yaml");
    auto cfg = write_file(dir.path / "cfg.yaml", "destination: /srv/mirror\n"
                                                 "limit: 42\n"
                                                 "quiet: yes\n"
                                                 "owner: \"on\"\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--destination"] == "/srv/mirror");
    REQUIRE(opts["--limit"] == "42");
    REQUIRE(opts["--quiet"] == "true");
    REQUIRE(opts["--owner"] == "on");
}

TEST_CASE("YAML config sections") {
    TempDir dir("ghbackup_cfg_yaml_sections");
    auto cfg = write_file(dir.path / "cfg.yaml", "listing:\n  owner: octo-org\n  limit: 5\n"
                                                 "logging:\n  log-level: DEBUG\n"
                                                 "  json-log: true\n"
                                                 "ignored:\n  - a\n  - b\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--owner"] == "octo-org");
    REQUIRE(opts["--limit"] == "5");
    REQUIRE(opts["--log-level"] == "DEBUG");
    REQUIRE(opts["--json-log"] == "true");
    REQUIRE(opts.count("--ignored") == 0);
}

TEST_CASE("YAML config errors") {
    TempDir dir("ghbackup_cfg_yaml_bad");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_yaml_config((dir.path / "missing.yaml").string(), opts, err));
    REQUIRE(err == "Failed to open file");

    auto list = write_file(dir.path / "list.yaml", "- a\n- b\n");
    REQUIRE_FALSE(load_yaml_config(list.string(), opts, err));
    REQUIRE(err == "Root YAML node is not a map");

    auto broken = write_file(dir.path / "broken.yaml", "key: [unclosed\n");
    err.clear();
    REQUIRE_FALSE(load_yaml_config(broken.string(), opts, err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("JSON config sections") {
    TempDir dir("ghbackup_cfg_json");
    auto cfg = write_file(dir.path / "cfg.json",
                          "{\n  \"destination\": \"mirror\",\n"
                          "  \"listing\": {\n    \"limit\": 10,\n    \"owner\": \"octo\"\n  },\n"
                          "  \"logging\": {\n    \"log-level\": \"DEBUG\",\n"
                          "    \"compress-logs\": false\n  }\n}");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--destination"] == "mirror");
    REQUIRE(opts["--limit"] == "10");
    REQUIRE(opts["--owner"] == "octo");
    REQUIRE(opts["--log-level"] == "DEBUG");
    REQUIRE(opts["--compress-logs"] == "false");
}

TEST_CASE("JSON config errors") {
    TempDir dir("ghbackup_cfg_json_bad");
    std::map<std::string, std::string> opts;
    std::string err;
    auto arr = write_file(dir.path / "arr.json", "[1, 2]");
    REQUIRE_FALSE(load_json_config(arr.string(), opts, err));
    REQUIRE(err == "Root JSON value is not an object");

    auto broken = write_file(dir.path / "broken.json", "{\"limit\": ");
    err.clear();
    REQUIRE_FALSE(load_json_config(broken.string(), opts, err));
    REQUIRE_FALSE(err.empty());
}
