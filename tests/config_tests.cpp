#include "test_common.hpp"
#include "config_utils.hpp"

TEST_CASE("YAML config flattens sections") {
    TempDir tmp("hazelnut_cfg");
    fs::path cfg = tmp.path() / "daemon.yaml";
    write_file(cfg, "pid-file: /tmp/h.pid\n"
                    "logging:\n"
                    "  log-level: debug\n"
                    "  json-log: true\n"
                    "  max-log-size: 1024\n"
                    "ignored:\n"
                    "  - a\n"
                    "  - b\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--pid-file"] == "/tmp/h.pid");
    REQUIRE(opts["--log-level"] == "debug");
    REQUIRE(opts["--json-log"] == "true");
    REQUIRE(opts["--max-log-size"] == "1024");
    REQUIRE(opts.count("--ignored") == 0);
}

TEST_CASE("JSON config converts scalar types") {
    TempDir tmp("hazelnut_cfg");
    fs::path cfg = tmp.path() / "daemon.json";
    write_file(cfg, R"({"update-timeout": 10, "syslog": false,
                        "logging": {"log-file": "~/h.log", "log-files": 4}})");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--update-timeout"] == "10");
    REQUIRE(opts["--syslog"] == "false");
    REQUIRE(opts["--log-file"] == "~/h.log");
    REQUIRE(opts["--log-files"] == "4");
}

TEST_CASE("load_config_file selects parser by extension") {
    TempDir tmp("hazelnut_cfg");
    fs::path json = tmp.path() / "a.json";
    fs::path yaml = tmp.path() / "a.yml";
    write_file(json, R"({"log-level": "warning"})");
    write_file(yaml, "log-level: error\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_config_file(json.string(), opts, err));
    REQUIRE(opts["--log-level"] == "warning");
    REQUIRE(load_config_file(yaml.string(), opts, err));
    REQUIRE(opts["--log-level"] == "error");
}

TEST_CASE("malformed configs report errors") {
    TempDir tmp("hazelnut_cfg");
    std::map<std::string, std::string> opts;
    std::string err;

    fs::path bad_yaml = tmp.path() / "bad.yaml";
    write_file(bad_yaml, "key: [unterminated\n");
    REQUIRE_FALSE(load_yaml_config(bad_yaml.string(), opts, err));
    REQUIRE_FALSE(err.empty());

    err.clear();
    fs::path list_yaml = tmp.path() / "list.yaml";
    write_file(list_yaml, "- a\n- b\n");
    REQUIRE_FALSE(load_yaml_config(list_yaml.string(), opts, err));

    err.clear();
    fs::path bad_json = tmp.path() / "bad.json";
    write_file(bad_json, "{\"a\": ");
    REQUIRE_FALSE(load_json_config(bad_json.string(), opts, err));
    REQUIRE_FALSE(err.empty());

    err.clear();
    REQUIRE_FALSE(load_config_file((tmp.path() / "missing.yaml").string(), opts, err));
    REQUIRE(err == "Failed to open file");
}

TEST_CASE("default config file lookup") {
    TempDir tmp("hazelnut_cfg");
    ScopedEnv xdg("XDG_CONFIG_HOME", tmp.path().string());
    REQUIRE(default_config_file().empty());
    write_file(tmp.path() / "hazelnut" / "daemon.json", "{}");
    REQUIRE(default_config_file() == tmp.path() / "hazelnut" / "daemon.json");
    write_file(tmp.path() / "hazelnut" / "daemon.yaml", "");
    REQUIRE(default_config_file() == tmp.path() / "hazelnut" / "daemon.yaml");
}
