#include "test_common.hpp"

TEST_CASE("YAML config loading") {
    fs::path cfg = fs::temp_directory_path() / "sb_cfg.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "days: 42\n";
        ofs << "dry-run: true\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--days"] == "42");
    REQUIRE(opts["--dry-run"] == "true");
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config categories") {
    fs::path cfg = fs::temp_directory_path() / "sb_cfg_cat.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "General:\n  days: 10\n  trunk: develop\nLogging:\n  log-level: DEBUG\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--days"] == "10");
    REQUIRE(opts["--trunk"] == "develop");
    REQUIRE(opts["--log-level"] == "DEBUG");
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config categories") {
    fs::path cfg = fs::temp_directory_path() / "sb_cfg_cat.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{\n  \"General\": {\n    \"days\": 10,\n    \"dry-run\": true\n  },\n  "
               "\"Logging\": {\n    \"log-level\": \"DEBUG\"\n  }\n}";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--days"] == "10");
    REQUIRE(opts["--dry-run"] == "true");
    REQUIRE(opts["--log-level"] == "DEBUG");
    FS_REMOVE(cfg);
}

TEST_CASE("YAML sequences become comma lists") {
    fs::path cfg = fs::temp_directory_path() / "sb_cfg_list.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "protect:\n  - release\n  - staging\nprotect-pattern: [\"keep/*\"]\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--protect"] == "release,staging");
    REQUIRE(opts["--protect-pattern"] == "keep/*");
    FS_REMOVE(cfg);
}

TEST_CASE("JSON arrays become comma lists") {
    fs::path cfg = fs::temp_directory_path() / "sb_cfg_list.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{ \"branch-pattern\": [\"feature-*\", \"bugfix-*\"] }";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--branch-pattern"] == "feature-*,bugfix-*");
    FS_REMOVE(cfg);
}

TEST_CASE("YAML value conversions") {
    fs::path cfg = fs::temp_directory_path() / "sb_cfg_values.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "bool_true: true\n";
        ofs << "bool_false: false\n";
        ofs << "int_val: 7\n";
        ofs << "float_val: 3.5\n";
        ofs << "null_val: null\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--bool_true"] == "true");
    REQUIRE(opts["--bool_false"] == "false");
    REQUIRE(opts["--int_val"] == "7");
    REQUIRE(opts["--float_val"] == "3.5");
    REQUIRE(opts["--null_val"] == "");
    FS_REMOVE(cfg);
}

TEST_CASE("JSON value conversions") {
    fs::path cfg = fs::temp_directory_path() / "sb_cfg_values.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{\n  \"bool_true\": true,\n  \"bool_false\": false,\n  \"int_val\": 7,\n  "
               "\"float_val\": 3.5,\n  \"null_val\": null\n}";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--bool_true"] == "true");
    REQUIRE(opts["--bool_false"] == "false");
    REQUIRE(opts["--int_val"] == "7");
    REQUIRE(opts["--float_val"] == "3.5");
    REQUIRE(opts["--null_val"] == "");
    FS_REMOVE(cfg);
}

TEST_CASE("Config loading reports errors") {
    std::map<std::string, std::string> opts;
    std::string err;
    fs::path missing = fs::temp_directory_path() / "sb_cfg_missing.yaml";
    fs::remove(missing);
    REQUIRE_FALSE(load_yaml_config(missing.string(), opts, err));
    REQUIRE(err == "Failed to open file");

    fs::path list = fs::temp_directory_path() / "sb_cfg_rootlist.json";
    {
        std::ofstream ofs(list);
        ofs << "[1, 2, 3]";
    }
    err.clear();
    REQUIRE_FALSE(load_json_config(list.string(), opts, err));
    REQUIRE(err == "Root JSON value is not an object");
    FS_REMOVE(list);

    fs::path broken = fs::temp_directory_path() / "sb_cfg_broken.json";
    {
        std::ofstream ofs(broken);
        ofs << "{ \"days\": ";
    }
    err.clear();
    REQUIRE_FALSE(load_json_config(broken.string(), opts, err));
    REQUIRE_FALSE(err.empty());
    FS_REMOVE(broken);
}

TEST_CASE("find_auto_config prefers YAML and earlier directories") {
    fs::path a = fs::temp_directory_path() / "sb_auto_a";
    fs::path b = fs::temp_directory_path() / "sb_auto_b";
    FS_REMOVE_ALL(a);
    FS_REMOVE_ALL(b);
    fs::create_directories(a);
    fs::create_directories(b);

    REQUIRE_FALSE(find_auto_config({a, b}).has_value());

    std::ofstream(b / ".stalebranch.yaml") << "days: 1\n";
    REQUIRE(find_auto_config({a, b}) == b / ".stalebranch.yaml");

    std::ofstream(a / ".stalebranch.json") << "{}";
    REQUIRE(find_auto_config({a, b}) == a / ".stalebranch.json");

    std::ofstream(a / ".stalebranch.yaml") << "days: 2\n";
    REQUIRE(find_auto_config({a, b}) == a / ".stalebranch.yaml");
    REQUIRE(find_auto_config({fs::path(), b}) == b / ".stalebranch.yaml");

    FS_REMOVE_ALL(a);
    FS_REMOVE_ALL(b);
}
