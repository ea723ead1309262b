// Config helper tests: TOML subset parsing and directory resolution.

#include <catch2/catch_test_macros.hpp>

#include <clawdesk/config/config_helpers.h>

#include "../../support/scoped_env.h"
#include "../../support/temp_dir_scope.hpp"

#include <fstream>

using namespace clawdesk::config;
using clawdesk::test_support::ScopedEnv;
using clawdesk::test_support::TempDirScope;
namespace fs = std::filesystem;

namespace {

fs::path writeFile(const fs::path& dir, const std::string& content) {
    auto path = dir / "config.toml";
    std::ofstream(path) << content;
    return path;
}

} // namespace

TEST_CASE("parse_config_value reads section keys", "[config][helpers]") {
    auto tmp = TempDirScope::unique_under("clawdesk_cfg_helpers");
    auto path = writeFile(tmp.path(), R"(
# top comment
[daemon]
binary = "/opt/bambooclaw/bin/bambooclaw"   # trailing comment
stop_timeout_ms = 2500

[download]
chunk_size = 65536
download.follow_redirects = false
label = "has # inside"
)");

    CHECK(parse_config_value(path, "daemon", "binary") == "/opt/bambooclaw/bin/bambooclaw");
    CHECK(parse_config_value(path, "daemon", "stop_timeout_ms") == "2500");
    CHECK(parse_config_value(path, "download", "chunk_size") == "65536");
    CHECK(parse_config_value(path, "download", "follow_redirects") == "false");
    CHECK(parse_config_value(path, "download", "label") == "has # inside");

    SECTION("keys are scoped to their section") {
        CHECK(parse_config_value(path, "download", "binary").empty());
        CHECK(parse_config_value(path, "flush", "scratch_dir").empty());
    }

    SECTION("missing file yields empty") {
        CHECK(parse_config_value(tmp.path() / "nope.toml", "daemon", "binary").empty());
    }
}

TEST_CASE("parse_string_list accepts arrays and comma lists", "[config][helpers]") {
    CHECK(parse_string_list(R"(["python3", "node"])") ==
          std::vector<std::string>{"python3", "node"});
    CHECK(parse_string_list("rustc, cargo") == std::vector<std::string>{"rustc", "cargo"});
    CHECK(parse_string_list(R"(["a,b", 'c'])") == std::vector<std::string>{"a,b", "c"});
    CHECK(parse_string_list("").empty());
    CHECK(parse_string_list("[]").empty());
}

TEST_CASE("Scalar parsers fall back on junk", "[config][helpers]") {
    CHECK(parse_bool("true", false));
    CHECK(parse_bool("YES", false));
    CHECK_FALSE(parse_bool("off", true));
    CHECK(parse_bool("maybe", true));

    CHECK(parse_ms("1500") == std::chrono::milliseconds(1500));
    CHECK(parse_ms("abc") == std::chrono::milliseconds(0));

    CHECK(unquote("\"x\"") == "x");
    CHECK(unquote("'y'") == "y");
    CHECK(unquote("plain") == "plain");
}

#ifndef _WIN32
TEST_CASE("Config and data directories follow XDG and HOME", "[config][helpers]") {
    SECTION("XDG variables win") {
        ScopedEnv cfg("XDG_CONFIG_HOME", std::string("/xdg/config"));
        ScopedEnv data("XDG_DATA_HOME", std::string("/xdg/data"));
        CHECK(get_config_dir() == fs::path("/xdg/config/clawdesk"));
        CHECK(get_data_dir() == fs::path("/xdg/data/clawdesk"));
    }

    SECTION("HOME fallback") {
        ScopedEnv cfg("XDG_CONFIG_HOME", std::nullopt);
        ScopedEnv data("XDG_DATA_HOME", std::nullopt);
        ScopedEnv home("HOME", std::string("/home/tester"));
        CHECK(get_config_dir() == fs::path("/home/tester/.config/clawdesk"));
        CHECK(get_data_dir() == fs::path("/home/tester/.local/share/clawdesk"));
        CHECK(expand_tilde("~/agent") == fs::path("/home/tester/agent"));
    }

    SECTION("explicit config path wins over CLAWDESK_CONFIG") {
        ScopedEnv env("CLAWDESK_CONFIG", std::string("/env/config.toml"));
        CHECK(get_config_path() == fs::path("/env/config.toml"));
        CHECK(get_config_path("/cli/config.toml") == fs::path("/cli/config.toml"));
    }
}
#endif
