#include <catch2/catch_test_macros.hpp>

#include <orderpix/config/config_helpers.h>
#include <orderpix/config/run_config.h>

#include "../../support/temp_dir_scope.hpp"

#include <string>
#include <vector>

using namespace orderpix::config;
using orderpix::downloader::ErrorCode;
using orderpix::test_support::TempDirScope;

namespace {

RunConfig validBase() {
    RunConfig cfg;
    cfg.orderId = "13011948";
    return cfg;
}

} // namespace

TEST_CASE("RunConfig: defaults", "[config]") {
    RunConfig cfg;
    CHECK(cfg.extensions == std::vector<std::string>{".jpg"});
    CHECK(cfg.outputDir == "downloaded_images");
    CHECK(cfg.baseUrl == "https://portal.diakrit.com");
    CHECK(cfg.logFile == "image_downloader.log");
    CHECK(cfg.maxAttempts == 3);
    CHECK(cfg.pathFilter == "/orderfiles/");
    CHECK_FALSE(cfg.tls.insecure);
    CHECK(cfg.tls.caPath.empty());
    CHECK(cfg.timeout == std::chrono::milliseconds{10000});
    CHECK_FALSE(cfg.parallel);
    CHECK(cfg.effectiveWorkers() == 1);
    cfg.parallel = true;
    CHECK(cfg.effectiveWorkers() == 5);
}

TEST_CASE("RunConfig: validate", "[config]") {
    SECTION("Accepts and normalizes a valid config") {
        auto cfg = validBase();
        cfg.orderId = "  13011948 ";
        cfg.extensions = {"JPG", ".png", ".jpg", " .Png "};
        cfg.baseUrl = "https://portal.test///";
        cfg.transform.extraParamsToRemove = {"", " sig "};
        auto r = cfg.validate();
        REQUIRE(r.ok());
        CHECK(cfg.orderId == "13011948");
        CHECK(cfg.extensions == std::vector<std::string>{".jpg", ".png"});
        CHECK(cfg.baseUrl == "https://portal.test");
        CHECK(cfg.transform.extraParamsToRemove == std::set<std::string>{"sig"});
    }

    SECTION("Rejects an empty order id") {
        auto cfg = validBase();
        cfg.orderId = "   ";
        auto r = cfg.validate();
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Rejects an empty extension list") {
        auto cfg = validBase();
        cfg.extensions.clear();
        CHECK_FALSE(cfg.validate().ok());
    }

    SECTION("Rejects a blank extension") {
        auto cfg = validBase();
        cfg.extensions = {".jpg", "."};
        CHECK_FALSE(cfg.validate().ok());
    }

    SECTION("Rejects workers out of range") {
        auto cfg = validBase();
        cfg.workers = 0;
        CHECK_FALSE(cfg.validate().ok());
        cfg.workers = kMaxWorkers + 1;
        CHECK_FALSE(cfg.validate().ok());
        cfg.workers = kMaxWorkers;
        CHECK(cfg.validate().ok());
    }

    SECTION("Rejects non-positive attempts and timeouts") {
        auto cfg = validBase();
        cfg.maxAttempts = 0;
        CHECK_FALSE(cfg.validate().ok());

        cfg = validBase();
        cfg.timeout = std::chrono::milliseconds{0};
        CHECK_FALSE(cfg.validate().ok());

        cfg = validBase();
        cfg.initialBackoff = std::chrono::milliseconds{-1};
        CHECK_FALSE(cfg.validate().ok());
    }

    SECTION("CA bundle must exist") {
        auto tmp = TempDirScope::unique_under("orderpix-ca");
        auto cfg = validBase();
        cfg.tls.caPath = (tmp.path() / "missing.pem").string();
        CHECK_FALSE(cfg.validate().ok());
        cfg.tls.caPath = tmp.write("ca.pem", "-----BEGIN CERTIFICATE-----\n").string();
        CHECK(cfg.validate().ok());
    }

    SECTION("Rejects a non-http base URL") {
        auto cfg = validBase();
        cfg.baseUrl = "ftp://portal.test";
        CHECK_FALSE(cfg.validate().ok());
        cfg.baseUrl = "HTTPS://portal.test";
        CHECK(cfg.validate().ok());
    }
}

TEST_CASE("Config file: parsing helpers", "[config]") {
    auto tmp = TempDirScope::unique_under("orderpix-config");

    SECTION("Sections, quotes and inline comments") {
        auto path = tmp.write("config.toml", R"(# orderpix settings
top = "level"

[portal]
base_url = "https://portal.test/#not-a-comment"  # trailing comment
user_agent = 'ua/1.0'

[download]
extensions = [".jpg", ".png"] # list
workers = 8
)");
        auto values = parse_config_file(path);
        CHECK(values["top"] == "level");
        CHECK(values["portal.base_url"] == "https://portal.test/#not-a-comment");
        CHECK(values["portal.user_agent"] == "ua/1.0");
        CHECK(values["download.workers"] == "8");
        CHECK(parse_config_value(path, "download", "extensions") == R"([".jpg", ".png"])");
        CHECK(parse_config_value(path, "download", "missing").empty());
    }

    SECTION("Missing file yields nothing") {
        CHECK(parse_config_file(tmp.path() / "nope.toml").empty());
    }

    SECTION("Lists") {
        CHECK(parse_list(".jpg,.png") == std::vector<std::string>{".jpg", ".png"});
        CHECK(parse_list(R"([".jpg", '.png', ])") == std::vector<std::string>{".jpg", ".png"});
        CHECK(parse_list("  ").empty());
    }

    SECTION("Terminal sanitizing") {
        CHECK(sanitize_for_terminal("ok\x1b[31mred\x07") == "ok?[31mred?");
    }
}

TEST_CASE("Config file: settings and precedence", "[config]") {
    auto tmp = TempDirScope::unique_under("orderpix-settings");

    SECTION("Loads recognized keys") {
        auto path = tmp.write("c.toml", R"([portal]
base_url = https://mirror.test
ca_file = /etc/ssl/portal.pem
[download]
output_dir = out
extensions = jpg, png
workers = 12
max_attempts = 4
timeout_ms = 2500
initial_backoff_ms = 0
path_filter = /orderfiles/
[log]
file = run.log
)");
        auto loaded = loadFileSettings(path);
        REQUIRE(loaded.ok());
        const auto& s = loaded.value();
        CHECK(s.baseUrl == std::optional<std::string>{"https://mirror.test"});
        CHECK(s.outputDir == std::optional<std::filesystem::path>{"out"});
        REQUIRE(s.extensions.has_value());
        CHECK(*s.extensions == std::vector<std::string>{"jpg", "png"});
        CHECK(s.workers == std::optional<int>{12});
        CHECK(s.maxAttempts == std::optional<int>{4});
        CHECK(s.timeout == std::optional<std::chrono::milliseconds>{2500});
        CHECK(s.initialBackoff == std::optional<std::chrono::milliseconds>{0});
        CHECK(s.pathFilter == std::optional<std::string>{"/orderfiles/"});
        CHECK(s.logFile == std::optional<std::filesystem::path>{"run.log"});
        CHECK(s.caFile == std::optional<std::string>{"/etc/ssl/portal.pem"});
        CHECK_FALSE(s.userAgent.has_value());
    }

    SECTION("Empty path filter clears the default") {
        auto path = tmp.write("all.toml", "[download]\npath_filter = \"\"\n");
        auto loaded = loadFileSettings(path);
        REQUIRE(loaded.ok());
        REQUIRE(loaded.value().pathFilter.has_value());

        RunConfig cfg;
        applyFileSettings(cfg, loaded.value(), [](Setting) { return false; });
        CHECK(cfg.pathFilter.empty());
    }

    SECTION("Malformed number is an error") {
        auto path = tmp.write("bad.toml", "[download]\nworkers = many\n");
        auto loaded = loadFileSettings(path);
        REQUIRE_FALSE(loaded.ok());
        CHECK(loaded.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Missing file gives empty settings") {
        auto loaded = loadFileSettings(tmp.path() / "absent.toml");
        REQUIRE(loaded.ok());
        CHECK_FALSE(loaded.value().workers.has_value());
    }

    SECTION("Command line wins over the file") {
        FileSettings file;
        file.workers = 9;
        file.baseUrl = "https://file.test";
        file.maxAttempts = 7;

        RunConfig cfg;
        cfg.workers = 3;
        applyFileSettings(cfg, file, [](Setting s) { return s == Setting::Workers; });
        CHECK(cfg.workers == 3);
        CHECK(cfg.baseUrl == "https://file.test");
        CHECK(cfg.maxAttempts == 7);
        CHECK(cfg.outputDir == "downloaded_images");
    }
}
