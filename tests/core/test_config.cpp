#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "chatvault/core/config.hpp"
#include "support/helpers.hpp"

namespace fs = std::filesystem;

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = chatvault::default_config();

    SECTION("session defaults") {
        CHECK_FALSE(cfg.sessions.dir.has_value());
        CHECK(cfg.sessions.checkpoint_interval_seconds == 60);
        CHECK(cfg.sessions.title_max_length == 50);
        CHECK(cfg.sessions.cleanup_max_age_days == 30);
        CHECK(cfg.sessions.cleanup_keep_minimum == 10);
    }

    SECTION("context defaults") {
        CHECK(cfg.context.mode == "smart");
        CHECK(cfg.context.window_size == 20);
        CHECK(cfg.context.preserve_first == 2);
        CHECK(cfg.context.preserve_last == 10);
        CHECK(cfg.context.compaction_message_floor == 20);
        CHECK(cfg.context.max_tool_result_tokens == 1000);
    }

    SECTION("log level defaults") {
        CHECK(cfg.log_level == "info");
    }
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    chatvault::testing::TempDir tmp;
    auto path = tmp.path() / "config.json";
    {
        std::ofstream out(path);
        out << R"({
            "log_level": "debug",
            "sessions": {"dir": "/var/lib/chatvault", "checkpoint_interval_seconds": 15},
            "context": {"mode": "selective", "window_size": 8}
        })";
    }

    auto cfg = chatvault::load_config(path);
    CHECK(cfg.log_level == "debug");
    CHECK(cfg.sessions.dir == "/var/lib/chatvault");
    CHECK(cfg.sessions.checkpoint_interval_seconds == 15);
    CHECK(cfg.sessions.title_max_length == 50);
    CHECK(cfg.context.mode == "selective");
    CHECK(cfg.context.window_size == 8);
    CHECK(cfg.context.preserve_last == 10);
}

TEST_CASE("load_config migrates the legacy summary mode", "[config]") {
    chatvault::testing::TempDir tmp;
    auto path = tmp.path() / "config.json";
    {
        std::ofstream out(path);
        out << R"({"context": {"mode": "summary"}})";
    }
    CHECK(chatvault::load_config(path).context.mode == "summarize");
}

TEST_CASE("load_config falls back to defaults", "[config]") {
    chatvault::testing::TempDir tmp;

    SECTION("missing file") {
        auto cfg = chatvault::load_config(tmp.path() / "absent.json");
        CHECK(cfg.context.mode == "smart");
    }

    SECTION("malformed file") {
        auto path = tmp.path() / "broken.json";
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        auto cfg = chatvault::load_config(path);
        CHECK(cfg.log_level == "info");
    }
}

TEST_CASE("environment overrides", "[config]") {
    chatvault::Config cfg;

    SECTION("sessions dir and interval") {
        ::setenv("CHATVAULT_SESSIONS_DIR", "/tmp/cv-sessions", 1);
        ::setenv("CHATVAULT_CHECKPOINT_INTERVAL", "5", 1);
        chatvault::apply_env_overrides(cfg);
        ::unsetenv("CHATVAULT_SESSIONS_DIR");
        ::unsetenv("CHATVAULT_CHECKPOINT_INTERVAL");

        CHECK(cfg.sessions.dir == "/tmp/cv-sessions");
        CHECK(cfg.sessions.checkpoint_interval_seconds == 5);
    }

    SECTION("malformed interval is ignored") {
        ::setenv("CHATVAULT_CHECKPOINT_INTERVAL", "soon", 1);
        chatvault::apply_env_overrides(cfg);
        ::unsetenv("CHATVAULT_CHECKPOINT_INTERVAL");
        CHECK(cfg.sessions.checkpoint_interval_seconds == 60);
    }
}

TEST_CASE("sessions_dir resolution", "[config]") {
    chatvault::Config cfg;

    SECTION("explicit sessions dir wins") {
        cfg.sessions.dir = "/srv/sessions";
        cfg.data_dir = "/srv/data";
        CHECK(chatvault::sessions_dir(cfg) == fs::path("/srv/sessions"));
    }

    SECTION("derived from data dir") {
        cfg.data_dir = "/srv/data";
        CHECK(chatvault::sessions_dir(cfg) == fs::path("/srv/data/sessions"));
    }
}
