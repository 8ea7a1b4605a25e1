#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "config/settings.hpp"
#include "core/errors.hpp"

#include <filesystem>
#include <fstream>

using namespace verdict;
using namespace verdict::config;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Empty script keeps the defaults", "[settings]") {
    auto settings = parse_settings("");
    REQUIRE(settings.is_success());
    CHECK(settings.value().log_level == spdlog::level::info);
    CHECK(settings.value().log_file.empty());
    CHECK(settings.value().json_indent == 0);
}

TEST_CASE("Settings are read from globals", "[settings]") {
    auto settings = parse_settings(R"(
        log_level = "debug"
        log_file = "verdict.log"
        json_indent = 2
    )", "/etc/verdict");

    REQUIRE(settings.is_success());
    CHECK(settings.value().log_level == spdlog::level::debug);
    CHECK(settings.value().log_file.generic_string() == "/etc/verdict/verdict.log");
    CHECK(settings.value().json_indent == 2);
}

TEST_CASE("Scripts can use the log functions and ConfigDir", "[settings]") {
    auto settings = parse_settings(R"(
        LOG("configuring from " .. ConfigDir)
        SPEW("spew")
        WARN("warn")
        if ConfigDir == "/srv/app" then
            log_level = "warn"
        end
    )", "/srv/app");

    REQUIRE(settings.is_success());
    CHECK(settings.value().log_level == spdlog::level::warn);
}

TEST_CASE("Absolute log files are kept", "[settings]") {
    auto settings = parse_settings(R"(log_file = "/var/log/verdict.log")", "/etc/verdict");
    REQUIRE(settings.is_success());
    CHECK(settings.value().log_file.generic_string() == "/var/log/verdict.log");
}

TEST_CASE("Invalid settings are configuration errors", "[settings]") {
    struct Case {
        const char* script;
        const char* message;
    };
    Case cases[] = {
        {"log_level = 3", "log_level must be a string"},
        {"log_level = 'chatty'", "Unknown log_level 'chatty'"},
        {"log_file = {}", "log_file must be a string"},
        {"json_indent = 'wide'", "json_indent must be an integer between 0 and 16"},
        {"json_indent = 2.5", "json_indent must be an integer"},
        {"json_indent = 17", "json_indent must be an integer"},
        {"json_indent = -1", "json_indent must be an integer"},
    };

    for (const auto& c : cases) {
        INFO(c.script);
        auto settings = parse_settings(c.script);
        REQUIRE(settings.is_failure());
        CHECK(settings.error()->is_error_type<ConfigurationError>());
        CHECK_THAT(settings.error()->description(), ContainsSubstring(c.message));
    }
}

TEST_CASE("Script errors fail the load", "[settings]") {
    auto settings = parse_settings("log_level = ");
    REQUIRE(settings.is_failure());
    CHECK(settings.error()->is_error_type<ConfigurationError>());
}

TEST_CASE("load_settings resolves against the script directory", "[settings]") {
    auto dir = std::filesystem::temp_directory_path() / "verdict_settings_test";
    std::filesystem::create_directories(dir);
    auto path = dir / "settings.lua";
    {
        std::ofstream out(path);
        out << "log_level = 'error'\nlog_file = 'logs/verdict.log'\n";
    }

    auto settings = load_settings(path);
    std::filesystem::remove_all(dir);

    REQUIRE(settings.is_success());
    CHECK(settings.value().log_level == spdlog::level::err);
    CHECK(settings.value().log_file.string() == (dir / "logs" / "verdict.log").string());
}

TEST_CASE("load_settings on a missing file", "[settings]") {
    auto settings = load_settings("/nonexistent/verdict/settings.lua");
    REQUIRE(settings.is_failure());
    CHECK_THAT(settings.error()->description(), ContainsSubstring("Failed to open file"));
}

TEST_CASE("load_settings on a directory", "[settings]") {
    auto settings = load_settings(std::filesystem::temp_directory_path());
    REQUIRE(settings.is_failure());
    CHECK(settings.error()->is_error_type<ConfigurationError>());
}
