//
// hello-sre - Config Tests
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <config/config.h>

#include <gtest/gtest.h>

#include <syslog.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <map>

namespace hello_sre {

    namespace {

        auto write_temp(std::string const& name, std::string const& contents)
            -> std::filesystem::path {
            auto path = std::filesystem::temp_directory_path() / name;
            std::ofstream file(path);
            file << contents;
            return path;
        }

        auto fake_environment(std::map<std::string, std::string> vars) -> EnvLookup {
            return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
                auto it = vars.find(std::string{name});
                if (it == vars.end()) {
                    return std::nullopt;
                }
                return it->second;
            };
        }

    }  // namespace

    TEST(ConfigTest, LoadDefaultConfig) {
        auto cfg_result = load_config_or_default("/nonexistent/path/config.toml");

        ASSERT_TRUE(cfg_result.has_value());
        auto const& cfg = cfg_result.value();

        // Verify defaults
        EXPECT_EQ(cfg.daemon.log_level, "info");
        EXPECT_EQ(cfg.server.host, "0.0.0.0");
        EXPECT_EQ(cfg.server.port, 8080);
        EXPECT_EQ(cfg.server.threads, 0);
        EXPECT_EQ(cfg.server.read_timeout, std::chrono::seconds{5});
        EXPECT_FALSE(cfg.server.log_requests);
        EXPECT_EQ(cfg.service.greeting_delay, std::chrono::milliseconds{0});
    }

    TEST(ConfigTest, LoadValidConfig) {
        auto temp_path = write_temp("hs_test_config.toml", R"(
[daemon]
log_level = "debug"

[server]
host = "127.0.0.1"
port = 9090
threads = 4
read_timeout_seconds = 2
write_timeout_seconds = 3
keep_alive_timeout_seconds = 1
keep_alive_max_count = 10

[debug]
greeting_delay_ms = 250
)");

        auto cfg_result = load_config(temp_path);
        ASSERT_TRUE(cfg_result.has_value()) << cfg_result.error();

        auto const& cfg = cfg_result.value();
        EXPECT_EQ(cfg.daemon.log_level, "debug");
        EXPECT_TRUE(cfg.server.log_requests);
        EXPECT_EQ(cfg.server.host, "127.0.0.1");
        EXPECT_EQ(cfg.server.port, 9090);
        EXPECT_EQ(cfg.server.threads, 4);
        EXPECT_EQ(cfg.server.read_timeout, std::chrono::seconds{2});
        EXPECT_EQ(cfg.server.write_timeout, std::chrono::seconds{3});
        EXPECT_EQ(cfg.server.keep_alive_timeout, std::chrono::seconds{1});
        EXPECT_EQ(cfg.server.keep_alive_max_count, 10);
        EXPECT_EQ(cfg.service.greeting_delay, std::chrono::milliseconds{250});

        std::filesystem::remove(temp_path);
    }

    TEST(ConfigTest, PartialConfigKeepsDefaults) {
        auto temp_path = write_temp("hs_test_partial.toml", R"(
[server]
port = 0
)");

        auto cfg_result = load_config(temp_path);
        ASSERT_TRUE(cfg_result.has_value()) << cfg_result.error();
        EXPECT_EQ(cfg_result->server.port, 0);
        EXPECT_EQ(cfg_result->server.host, "0.0.0.0");
        EXPECT_EQ(cfg_result->daemon.log_level, "info");

        std::filesystem::remove(temp_path);
    }

    TEST(ConfigTest, InvalidTomlSyntax) {
        auto temp_path = write_temp("hs_test_invalid.toml", "this is not valid toml [[[");

        auto cfg_result = load_config(temp_path);
        ASSERT_FALSE(cfg_result.has_value());
        EXPECT_NE(cfg_result.error().find("parse error"), std::string::npos);

        std::filesystem::remove(temp_path);
    }

    TEST(ConfigTest, PortOutOfRange) {
        auto temp_path = write_temp("hs_test_bad_port.toml", R"(
[server]
port = 70000
)");

        auto cfg_result = load_config(temp_path);
        ASSERT_FALSE(cfg_result.has_value());
        EXPECT_NE(cfg_result.error().find("port"), std::string::npos);

        std::filesystem::remove(temp_path);
    }

    TEST(ConfigTest, NegativeTimeoutRejected) {
        auto temp_path = write_temp("hs_test_bad_timeout.toml", R"(
[server]
read_timeout_seconds = -1
)");

        auto cfg_result = load_config(temp_path);
        ASSERT_FALSE(cfg_result.has_value());
        EXPECT_FALSE(cfg_result.error().empty());

        std::filesystem::remove(temp_path);
    }

    TEST(ConfigTest, ZeroConnectionLimitsRejected) {
        for (auto const* key : {"read_timeout_seconds", "write_timeout_seconds",
                                "keep_alive_timeout_seconds", "keep_alive_max_count"}) {
            auto temp_path = write_temp("hs_test_zero_limit.toml",
                                        std::format("[server]\n{} = 0\n", key));

            auto cfg_result = load_config(temp_path);
            ASSERT_FALSE(cfg_result.has_value()) << key;
            EXPECT_NE(cfg_result.error().find(key), std::string::npos) << cfg_result.error();

            std::filesystem::remove(temp_path);
        }
    }

    TEST(ConfigTest, MinimalConnectionLimitsAccepted) {
        auto temp_path = write_temp("hs_test_min_limits.toml", R"(
[server]
read_timeout_seconds = 1
write_timeout_seconds = 1
keep_alive_timeout_seconds = 1
keep_alive_max_count = 1
)");

        auto cfg_result = load_config(temp_path);
        ASSERT_TRUE(cfg_result.has_value()) << cfg_result.error();
        EXPECT_EQ(cfg_result->server.keep_alive_max_count, 1);
        EXPECT_EQ(cfg_result->server.read_timeout, std::chrono::seconds{1});

        std::filesystem::remove(temp_path);
    }

    TEST(ConfigTest, ThreadCountCapped) {
        auto temp_path = write_temp("hs_test_threads.toml", std::format(
            "[server]\nthreads = {}\n", max_server_threads + 1));

        auto cfg_result = load_config(temp_path);
        ASSERT_FALSE(cfg_result.has_value());
        EXPECT_NE(cfg_result.error().find("threads"), std::string::npos);

        std::filesystem::remove(temp_path);

        temp_path = write_temp("hs_test_threads.toml", std::format(
            "[server]\nthreads = {}\n", max_server_threads));
        cfg_result = load_config(temp_path);
        ASSERT_TRUE(cfg_result.has_value()) << cfg_result.error();
        EXPECT_EQ(cfg_result->server.threads, max_server_threads);

        std::filesystem::remove(temp_path);
    }

    TEST(ConfigTest, InvalidLogLevel) {
        auto temp_path = write_temp("hs_test_bad_level.toml", R"(
[daemon]
log_level = "chatty"
)");

        auto cfg_result = load_config(temp_path);
        ASSERT_FALSE(cfg_result.has_value());
        EXPECT_NE(cfg_result.error().find("chatty"), std::string::npos);

        std::filesystem::remove(temp_path);
    }

    TEST(ConfigTest, LogLevelPriority) {
        EXPECT_EQ(log_level_priority("debug"), LOG_DEBUG);
        EXPECT_EQ(log_level_priority("info"), LOG_INFO);
        EXPECT_EQ(log_level_priority("warning"), LOG_WARNING);
        EXPECT_EQ(log_level_priority("error"), LOG_ERR);
        EXPECT_FALSE(log_level_priority("INFO").has_value());
    }

    TEST(ConfigTest, ParsePort) {
        EXPECT_EQ(parse_port("8080"), 8080);
        EXPECT_EQ(parse_port("0"), 0);
        EXPECT_EQ(parse_port("65535"), 65535);
        EXPECT_FALSE(parse_port("65536").has_value());
        EXPECT_FALSE(parse_port("-1").has_value());
        EXPECT_FALSE(parse_port("80a").has_value());
        EXPECT_FALSE(parse_port("").has_value());
    }

    TEST(ConfigTest, EnvironmentOverridesHostAndPort) {
        Config cfg;
        auto result = apply_environment(cfg, fake_environment({
            {"HELLO_SRE_HOST", "127.0.0.1"},
            {"HELLO_SRE_PORT", "9000"},
        }));

        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(cfg.server.host, "127.0.0.1");
        EXPECT_EQ(cfg.server.port, 9000);
    }

    TEST(ConfigTest, EnvironmentUnsetLeavesConfig) {
        Config cfg;
        cfg.server.port = 1234;

        auto result = apply_environment(cfg, fake_environment({}));

        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(cfg.server.host, "0.0.0.0");
        EXPECT_EQ(cfg.server.port, 1234);
    }

    TEST(ConfigTest, InvalidEnvironmentPortLeavesConfigUnchanged) {
        Config cfg;
        auto result = apply_environment(cfg, fake_environment({
            {"HELLO_SRE_HOST", "127.0.0.1"},
            {"HELLO_SRE_PORT", "not-a-port"},
        }));

        ASSERT_FALSE(result.has_value());
        EXPECT_NE(result.error().find("HELLO_SRE_PORT"), std::string::npos);
        EXPECT_EQ(cfg.server.host, "0.0.0.0");
        EXPECT_EQ(cfg.server.port, 8080);
    }

}  // namespace hello_sre
