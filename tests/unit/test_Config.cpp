#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/paths.hpp"
#include "log/Registry.hpp"
#include "fakes/testDirs.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

using namespace ts::config;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = ts::test::makeTestDir();
        for (const auto* var : {"ZENDESK_SUBDOMAIN", "ZENDESK_EMAIL", "ZENDESK_API_TOKEN"}) ::unsetenv(var);
    }

    void TearDown() override {
        for (const auto* var : {"ZENDESK_SUBDOMAIN", "ZENDESK_EMAIL", "ZENDESK_API_TOKEN"}) ::unsetenv(var);
        fs::remove_all(test_dir);
    }

    fs::path writeConfig(const std::string& yaml) const {
        const auto path = test_dir / "config.yaml";
        ts::test::writeTextFile(path, yaml);
        return path;
    }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = loadConfig(test_dir / "absent.yaml");

    EXPECT_FALSE(cfg.zendesk.hasCredentials());
    EXPECT_EQ(cfg.storage.ticketsRoot(), cfg.storage.downloads_dir / "tickets");
    EXPECT_EQ(cfg.sync.archive_extension, ".zip");
    EXPECT_EQ(cfg.sync.closed_statuses, (std::vector<std::string>{"solved", "closed"}));
    EXPECT_EQ(cfg.sync.status_batch_size, DEFAULT_STATUS_BATCH_SIZE);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::info);
}

TEST_F(ConfigTest, ReadsEverySection) {
    const auto path = writeConfig(R"(
zendesk:
  subdomain: acme
  email: agent@example.com
  api_token: secret
  timeout_seconds: 30
storage:
  downloads_dir: ~/Support
  state_file: /var/tmp/ticketsync/state.json
sync:
  closed_statuses: [solved]
  status_batch_size: 25
logging:
  log_dir: /var/tmp/ticketsync/logs
  log_levels:
    console_log_level: warn
    subsystem_levels:
      sync: debug
)");

    const auto cfg = loadConfig(path);

    EXPECT_TRUE(cfg.zendesk.hasCredentials());
    EXPECT_EQ(cfg.zendesk.subdomain, "acme");
    EXPECT_EQ(cfg.zendesk.timeout_seconds, 30u);
    EXPECT_EQ(cfg.storage.downloads_dir, ts::paths::expandHome("~/Support"));
    EXPECT_NE(cfg.storage.downloads_dir.string().front(), '~');
    EXPECT_EQ(cfg.storage.state_file, fs::path("/var/tmp/ticketsync/state.json"));
    EXPECT_EQ(cfg.sync.archive_extension, ".zip");
    EXPECT_EQ(cfg.sync.closed_statuses, (std::vector<std::string>{"solved"}));
    EXPECT_EQ(cfg.sync.status_batch_size, 25u);
    EXPECT_EQ(cfg.logging.log_dir, fs::path("/var/tmp/ticketsync/logs"));
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.http, spdlog::level::warn);
}

TEST_F(ConfigTest, EnvironmentOverridesCredentials) {
    const auto path = writeConfig("zendesk:\n  subdomain: fromfile\n  email: file@example.com\n");
    ::setenv("ZENDESK_SUBDOMAIN", "fromenv", 1);
    ::setenv("ZENDESK_API_TOKEN", "envtoken", 1);

    const auto cfg = loadConfig(path);

    EXPECT_EQ(cfg.zendesk.subdomain, "fromenv");
    EXPECT_EQ(cfg.zendesk.email, "file@example.com");
    EXPECT_EQ(cfg.zendesk.api_token, "envtoken");
}

TEST_F(ConfigTest, RejectsZeroBatchSize) {
    const auto path = writeConfig("sync:\n  status_batch_size: 0\n");
    EXPECT_THROW(loadConfig(path), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsNonMappingSection) {
    const auto path = writeConfig("storage: just-a-string\n");
    EXPECT_THROW(loadConfig(path), std::invalid_argument);
}

TEST_F(ConfigTest, MalformedYamlThrows) {
    const auto path = writeConfig("zendesk: [unterminated\n");
    EXPECT_THROW(loadConfig(path), YAML::Exception);
}

TEST_F(ConfigTest, JsonMasksToken) {
    Config cfg;
    cfg.zendesk.subdomain = "acme";
    cfg.zendesk.api_token = "very-secret";

    const nlohmann::json j = cfg;

    EXPECT_EQ(j["zendesk"]["subdomain"], "acme");
    EXPECT_EQ(j["zendesk"]["api_token"], "********");
    EXPECT_EQ(j.dump().find("very-secret"), std::string::npos);
    EXPECT_EQ(j["sync"]["status_batch_size"], DEFAULT_STATUS_BATCH_SIZE);
}

TEST(PathsTest, ExpandHome) {
    const char* home = std::getenv("HOME");
    ASSERT_NE(home, nullptr);

    EXPECT_EQ(ts::paths::expandHome("~/Downloads"), fs::path(home) / "Downloads");
    EXPECT_EQ(ts::paths::expandHome("~"), fs::path(home));
    EXPECT_EQ(ts::paths::expandHome("/abs/path"), fs::path("/abs/path"));
    EXPECT_EQ(ts::paths::expandHome("~other/x"), fs::path("~other/x"));
}

TEST(LogRegistryTest, ConsoleSinkWritesToStderr) {
    for (const auto* name : {"ticketsync", "http", "ticketing", "crypto", "archive", "index", "sync", "shell"}) {
        const auto logger = ts::log::Registry::get(name);
        ASSERT_NE(logger, nullptr) << name;

        const auto& sinks = logger->sinks();
        const auto console = std::ranges::any_of(sinks, [](const auto& s) {
            return std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(s) != nullptr;
        });
        EXPECT_TRUE(console) << name;
        EXPECT_TRUE(std::ranges::none_of(sinks, [](const auto& s) {
            return std::dynamic_pointer_cast<spdlog::sinks::stdout_color_sink_mt>(s) != nullptr;
        })) << name;
    }
}
