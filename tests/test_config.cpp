#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "core/config.hpp"
#include "core/uuid.hpp"

using namespace warden;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("warden_test_" + UUID::generate());
    fs::create_directories(test_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  fs::path write_file(const std::string& name, const std::string& content) {
    auto path = test_dir_ / name;
    std::ofstream file(path);
    file << content;
    return path;
  }

  fs::path test_dir_;
};

TEST_F(ConfigTest, Defaults) {
  Config config;

  EXPECT_EQ(config.agent_command, "claude");
  EXPECT_EQ(config.log_level, "info");
  EXPECT_EQ(config.abort_grace, std::chrono::milliseconds(2000));
  EXPECT_EQ(config.event_history_limit, 1000u);
  EXPECT_EQ(config.permissions.ask_behavior, AskBehavior::Ask);
  EXPECT_TRUE(config.permissions.enable_session_cache);
  EXPECT_TRUE(config.permissions.auto_approve_read_only);
  EXPECT_TRUE(config.mcp_servers.empty());
}

TEST_F(ConfigTest, MissingFileGivesDefaults) {
  auto config = Config::load(test_dir_ / "nope.json");
  EXPECT_EQ(config.agent_command, "claude");
}

TEST_F(ConfigTest, LoadFile) {
  auto path = write_file("config.json", R"({
    "agent_command": "/usr/local/bin/agent",
    "agent_args": ["--print"],
    "agent_env": {"FOO": "bar", "IGNORED": 1},
    "model": "sonnet",
    "abort_grace_ms": 500,
    "permissions": {
      "ask_behavior": "deny",
      "enable_session_cache": false,
      "denied_tools": ["WebFetch"],
      "prompt_timeout_ms": 1500
    },
    "mcp_servers": [
      {"name": "files", "command": "mcp-files", "args": ["--root", "/srv"], "enabled": false}
    ],
    "event_history_limit": 50,
    "transcript_root": "/var/transcripts",
    "log_level": "debug"
  })");

  auto config = Config::load(path);

  EXPECT_EQ(config.agent_command, "/usr/local/bin/agent");
  EXPECT_EQ(config.agent_args, std::vector<std::string>{"--print"});
  EXPECT_EQ(config.agent_env.size(), 1u);
  EXPECT_EQ(config.agent_env["FOO"], "bar");
  EXPECT_EQ(config.model, "sonnet");
  EXPECT_EQ(config.abort_grace, std::chrono::milliseconds(500));

  EXPECT_EQ(config.permissions.ask_behavior, AskBehavior::Deny);
  EXPECT_FALSE(config.permissions.enable_session_cache);
  EXPECT_EQ(config.permissions.denied_tools, std::vector<std::string>{"WebFetch"});
  EXPECT_EQ(config.permissions.prompt_timeout, std::chrono::milliseconds(1500));
  // Untouched keys keep their defaults
  EXPECT_TRUE(config.permissions.auto_approve_safe_commands);

  ASSERT_EQ(config.mcp_servers.size(), 1u);
  EXPECT_EQ(config.mcp_servers[0].name, "files");
  EXPECT_EQ(config.mcp_servers[0].args, (std::vector<std::string>{"--root", "/srv"}));
  EXPECT_FALSE(config.mcp_servers[0].enabled);

  EXPECT_EQ(config.event_history_limit, 50u);
  EXPECT_EQ(config.transcript_root, fs::path("/var/transcripts"));
  EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ConfigTest, InvalidJsonFallsBackToDefaults) {
  auto path = write_file("broken.json", "{ not json");
  auto config = Config::load(path);

  EXPECT_EQ(config.agent_command, "claude");
  EXPECT_EQ(config.log_level, "info");
}

TEST_F(ConfigTest, SaveAndReload) {
  Config config;
  config.agent_command = "agent-bin";
  config.model = "opus";
  config.permissions.ask_behavior = AskBehavior::Allow;
  config.permissions.internal_tools = {"TodoWrite"};
  config.mcp_servers.push_back(McpServerConfig{"search", "mcp-search", {"-v"}, {{"TOKEN", "x"}}, true});
  config.log_file = test_dir_ / "warden.log";

  auto path = test_dir_ / "nested" / "config.json";
  config.save(path);
  ASSERT_TRUE(fs::exists(path));

  auto loaded = Config::load(path);
  EXPECT_EQ(loaded.agent_command, "agent-bin");
  EXPECT_EQ(loaded.model, "opus");
  EXPECT_EQ(loaded.permissions.ask_behavior, AskBehavior::Allow);
  EXPECT_EQ(loaded.permissions.internal_tools, std::vector<std::string>{"TodoWrite"});
  ASSERT_EQ(loaded.mcp_servers.size(), 1u);
  EXPECT_EQ(loaded.mcp_servers[0].env.at("TOKEN"), "x");
  EXPECT_EQ(loaded.log_file, test_dir_ / "warden.log");
}

TEST_F(ConfigTest, AskBehaviorStrings) {
  EXPECT_EQ(ask_behavior_from_string("deny"), AskBehavior::Deny);
  EXPECT_EQ(ask_behavior_from_string("allow"), AskBehavior::Allow);
  EXPECT_EQ(ask_behavior_from_string("whatever"), AskBehavior::Ask);
  EXPECT_EQ(to_string(AskBehavior::Deny), "deny");
}

TEST(ConfigPathsTest, EncodeProjectPath) {
  EXPECT_EQ(config_paths::encode_project_path("/Users/foo/bar_baz"), "-Users-foo-bar-baz");
}

TEST(ConfigPathsTest, ProjectSettingsFile) {
  EXPECT_EQ(config_paths::project_settings_file("/work/app"), fs::path("/work/app/.claude/settings.local.json"));
}

TEST(ConfigPathsTest, TranscriptDir) {
  Config config;
  config.working_dir = "/work/my_app";
  config.transcript_root = "/data/projects";

  EXPECT_EQ(config.transcript_dir(), fs::path("/data/projects/-work-my-app"));
}
