#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace warden {

// What the policy engine does when a human would have to be asked
enum class AskBehavior {
  Ask,   // Return an ask decision, the caller prompts
  Deny,  // Non-interactive use
  Allow  // Tests only
};

std::string to_string(AskBehavior behavior);

AskBehavior ask_behavior_from_string(const std::string& str);

// Long-lived helper process started alongside an agent
struct McpServerConfig {
  std::string name;
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  bool enabled = true;
};

struct PermissionSettings {
  AskBehavior ask_behavior = AskBehavior::Ask;

  // Remember approvals of write-class tools for the session lifetime
  bool enable_session_cache = true;

  // Read <project>/.claude/settings.local.json
  bool load_project_settings = true;

  // Read, Grep and Glob are allowed without a pattern
  bool auto_approve_read_only = true;

  // Read-only shell commands (ls, git status, ...) are allowed without a pattern
  bool auto_approve_safe_commands = true;

  std::vector<std::string> internal_tools = {"TodoWrite", "BashOutput", "KillShell", "KillBash"};
  std::vector<std::string> internal_tool_prefixes = {"mcp__warden-"};

  // Always denied, checked first
  std::vector<std::string> denied_tools;

  // Unanswered prompts are denied after this long; zero waits forever
  std::chrono::milliseconds prompt_timeout{std::chrono::minutes(5)};
};

// Engine configuration
struct Config {
  // Agent subprocess
  std::string agent_command = "claude";
  std::vector<std::string> agent_args = {"--print",
                                         "--verbose",
                                         "--input-format",
                                         "stream-json",
                                         "--output-format",
                                         "stream-json",
                                         "--include-partial-messages",
                                         "--permission-prompt-tool",
                                         "stdio"};
  std::map<std::string, std::string> agent_env;
  std::optional<std::string> model;

  // Working directory of the main agent
  std::filesystem::path working_dir = std::filesystem::current_path();

  // SIGTERM to SIGKILL escalation delay on abort
  std::chrono::milliseconds abort_grace{2000};

  PermissionSettings permissions;

  std::vector<McpServerConfig> mcp_servers;

  // Outward events kept for replay
  size_t event_history_limit = 1000;

  // Where the agent persists its transcripts (default ~/.claude/projects)
  std::optional<std::filesystem::path> transcript_root;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // File config overridden by WARDEN_AGENT_COMMAND, WARDEN_MODEL, WARDEN_LOG_LEVEL
  static Config from_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  // Transcript directory for this config's working directory
  std::filesystem::path transcript_dir() const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

// ~/.config/warden
std::filesystem::path config_dir();

std::filesystem::path default_config_file();

// <cwd>/.warden/config.json
std::filesystem::path project_config_file();

// ~/.claude
std::filesystem::path agent_home();

// <project>/.claude/settings.local.json
std::filesystem::path project_settings_file(const std::filesystem::path& project_dir);

// "/Users/foo/bar_baz" -> "-Users-foo-bar-baz"
std::string encode_project_path(const std::filesystem::path& project_dir);
}  // namespace config_paths

}  // namespace warden
