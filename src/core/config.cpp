#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace warden {

namespace fs = std::filesystem;

std::string to_string(AskBehavior behavior) {
  switch (behavior) {
    case AskBehavior::Ask:
      return "ask";
    case AskBehavior::Deny:
      return "deny";
    case AskBehavior::Allow:
      return "allow";
  }
  return "ask";
}

AskBehavior ask_behavior_from_string(const std::string& str) {
  if (str == "deny") return AskBehavior::Deny;
  if (str == "allow") return AskBehavior::Allow;
  return AskBehavior::Ask;
}

namespace {

std::vector<std::string> string_list(const json& j) {
  std::vector<std::string> result;
  if (!j.is_array()) return result;
  for (const auto& item : j) {
    if (item.is_string()) {
      result.push_back(item.get<std::string>());
    }
  }
  return result;
}

std::map<std::string, std::string> string_map(const json& j) {
  std::map<std::string, std::string> result;
  if (!j.is_object()) return result;
  for (auto& [k, v] : j.items()) {
    if (v.is_string()) {
      result[k] = v.get<std::string>();
    }
  }
  return result;
}

void load_permissions(const json& j, PermissionSettings& perms) {
  perms.ask_behavior = ask_behavior_from_string(j.value("ask_behavior", "ask"));
  perms.enable_session_cache = j.value("enable_session_cache", perms.enable_session_cache);
  perms.load_project_settings = j.value("load_project_settings", perms.load_project_settings);
  perms.auto_approve_read_only = j.value("auto_approve_read_only", perms.auto_approve_read_only);
  perms.auto_approve_safe_commands = j.value("auto_approve_safe_commands", perms.auto_approve_safe_commands);
  if (j.contains("internal_tools")) {
    perms.internal_tools = string_list(j["internal_tools"]);
  }
  if (j.contains("internal_tool_prefixes")) {
    perms.internal_tool_prefixes = string_list(j["internal_tool_prefixes"]);
  }
  if (j.contains("denied_tools")) {
    perms.denied_tools = string_list(j["denied_tools"]);
  }
  perms.prompt_timeout = std::chrono::milliseconds(j.value("prompt_timeout_ms", static_cast<int64_t>(perms.prompt_timeout.count())));
}

}  // namespace

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot open {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    config.agent_command = j.value("agent_command", config.agent_command);
    if (j.contains("agent_args")) {
      config.agent_args = string_list(j["agent_args"]);
    }
    if (j.contains("agent_env")) {
      config.agent_env = string_map(j["agent_env"]);
    }
    if (j.contains("model") && j["model"].is_string()) {
      config.model = j["model"].get<std::string>();
    }
    if (j.contains("working_dir") && j["working_dir"].is_string()) {
      config.working_dir = j["working_dir"].get<std::string>();
    }
    config.abort_grace = std::chrono::milliseconds(j.value("abort_grace_ms", static_cast<int64_t>(config.abort_grace.count())));

    if (j.contains("permissions") && j["permissions"].is_object()) {
      load_permissions(j["permissions"], config.permissions);
    }

    // Load MCP servers
    if (j.contains("mcp_servers")) {
      for (const auto& server_json : j["mcp_servers"]) {
        McpServerConfig server;
        server.name = server_json.value("name", "");
        server.command = server_json.value("command", "");
        server.enabled = server_json.value("enabled", true);
        if (server_json.contains("args")) {
          server.args = string_list(server_json["args"]);
        }
        if (server_json.contains("env")) {
          server.env = string_map(server_json["env"]);
        }
        config.mcp_servers.push_back(server);
      }
    }

    config.event_history_limit = j.value("event_history_limit", config.event_history_limit);
    if (j.contains("transcript_root") && j["transcript_root"].is_string()) {
      config.transcript_root = j["transcript_root"].get<std::string>();
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
  } catch (const std::exception& e) {
    spdlog::warn("[Config] Failed to parse {}: {}, using defaults", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  if (const char* command = std::getenv("WARDEN_AGENT_COMMAND")) {
    config.agent_command = command;
  }
  if (const char* model = std::getenv("WARDEN_MODEL")) {
    config.model = model;
  }
  if (const char* level = std::getenv("WARDEN_LOG_LEVEL")) {
    config.log_level = level;
  }

  return config;
}

void Config::save(const fs::path& path) const {
  json j;

  j["agent_command"] = agent_command;
  j["agent_args"] = agent_args;
  j["agent_env"] = agent_env;
  if (model) {
    j["model"] = *model;
  }
  j["working_dir"] = working_dir.string();
  j["abort_grace_ms"] = abort_grace.count();

  j["permissions"] = {{"ask_behavior", to_string(permissions.ask_behavior)},
                      {"enable_session_cache", permissions.enable_session_cache},
                      {"load_project_settings", permissions.load_project_settings},
                      {"auto_approve_read_only", permissions.auto_approve_read_only},
                      {"auto_approve_safe_commands", permissions.auto_approve_safe_commands},
                      {"internal_tools", permissions.internal_tools},
                      {"internal_tool_prefixes", permissions.internal_tool_prefixes},
                      {"denied_tools", permissions.denied_tools},
                      {"prompt_timeout_ms", permissions.prompt_timeout.count()}};

  json servers_json = json::array();
  for (const auto& server : mcp_servers) {
    json s;
    s["name"] = server.name;
    s["command"] = server.command;
    s["args"] = server.args;
    s["env"] = server.env;
    s["enabled"] = server.enabled;
    servers_json.push_back(s);
  }
  j["mcp_servers"] = servers_json;

  j["event_history_limit"] = event_history_limit;
  if (transcript_root) {
    j["transcript_root"] = transcript_root->string();
  }

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);

  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot write {}", path.string());
    return;
  }
  file << j.dump(2);
}

fs::path Config::transcript_dir() const {
  auto root = transcript_root ? *transcript_root : config_paths::agent_home() / "projects";
  return root / config_paths::encode_project_path(working_dir);
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "warden";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".warden" / "config.json";
}

fs::path agent_home() {
  return home_dir() / ".claude";
}

fs::path project_settings_file(const fs::path& project_dir) {
  return project_dir / ".claude" / "settings.local.json";
}

std::string encode_project_path(const fs::path& project_dir) {
  auto encoded = project_dir.string();
  for (auto& c : encoded) {
    if (c == '/' || c == '_') c = '-';
  }
  return encoded;
}

}  // namespace config_paths

}  // namespace warden
