#include "permission/store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <map>

#include "core/config.hpp"

namespace warden::permission {

namespace fs = std::filesystem;

namespace {

std::vector<PermissionPattern> parse_list(const json& permissions, const char* key) {
  std::vector<PermissionPattern> patterns;
  if (!permissions.is_object()) return patterns;

  auto it = permissions.find(key);
  if (it == permissions.end() || !it->is_array()) return patterns;

  for (const auto& item : *it) {
    if (item.is_string()) {
      patterns.push_back(PermissionPattern::parse(item.get<std::string>()));
    }
  }
  return patterns;
}

std::optional<std::string> first_match(const std::vector<PermissionPattern>& patterns, const std::string& tool_name, const json& input,
                                       const MatchContext& ctx) {
  for (const auto& pattern : patterns) {
    if (pattern.matches(tool_name, input, ctx)) {
      return pattern.text();
    }
  }
  return std::nullopt;
}

std::vector<std::string> texts(const std::vector<PermissionPattern>& patterns) {
  std::vector<std::string> result;
  result.reserve(patterns.size());
  for (const auto& pattern : patterns) {
    result.push_back(pattern.text());
  }
  return result;
}

std::optional<fs::file_time_type> modification_time(const fs::path& path) {
  std::error_code ec;
  auto mtime = fs::last_write_time(path, ec);
  if (ec) return std::nullopt;
  return mtime;
}

}  // namespace

PermissionStore::PermissionStore(fs::path settings_file) : path_(std::move(settings_file)) {
  std::unique_lock lock(mutex_);
  load_locked();
}

std::shared_ptr<PermissionStore> PermissionStore::for_project(const fs::path& project_dir) {
  static std::mutex registry_mutex;
  static std::map<std::string, std::weak_ptr<PermissionStore>> registry;

  auto path = config_paths::project_settings_file(project_dir);
  std::lock_guard lock(registry_mutex);

  auto& slot = registry[path.lexically_normal().string()];
  if (auto existing = slot.lock()) {
    return existing;
  }
  auto store = std::make_shared<PermissionStore>(path);
  slot = store;
  return store;
}

json PermissionStore::read_document() const {
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    return json::object();
  }

  std::ifstream file(path_);
  if (!file.is_open()) {
    spdlog::warn("[Permission] Failed to open {}", path_.string());
    return json::object();
  }

  auto document = json::parse(file, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    spdlog::warn("[Permission] Ignoring unreadable settings file {}", path_.string());
    return json::object();
  }
  return document;
}

void PermissionStore::load_locked() {
  auto document = read_document();
  auto snapshot = std::make_shared<Snapshot>();

  if (document.contains("permissions")) {
    const auto& permissions = document["permissions"];
    snapshot->allow = parse_list(permissions, "allow");
    snapshot->deny = parse_list(permissions, "deny");
    snapshot->ask = parse_list(permissions, "ask");
  }

  snapshot_ = std::move(snapshot);
  loaded_mtime_ = modification_time(path_);
  spdlog::debug("[Permission] Loaded {} allow / {} deny patterns from {}", snapshot_->allow.size(), snapshot_->deny.size(),
                path_.string());
}

void PermissionStore::refresh() {
  auto mtime = modification_time(path_);
  {
    std::shared_lock lock(mutex_);
    if (mtime == loaded_mtime_) return;
  }
  std::unique_lock lock(mutex_);
  load_locked();
}

std::shared_ptr<const PermissionStore::Snapshot> PermissionStore::snapshot() const {
  std::shared_lock lock(mutex_);
  return snapshot_;
}

std::optional<std::string> PermissionStore::find_allow(const std::string& tool_name, const json& input, const MatchContext& ctx) const {
  return first_match(snapshot()->allow, tool_name, input, ctx);
}

std::optional<std::string> PermissionStore::find_deny(const std::string& tool_name, const json& input, const MatchContext& ctx) const {
  return first_match(snapshot()->deny, tool_name, input, ctx);
}

std::vector<std::string> PermissionStore::allow_patterns() const {
  return texts(snapshot()->allow);
}

std::vector<std::string> PermissionStore::deny_patterns() const {
  return texts(snapshot()->deny);
}

bool PermissionStore::add_allow(const std::string& pattern) {
  return append("allow", pattern);
}

bool PermissionStore::add_deny(const std::string& pattern) {
  return append("deny", pattern);
}

bool PermissionStore::append(const std::string& list, const std::string& pattern) {
  std::lock_guard write_lock(write_mutex_);

  // Start from the file, not the snapshot, so entries written elsewhere survive
  auto document = read_document();
  if (!document.contains("permissions") || !document["permissions"].is_object()) {
    document["permissions"] = json::object();
  }
  auto& permissions = document["permissions"];
  for (const char* key : {"allow", "deny", "ask"}) {
    if (!permissions.contains(key) || !permissions[key].is_array()) {
      permissions[key] = json::array();
    }
  }

  auto& entries = permissions[list];
  for (const auto& entry : entries) {
    if (entry.is_string() && entry.get<std::string>() == pattern) {
      return false;
    }
  }
  entries.push_back(pattern);

  if (!atomic_write(document)) {
    return false;
  }

  std::unique_lock lock(mutex_);
  load_locked();
  spdlog::info("[Permission] Added {} pattern '{}' to {}", list, pattern, path_.string());
  return true;
}

bool PermissionStore::atomic_write(const json& document) {
  std::error_code ec;
  fs::create_directories(path_.parent_path(), ec);
  if (ec) {
    spdlog::warn("[Permission] Failed to create {}: {}", path_.parent_path().string(), ec.message());
    return false;
  }

  auto tmp_path = path_;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file.is_open()) {
    spdlog::warn("[Permission] Failed to open temp file for writing: {}", tmp_path.string());
    return false;
  }

  file << document.dump(2);
  file.close();

  if (file.fail()) {
    spdlog::warn("[Permission] Failed to write temp file: {}", tmp_path.string());
    fs::remove(tmp_path, ec);
    return false;
  }

  fs::rename(tmp_path, path_, ec);
  if (ec) {
    spdlog::warn("[Permission] Failed to rename temp file {} -> {}: {}", tmp_path.string(), path_.string(), ec.message());
    fs::remove(tmp_path, ec);
    return false;
  }
  return true;
}

}  // namespace warden::permission
