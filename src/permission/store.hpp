#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "permission/pattern.hpp"

namespace warden::permission {

// Durable allow/deny/ask lists of one project, persisted as
//   <project>/.claude/settings.local.json
//   {"permissions": {"allow": [...], "deny": [...], "ask": [...]}}
// Keys other than permissions.allow/deny/ask are preserved on write.
//
// Reads from any number of sessions share a parsed snapshot. Appends are
// serialized, deduplicated and written atomically (temp file + rename).
class PermissionStore {
 public:
  struct Snapshot {
    std::vector<PermissionPattern> allow;
    std::vector<PermissionPattern> deny;
    std::vector<PermissionPattern> ask;
  };

  explicit PermissionStore(std::filesystem::path settings_file);

  // One shared instance per project directory
  static std::shared_ptr<PermissionStore> for_project(const std::filesystem::path& project_dir);

  const std::filesystem::path& path() const {
    return path_;
  }

  std::shared_ptr<const Snapshot> snapshot() const;

  // Re-read the file when it changed on disk since the last load
  void refresh();

  // First allow pattern matching the invocation
  std::optional<std::string> find_allow(const std::string& tool_name, const json& input, const MatchContext& ctx) const;

  std::optional<std::string> find_deny(const std::string& tool_name, const json& input, const MatchContext& ctx) const;

  // False when the pattern was already present or the write failed
  bool add_allow(const std::string& pattern);

  bool add_deny(const std::string& pattern);

  std::vector<std::string> allow_patterns() const;

  std::vector<std::string> deny_patterns() const;

 private:
  bool append(const std::string& list, const std::string& pattern);

  // Parsed document, or an empty object when missing or unreadable
  json read_document() const;

  bool atomic_write(const json& document);

  void load_locked();

  std::filesystem::path path_;

  mutable std::shared_mutex mutex_;
  std::shared_ptr<const Snapshot> snapshot_;
  std::optional<std::filesystem::file_time_type> loaded_mtime_;

  // Serializes read-modify-write cycles
  std::mutex write_mutex_;
};

}  // namespace warden::permission
