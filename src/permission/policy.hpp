#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "permission/pattern.hpp"
#include "permission/store.hpp"

namespace warden::permission {

enum class DecisionKind { Allow, Deny, Ask };

std::string to_string(DecisionKind kind);

struct PermissionDecision {
  DecisionKind kind = DecisionKind::Ask;
  std::string reason;
  bool remember = false;
  std::optional<std::string> matched_pattern;

  // Offered to the user as "always allow" on ask
  std::optional<std::string> inferred_pattern;

  static PermissionDecision allow(std::string reason, std::optional<std::string> matched = std::nullopt);
  static PermissionDecision deny(std::string reason, std::optional<std::string> matched = std::nullopt);
  static PermissionDecision ask(std::string reason, std::string inferred);

  bool allowed() const {
    return kind == DecisionKind::Allow;
  }

  json to_json() const;
};

// Decides whether one tool invocation may run without a human.
// One instance per session: the session cache lives here, the durable
// lists live in the shared PermissionStore.
class PermissionPolicy {
 public:
  // store may be null when project settings are disabled
  PermissionPolicy(PermissionSettings settings, std::shared_ptr<PermissionStore> store);

  PermissionDecision check_permission(const std::string& tool_name, const json& input, const std::string& cwd);

  // Store the pattern inferred from the invocation and return it
  std::string remember(const std::string& tool_name, const json& input);

  void add_session_pattern(const std::string& pattern);

  std::vector<std::string> session_patterns() const;

  void clear_session_cache();

  const PermissionSettings& settings() const {
    return settings_;
  }

  const std::shared_ptr<PermissionStore>& store() const {
    return store_;
  }

 private:
  bool is_internal_tool(const std::string& tool_name) const;

  std::optional<std::string> find_session_pattern(const std::string& tool_name, const json& input, const MatchContext& ctx) const;

  PermissionSettings settings_;
  std::shared_ptr<PermissionStore> store_;

  mutable std::mutex session_mutex_;
  std::vector<PermissionPattern> session_cache_;
};

}  // namespace warden::permission
