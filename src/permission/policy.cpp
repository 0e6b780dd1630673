#include "permission/policy.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "permission/inference.hpp"
#include "permission/safe_commands.hpp"
#include "permission/tool_input.hpp"

namespace warden::permission {

std::string to_string(DecisionKind kind) {
  switch (kind) {
    case DecisionKind::Allow:
      return "allow";
    case DecisionKind::Deny:
      return "deny";
    case DecisionKind::Ask:
      return "ask";
  }
  return "ask";
}

PermissionDecision PermissionDecision::allow(std::string reason, std::optional<std::string> matched) {
  PermissionDecision decision;
  decision.kind = DecisionKind::Allow;
  decision.reason = std::move(reason);
  decision.matched_pattern = std::move(matched);
  return decision;
}

PermissionDecision PermissionDecision::deny(std::string reason, std::optional<std::string> matched) {
  PermissionDecision decision;
  decision.kind = DecisionKind::Deny;
  decision.reason = std::move(reason);
  decision.matched_pattern = std::move(matched);
  return decision;
}

PermissionDecision PermissionDecision::ask(std::string reason, std::string inferred) {
  PermissionDecision decision;
  decision.kind = DecisionKind::Ask;
  decision.reason = std::move(reason);
  decision.inferred_pattern = std::move(inferred);
  return decision;
}

json PermissionDecision::to_json() const {
  json j = {{"kind", to_string(kind)}, {"reason", reason}, {"remember", remember}};
  if (matched_pattern) j["matched_pattern"] = *matched_pattern;
  if (inferred_pattern) j["inferred_pattern"] = *inferred_pattern;
  return j;
}

PermissionPolicy::PermissionPolicy(PermissionSettings settings, std::shared_ptr<PermissionStore> store)
    : settings_(std::move(settings)), store_(std::move(store)) {}

bool PermissionPolicy::is_internal_tool(const std::string& tool_name) const {
  if (std::find(settings_.internal_tools.begin(), settings_.internal_tools.end(), tool_name) != settings_.internal_tools.end()) {
    return true;
  }
  return std::any_of(settings_.internal_tool_prefixes.begin(), settings_.internal_tool_prefixes.end(),
                     [&](const std::string& prefix) { return !prefix.empty() && tool_name.starts_with(prefix); });
}

std::optional<std::string> PermissionPolicy::find_session_pattern(const std::string& tool_name, const json& input,
                                                                  const MatchContext& ctx) const {
  std::lock_guard lock(session_mutex_);
  for (const auto& pattern : session_cache_) {
    if (pattern.matches(tool_name, input, ctx)) {
      return pattern.text();
    }
  }
  return std::nullopt;
}

PermissionDecision PermissionPolicy::check_permission(const std::string& tool_name, const json& input, const std::string& cwd) {
  const auto& denied = settings_.denied_tools;
  if (std::find(denied.begin(), denied.end(), tool_name) != denied.end()) {
    spdlog::info("[Policy] {} denied by configuration", tool_name);
    return PermissionDecision::deny("Tool " + tool_name + " is disabled");
  }

  if (is_internal_tool(tool_name)) {
    return PermissionDecision::allow("internal tool");
  }

  if (settings_.auto_approve_read_only && is_read_only_tool(tool_name)) {
    auto path = tool_path(tool_name, input);
    if (path && has_path_traversal(*path)) {
      spdlog::warn("[Policy] Denied {} with path traversal: {}", tool_name, *path);
      return PermissionDecision::deny("Path traversal is not allowed");
    }
    return PermissionDecision::allow("read-only tool");
  }

  MatchContext ctx{cwd};

  if (store_) {
    store_->refresh();
    if (auto matched = store_->find_deny(tool_name, input, ctx)) {
      spdlog::info("[Policy] {} denied by pattern {}", tool_name, *matched);
      return PermissionDecision::deny("Denied by " + *matched, matched);
    }
  }

  if (settings_.auto_approve_safe_commands && tool_kind(tool_name) == ToolKind::Bash) {
    auto command = tool_subject(tool_name, input);
    if (command && is_safe_bash_command(*command, cwd)) {
      return PermissionDecision::allow("safe read-only command");
    }
  }

  // Without a durable store every remembered pattern lives in the session cache
  if ((settings_.enable_session_cache && is_write_tool(tool_name)) || !store_) {
    if (auto matched = find_session_pattern(tool_name, input, ctx)) {
      spdlog::debug("[Policy] {} allowed by session pattern {}", tool_name, *matched);
      return PermissionDecision::allow("session allow-list", matched);
    }
  }

  if (store_) {
    if (auto matched = store_->find_allow(tool_name, input, ctx)) {
      spdlog::debug("[Policy] {} allowed by pattern {}", tool_name, *matched);
      return PermissionDecision::allow("project allow-list", matched);
    }
  }

  auto inferred = infer_pattern(tool_name, input);
  switch (settings_.ask_behavior) {
    case AskBehavior::Allow:
      return PermissionDecision::allow("ask behavior is allow");
    case AskBehavior::Deny:
      spdlog::info("[Policy] {} denied, no interactive approval available", tool_name);
      return PermissionDecision::deny("Permission requires approval");
    case AskBehavior::Ask:
      break;
  }
  return PermissionDecision::ask("no matching pattern", inferred);
}

std::string PermissionPolicy::remember(const std::string& tool_name, const json& input) {
  auto pattern = infer_pattern(tool_name, input);

  if (is_write_tool(tool_name)) {
    if (settings_.enable_session_cache) {
      add_session_pattern(pattern);
    } else {
      spdlog::debug("[Policy] Session cache disabled, not remembering {}", pattern);
    }
    return pattern;
  }

  if (store_) {
    if (!store_->add_allow(pattern)) {
      spdlog::debug("[Policy] {} already stored or not written", pattern);
    }
  } else {
    add_session_pattern(pattern);
  }
  return pattern;
}

void PermissionPolicy::add_session_pattern(const std::string& pattern) {
  auto parsed = PermissionPattern::parse(pattern);
  if (!parsed.valid()) return;

  std::lock_guard lock(session_mutex_);
  for (const auto& existing : session_cache_) {
    if (existing.text() == pattern) return;
  }
  session_cache_.push_back(std::move(parsed));
  spdlog::debug("[Policy] Session pattern added: {}", pattern);
}

std::vector<std::string> PermissionPolicy::session_patterns() const {
  std::lock_guard lock(session_mutex_);
  std::vector<std::string> result;
  for (const auto& pattern : session_cache_) {
    result.push_back(pattern.text());
  }
  return result;
}

void PermissionPolicy::clear_session_cache() {
  std::lock_guard lock(session_mutex_);
  session_cache_.clear();
}

}  // namespace warden::permission
