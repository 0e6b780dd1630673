#pragma once

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include "core/types.hpp"

namespace warden::permission {

// Where the invocation happens; cd targets are resolved against cwd
struct MatchContext {
  std::string cwd;
};

// One parsed permission rule, "ToolName" or "ToolName(arg)".
//
// Parsed once; matching never throws. An invalid pattern keeps its text and
// parse error and matches nothing.
class PermissionPattern {
 public:
  static PermissionPattern parse(const std::string& source);

  const std::string& text() const {
    return text_;
  }

  bool valid() const {
    return error_.empty();
  }

  const std::string& error() const {
    return error_;
  }

  const std::string& tool() const {
    return tool_;
  }

  const std::optional<std::string>& argument() const {
    return argument_;
  }

  bool matches_tool(const std::string& tool_name) const;

  bool matches(const std::string& tool_name, const json& input, const MatchContext& ctx = {}) const;

 private:
  PermissionPattern() = default;

  bool matches_argument(const std::string& tool_name, const json& input, const MatchContext& ctx) const;
  bool matches_bash(const std::string& command, const MatchContext& ctx) const;
  bool matches_bash_part(const std::string& command) const;
  bool matches_file(const std::string& path) const;
  bool matches_web_fetch(const std::string& url) const;
  bool matches_web_search(const std::string& query) const;

  std::string text_;
  std::string error_;

  std::string tool_;
  std::optional<std::string> argument_;

  // Set when the tool name is an alternation such as "Write|Edit"
  std::shared_ptr<const std::regex> tool_regex_;

  // Compiled argument regex (WebFetch URL regex, WebSearch query regex)
  std::shared_ptr<const std::regex> argument_regex_;

  // Normalized file glob
  std::string glob_;

  // Bash: literal prefix of "prefix:*", or the collapsed exact command
  std::optional<std::string> bash_prefix_;
  std::string bash_exact_;
};

// Collapse duplicate slashes and drop a trailing slash
std::string normalize_path(std::string_view path);

// True when the raw, normalized, percent-decoded or double-decoded path has a ".." segment
bool has_path_traversal(std::string_view path);

// Glob with "**" (any depth), "*" (within one component) and "?" (one character).
// "dir/**" also matches "dir" itself.
bool glob_match(std::string_view pattern, std::string_view path);

// Lower-cased host of an absolute URL. Empty when there is none or when it is
// not a plain hostname ([A-Za-z0-9.-]) or a bracketed IPv6 literal.
std::string url_host(std::string_view url);

}  // namespace warden::permission
