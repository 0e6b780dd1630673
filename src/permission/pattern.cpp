#include "permission/pattern.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#include "core/text.hpp"
#include "permission/bash_parser.hpp"
#include "permission/safe_commands.hpp"
#include "permission/tool_input.hpp"

namespace warden::permission {

namespace {

bool glob_match_impl(std::string_view pattern, std::string_view path) {
  while (!pattern.empty()) {
    if (pattern.starts_with("**")) {
      auto rest = pattern.substr(2);
      for (size_t i = 0; i <= path.size(); ++i) {
        if (glob_match_impl(rest, path.substr(i))) return true;
      }
      return false;
    }

    if (pattern[0] == '*') {
      auto rest = pattern.substr(1);
      for (size_t i = 0; i <= path.size(); ++i) {
        if (glob_match_impl(rest, path.substr(i))) return true;
        if (i < path.size() && path[i] == '/') break;
      }
      return false;
    }

    if (path.empty()) return false;
    if (pattern[0] == '?') {
      if (path[0] == '/') return false;
    } else if (pattern[0] != path[0]) {
      return false;
    }
    pattern.remove_prefix(1);
    path.remove_prefix(1);
  }
  return path.empty();
}

bool has_parent_segment(std::string path) {
  for (auto& c : path) {
    if (c == '\\') c = '/';
  }
  size_t start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string::npos) end = path.size();
    if (path.compare(start, end - start, "..") == 0 && end - start == 2) {
      return true;
    }
    start = end + 1;
  }
  return false;
}

std::shared_ptr<const std::regex> compile(const std::string& expr) {
  return std::make_shared<const std::regex>(expr, std::regex::ECMAScript);
}

bool search(const std::string& subject, const std::shared_ptr<const std::regex>& re) {
  if (!re) return false;
  try {
    return std::regex_search(subject, *re);
  } catch (const std::regex_error& e) {
    spdlog::warn("[Permission] Regex evaluation failed: {}", e.what());
    return false;
  }
}

}  // namespace

std::string normalize_path(std::string_view path) {
  std::string result;
  result.reserve(path.size());
  for (char c : path) {
    if (c == '/' && !result.empty() && result.back() == '/') continue;
    result += c;
  }
  while (result.size() > 1 && result.back() == '/') {
    result.pop_back();
  }
  return result;
}

bool has_path_traversal(std::string_view path) {
  auto decoded = text::percent_decode(path);
  return has_parent_segment(std::string(path)) || has_parent_segment(normalize_path(path)) || has_parent_segment(decoded) ||
         has_parent_segment(text::percent_decode(decoded));
}

bool glob_match(std::string_view pattern, std::string_view path) {
  if (pattern.ends_with("/**") && path == pattern.substr(0, pattern.size() - 3)) {
    return true;
  }
  return glob_match_impl(pattern, path);
}

std::string url_host(std::string_view url) {
  auto scheme = url.find("://");
  if (scheme == std::string_view::npos) {
    return {};
  }

  // Browsers treat a backslash like "/", so it ends the authority too
  auto rest = url.substr(scheme + 3);
  auto authority = rest.substr(0, rest.find_first_of("/?#\\"));

  auto at = authority.rfind('@');
  if (at != std::string_view::npos) {
    authority = authority.substr(at + 1);
  }

  std::string_view host;
  if (authority.starts_with("[")) {
    auto close = authority.find(']');
    if (close == std::string_view::npos) return {};
    host = authority.substr(1, close - 1);
    auto port = authority.substr(close + 1);
    if (!port.empty() && !port.starts_with(":")) return {};
    bool ipv6 = !host.empty() && std::all_of(host.begin(), host.end(), [](char c) {
      return std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.';
    });
    if (!ipv6) return {};
  } else {
    host = authority.substr(0, authority.find(':'));
    bool hostname = !host.empty() && std::all_of(host.begin(), host.end(), [](char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-';
    });
    if (!hostname) return {};
  }
  return text::to_lower(host);
}

PermissionPattern PermissionPattern::parse(const std::string& source) {
  PermissionPattern pattern;
  pattern.text_ = source;

  auto trimmed = text::trim(source);
  auto open = trimmed.find('(');

  if (open == std::string::npos) {
    pattern.tool_ = trimmed;
    if (trimmed.find(')') != std::string::npos) {
      pattern.error_ = "unbalanced parenthesis";
    }
  } else if (trimmed.back() != ')') {
    pattern.error_ = "missing closing parenthesis";
  } else {
    pattern.tool_ = text::trim(trimmed.substr(0, open));
    pattern.argument_ = trimmed.substr(open + 1, trimmed.size() - open - 2);
  }

  if (pattern.error_.empty() && pattern.tool_.empty()) {
    pattern.error_ = "empty tool name";
  }

  if (pattern.error_.empty()) {
    try {
      if (pattern.tool_.find('|') != std::string::npos) {
        pattern.tool_regex_ = compile("^(?:" + pattern.tool_ + ")$");
      }

      if (pattern.argument_) {
        const auto& arg = *pattern.argument_;

        if (arg.ends_with(":*")) {
          pattern.bash_prefix_ = text::collapse_whitespace(arg.substr(0, arg.size() - 2));
        } else {
          pattern.bash_exact_ = text::collapse_whitespace(arg);
        }
        pattern.glob_ = normalize_path(arg);

        bool web_search = pattern.matches_tool("WebSearch");
        bool web_fetch = pattern.matches_tool("WebFetch");
        if (web_search && arg.starts_with("query:")) {
          pattern.argument_regex_ = compile(arg.substr(6));
        } else if ((web_search || web_fetch) && !arg.empty() && arg != "*" && !arg.starts_with("domain:")) {
          pattern.argument_regex_ = compile(arg);
        }
      }
    } catch (const std::regex_error& e) {
      pattern.error_ = std::string("invalid regex: ") + e.what();
    }
  }

  if (!pattern.error_.empty()) {
    spdlog::warn("[Permission] Ignoring invalid pattern '{}': {}", source, pattern.error_);
  }
  return pattern;
}

bool PermissionPattern::matches_tool(const std::string& tool_name) const {
  if (!tool_regex_) {
    return tool_ == tool_name;
  }
  try {
    return std::regex_match(tool_name, *tool_regex_);
  } catch (const std::regex_error& e) {
    spdlog::warn("[Permission] Tool regex evaluation failed for '{}': {}", text_, e.what());
    return false;
  }
}

bool PermissionPattern::matches(const std::string& tool_name, const json& input, const MatchContext& ctx) const {
  if (!valid() || !matches_tool(tool_name)) {
    return false;
  }

  // Traversal paths never match, whatever the pattern says
  if (auto path = tool_path(tool_name, input)) {
    if (has_path_traversal(*path)) {
      return false;
    }
  }

  if (!argument_) {
    return true;
  }
  return matches_argument(tool_name, input, ctx);
}

bool PermissionPattern::matches_argument(const std::string& tool_name, const json& input, const MatchContext& ctx) const {
  const auto& arg = *argument_;
  auto kind = tool_kind(tool_name);
  auto subject = tool_subject(tool_name, input);

  if (subject_field(kind)) {
    // Grammar-required field missing: fail closed
    if (!subject) return false;
    if (arg == "*") return true;
    if (arg.empty()) return subject->empty();

    switch (kind) {
      case ToolKind::Bash:
        return matches_bash(*subject, ctx);
      case ToolKind::Read:
      case ToolKind::Write:
      case ToolKind::Edit:
      case ToolKind::MultiEdit:
        return matches_file(*subject);
      case ToolKind::WebFetch:
        return matches_web_fetch(*subject);
      case ToolKind::WebSearch:
        return matches_web_search(*subject);
      default:
        return false;
    }
  }

  if (arg == "*") return true;
  if (arg.empty()) {
    bool no_input = input.is_null() || (input.is_object() && input.empty());
    return no_input || (subject && subject->empty());
  }
  return subject && *subject == arg;
}

bool PermissionPattern::matches_bash_part(const std::string& command) const {
  auto collapsed = text::collapse_whitespace(command);
  if (bash_prefix_) {
    return collapsed.starts_with(*bash_prefix_);
  }
  return collapsed == bash_exact_;
}

bool PermissionPattern::matches_bash(const std::string& command, const MatchContext& ctx) const {
  if (text::is_blank(command)) {
    return false;
  }

  if (!bash_prefix_ && text::collapse_whitespace(command) == bash_exact_) {
    return true;
  }
  if (has_command_substitution(command)) {
    return false;
  }

  auto parsed = parse_bash_command(command);
  bool matched = false;
  for (const auto& part : parsed) {
    if (part.type == CommandType::Cd && is_cd_within(part.command, ctx.cwd)) {
      continue;
    }
    if (matches_bash_part(part.command)) {
      matched = true;
      continue;
    }
    if (part.type == CommandType::PipelinePart && is_safe_output_filter(part.command)) {
      continue;
    }
    return false;
  }
  return matched;
}

bool PermissionPattern::matches_file(const std::string& path) const {
  if (path.empty() || has_path_traversal(path)) {
    return false;
  }
  return glob_match(glob_, normalize_path(path));
}

bool PermissionPattern::matches_web_fetch(const std::string& url) const {
  if (url.empty()) {
    return false;
  }

  const auto& arg = *argument_;
  if (arg.starts_with("domain:")) {
    auto domain = text::to_lower(text::trim(arg.substr(7)));
    auto host = url_host(url);
    if (domain.empty() || host.empty()) return false;
    return host == domain || host.ends_with("." + domain);
  }

  return search(url, argument_regex_);
}

bool PermissionPattern::matches_web_search(const std::string& query) const {
  if (query.empty()) {
    return false;
  }
  return search(query, argument_regex_);
}

}  // namespace warden::permission
