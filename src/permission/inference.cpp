#include "permission/inference.hpp"

#include <filesystem>

#include "core/text.hpp"
#include "permission/bash_parser.hpp"
#include "permission/pattern.hpp"
#include "permission/tool_input.hpp"

namespace warden::permission {

namespace {

bool is_path_like(const std::string& word) {
  return word.starts_with("/") || word.starts_with("./") || word.starts_with("~/") || word.starts_with("..");
}

std::string infer_bash(const std::string& command) {
  auto parsed = parse_bash_command(command);
  if (parsed.empty()) {
    return "Bash()";
  }

  auto primary = parsed.front().command;
  for (const auto& part : parsed) {
    if (part.type != CommandType::Cd) {
      primary = part.command;
      break;
    }
  }

  std::vector<std::string> base;
  for (const auto& word : text::split_whitespace(primary)) {
    if (word.starts_with("-")) break;
    if (is_path_like(word)) {
      // A path in command position is the command itself
      if (base.empty()) base.push_back(word);
      break;
    }
    base.push_back(word);
  }

  if (base.empty()) {
    return "Bash()";
  }

  std::string joined;
  for (const auto& word : base) {
    if (!joined.empty()) joined += ' ';
    joined += word;
  }
  return "Bash(" + joined + ":*)";
}

std::string infer_file(const std::string& tool_name, const std::string& file_path) {
  if (file_path.empty()) {
    return tool_name + "()";
  }

  auto directory = std::filesystem::path(file_path).parent_path().string();
  if (directory.empty() || directory == ".") {
    return tool_name + "(**)";
  }
  if (directory == "/") {
    return tool_name + "(/**)";
  }
  return tool_name + "(" + directory + "/**)";
}

}  // namespace

std::string infer_pattern(const std::string& tool_name, const json& input) {
  auto kind = tool_kind(tool_name);
  auto subject = tool_subject(tool_name, input).value_or("");

  switch (kind) {
    case ToolKind::Bash:
      return infer_bash(subject);
    case ToolKind::Read:
    case ToolKind::Write:
    case ToolKind::Edit:
    case ToolKind::MultiEdit:
      return infer_file(tool_name, subject);
    case ToolKind::WebFetch: {
      auto host = url_host(subject);
      return host.empty() ? "WebFetch()" : "WebFetch(domain:" + host + ")";
    }
    case ToolKind::WebSearch:
    case ToolKind::Grep:
    case ToolKind::Glob:
    case ToolKind::Other:
      return tool_name;
  }
  return tool_name;
}

}  // namespace warden::permission
