#include "permission/tool_input.hpp"

namespace warden::permission {

namespace {

std::optional<std::string> string_value(const json& input, const std::string& key) {
  if (!input.is_object()) return std::nullopt;
  auto it = input.find(key);
  if (it == input.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

}  // namespace

ToolKind tool_kind(const std::string& tool_name) {
  if (tool_name == "Bash") return ToolKind::Bash;
  if (tool_name == "Read") return ToolKind::Read;
  if (tool_name == "Write") return ToolKind::Write;
  if (tool_name == "Edit") return ToolKind::Edit;
  if (tool_name == "MultiEdit") return ToolKind::MultiEdit;
  if (tool_name == "WebFetch") return ToolKind::WebFetch;
  if (tool_name == "WebSearch") return ToolKind::WebSearch;
  if (tool_name == "Grep") return ToolKind::Grep;
  if (tool_name == "Glob") return ToolKind::Glob;
  return ToolKind::Other;
}

bool is_file_tool(ToolKind kind) {
  return kind == ToolKind::Read || kind == ToolKind::Write || kind == ToolKind::Edit || kind == ToolKind::MultiEdit;
}

bool is_write_tool(const std::string& tool_name) {
  return tool_name == "Write" || tool_name == "Edit" || tool_name == "MultiEdit";
}

bool is_read_only_tool(const std::string& tool_name) {
  return tool_name == "Read" || tool_name == "Grep" || tool_name == "Glob";
}

std::optional<std::string> subject_field(ToolKind kind) {
  switch (kind) {
    case ToolKind::Bash:
      return "command";
    case ToolKind::Read:
    case ToolKind::Write:
    case ToolKind::Edit:
    case ToolKind::MultiEdit:
      return "file_path";
    case ToolKind::WebFetch:
      return "url";
    case ToolKind::WebSearch:
      return "query";
    case ToolKind::Grep:
    case ToolKind::Glob:
    case ToolKind::Other:
      return std::nullopt;
  }
  return std::nullopt;
}

std::optional<std::string> tool_subject(const std::string& tool_name, const json& input) {
  if (auto field = subject_field(tool_kind(tool_name))) {
    return string_value(input, *field);
  }

  if (!input.is_object()) return std::nullopt;

  std::optional<std::string> only;
  for (auto& [key, value] : input.items()) {
    if (!value.is_string()) continue;
    if (only) return std::nullopt;
    only = value.get<std::string>();
  }
  return only;
}

std::optional<std::string> tool_path(const std::string& tool_name, const json& input) {
  auto kind = tool_kind(tool_name);
  if (is_file_tool(kind)) {
    return string_value(input, "file_path");
  }
  if (kind == ToolKind::Grep || kind == ToolKind::Glob) {
    return string_value(input, "path");
  }
  return std::nullopt;
}

}  // namespace warden::permission
