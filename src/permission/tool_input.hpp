#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"

namespace warden::permission {

// Tools whose pattern argument has its own grammar
enum class ToolKind {
  Bash,
  Read,
  Write,
  Edit,
  MultiEdit,
  WebFetch,
  WebSearch,
  Grep,
  Glob,
  Other
};

ToolKind tool_kind(const std::string& tool_name);

// Read, Write, Edit, MultiEdit
bool is_file_tool(ToolKind kind);

// Write, Edit, MultiEdit: approvals are remembered for the session only
bool is_write_tool(const std::string& tool_name);

// Read, Grep, Glob
bool is_read_only_tool(const std::string& tool_name);

// Input field the tool's grammar constrains: command, file_path, url or query
std::optional<std::string> subject_field(ToolKind kind);

// Value of the constrained field; nullopt when it is missing or not a string.
// Tools without a grammar use their only string field, if they have exactly one.
std::optional<std::string> tool_subject(const std::string& tool_name, const json& input);

// Path a file tool (or Grep/Glob "path") operates on, if any
std::optional<std::string> tool_path(const std::string& tool_name, const json& input);

}  // namespace warden::permission
