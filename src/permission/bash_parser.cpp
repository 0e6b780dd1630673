#include "permission/bash_parser.hpp"

#include <filesystem>

#include "core/text.hpp"

namespace warden::permission {

namespace {

// Splits on top-level operators. With pipes=false: &&, ||, ;, a lone & and
// line breaks. With pipes=true: single |.
std::vector<std::string> split_top_level(std::string_view command, bool pipes) {
  std::vector<std::string> parts;
  std::string current;
  bool in_single = false;
  bool in_double = false;

  auto flush = [&] {
    parts.push_back(std::move(current));
    current.clear();
  };

  for (size_t i = 0; i < command.size(); ++i) {
    char c = command[i];
    char prev = i > 0 ? command[i - 1] : '\0';
    char next = i + 1 < command.size() ? command[i + 1] : '\0';

    if (c == '\\' && !in_single && i + 1 < command.size()) {
      current += c;
      current += next;
      ++i;
    } else if (c == '\'' && !in_double) {
      in_single = !in_single;
      current += c;
    } else if (c == '"' && !in_single) {
      in_double = !in_double;
      current += c;
    } else if (in_single || in_double) {
      current += c;
    } else if (!pipes && (c == ';' || c == '\n' || c == '\r')) {
      flush();
    } else if (!pipes && (c == '&' || c == '|') && next == c) {
      flush();
      ++i;
    } else if (!pipes && c == '&' && prev != '>' && prev != '<' && prev != '|' && next != '>') {
      // Background operator; "2>&1", "&>" and "|&" are redirections
      flush();
    } else if (pipes && c == '|') {
      if (next == '|') {
        // "||" is handled by the logical split
        current += "||";
        ++i;
      } else {
        flush();
      }
    } else {
      current += c;
    }
  }

  if (!current.empty()) {
    parts.push_back(std::move(current));
  }
  return parts;
}

bool is_cd(const std::string& command) {
  auto words = text::split_whitespace(command);
  return !words.empty() && words[0] == "cd";
}

}  // namespace

std::vector<ParsedCommand> parse_bash_command(std::string_view command) {
  std::vector<ParsedCommand> result;
  if (text::is_blank(command)) {
    return result;
  }

  for (const auto& segment : split_top_level(command, false)) {
    auto pipeline = split_top_level(segment, true);
    bool is_pipeline = pipeline.size() > 1;

    for (const auto& part : pipeline) {
      auto trimmed = text::trim(part);
      if (trimmed.empty()) continue;

      CommandType type = CommandType::Simple;
      if (is_cd(trimmed)) {
        type = CommandType::Cd;
      } else if (is_pipeline) {
        type = CommandType::PipelinePart;
      }
      result.push_back({std::move(trimmed), type});
    }
  }

  return result;
}

bool has_command_substitution(std::string_view command) {
  bool in_single = false;
  bool in_double = false;

  for (size_t i = 0; i < command.size(); ++i) {
    char c = command[i];
    char next = i + 1 < command.size() ? command[i + 1] : '\0';

    if (in_single) {
      if (c == '\'') in_single = false;
      continue;
    }
    if (c == '\\') {
      ++i;
    } else if (c == '\'' && !in_double) {
      in_single = true;
    } else if (c == '"') {
      in_double = !in_double;
    } else if (c == '`' || (c == '$' && next == '(')) {
      return true;
    } else if (!in_double && (c == '<' || c == '>') && next == '(') {
      return true;
    }
  }
  return false;
}

bool is_cd_within(std::string_view cd_command, const std::string& working_dir) {
  namespace fs = std::filesystem;

  auto words = text::split_whitespace(cd_command);
  if (words.size() < 2 || words[0] != "cd" || working_dir.empty()) {
    return false;
  }

  const auto& target = words[1];
  if (target.starts_with("~")) {
    return false;
  }

  auto base = fs::path(working_dir).lexically_normal();
  fs::path resolved = target.starts_with("/") ? fs::path(target) : base / target;
  resolved = resolved.lexically_normal();

  auto base_str = base.string();
  auto resolved_str = resolved.string();
  while (base_str.size() > 1 && base_str.back() == '/') base_str.pop_back();
  while (resolved_str.size() > 1 && resolved_str.back() == '/') resolved_str.pop_back();

  if (base_str == "/") {
    return resolved_str.starts_with("/");
  }
  return resolved_str == base_str || resolved_str.starts_with(base_str + "/");
}

}  // namespace warden::permission
