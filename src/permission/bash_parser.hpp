#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace warden::permission {

enum class CommandType {
  Simple,
  Cd,
  PipelinePart
};

struct ParsedCommand {
  std::string command;
  CommandType type = CommandType::Simple;

  bool operator==(const ParsedCommand& other) const {
    return command == other.command && type == other.type;
  }
};

// Splits a compound shell command on &&, ||, ;, &, | and line breaks, ignoring
// operators that are quoted or backslash-escaped. Sub-commands are trimmed;
// empty ones dropped.
std::vector<ParsedCommand> parse_bash_command(std::string_view command);

// $(...) or backticks outside single quotes, or <(...) / >(...) outside any
// quotes. Such commands run code the splitter cannot see.
bool has_command_substitution(std::string_view command);

// True for "cd <dir>" where dir resolves to working_dir or below.
// "cd" alone and "cd ~/..." count as outside.
bool is_cd_within(std::string_view cd_command, const std::string& working_dir);

}  // namespace warden::permission
