#pragma once

#include <string>
#include <string_view>

namespace warden::permission {

// Read-only command that may run without a pattern: a known command name or
// a read-only git/npm/dart/pip subcommand, without stdout redirection or a
// flag that writes files or runs commands (find -exec, sed -i, awk system()).
bool is_command_safe(std::string_view command);

// head, tail, grep, sort, jq and other filters commonly piped into, used
// without a writing or executing flag
bool is_safe_output_filter(std::string_view command);

// Every sub-command of a compound command is safe, or a cd within working_dir,
// or a safe filter inside a pipeline. Commands with substitutions never are.
bool is_safe_bash_command(std::string_view command, const std::string& working_dir);

}  // namespace warden::permission
