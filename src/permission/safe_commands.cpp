#include "permission/safe_commands.hpp"

#include <regex>
#include <set>

#include "core/text.hpp"
#include "permission/bash_parser.hpp"

namespace warden::permission {

namespace {

const std::set<std::string, std::less<>> kSafeCommands = {
    // Listing
    "ls", "pwd", "which", "whoami", "tree",
    // Reading
    "cat", "head", "tail", "less", "more",
    // Searching
    "find", "grep", "egrep", "fgrep", "rg",
    // Process inspection
    "ps", "top", "htop",
    // Metadata
    "stat", "file", "wc", "du", "df",
    // Environment
    "printenv", "echo",
    // Text processing
    "sort", "uniq", "cut", "awk", "sed", "jq", "tr", "column", "nl",
    // Subcommands checked separately
    "git", "npm", "dart", "pip"};

const std::set<std::string, std::less<>> kSafeGitSubcommands = {
    "status", "log",    "diff",      "show",      "branch", "remote",   "rev-parse", "describe", "ls-files",
    "ls-tree", "ls-remote", "blame", "shortlog", "tag",      "reflog", "cat-file", "rev-list"};

const std::set<std::string, std::less<>> kSafeNpmSubcommands = {"list", "ls",       "view",   "show", "info",
                                                                "search", "outdated", "doctor", "version", "help"};

const std::set<std::string, std::less<>> kSafeDartSubcommands = {"analyze", "doc", "info", "pub", "help", "version"};

const std::set<std::string, std::less<>> kSafePipSubcommands = {"list", "show", "search", "check", "help"};

const std::set<std::string, std::less<>> kSafeFilters = {"head", "tail", "grep", "egrep", "fgrep", "sed", "awk",
                                                         "cut",  "sort", "uniq", "wc",    "tr",    "less", "more",
                                                         "cat",  "column", "nl",  "jq"};

// find actions that run commands or write files
const std::set<std::string, std::less<>> kFindActions = {"-delete", "-exec",    "-execdir", "-ok",
                                                         "-okdir",  "-fprint", "-fprint0", "-fprintf", "-fls"};

// ">" anywhere except as part of "2>" or ">&1"
bool has_stdout_redirection(std::string_view command) {
  for (size_t i = 0; i < command.size(); ++i) {
    if (command[i] != '>') continue;
    bool after_two = i > 0 && command[i - 1] == '2';
    bool to_stdout = command.substr(i + 1, 2) == "&1";
    if (!after_two && !to_stdout) {
      return true;
    }
  }
  return false;
}

bool has_word(const std::vector<std::string>& words, std::string_view word) {
  for (size_t i = 1; i < words.size(); ++i) {
    if (words[i] == word || words[i].starts_with(std::string(word) + "=")) return true;
  }
  return false;
}

// Short option cluster containing the letter, e.g. "-nf" for 'f'
bool has_short_flag(const std::vector<std::string>& words, char flag) {
  for (size_t i = 1; i < words.size(); ++i) {
    const auto& word = words[i];
    if (word.size() > 1 && word[0] == '-' && word[1] != '-' && word.find(flag) != std::string::npos) return true;
  }
  return false;
}

// Words with shell quoting and escapes removed
std::vector<std::string> unquoted_words(std::string_view command) {
  auto words = text::split_whitespace(command);
  for (auto& word : words) {
    std::erase_if(word, [](char c) { return c == '\'' || c == '"' || c == '\\'; });
  }
  return words;
}

bool is_bare_option(const std::string& word) {
  static const std::regex kOption(R"(-[A-Za-z]+|--[A-Za-z-]+)");
  return std::regex_match(word, kOption);
}

// sed scripts using the e (execute) or w (write) command or s/// flag
bool sed_executes_or_writes(const std::vector<std::string>& words) {
  static const std::regex kExecuteOrWrite(R"((^|[^A-Za-z])[gpiImM0-9]*[ewW]([^A-Za-z]|$))");
  for (size_t i = 1; i < words.size(); ++i) {
    if (!is_bare_option(words[i]) && std::regex_search(words[i], kExecuteOrWrite)) return true;
  }
  return false;
}

bool has_dangerous_flags(std::string_view command) {
  if (has_stdout_redirection(command)) {
    return true;
  }

  auto words = unquoted_words(command);
  if (words.empty()) {
    return false;
  }
  const auto& name = words[0];

  if (name == "find") {
    for (const auto& word : words) {
      if (kFindActions.count(word)) return true;
    }
  } else if (name == "sed") {
    return has_short_flag(words, 'i') || has_short_flag(words, 'f') || has_word(words, "--in-place") ||
           has_word(words, "--file") || sed_executes_or_writes(words);
  } else if (name == "awk") {
    return command.find("system") != std::string_view::npos || command.find('|') != std::string_view::npos ||
           has_short_flag(words, 'f') || has_word(words, "--file");
  } else if (name == "sort") {
    return has_short_flag(words, 'o') || has_word(words, "--output");
  } else if (name == "tree") {
    return has_short_flag(words, 'o');
  } else if (name == "rg") {
    return has_word(words, "--pre");
  }
  return false;
}

}  // namespace

bool is_command_safe(std::string_view command) {
  auto trimmed = text::trim(command);
  auto words = text::split_whitespace(trimmed);
  if (words.empty() || !kSafeCommands.count(words[0])) {
    return false;
  }

  const auto& name = words[0];
  if (name == "git" || name == "npm" || name == "dart" || name == "pip") {
    if (words.size() < 2 || has_stdout_redirection(trimmed)) return false;
    const auto& sub = words[1];
    if (name == "git") return kSafeGitSubcommands.count(sub) > 0;
    if (name == "npm") return kSafeNpmSubcommands.count(sub) > 0;
    if (name == "dart") return kSafeDartSubcommands.count(sub) > 0;
    return kSafePipSubcommands.count(sub) > 0;
  }

  return !has_dangerous_flags(trimmed);
}

bool is_safe_output_filter(std::string_view command) {
  auto words = text::split_whitespace(command);
  return !words.empty() && kSafeFilters.count(words[0]) > 0 && !has_dangerous_flags(command);
}

bool is_safe_bash_command(std::string_view command, const std::string& working_dir) {
  if (has_command_substitution(command)) {
    return false;
  }
  auto parsed = parse_bash_command(command);
  if (parsed.empty()) {
    return false;
  }

  for (const auto& part : parsed) {
    if (part.type == CommandType::Cd) {
      if (is_cd_within(part.command, working_dir)) continue;
      return false;
    }
    if (part.type == CommandType::PipelinePart && is_safe_output_filter(part.command)) {
      continue;
    }
    if (!is_command_safe(part.command)) {
      return false;
    }
  }
  return true;
}

}  // namespace warden::permission
