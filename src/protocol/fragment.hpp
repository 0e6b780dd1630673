#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/types.hpp"

namespace warden {

// Response fragment types

struct TextFragment {
  std::string content;
  bool is_partial = false;     // Delta to append
  bool is_cumulative = false;  // Snapshot of the block so far
  std::optional<std::string> stop_reason;
};

struct ToolUseFragment {
  std::string tool_name;
  json parameters = json::object();
  ToolUseId tool_use_id;
};

struct ToolResultFragment {
  ToolUseId tool_use_id;
  std::string content;
  bool is_error = false;

  // Set by the state machine when no ToolUse with this id exists
  bool orphaned = false;
};

struct CompactBoundaryFragment {
  std::string trigger = "auto";
  int64_t pre_tokens = 0;
};

struct CompactSummaryFragment {
  std::string content;
  bool is_visible_in_transcript_only = true;
};

struct CompletionFragment {
  std::string stop_reason;
  TokenUsage usage;
};

struct ErrorFragment {
  std::string message;
  std::optional<std::string> details;
  std::optional<std::string> code;
};

struct StatusFragment {
  std::string status;
  std::optional<std::string> message;
};

struct MetaFragment {
  std::optional<std::string> conversation_id;
  json metadata = json::object();
};

struct UserMessageFragment {
  std::string content;
  bool is_replay = false;
};

struct UnknownFragment {
  json raw;
};

using FragmentBody = std::variant<TextFragment,
                                  ToolUseFragment,
                                  ToolResultFragment,
                                  CompactBoundaryFragment,
                                  CompactSummaryFragment,
                                  CompletionFragment,
                                  ErrorFragment,
                                  StatusFragment,
                                  MetaFragment,
                                  UserMessageFragment,
                                  UnknownFragment>;

enum class FragmentKind {
  Text,
  ToolUse,
  ToolResult,
  CompactBoundary,
  CompactSummary,
  Completion,
  Error,
  Status,
  Meta,
  UserMessage,
  Unknown
};

std::string to_string(FragmentKind kind);

// One decoded unit of the agent's output
struct Fragment {
  std::string id;
  std::optional<MessageId> message_id;  // Declared assistant message id, if the line had one
  Timestamp timestamp = std::chrono::system_clock::now();
  FragmentBody body;

  // Usage reported by the line, carried by its last fragment only
  std::optional<TokenUsage> usage;

  FragmentKind kind() const {
    return static_cast<FragmentKind>(body.index());
  }

  template <typename T>
  const T* as() const {
    return std::get_if<T>(&body);
  }

  template <typename T>
  T* as() {
    return std::get_if<T>(&body);
  }

  template <typename T>
  bool is() const {
    return std::holds_alternative<T>(body);
  }

  // Text, ToolUse, Completion and Error belong to the assistant's message
  bool is_assistant_bound() const;

  json to_json() const;
};

}  // namespace warden
