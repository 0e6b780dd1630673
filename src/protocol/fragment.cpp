#include "protocol/fragment.hpp"

#include <type_traits>

namespace warden {

std::string to_string(FragmentKind kind) {
  switch (kind) {
    case FragmentKind::Text:
      return "text";
    case FragmentKind::ToolUse:
      return "tool_use";
    case FragmentKind::ToolResult:
      return "tool_result";
    case FragmentKind::CompactBoundary:
      return "compact_boundary";
    case FragmentKind::CompactSummary:
      return "compact_summary";
    case FragmentKind::Completion:
      return "completion";
    case FragmentKind::Error:
      return "error";
    case FragmentKind::Status:
      return "status";
    case FragmentKind::Meta:
      return "meta";
    case FragmentKind::UserMessage:
      return "user_message";
    case FragmentKind::Unknown:
      return "unknown";
  }
  return "unknown";
}

bool Fragment::is_assistant_bound() const {
  return is<TextFragment>() || is<ToolUseFragment>() || is<CompletionFragment>() || is<ErrorFragment>();
}

json Fragment::to_json() const {
  json j;
  j["type"] = to_string(kind());
  j["id"] = id;
  if (message_id) {
    j["message_id"] = *message_id;
  }
  j["timestamp"] = format_timestamp(timestamp);
  if (usage) {
    j["usage"] = warden::to_json(*usage);
  }

  std::visit(
      [&j](const auto& f) {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, TextFragment>) {
          j["content"] = f.content;
          j["is_partial"] = f.is_partial;
          j["is_cumulative"] = f.is_cumulative;
          if (f.stop_reason) j["stop_reason"] = *f.stop_reason;
        } else if constexpr (std::is_same_v<T, ToolUseFragment>) {
          j["tool_name"] = f.tool_name;
          j["parameters"] = f.parameters;
          j["tool_use_id"] = f.tool_use_id;
        } else if constexpr (std::is_same_v<T, ToolResultFragment>) {
          j["tool_use_id"] = f.tool_use_id;
          j["content"] = f.content;
          j["is_error"] = f.is_error;
          j["orphaned"] = f.orphaned;
        } else if constexpr (std::is_same_v<T, CompactBoundaryFragment>) {
          j["trigger"] = f.trigger;
          j["pre_tokens"] = f.pre_tokens;
        } else if constexpr (std::is_same_v<T, CompactSummaryFragment>) {
          j["content"] = f.content;
          j["is_visible_in_transcript_only"] = f.is_visible_in_transcript_only;
        } else if constexpr (std::is_same_v<T, CompletionFragment>) {
          j["stop_reason"] = f.stop_reason;
          j["usage"] = warden::to_json(f.usage);
        } else if constexpr (std::is_same_v<T, ErrorFragment>) {
          j["message"] = f.message;
          if (f.details) j["details"] = *f.details;
          if (f.code) j["code"] = *f.code;
        } else if constexpr (std::is_same_v<T, StatusFragment>) {
          j["status"] = f.status;
          if (f.message) j["message"] = *f.message;
        } else if constexpr (std::is_same_v<T, MetaFragment>) {
          if (f.conversation_id) j["conversation_id"] = *f.conversation_id;
          j["metadata"] = f.metadata;
        } else if constexpr (std::is_same_v<T, UserMessageFragment>) {
          j["content"] = f.content;
          j["is_replay"] = f.is_replay;
        } else if constexpr (std::is_same_v<T, UnknownFragment>) {
          j["raw"] = f.raw;
        }
      },
      body);

  return j;
}

}  // namespace warden
