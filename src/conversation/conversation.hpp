#pragma once

#include <optional>
#include <string>
#include <vector>

#include "conversation/message.hpp"
#include "core/types.hpp"

namespace warden {

// Messages and token counters of one agent. Copies are used as snapshots.
struct Conversation {
  std::vector<Message> messages;
  ConversationState state = ConversationState::Idle;

  // Accumulated over every usage report
  int64_t total_input_tokens = 0;
  int64_t total_output_tokens = 0;
  int64_t total_cache_read_tokens = 0;
  int64_t total_cache_creation_tokens = 0;
  double total_cost_usd = 0.0;

  // Replaced by every usage report
  int64_t current_context_input_tokens = 0;
  int64_t current_context_cache_read_tokens = 0;
  int64_t current_context_cache_creation_tokens = 0;

  std::optional<std::string> current_error;

  int64_t total_tokens() const {
    return total_input_tokens + total_output_tokens;
  }

  int64_t current_context_tokens() const {
    return current_context_input_tokens + current_context_cache_read_tokens + current_context_cache_creation_tokens;
  }

  bool is_processing() const {
    return state == ConversationState::SendingMessage || state == ConversationState::Processing ||
           state == ConversationState::ReceivingResponse;
  }

  const Message* last_message() const {
    return messages.empty() ? nullptr : &messages.back();
  }

  const Message* find_message(const MessageId& id) const;

  // Conversation-wide pairing; results may sit in a later message than their call
  std::vector<ToolInvocation> tool_invocations() const;

  std::optional<ToolInvocation> find_invocation(const ToolUseId& id) const;

  bool has_tool_use(const ToolUseId& id) const;

  json to_json() const;
};

}  // namespace warden
