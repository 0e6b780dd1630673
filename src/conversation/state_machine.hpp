#pragma once

#include <optional>
#include <set>
#include <string>

#include "conversation/conversation.hpp"
#include "protocol/decoder.hpp"

namespace warden {

// What one apply() call did to the conversation
struct ConversationDelta {
  enum class Kind { None, Appended, UpdatedLast };

  Kind kind = Kind::None;
  ConversationState state = ConversationState::Idle;
  bool turn_completed = false;
  bool orphan_recorded = false;

  // Message appended to or updated, if any
  std::optional<MessageId> message_id;

  bool changed() const {
    return kind != Kind::None;
  }
};

std::string to_string(ConversationDelta::Kind kind);

// Applies decoded fragments, strictly in arrival order, to one conversation.
// Not thread safe; the owning session serializes calls.
class ConversationStateMachine {
 public:
  ConversationStateMachine() = default;
  explicit ConversationStateMachine(Conversation initial);

  ConversationDelta apply(const Fragment& fragment);

  // Every fragment of the line, then the line's usage if no fragment carried it
  ConversationDelta apply(const protocol::DecodedLine& line);

  // Totals grow, current-context counters are replaced
  void apply_usage(const TokenUsage& usage);

  // A user turn written by the session itself
  ConversationDelta append_user_message(Message msg);

  // Synthetic messages (aborted marker, spawn failure)
  ConversationDelta append_message(Message msg);

  // Finalize the open message without touching the state
  void close_open_message();

  void set_state(ConversationState state) {
    conversation_.state = state;
  }

  ConversationState state() const {
    return conversation_.state;
  }

  // Error -> Idle once the error has been surfaced
  void clear_error();

  // Replace everything, e.g. with a reloaded transcript
  void reset(Conversation conversation);

  const Conversation& conversation() const {
    return conversation_;
  }

  Conversation snapshot() const {
    return conversation_;
  }

  const std::optional<MessageId>& open_message_id() const {
    return open_message_id_;
  }

  // Agent-side session id announced by a Meta fragment
  const std::optional<std::string>& agent_session_id() const {
    return agent_session_id_;
  }

 private:
  Message* open_message();

  // Open message the fragment belongs to, starting a new one when ids differ
  Message& message_for(const std::optional<MessageId>& declared, ConversationDelta& delta);

  ConversationDelta apply_text(const Fragment& fragment, const TextFragment& text);
  ConversationDelta apply_tool_use(const Fragment& fragment, const ToolUseFragment& tool);
  ConversationDelta apply_tool_result(const Fragment& fragment, const ToolResultFragment& result);
  ConversationDelta apply_completion(const Fragment& fragment, const CompletionFragment& completion);
  ConversationDelta apply_error(const Fragment& fragment, const ErrorFragment& error);
  ConversationDelta apply_user(const Fragment& fragment, const UserMessageFragment& user);
  ConversationDelta apply_compact_boundary(const Fragment& fragment);
  ConversationDelta apply_compact_summary(const Fragment& fragment, const CompactSummaryFragment& summary);

  void finish_turn(ConversationDelta& delta);

  ConversationDelta none() const;

  Conversation conversation_;

  std::optional<MessageId> open_message_id_;
  bool open_is_provisional_ = false;

  // Declared by a message_start line before any fragment of the message
  std::optional<MessageId> pending_message_id_;

  // The turn was ended by an end_turn text block; the result line that
  // follows belongs to it and must not end the next turn
  bool awaiting_completion_ = false;

  std::set<ToolUseId> tool_use_ids_;
  std::optional<std::string> agent_session_id_;
};

}  // namespace warden
