#include "conversation/state_machine.hpp"

#include <spdlog/spdlog.h>

#include <type_traits>

namespace warden {

std::string to_string(ConversationDelta::Kind kind) {
  switch (kind) {
    case ConversationDelta::Kind::None:
      return "none";
    case ConversationDelta::Kind::Appended:
      return "appended";
    case ConversationDelta::Kind::UpdatedLast:
      return "updated_last";
  }
  return "none";
}

ConversationStateMachine::ConversationStateMachine(Conversation initial) {
  reset(std::move(initial));
}

ConversationDelta ConversationStateMachine::none() const {
  ConversationDelta delta;
  delta.state = conversation_.state;
  return delta;
}

Message* ConversationStateMachine::open_message() {
  if (!open_message_id_) {
    return nullptr;
  }
  for (auto it = conversation_.messages.rbegin(); it != conversation_.messages.rend(); ++it) {
    if (it->id() == *open_message_id_) {
      if (it->is_complete()) break;
      return &*it;
    }
  }
  open_message_id_.reset();
  open_is_provisional_ = false;
  return nullptr;
}

Message& ConversationStateMachine::message_for(const std::optional<MessageId>& declared, ConversationDelta& delta) {
  if (auto* open = open_message()) {
    if (!declared || *declared == open->id()) {
      delta.kind = ConversationDelta::Kind::UpdatedLast;
      delta.message_id = open->id();
      return *open;
    }
    if (open_is_provisional_) {
      open->adopt_id(*declared);
      open_message_id_ = *declared;
      open_is_provisional_ = false;
      delta.kind = ConversationDelta::Kind::UpdatedLast;
      delta.message_id = open->id();
      return *open;
    }
    // A different message begins; the previous one is left as it was
    spdlog::debug("[Conversation] Message {} superseded by {}", open->id(), *declared);
  }

  conversation_.messages.push_back(Message::assistant(declared ? *declared : UUID::generate()));
  auto& msg = conversation_.messages.back();
  open_message_id_ = msg.id();
  open_is_provisional_ = !declared;
  delta.kind = ConversationDelta::Kind::Appended;
  delta.message_id = msg.id();
  return msg;
}

void ConversationStateMachine::finish_turn(ConversationDelta& delta) {
  if (auto* open = open_message()) {
    open->finalize();
  }
  open_message_id_.reset();
  open_is_provisional_ = false;
  pending_message_id_.reset();

  if (conversation_.state != ConversationState::Error) {
    conversation_.state = ConversationState::Idle;
  }
  delta.turn_completed = true;
}

ConversationDelta ConversationStateMachine::apply(const Fragment& fragment) {
  auto delta = std::visit(
      [this, &fragment](const auto& body) -> ConversationDelta {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, TextFragment>) {
          return apply_text(fragment, body);
        } else if constexpr (std::is_same_v<T, ToolUseFragment>) {
          return apply_tool_use(fragment, body);
        } else if constexpr (std::is_same_v<T, ToolResultFragment>) {
          return apply_tool_result(fragment, body);
        } else if constexpr (std::is_same_v<T, CompactBoundaryFragment>) {
          return apply_compact_boundary(fragment);
        } else if constexpr (std::is_same_v<T, CompactSummaryFragment>) {
          return apply_compact_summary(fragment, body);
        } else if constexpr (std::is_same_v<T, CompletionFragment>) {
          return apply_completion(fragment, body);
        } else if constexpr (std::is_same_v<T, ErrorFragment>) {
          return apply_error(fragment, body);
        } else if constexpr (std::is_same_v<T, UserMessageFragment>) {
          return apply_user(fragment, body);
        } else if constexpr (std::is_same_v<T, MetaFragment>) {
          if (body.conversation_id) {
            agent_session_id_ = body.conversation_id;
          }
          return none();
        } else if constexpr (std::is_same_v<T, StatusFragment>) {
          spdlog::debug("[Conversation] Status: {}", body.status);
          return none();
        } else {
          spdlog::debug("[Conversation] Ignoring unknown fragment {}", fragment.id);
          return none();
        }
      },
      fragment.body);

  if (fragment.usage) {
    apply_usage(*fragment.usage);
  }

  delta.state = conversation_.state;
  return delta;
}

ConversationDelta ConversationStateMachine::apply(const protocol::DecodedLine& line) {
  if (line.message_id && line.fragments.empty()) {
    pending_message_id_ = line.message_id;
  }

  auto result = none();
  for (const auto& fragment : line.fragments) {
    auto delta = apply(fragment);
    if (delta.kind == ConversationDelta::Kind::Appended) {
      result.kind = delta.kind;
    } else if (delta.changed() && result.kind == ConversationDelta::Kind::None) {
      result.kind = delta.kind;
    }
    if (delta.message_id) result.message_id = delta.message_id;
    result.turn_completed = result.turn_completed || delta.turn_completed;
    result.orphan_recorded = result.orphan_recorded || delta.orphan_recorded;
  }

  if (line.usage && line.fragments.empty()) {
    apply_usage(*line.usage);
  }

  result.state = conversation_.state;
  return result;
}

void ConversationStateMachine::apply_usage(const TokenUsage& usage) {
  conversation_.total_input_tokens += usage.input_tokens;
  conversation_.total_output_tokens += usage.output_tokens;
  conversation_.total_cache_read_tokens += usage.cache_read_tokens;
  conversation_.total_cache_creation_tokens += usage.cache_creation_tokens;
  conversation_.total_cost_usd += usage.cost_usd;

  conversation_.current_context_input_tokens = usage.input_tokens;
  conversation_.current_context_cache_read_tokens = usage.cache_read_tokens;
  conversation_.current_context_cache_creation_tokens = usage.cache_creation_tokens;
}

ConversationDelta ConversationStateMachine::apply_text(const Fragment& fragment, const TextFragment& text) {
  auto delta = none();
  awaiting_completion_ = false;
  auto& msg = message_for(fragment.message_id ? fragment.message_id : pending_message_id_, delta);
  msg.add_fragment(fragment);
  msg.set_streaming(true);
  conversation_.state = ConversationState::ReceivingResponse;

  if (text.stop_reason && *text.stop_reason == "end_turn") {
    finish_turn(delta);
    awaiting_completion_ = true;
  }
  return delta;
}

ConversationDelta ConversationStateMachine::apply_tool_use(const Fragment& fragment, const ToolUseFragment& tool) {
  auto delta = none();
  awaiting_completion_ = false;
  auto& msg = message_for(fragment.message_id ? fragment.message_id : pending_message_id_, delta);
  msg.add_fragment(fragment);
  msg.set_streaming(true);
  tool_use_ids_.insert(tool.tool_use_id);
  conversation_.state = ConversationState::Processing;
  return delta;
}

ConversationDelta ConversationStateMachine::apply_tool_result(const Fragment& fragment, const ToolResultFragment& result) {
  auto delta = none();
  awaiting_completion_ = false;

  Fragment recorded = fragment;
  if (!tool_use_ids_.count(result.tool_use_id)) {
    spdlog::warn("[Conversation] Tool result for unknown tool use {}", result.tool_use_id);
    recorded.as<ToolResultFragment>()->orphaned = true;
    delta.orphan_recorded = true;
  }

  auto& msg = message_for(std::nullopt, delta);
  msg.add_fragment(std::move(recorded));
  conversation_.state = ConversationState::Processing;
  return delta;
}

ConversationDelta ConversationStateMachine::apply_completion(const Fragment& fragment, const CompletionFragment& completion) {
  auto delta = none();
  if (awaiting_completion_ && !open_message()) {
    // Usage is still applied by the caller
    awaiting_completion_ = false;
    spdlog::debug("[Conversation] Completion {} closes a turn already ended", fragment.id);
    return delta;
  }
  awaiting_completion_ = false;

  if (auto* open = open_message()) {
    open->add_fragment(fragment);
    delta.kind = ConversationDelta::Kind::UpdatedLast;
    delta.message_id = open->id();
  }

  if (completion.stop_reason == "tool_use") {
    if (auto* open = open_message()) {
      open->set_streaming(true);
    }
    conversation_.state = ConversationState::Processing;
    return delta;
  }

  finish_turn(delta);
  return delta;
}

ConversationDelta ConversationStateMachine::apply_error(const Fragment& fragment, const ErrorFragment& error) {
  auto delta = none();
  awaiting_completion_ = false;
  spdlog::warn("[Conversation] Agent error: {}", error.message);

  if (auto* open = open_message()) {
    open->add_fragment(fragment);
    open->fail(error.message);
    delta.kind = ConversationDelta::Kind::UpdatedLast;
    delta.message_id = open->id();
  } else {
    Message msg(Role::Assistant, MessageType::Error, fragment.id);
    msg.add_fragment(fragment);
    msg.fail(error.message);
    conversation_.messages.push_back(std::move(msg));
    delta.kind = ConversationDelta::Kind::Appended;
    delta.message_id = fragment.id;
  }

  open_message_id_.reset();
  open_is_provisional_ = false;
  pending_message_id_.reset();
  conversation_.current_error = error.message;
  conversation_.state = ConversationState::Error;
  return delta;
}

ConversationDelta ConversationStateMachine::apply_user(const Fragment& fragment, const UserMessageFragment& user) {
  if (user.is_replay) {
    for (auto it = conversation_.messages.rbegin(); it != conversation_.messages.rend(); ++it) {
      if (it->type() == MessageType::UserMessage && it->text() == user.content) {
        return none();
      }
    }
  }

  Message msg(Role::User, MessageType::UserMessage, fragment.id);
  msg.set_timestamp(fragment.timestamp);
  msg.add_fragment(fragment);
  msg.finalize();
  return append_message(std::move(msg));
}

ConversationDelta ConversationStateMachine::apply_compact_boundary(const Fragment& fragment) {
  Message msg(Role::System, MessageType::CompactBoundary, fragment.id);
  msg.set_timestamp(fragment.timestamp);
  msg.add_fragment(fragment);
  msg.finalize();
  return append_message(std::move(msg));
}

ConversationDelta ConversationStateMachine::apply_compact_summary(const Fragment& fragment, const CompactSummaryFragment& summary) {
  Message msg(Role::User, MessageType::CompactSummary, fragment.id);
  msg.set_compact_summary(true, summary.is_visible_in_transcript_only);
  msg.set_timestamp(fragment.timestamp);
  msg.add_fragment(fragment);
  msg.finalize();
  return append_message(std::move(msg));
}

ConversationDelta ConversationStateMachine::append_user_message(Message msg) {
  conversation_.current_error.reset();
  return append_message(std::move(msg));
}

ConversationDelta ConversationStateMachine::append_message(Message msg) {
  auto delta = none();
  delta.kind = ConversationDelta::Kind::Appended;
  delta.message_id = msg.id();
  for (const auto& fragment : msg.fragments()) {
    if (auto* tool = fragment.as<ToolUseFragment>()) {
      tool_use_ids_.insert(tool->tool_use_id);
    }
  }
  conversation_.messages.push_back(std::move(msg));
  return delta;
}

void ConversationStateMachine::close_open_message() {
  if (auto* open = open_message()) {
    open->finalize();
  }
  open_message_id_.reset();
  open_is_provisional_ = false;
  pending_message_id_.reset();
  awaiting_completion_ = false;
}

void ConversationStateMachine::clear_error() {
  if (conversation_.state == ConversationState::Error) {
    conversation_.state = ConversationState::Idle;
  }
}

void ConversationStateMachine::reset(Conversation conversation) {
  conversation_ = std::move(conversation);
  open_message_id_.reset();
  open_is_provisional_ = false;
  pending_message_id_.reset();
  awaiting_completion_ = false;
  tool_use_ids_.clear();

  for (const auto& msg : conversation_.messages) {
    for (const auto& fragment : msg.fragments()) {
      if (auto* tool = fragment.as<ToolUseFragment>()) {
        tool_use_ids_.insert(tool->tool_use_id);
      }
    }
  }
}

}  // namespace warden
