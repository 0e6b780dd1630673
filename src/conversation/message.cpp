#include "conversation/message.hpp"

#include <map>

namespace warden {

Message::Message(Role role, MessageType type, MessageId id) : id_(std::move(id)), role_(role), type_(type) {}

Message Message::user(const std::string& text, std::vector<Attachment> attachments) {
  Message msg(Role::User, MessageType::UserMessage);
  Fragment fragment;
  fragment.id = msg.id_;
  fragment.body = UserMessageFragment{text, false};
  msg.fragments_.push_back(std::move(fragment));
  msg.attachments_ = std::move(attachments);
  msg.complete_ = true;
  return msg;
}

Message Message::assistant(MessageId id) {
  Message msg(Role::Assistant, MessageType::Normal, std::move(id));
  msg.streaming_ = true;
  return msg;
}

Message Message::status(const std::string& text) {
  Message msg(Role::System, MessageType::Status);
  Fragment fragment;
  fragment.id = msg.id_;
  fragment.body = StatusFragment{text, std::nullopt};
  msg.fragments_.push_back(std::move(fragment));
  msg.complete_ = true;
  return msg;
}

Message Message::error(const std::string& text) {
  Message msg(Role::Assistant, MessageType::Error);
  Fragment fragment;
  fragment.id = msg.id_;
  fragment.body = ErrorFragment{text, std::nullopt, std::nullopt};
  msg.fragments_.push_back(std::move(fragment));
  msg.error_ = text;
  msg.complete_ = true;
  return msg;
}

bool Message::add_fragment(Fragment fragment) {
  if (complete_) {
    return false;
  }
  fragments_.push_back(std::move(fragment));
  return true;
}

void Message::finalize() {
  streaming_ = false;
  complete_ = true;
}

void Message::fail(const std::string& error) {
  if (complete_) {
    return;
  }
  error_ = error;
  finalize();
}

std::string Message::text(TextMergeMode mode) const {
  std::string result;
  std::string segment;
  bool seen_partial = false;

  auto flush = [&]() {
    if (!segment.empty()) {
      if (!result.empty()) result += "\n";
      result += segment;
    }
    segment.clear();
    if (mode == TextMergeMode::PerSegment) {
      seen_partial = false;
    }
  };

  for (const auto& fragment : fragments_) {
    if (auto* text = fragment.as<TextFragment>()) {
      if (text->is_partial) {
        seen_partial = true;
        segment += text->content;
      } else if (text->is_cumulative) {
        // A snapshot would duplicate deltas already appended
        if (!seen_partial) {
          segment = text->content;
        }
      } else {
        segment += text->content;
      }
    } else if (auto* user = fragment.as<UserMessageFragment>()) {
      segment += user->content;
    } else if (auto* summary = fragment.as<CompactSummaryFragment>()) {
      segment += summary->content;
    } else {
      flush();
    }
  }
  flush();

  return result;
}

bool Message::has_tool_use(const ToolUseId& id) const {
  for (const auto& fragment : fragments_) {
    if (auto* tool = fragment.as<ToolUseFragment>()) {
      if (tool->tool_use_id == id) return true;
    }
  }
  return false;
}

std::vector<ToolInvocation> Message::tool_invocations() const {
  std::map<ToolUseId, const ToolResultFragment*> results;
  for (const auto& fragment : fragments_) {
    if (auto* result = fragment.as<ToolResultFragment>()) {
      results.emplace(result->tool_use_id, result);
    }
  }

  std::vector<ToolInvocation> invocations;
  for (const auto& fragment : fragments_) {
    auto* tool = fragment.as<ToolUseFragment>();
    if (!tool) continue;

    ToolInvocation invocation{tool->tool_use_id, tool->tool_name, tool->parameters, std::nullopt};
    auto it = results.find(tool->tool_use_id);
    if (it != results.end()) {
      invocation.result = *it->second;
    }
    invocations.push_back(std::move(invocation));
  }
  return invocations;
}

std::vector<ToolResultFragment> Message::orphaned_results() const {
  std::vector<ToolResultFragment> orphans;
  for (const auto& fragment : fragments_) {
    auto* result = fragment.as<ToolResultFragment>();
    if (result && result->orphaned) {
      orphans.push_back(*result);
    }
  }
  return orphans;
}

json Message::to_json() const {
  json j;
  j["id"] = id_;
  j["role"] = to_string(role_);
  j["message_type"] = to_string(type_);
  j["timestamp"] = format_timestamp(timestamp_);
  j["content"] = text();
  j["is_streaming"] = streaming_;
  j["is_complete"] = complete_;

  if (compact_summary_) {
    j["is_compact_summary"] = true;
    j["is_visible_in_transcript_only"] = visible_in_transcript_only_;
  }
  if (error_) {
    j["error"] = *error_;
  }

  json fragments_json = json::array();
  for (const auto& fragment : fragments_) {
    fragments_json.push_back(fragment.to_json());
  }
  j["fragments"] = fragments_json;

  if (!attachments_.empty()) {
    json attachments_json = json::array();
    for (const auto& attachment : attachments_) {
      attachments_json.push_back(warden::to_json(attachment));
    }
    j["attachments"] = attachments_json;
  }

  return j;
}

}  // namespace warden
