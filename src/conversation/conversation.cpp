#include "conversation/conversation.hpp"

#include <map>

namespace warden {

const Message* Conversation::find_message(const MessageId& id) const {
  for (const auto& msg : messages) {
    if (msg.id() == id) return &msg;
  }
  return nullptr;
}

std::vector<ToolInvocation> Conversation::tool_invocations() const {
  std::map<ToolUseId, const ToolResultFragment*> results;
  for (const auto& msg : messages) {
    for (const auto& fragment : msg.fragments()) {
      if (auto* result = fragment.as<ToolResultFragment>()) {
        results.emplace(result->tool_use_id, result);
      }
    }
  }

  std::vector<ToolInvocation> invocations;
  for (const auto& msg : messages) {
    for (const auto& fragment : msg.fragments()) {
      auto* tool = fragment.as<ToolUseFragment>();
      if (!tool) continue;

      ToolInvocation invocation{tool->tool_use_id, tool->tool_name, tool->parameters, std::nullopt};
      auto it = results.find(tool->tool_use_id);
      if (it != results.end()) {
        invocation.result = *it->second;
      }
      invocations.push_back(std::move(invocation));
    }
  }
  return invocations;
}

std::optional<ToolInvocation> Conversation::find_invocation(const ToolUseId& id) const {
  for (auto& invocation : tool_invocations()) {
    if (invocation.tool_use_id == id) {
      return invocation;
    }
  }
  return std::nullopt;
}

bool Conversation::has_tool_use(const ToolUseId& id) const {
  for (const auto& msg : messages) {
    if (msg.has_tool_use(id)) return true;
  }
  return false;
}

json Conversation::to_json() const {
  json j;
  j["state"] = to_string(state);

  json messages_json = json::array();
  for (const auto& msg : messages) {
    messages_json.push_back(msg.to_json());
  }
  j["messages"] = messages_json;

  j["total_input_tokens"] = total_input_tokens;
  j["total_output_tokens"] = total_output_tokens;
  j["total_cache_read_tokens"] = total_cache_read_tokens;
  j["total_cache_creation_tokens"] = total_cache_creation_tokens;
  j["total_cost_usd"] = total_cost_usd;
  j["current_context_input_tokens"] = current_context_input_tokens;
  j["current_context_cache_read_tokens"] = current_context_cache_read_tokens;
  j["current_context_cache_creation_tokens"] = current_context_cache_creation_tokens;
  if (current_error) {
    j["current_error"] = *current_error;
  }
  return j;
}

}  // namespace warden
