#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace warden::protocol {

// Request the agent sends before it acts, e.g. can_use_tool
struct ControlRequest {
  std::string request_id;
  std::string subtype;

  // can_use_tool
  std::string tool_name;
  json input = json::object();
  std::optional<ToolUseId> tool_use_id;
  std::vector<std::string> permission_suggestions;

  json raw;

  bool is_can_use_tool() const {
    return subtype == "can_use_tool";
  }
};

// Parse a control_request object; nullopt when request_id or subtype is missing
std::optional<ControlRequest> parse_control_request(const json& line);

// Encoders for lines written to the agent's stdin, newline included

std::string encode_control_success(const std::string& request_id, const json& response);

std::string encode_control_error(const std::string& request_id, const std::string& error);

std::string encode_permission_allow(const std::string& request_id, const json& input);

std::string encode_permission_deny(const std::string& request_id, const std::string& reason);

// Throws ProtocolError for an image or document attachment without content
std::string encode_user_message(const std::string& text, const std::vector<Attachment>& attachments = {});

}  // namespace warden::protocol
