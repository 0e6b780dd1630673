#include "protocol/control.hpp"

#include "core/errors.hpp"

namespace warden::protocol {

namespace {

std::string to_line(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

json attachment_block(const Attachment& attachment) {
  if (attachment.type == "image") {
    if (!attachment.content) {
      throw ProtocolError("Image attachment needs base64 content");
    }
    return {{"type", "image"},
            {"source", {{"type", "base64"}, {"media_type", attachment.mime_type.value_or("image/jpeg")}, {"data", *attachment.content}}}};
  }

  if (attachment.type == "document") {
    if (!attachment.content) {
      throw ProtocolError("Document attachment needs content");
    }
    json block = {{"type", "document"},
                  {"source", {{"type", "text"}, {"media_type", attachment.mime_type.value_or("text/plain")}, {"data", *attachment.content}}}};
    if (attachment.path) {
      block["title"] = *attachment.path;
    }
    return block;
  }

  return to_json(attachment);
}

}  // namespace

std::optional<ControlRequest> parse_control_request(const json& line) {
  if (!line.is_object()) {
    return std::nullopt;
  }
  auto request_id = line.find("request_id");
  auto request = line.find("request");
  if (request_id == line.end() || !request_id->is_string() || request == line.end() || !request->is_object()) {
    return std::nullopt;
  }

  ControlRequest result;
  result.request_id = request_id->get<std::string>();
  result.subtype = request->value("subtype", "");
  result.raw = *request;
  if (result.subtype.empty()) {
    return std::nullopt;
  }

  if (result.is_can_use_tool()) {
    result.tool_name = request->value("tool_name", "");
    if (request->contains("input") && (*request)["input"].is_object()) {
      result.input = (*request)["input"];
    }
    if (request->contains("tool_use_id") && (*request)["tool_use_id"].is_string()) {
      result.tool_use_id = (*request)["tool_use_id"].get<std::string>();
    }
    if (request->contains("permission_suggestions") && (*request)["permission_suggestions"].is_array()) {
      for (const auto& suggestion : (*request)["permission_suggestions"]) {
        if (suggestion.is_string()) {
          result.permission_suggestions.push_back(suggestion.get<std::string>());
        }
      }
    }
  }

  return result;
}

std::string encode_control_success(const std::string& request_id, const json& response) {
  json j = {{"type", "control_response"}, {"response", {{"subtype", "success"}, {"request_id", request_id}, {"response", response}}}};
  return to_line(j);
}

std::string encode_control_error(const std::string& request_id, const std::string& error) {
  json j = {{"type", "control_response"}, {"response", {{"subtype", "error"}, {"request_id", request_id}, {"error", error}}}};
  return to_line(j);
}

std::string encode_permission_allow(const std::string& request_id, const json& input) {
  return encode_control_success(request_id, {{"behavior", "allow"}, {"updatedInput", input}});
}

std::string encode_permission_deny(const std::string& request_id, const std::string& reason) {
  return encode_control_success(request_id, {{"behavior", "deny"}, {"message", reason}});
}

std::string encode_user_message(const std::string& text, const std::vector<Attachment>& attachments) {
  json content = json::array();
  content.push_back({{"type", "text"}, {"text", text}});
  for (const auto& attachment : attachments) {
    content.push_back(attachment_block(attachment));
  }

  json j = {{"type", "user"}, {"message", {{"role", "user"}, {"content", content}}}};
  return to_line(j);
}

}  // namespace warden::protocol
