#include "protocol/decoder.hpp"

#include <spdlog/spdlog.h>

#include "core/text.hpp"
#include "core/uuid.hpp"

namespace warden::protocol {

namespace {

std::string string_field(const json& j, const char* key, const std::string& fallback = "") {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return fallback;
  return it->get<std::string>();
}

std::optional<std::string> optional_string(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

bool bool_field(const json& j, const char* camel, const char* snake, bool fallback) {
  for (const char* key : {camel, snake}) {
    auto it = j.find(key);
    if (it != j.end() && it->is_boolean()) return it->get<bool>();
  }
  return fallback;
}

json decode_entities_deep(const json& value) {
  if (value.is_string()) {
    return text::decode_html_entities(value.get<std::string>());
  }
  if (value.is_object() || value.is_array()) {
    json result = value;
    for (auto& item : result) {
      item = decode_entities_deep(item);
    }
    return result;
  }
  return value;
}

// String content, or the concatenated text blocks of an array
std::string content_text(const json& content) {
  if (content.is_string()) {
    return content.get<std::string>();
  }
  std::string result;
  if (content.is_array()) {
    for (const auto& block : content) {
      if (block.is_object() && string_field(block, "type") == "text") {
        result += string_field(block, "text");
      }
    }
  }
  return result;
}

Fragment make_fragment(std::string id, FragmentBody body) {
  Fragment fragment;
  fragment.id = id.empty() ? UUID::with_prefix("frag_") : std::move(id);
  fragment.body = std::move(body);
  return fragment;
}

const json* message_object(const json& line) {
  auto it = line.find("message");
  if (it == line.end() || !it->is_object()) return nullptr;
  return &*it;
}

void decode_user(const json& line, DecodedLine& out) {
  if (bool_field(line, "isMeta", "is_meta", false)) {
    return;
  }

  const json* message = message_object(line);
  if (!message) {
    out.fragments.push_back(make_fragment(string_field(line, "uuid"), UnknownFragment{line}));
    return;
  }

  auto uuid = string_field(line, "uuid");
  const json empty = json::array();
  const json& content = message->contains("content") ? (*message)["content"] : empty;

  if (bool_field(line, "isCompactSummary", "is_compact_summary", false)) {
    CompactSummaryFragment summary;
    summary.content = content_text(content);
    summary.is_visible_in_transcript_only = bool_field(line, "isVisibleInTranscriptOnly", "is_visible_in_transcript_only", true);
    out.fragments.push_back(make_fragment(uuid, std::move(summary)));
    return;
  }

  if (content.is_array()) {
    size_t index = 0;
    for (const auto& block : content) {
      if (!block.is_object() || string_field(block, "type") != "tool_result") {
        ++index;
        continue;
      }
      ToolResultFragment result;
      result.tool_use_id = string_field(block, "tool_use_id", string_field(block, "id"));
      result.content = text::decode_html_entities(block.contains("content") ? content_text(block["content"]) : "");
      result.is_error = block.value("is_error", false);
      auto id = uuid.empty() ? std::string() : uuid + "-" + std::to_string(index);
      out.fragments.push_back(make_fragment(id, std::move(result)));
      ++index;
    }
    if (!out.fragments.empty()) {
      return;
    }
  }

  UserMessageFragment user;
  user.content = content_text(content);
  user.is_replay = bool_field(line, "isReplay", "is_replay", false);
  auto fragment = make_fragment(uuid, std::move(user));
  if (auto ts = optional_string(line, "timestamp")) {
    if (auto parsed = parse_timestamp(*ts)) fragment.timestamp = *parsed;
  }
  out.fragments.push_back(std::move(fragment));
}

void decode_assistant(const json& line, DecodedLine& out) {
  const json* message = message_object(line);
  if (!message) {
    // Bare assistant text
    TextFragment text;
    text.content = text::decode_html_entities(content_text(line.value("content", json())));
    text.is_cumulative = true;
    if (!text.content.empty()) {
      out.fragments.push_back(make_fragment(string_field(line, "uuid"), std::move(text)));
    }
    return;
  }

  out.message_id = optional_string(*message, "id");
  auto base_id = string_field(line, "uuid", out.message_id.value_or(""));
  auto stop_reason = optional_string(*message, "stop_reason");

  const json empty = json::array();
  const json& content = message->contains("content") ? (*message)["content"] : empty;

  if (content.is_string()) {
    TextFragment text;
    text.content = text::decode_html_entities(content.get<std::string>());
    text.is_cumulative = true;
    if (!text.content.empty()) {
      out.fragments.push_back(make_fragment(base_id, std::move(text)));
    }
  } else if (content.is_array()) {
    size_t index = 0;
    for (const auto& block : content) {
      auto block_id = base_id.empty() ? std::string() : base_id + "-" + std::to_string(index++);
      if (!block.is_object()) continue;

      auto block_type = string_field(block, "type");
      if (block_type == "text") {
        TextFragment text;
        text.content = text::decode_html_entities(string_field(block, "text"));
        // Full text of this block, not a delta
        text.is_cumulative = true;
        if (!text.content.empty()) {
          out.fragments.push_back(make_fragment(block_id, std::move(text)));
        }
      } else if (block_type == "tool_use") {
        ToolUseFragment tool;
        tool.tool_name = text::decode_html_entities(string_field(block, "name"));
        if (block.contains("input") && block["input"].is_object()) {
          tool.parameters = decode_entities_deep(block["input"]);
        }
        tool.tool_use_id = string_field(block, "id");
        out.fragments.push_back(make_fragment(string_field(block, "id", block_id), std::move(tool)));
      }
      // thinking and other blocks carry nothing for the conversation
    }
  }

  if (stop_reason) {
    for (auto it = out.fragments.rbegin(); it != out.fragments.rend(); ++it) {
      if (auto* text = it->as<TextFragment>()) {
        text->stop_reason = stop_reason;
        break;
      }
    }
  }
}

void decode_system(const json& line, DecodedLine& out) {
  auto subtype = string_field(line, "subtype");
  auto uuid = string_field(line, "uuid");

  if (subtype == "compact_boundary") {
    const json* metadata = nullptr;
    for (const char* key : {"compactMetadata", "compact_metadata"}) {
      auto it = line.find(key);
      if (it != line.end() && it->is_object()) {
        metadata = &*it;
        break;
      }
    }

    CompactBoundaryFragment boundary;
    boundary.trigger = string_field(metadata ? *metadata : json::object(), "trigger", string_field(line, "trigger", "auto"));
    for (const json* source : {metadata, &line}) {
      if (!source) continue;
      bool found = false;
      for (const char* key : {"preTokens", "pre_tokens"}) {
        auto it = source->find(key);
        if (it != source->end() && it->is_number_integer()) {
          boundary.pre_tokens = it->get<int64_t>();
          found = true;
          break;
        }
      }
      if (found) break;
    }

    auto fragment = make_fragment(uuid, std::move(boundary));
    if (auto ts = optional_string(line, "timestamp")) {
      if (auto parsed = parse_timestamp(*ts)) fragment.timestamp = *parsed;
    }
    out.fragments.push_back(std::move(fragment));
    return;
  }

  if (subtype == "init") {
    MetaFragment meta;
    meta.conversation_id = optional_string(line, "session_id");
    meta.metadata = line;
    out.fragments.push_back(make_fragment(uuid, std::move(meta)));
    return;
  }

  StatusFragment status;
  status.status = subtype.empty() ? string_field(line, "status", "unknown") : subtype;
  status.message = optional_string(line, "message");
  out.fragments.push_back(make_fragment(uuid, std::move(status)));
}

void decode_result(const json& line, DecodedLine& out) {
  auto uuid = string_field(line, "uuid");
  auto subtype = string_field(line, "subtype");

  CompletionFragment completion;
  completion.stop_reason = subtype == "success" ? "end_turn" : "error";
  completion.usage = extract_usage(line).value_or(TokenUsage{});

  if (line.value("is_error", false)) {
    ErrorFragment error;
    error.message = string_field(line, "result", "Agent reported an error");
    error.code = subtype.empty() ? std::nullopt : std::optional<std::string>(subtype);
    out.fragments.push_back(make_fragment(uuid.empty() ? "" : uuid + "-error", std::move(error)));
  }

  out.fragments.push_back(make_fragment(uuid, std::move(completion)));
}

void decode_stream_event(const json& line, DecodedLine& out) {
  auto event = line.find("event");
  if (event == line.end() || !event->is_object()) {
    return;
  }

  auto event_type = string_field(*event, "type");
  if (event_type == "message_start") {
    auto message = event->find("message");
    if (message != event->end() && message->is_object()) {
      out.message_id = optional_string(*message, "id");
    }
    return;
  }

  if (event_type == "content_block_delta") {
    auto delta = event->find("delta");
    if (delta == event->end() || !delta->is_object()) return;
    auto text = string_field(*delta, "text");
    if (text.empty()) return;

    TextFragment fragment;
    fragment.content = text;
    fragment.is_partial = true;
    out.fragments.push_back(make_fragment(string_field(line, "uuid"), std::move(fragment)));
  }
}

void decode_generic(const std::string& type, const json& line, DecodedLine& out) {
  auto id = string_field(line, "id", string_field(line, "uuid"));

  if (type == "error") {
    ErrorFragment error;
    error.message = string_field(line, "error", string_field(line, "message", "Unknown error"));
    if (line.contains("error") && line["error"].is_object()) {
      error.message = string_field(line["error"], "message", "Unknown error");
    }
    error.details = optional_string(line, "details");
    if (!error.details) error.details = optional_string(line, "description");
    error.code = optional_string(line, "code");
    out.fragments.push_back(make_fragment(id, std::move(error)));
  } else if (type == "status") {
    StatusFragment status;
    status.status = string_field(line, "status", "unknown");
    status.message = optional_string(line, "message");
    out.fragments.push_back(make_fragment(id, std::move(status)));
  } else if (type == "meta") {
    MetaFragment meta;
    meta.conversation_id = optional_string(line, "conversation_id");
    meta.metadata = line.contains("metadata") ? line["metadata"] : line;
    out.fragments.push_back(make_fragment(id, std::move(meta)));
  } else if (type == "text" || type == "message") {
    TextFragment text;
    text.content = text::decode_html_entities(line.contains("content") ? content_text(line["content"]) : string_field(line, "text"));
    text.is_partial = line.value("partial", false);
    out.fragments.push_back(make_fragment(id, std::move(text)));
  } else if (type == "completion") {
    CompletionFragment completion;
    completion.stop_reason = string_field(line, "stop_reason", "end_turn");
    completion.usage = extract_usage(line).value_or(TokenUsage{});
    out.fragments.push_back(make_fragment(id, std::move(completion)));
  } else {
    out.fragments.push_back(make_fragment(id, UnknownFragment{line}));
  }
}

}  // namespace

std::optional<TokenUsage> extract_usage(const json& line) {
  if (!line.is_object()) {
    return std::nullopt;
  }

  TokenUsage usage;
  const json* message = message_object(line);
  if (message && message->contains("usage") && (*message)["usage"].is_object()) {
    usage = token_usage_from_json((*message)["usage"]);
  } else if (line.contains("usage") && line["usage"].is_object()) {
    usage = token_usage_from_json(line["usage"]);
  }

  auto cost = line.find("total_cost_usd");
  if (cost != line.end() && cost->is_number()) {
    usage.cost_usd = cost->get<double>();
  }

  if (usage.empty()) {
    return std::nullopt;
  }
  return usage;
}

DecodedLine decode_object(const json& line) {
  DecodedLine out;
  if (!line.is_object()) {
    return out;
  }

  auto type_it = line.find("type");
  if (type_it == line.end() || !type_it->is_string()) {
    return out;
  }
  out.type = type_it->get<std::string>();

  if (out.type == "user") {
    decode_user(line, out);
  } else if (out.type == "assistant") {
    decode_assistant(line, out);
  } else if (out.type == "system") {
    decode_system(line, out);
  } else if (out.type == "result") {
    decode_result(line, out);
  } else if (out.type == "stream_event") {
    decode_stream_event(line, out);
  } else if (out.type == "control_request") {
    out.control_request = parse_control_request(line);
    if (!out.control_request) {
      spdlog::warn("[Decoder] control_request without request_id or subtype");
    }
    return out;
  } else if (out.type == "control_response") {
    spdlog::debug("[Decoder] control_response for {}", line.contains("response") ? line["response"].value("request_id", "?") : "?");
    return out;
  } else {
    decode_generic(out.type, line, out);
  }

  if (out.type != "stream_event") {
    out.usage = extract_usage(line);
  }
  if (out.usage && !out.fragments.empty()) {
    out.fragments.back().usage = out.usage;
  }

  for (auto& fragment : out.fragments) {
    if (out.message_id && fragment.is_assistant_bound()) {
      fragment.message_id = out.message_id;
    }
  }

  return out;
}

DecodedLine decode_line(std::string_view raw) {
  if (text::is_blank(raw)) {
    return {};
  }

  auto sanitized = text::sanitize_utf8(raw);
  auto parsed = json::parse(sanitized, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    DecodedLine out;
    if (sanitized.find("\"type\"") != std::string::npos) {
      out.malformed = true;
      out.raw = sanitized;
      spdlog::warn("[Decoder] Skipping unparseable line: {:.200}", sanitized);
    } else {
      spdlog::debug("[Decoder] Ignoring non-protocol output: {:.200}", sanitized);
    }
    return out;
  }

  try {
    return decode_object(parsed);
  } catch (const json::exception& e) {
    // A field of an unexpected JSON type
    spdlog::warn("[Decoder] Skipping line with unexpected field types: {}", e.what());
    DecodedLine out;
    out.malformed = true;
    out.raw = sanitized;
    return out;
  }
}

std::vector<std::string> LineSplitter::feed(std::string_view chunk) {
  std::vector<std::string> lines;
  buffer_.append(chunk.data(), chunk.size());

  size_t start = 0;
  while (true) {
    auto newline = buffer_.find('\n', start);
    if (newline == std::string::npos) break;

    auto line = buffer_.substr(start, newline - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    start = newline + 1;
  }

  buffer_.erase(0, start);
  return lines;
}

std::optional<std::string> LineSplitter::flush() {
  if (buffer_.empty()) {
    return std::nullopt;
  }
  std::string rest = std::move(buffer_);
  buffer_.clear();
  return rest;
}

}  // namespace warden::protocol
