#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace warden {

using json = nlohmann::json;

// Type aliases
using SessionId = std::string;
using MessageId = std::string;
using ToolUseId = std::string;
using AgentId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Token usage reported by the agent for one protocol line
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
  int64_t cache_read_tokens = 0;
  int64_t cache_creation_tokens = 0;
  double cost_usd = 0.0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  // All-zero counters mean "nothing reported"
  bool empty() const {
    return input_tokens == 0 && output_tokens == 0 && cache_read_tokens == 0 && cache_creation_tokens == 0 && cost_usd == 0.0;
  }

  TokenUsage &operator+=(const TokenUsage &other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    cache_read_tokens += other.cache_read_tokens;
    cache_creation_tokens += other.cache_creation_tokens;
    cost_usd += other.cost_usd;
    return *this;
  }
};

json to_json(const TokenUsage &usage);

TokenUsage token_usage_from_json(const json &j);

// File, image or document sent along with a user message
struct Attachment {
  std::string type;  // "file", "image" or "document"
  std::optional<std::string> path;
  std::optional<std::string> content;  // Base64 for images, text for documents
  std::optional<std::string> mime_type;

  static Attachment file(const std::string &path) {
    return Attachment{"file", path, std::nullopt, std::nullopt};
  }

  static Attachment image_base64(const std::string &data, const std::string &mime_type) {
    return Attachment{"image", std::nullopt, data, mime_type};
  }

  static Attachment document(const std::string &text, std::optional<std::string> title = std::nullopt) {
    return Attachment{"document", std::move(title), text, "text/plain"};
  }
};

json to_json(const Attachment &attachment);

// Message roles
enum class Role { User, Assistant, System };

std::string to_string(Role role);

// What a conversation message represents
enum class MessageType {
  Normal,
  CompactBoundary,
  CompactSummary,
  Status,
  Meta,
  Completion,
  Error,
  Unknown,
  UserMessage
};

std::string to_string(MessageType type);

// Lifecycle state shared by a conversation and the session driving it
enum class ConversationState {
  Idle,
  SendingMessage,
  Processing,
  ReceivingResponse,
  Error
};

std::string to_string(ConversationState state);

// ISO-8601 UTC with milliseconds, e.g. 2025-01-31T12:00:00.123Z
std::string format_timestamp(Timestamp ts);

std::optional<Timestamp> parse_timestamp(const std::string &str);

}  // namespace warden
