#include "core/types.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace warden {

json to_json(const TokenUsage &usage) {
  return {{"input_tokens", usage.input_tokens},
          {"output_tokens", usage.output_tokens},
          {"cache_read_input_tokens", usage.cache_read_tokens},
          {"cache_creation_input_tokens", usage.cache_creation_tokens},
          {"total_cost_usd", usage.cost_usd}};
}

TokenUsage token_usage_from_json(const json &j) {
  TokenUsage usage;
  if (!j.is_object()) {
    return usage;
  }
  auto read_count = [&j](const char *key) -> int64_t {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return 0;
    return it->get<int64_t>();
  };
  usage.input_tokens = read_count("input_tokens");
  usage.output_tokens = read_count("output_tokens");
  usage.cache_read_tokens = read_count("cache_read_input_tokens");
  usage.cache_creation_tokens = read_count("cache_creation_input_tokens");
  auto cost = j.find("total_cost_usd");
  if (cost != j.end() && cost->is_number()) {
    usage.cost_usd = cost->get<double>();
  }
  return usage;
}

json to_json(const Attachment &attachment) {
  json j;
  j["type"] = attachment.type;
  if (attachment.path) j["path"] = *attachment.path;
  if (attachment.content) j["content"] = *attachment.content;
  if (attachment.mime_type) j["mime_type"] = *attachment.mime_type;
  return j;
}

std::string to_string(Role role) {
  switch (role) {
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::System:
      return "system";
  }
  return "assistant";
}

std::string to_string(MessageType type) {
  switch (type) {
    case MessageType::Normal:
      return "normal";
    case MessageType::CompactBoundary:
      return "compact_boundary";
    case MessageType::CompactSummary:
      return "compact_summary";
    case MessageType::Status:
      return "status";
    case MessageType::Meta:
      return "meta";
    case MessageType::Completion:
      return "completion";
    case MessageType::Error:
      return "error";
    case MessageType::Unknown:
      return "unknown";
    case MessageType::UserMessage:
      return "user_message";
  }
  return "unknown";
}

std::string to_string(ConversationState state) {
  switch (state) {
    case ConversationState::Idle:
      return "idle";
    case ConversationState::SendingMessage:
      return "sending_message";
    case ConversationState::Processing:
      return "processing";
    case ConversationState::ReceivingResponse:
      return "receiving_response";
    case ConversationState::Error:
      return "error";
  }
  return "idle";
}

std::string format_timestamp(Timestamp ts) {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count() % 1000;
  if (millis < 0) millis += 1000;
  std::time_t seconds = std::chrono::system_clock::to_time_t(ts);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

std::optional<Timestamp> parse_timestamp(const std::string &str) {
  std::tm utc{};
  std::istringstream in(str);
  in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  int64_t millis = 0;
  if (in.peek() == '.') {
    in.get();
    std::string digits;
    while (std::isdigit(in.peek())) {
      digits.push_back(static_cast<char>(in.get()));
    }
    digits.resize(3, '0');
    millis = std::stoll(digits.substr(0, 3));
  }

  auto ts = std::chrono::system_clock::from_time_t(timegm(&utc));
  return ts + std::chrono::milliseconds(millis);
}

}  // namespace warden
