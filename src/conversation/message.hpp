#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "core/uuid.hpp"
#include "protocol/fragment.hpp"

namespace warden {

// How long a partial text fragment suppresses cumulative snapshots
enum class TextMergeMode {
  PerSegment,  // Until the next non-text fragment
  PerMessage   // For the rest of the message
};

// A ToolUse paired with its result, if one arrived
struct ToolInvocation {
  ToolUseId tool_use_id;
  std::string tool_name;
  json parameters = json::object();
  std::optional<ToolResultFragment> result;

  bool has_result() const {
    return result.has_value();
  }

  bool is_error() const {
    return result && result->is_error;
  }

  std::string result_content() const {
    return result ? result->content : std::string();
  }
};

class Message {
 public:
  Message() = default;
  Message(Role role, MessageType type, MessageId id = UUID::generate());

  // Factory methods
  static Message user(const std::string& text, std::vector<Attachment> attachments = {});
  static Message assistant(MessageId id = UUID::generate());
  static Message status(const std::string& text);
  static Message error(const std::string& text);

  // Accessors
  const MessageId& id() const {
    return id_;
  }

  // A provisional message takes the id the agent declares later
  void adopt_id(MessageId id) {
    id_ = std::move(id);
  }

  Role role() const {
    return role_;
  }

  MessageType type() const {
    return type_;
  }

  Timestamp timestamp() const {
    return timestamp_;
  }

  void set_timestamp(Timestamp ts) {
    timestamp_ = ts;
  }

  const std::vector<Fragment>& fragments() const {
    return fragments_;
  }

  bool is_streaming() const {
    return streaming_;
  }

  void set_streaming(bool streaming) {
    if (!complete_) streaming_ = streaming;
  }

  // Once complete the message no longer changes
  bool is_complete() const {
    return complete_;
  }

  const std::vector<Attachment>& attachments() const {
    return attachments_;
  }

  const std::optional<std::string>& error_text() const {
    return error_;
  }

  bool is_compact_summary() const {
    return compact_summary_;
  }

  bool is_visible_in_transcript_only() const {
    return visible_in_transcript_only_;
  }

  void set_compact_summary(bool summary, bool visible_in_transcript_only) {
    compact_summary_ = summary;
    visible_in_transcript_only_ = visible_in_transcript_only;
  }

  // False when the message is already complete
  bool add_fragment(Fragment fragment);

  void finalize();

  // Records the error and finalizes
  void fail(const std::string& error);

  // Rendered text content
  std::string text(TextMergeMode mode = TextMergeMode::PerSegment) const;

  bool has_tool_use(const ToolUseId& id) const;

  std::vector<ToolInvocation> tool_invocations() const;

  std::vector<ToolResultFragment> orphaned_results() const;

  json to_json() const;

 private:
  MessageId id_;
  Role role_ = Role::Assistant;
  MessageType type_ = MessageType::Normal;
  Timestamp timestamp_ = std::chrono::system_clock::now();

  std::vector<Fragment> fragments_;
  std::vector<Attachment> attachments_;
  std::optional<std::string> error_;

  bool streaming_ = false;
  bool complete_ = false;
  bool compact_summary_ = false;
  bool visible_in_transcript_only_ = false;
};

}  // namespace warden
