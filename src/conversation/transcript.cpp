#include "conversation/transcript.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "protocol/decoder.hpp"

namespace warden {

namespace fs = std::filesystem;

TranscriptLoader::TranscriptLoader(fs::path root) : root_(std::move(root)) {
  if (root_.empty()) {
    root_ = config_paths::agent_home() / "projects";
  }
}

fs::path TranscriptLoader::transcript_path(const std::string& agent_session_id, const fs::path& project_dir) const {
  return root_ / config_paths::encode_project_path(project_dir) / (agent_session_id + ".jsonl");
}

bool TranscriptLoader::has_transcript(const std::string& agent_session_id, const fs::path& project_dir) const {
  std::error_code ec;
  return fs::exists(transcript_path(agent_session_id, project_dir), ec);
}

Conversation TranscriptLoader::load(const std::string& agent_session_id, const fs::path& project_dir) const {
  auto path = transcript_path(agent_session_id, project_dir);
  if (!has_transcript(agent_session_id, project_dir)) {
    throw TranscriptError("Transcript not found: " + path.string(), agent_session_id);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    throw TranscriptError("Cannot open transcript: " + path.string(), agent_session_id);
  }

  auto conversation = parse(file);
  spdlog::info("[Transcript] Loaded {} messages from {}", conversation.messages.size(), path.string());
  return conversation;
}

Conversation TranscriptLoader::parse(std::istream& in) {
  Conversation conversation;
  auto& messages = conversation.messages;
  std::optional<MessageId> last_assistant_id;
  std::optional<TokenUsage> last_usage;

  auto last_is_assistant = [&messages]() {
    return !messages.empty() && messages.back().role() == Role::Assistant && messages.back().type() == MessageType::Normal;
  };

  std::string line;
  while (std::getline(in, line)) {
    auto decoded = protocol::decode_line(line);
    if (decoded.fragments.empty()) continue;

    if (decoded.usage) {
      last_usage = decoded.usage;
    }

    for (const auto& fragment : decoded.fragments) {
      switch (fragment.kind()) {
        case FragmentKind::Status:
        case FragmentKind::Meta:
        case FragmentKind::Completion:
        case FragmentKind::Unknown:
          // Only meaningful while streaming
          break;

        case FragmentKind::ToolResult:
          if (last_is_assistant()) {
            messages.back().add_fragment(fragment);
          }
          break;

        case FragmentKind::Text:
        case FragmentKind::ToolUse:
          if (decoded.message_id && decoded.message_id == last_assistant_id && last_is_assistant()) {
            messages.back().add_fragment(fragment);
          } else {
            auto msg = Message::assistant(decoded.message_id.value_or(fragment.id));
            msg.set_timestamp(fragment.timestamp);
            msg.add_fragment(fragment);
            messages.push_back(std::move(msg));
            last_assistant_id = decoded.message_id;
          }
          break;

        case FragmentKind::Error: {
          Message msg(Role::Assistant, MessageType::Error, fragment.id);
          msg.add_fragment(fragment);
          msg.fail(fragment.as<ErrorFragment>()->message);
          messages.push_back(std::move(msg));
          break;
        }

        case FragmentKind::UserMessage: {
          Message msg(Role::User, MessageType::UserMessage, fragment.id);
          msg.set_timestamp(fragment.timestamp);
          msg.add_fragment(fragment);
          messages.push_back(std::move(msg));
          last_assistant_id.reset();
          break;
        }

        case FragmentKind::CompactSummary: {
          Message msg(Role::User, MessageType::CompactSummary, fragment.id);
          msg.set_compact_summary(true, fragment.as<CompactSummaryFragment>()->is_visible_in_transcript_only);
          msg.add_fragment(fragment);
          messages.push_back(std::move(msg));
          last_assistant_id.reset();
          break;
        }

        case FragmentKind::CompactBoundary: {
          Message msg(Role::System, MessageType::CompactBoundary, fragment.id);
          msg.set_timestamp(fragment.timestamp);
          msg.add_fragment(fragment);
          messages.push_back(std::move(msg));
          last_assistant_id.reset();
          break;
        }
      }
    }
  }

  for (auto& msg : messages) {
    msg.finalize();
  }

  if (last_usage) {
    conversation.current_context_input_tokens = last_usage->input_tokens;
    conversation.current_context_cache_read_tokens = last_usage->cache_read_tokens;
    conversation.current_context_cache_creation_tokens = last_usage->cache_creation_tokens;
  }
  conversation.state = ConversationState::Idle;
  return conversation;
}

}  // namespace warden
