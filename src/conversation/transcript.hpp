#pragma once

#include <filesystem>
#include <istream>
#include <string>

#include "conversation/conversation.hpp"

namespace warden {

// Rebuilds a Conversation from the JSONL transcript the agent persists:
//   <root>/<encoded project path>/<agent session id>.jsonl
class TranscriptLoader {
 public:
  // root defaults to ~/.claude/projects
  explicit TranscriptLoader(std::filesystem::path root = {});

  std::filesystem::path transcript_path(const std::string& agent_session_id, const std::filesystem::path& project_dir) const;

  bool has_transcript(const std::string& agent_session_id, const std::filesystem::path& project_dir) const;

  // Throws TranscriptError when the file is missing or unreadable
  Conversation load(const std::string& agent_session_id, const std::filesystem::path& project_dir) const;

  // Unreadable lines are skipped
  static Conversation parse(std::istream& in);

 private:
  std::filesystem::path root_;
};

}  // namespace warden
