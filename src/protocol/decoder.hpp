#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/types.hpp"
#include "protocol/control.hpp"
#include "protocol/fragment.hpp"

namespace warden::protocol {

// Everything one line of agent output carries
struct DecodedLine {
  std::vector<Fragment> fragments;

  // Usage side channel; also attached to the last fragment
  std::optional<TokenUsage> usage;

  std::optional<ControlRequest> control_request;

  // Assistant message id declared by the line (message.id or a message_start event)
  std::optional<MessageId> message_id;

  std::string type;

  // Looked like protocol output but did not parse
  bool malformed = false;
  std::string raw;

  bool empty() const {
    return fragments.empty() && !usage && !control_request && !message_id;
  }
};

// Decode one line. Never throws; malformed input yields no fragments.
DecodedLine decode_line(std::string_view raw);

// Decode an already parsed line object
DecodedLine decode_object(const json& line);

// message.usage, else top-level usage, plus total_cost_usd; nullopt when all zero
std::optional<TokenUsage> extract_usage(const json& line);

// Reassembles newline-delimited lines from arbitrary read chunks
class LineSplitter {
 public:
  // Complete lines found so far, without the newline or a trailing \r
  std::vector<std::string> feed(std::string_view chunk);

  // Whatever is left once the stream has ended
  std::optional<std::string> flush();

  size_t buffered() const {
    return buffer_.size();
  }

 private:
  std::string buffer_;
};

}  // namespace warden::protocol
