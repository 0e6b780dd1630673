#pragma once

#include <asio.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conversation/conversation.hpp"
#include "core/types.hpp"

namespace warden {

enum class EventType {
  Connected,
  History,
  Message,
  Status,
  ToolUse,
  ToolResult,
  PermissionRequest,
  PermissionTimeout,
  AgentSpawned,
  AgentTerminated,
  Done,
  Aborted,
  Error,
  Unknown
};

// "permission-request", "agent-spawned", ...
std::string to_string(EventType type);

// Which agent an event is about
struct AgentInfo {
  AgentId id;
  std::string type = "main";
  std::string name;
  std::optional<std::string> task_name;
};

struct OutwardEvent {
  uint64_t seq = 0;
  std::string event_id;
  Timestamp timestamp;
  EventType type = EventType::Unknown;
  AgentInfo agent;
  json data = json::object();

  json to_json() const;
};

// Sequenced record of everything observers of a network are told. Keeps the
// last `limit` events so a reconnecting client can replay what it missed.
// Thread safe.
class EventLog {
 public:
  using Listener = std::function<void(const OutwardEvent&)>;
  using ListenerId = uint64_t;

  explicit EventLog(size_t limit = 1000);

  // Assigns the next seq, records and delivers the event
  OutwardEvent append(EventType type, const AgentInfo& agent, json data = json::object());

  // Recorded events with seq greater than `seq`, oldest first
  std::vector<OutwardEvent> history_since(uint64_t seq) const;

  std::vector<OutwardEvent> history() const {
    return history_since(0);
  }

  uint64_t last_seq() const;

  size_t size() const;

  // Reconnection handshake. Neither event is recorded; both carry the
  // current last_seq so the client knows where replay starts.
  OutwardEvent connected_event(const AgentInfo& agent) const;

  OutwardEvent history_event(const AgentInfo& agent, const Conversation& conversation) const;

  // The listener is posted to a strand over `executor` for every appended
  // event, in seq order; append() never waits for it
  ListenerId subscribe(asio::any_io_executor executor, Listener listener);

  void unsubscribe(ListenerId id);

 private:
  OutwardEvent make_event(EventType type, const AgentInfo& agent, json data, uint64_t seq) const;

  size_t limit_;

  mutable std::mutex mutex_;
  std::deque<OutwardEvent> events_;
  uint64_t next_seq_ = 1;

  struct ListenerEntry {
    asio::strand<asio::any_io_executor> strand;
    Listener callback;
  };

  ListenerId next_listener_id_ = 1;
  std::map<ListenerId, ListenerEntry> listeners_;
};

}  // namespace warden
