#include "session/event_log.hpp"

#include "core/uuid.hpp"

namespace warden {

std::string to_string(EventType type) {
  switch (type) {
    case EventType::Connected:
      return "connected";
    case EventType::History:
      return "history";
    case EventType::Message:
      return "message";
    case EventType::Status:
      return "status";
    case EventType::ToolUse:
      return "tool-use";
    case EventType::ToolResult:
      return "tool-result";
    case EventType::PermissionRequest:
      return "permission-request";
    case EventType::PermissionTimeout:
      return "permission-timeout";
    case EventType::AgentSpawned:
      return "agent-spawned";
    case EventType::AgentTerminated:
      return "agent-terminated";
    case EventType::Done:
      return "done";
    case EventType::Aborted:
      return "aborted";
    case EventType::Error:
      return "error";
    case EventType::Unknown:
      return "unknown";
  }
  return "unknown";
}

json OutwardEvent::to_json() const {
  json j = {{"seq", seq},
            {"event-id", event_id},
            {"type", to_string(type)},
            {"timestamp", format_timestamp(timestamp)},
            {"agent-id", agent.id},
            {"agent-type", agent.type},
            {"agent-name", agent.name},
            {"data", data}};
  if (agent.task_name) {
    j["task-name"] = *agent.task_name;
  }
  return j;
}

EventLog::EventLog(size_t limit) : limit_(limit == 0 ? 1 : limit) {}

OutwardEvent EventLog::make_event(EventType type, const AgentInfo& agent, json data, uint64_t seq) const {
  OutwardEvent event;
  event.seq = seq;
  event.event_id = UUID::generate();
  event.timestamp = std::chrono::system_clock::now();
  event.type = type;
  event.agent = agent;
  event.data = data.is_null() ? json::object() : std::move(data);
  return event;
}

OutwardEvent EventLog::append(EventType type, const AgentInfo& agent, json data) {
  std::lock_guard lock(mutex_);
  auto event = make_event(type, agent, std::move(data), next_seq_++);
  events_.push_back(event);
  while (events_.size() > limit_) {
    events_.pop_front();
  }

  // Posted under the lock so every strand sees events in seq order
  if (!listeners_.empty()) {
    auto shared = std::make_shared<const OutwardEvent>(event);
    for (const auto& [id, entry] : listeners_) {
      asio::post(entry.strand, [callback = entry.callback, shared] {
        callback(*shared);
      });
    }
  }
  return event;
}

std::vector<OutwardEvent> EventLog::history_since(uint64_t seq) const {
  std::lock_guard lock(mutex_);
  std::vector<OutwardEvent> result;
  for (const auto& event : events_) {
    if (event.seq > seq) {
      result.push_back(event);
    }
  }
  return result;
}

uint64_t EventLog::last_seq() const {
  std::lock_guard lock(mutex_);
  return next_seq_ - 1;
}

size_t EventLog::size() const {
  std::lock_guard lock(mutex_);
  return events_.size();
}

OutwardEvent EventLog::connected_event(const AgentInfo& agent) const {
  auto seq = last_seq();
  return make_event(EventType::Connected, agent, {{"last-seq", seq}}, seq);
}

OutwardEvent EventLog::history_event(const AgentInfo& agent, const Conversation& conversation) const {
  auto seq = last_seq();
  json data = {{"last-seq", seq}, {"conversation", conversation.to_json()}};
  return make_event(EventType::History, agent, std::move(data), seq);
}

EventLog::ListenerId EventLog::subscribe(asio::any_io_executor executor, Listener listener) {
  std::lock_guard lock(mutex_);
  auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerEntry{asio::make_strand(std::move(executor)), std::move(listener)});
  return id;
}

void EventLog::unsubscribe(ListenerId id) {
  std::lock_guard lock(mutex_);
  listeners_.erase(id);
}

}  // namespace warden
