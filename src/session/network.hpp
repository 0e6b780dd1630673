#pragma once

#include <asio.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "session/event_log.hpp"
#include "session/session.hpp"

namespace warden {

// A main agent and the sub-agents spawned for it. All sessions of a network
// share one event log. Destroying the network terminates every session.
class AgentNetwork {
 public:
  AgentNetwork(asio::io_context& io_ctx, Config config, std::string main_agent_name = "main");
  ~AgentNetwork();

  AgentNetwork(const AgentNetwork&) = delete;
  AgentNetwork& operator=(const AgentNetwork&) = delete;

  const std::string& id() const {
    return id_;
  }

  const std::shared_ptr<EventLog>& events() const {
    return events_;
  }

  std::shared_ptr<Session> main_agent() const;

  // Start a sub-agent whose parent is the main agent
  std::shared_ptr<Session> spawn_agent(const std::string& name, const std::string& type, std::optional<std::string> task_name = std::nullopt,
                                       std::optional<std::filesystem::path> working_dir = std::nullopt);

  // Close a sub-agent; false for unknown ids and the main agent
  bool terminate_agent(const AgentId& id);

  std::shared_ptr<Session> find(const AgentId& id) const;

  std::vector<std::shared_ptr<Session>> agents() const;

  // Close every session; idempotent
  void shutdown();

 private:
  std::shared_ptr<Session> add_session(SessionOptions options);

  asio::io_context& io_ctx_;
  Config config_;
  std::string id_;
  std::shared_ptr<EventLog> events_;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Session>> sessions_;
  bool shut_down_ = false;
};

}  // namespace warden
