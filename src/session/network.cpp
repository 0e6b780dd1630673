#include "session/network.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "core/uuid.hpp"

namespace warden {

AgentNetwork::AgentNetwork(asio::io_context& io_ctx, Config config, std::string main_agent_name)
    : io_ctx_(io_ctx),
      config_(std::move(config)),
      id_(UUID::generate()),
      events_(std::make_shared<EventLog>(config_.event_history_limit)) {
  SessionOptions options;
  options.agent_name = std::move(main_agent_name);
  options.agent_type = "main";
  add_session(std::move(options));
  spdlog::info("[Network {}] Created in {}", id_, config_.working_dir.string());
}

AgentNetwork::~AgentNetwork() {
  shutdown();
}

std::shared_ptr<Session> AgentNetwork::add_session(SessionOptions options) {
  auto session = Session::create(io_ctx_, config_, std::move(options), events_);
  {
    std::lock_guard lock(mutex_);
    sessions_.push_back(session);
  }

  json data = {{"network-id", id_}};
  if (session->parent_id()) data["parent-id"] = *session->parent_id();
  events_->append(EventType::AgentSpawned, session->agent(), std::move(data));
  return session;
}

std::shared_ptr<Session> AgentNetwork::main_agent() const {
  std::lock_guard lock(mutex_);
  return sessions_.empty() ? nullptr : sessions_.front();
}

std::shared_ptr<Session> AgentNetwork::spawn_agent(const std::string& name, const std::string& type, std::optional<std::string> task_name,
                                                   std::optional<std::filesystem::path> working_dir) {
  auto main = main_agent();

  SessionOptions options;
  options.agent_name = name;
  options.agent_type = type;
  options.task_name = std::move(task_name);
  options.working_dir = std::move(working_dir);
  if (main) options.parent_id = main->id();

  auto session = add_session(std::move(options));
  spdlog::info("[Network {}] Spawned {} agent '{}' ({})", id_, type, name, session->id());
  return session;
}

bool AgentNetwork::terminate_agent(const AgentId& id) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(sessions_.begin(), sessions_.end(), [&](const auto& s) { return s->id() == id; });
    if (it == sessions_.end() || it == sessions_.begin()) {
      return false;
    }
    session = *it;
    sessions_.erase(it);
  }

  session->close();
  events_->append(EventType::AgentTerminated, session->agent(), {{"network-id", id_}});
  spdlog::info("[Network {}] Terminated agent {}", id_, id);
  return true;
}

std::shared_ptr<Session> AgentNetwork::find(const AgentId& id) const {
  std::lock_guard lock(mutex_);
  for (const auto& session : sessions_) {
    if (session->id() == id) return session;
  }
  return nullptr;
}

std::vector<std::shared_ptr<Session>> AgentNetwork::agents() const {
  std::lock_guard lock(mutex_);
  return sessions_;
}

void AgentNetwork::shutdown() {
  std::vector<std::shared_ptr<Session>> sessions;
  {
    std::lock_guard lock(mutex_);
    if (shut_down_) return;
    shut_down_ = true;
    sessions.swap(sessions_);
  }

  // Sub-agents first, the main agent last
  for (auto it = sessions.rbegin(); it != sessions.rend(); ++it) {
    (*it)->close();
    events_->append(EventType::AgentTerminated, (*it)->agent(), {{"network-id", id_}});
  }
  spdlog::info("[Network {}] Shut down {} agent(s)", id_, sessions.size());
}

}  // namespace warden
