#include "session/mcp_server.hpp"

#include <spdlog/spdlog.h>

#include "bus/bus.hpp"
#include "core/errors.hpp"

namespace warden {

McpServer::McpServer(McpServerConfig config, std::filesystem::path working_dir)
    : config_(std::move(config)), working_dir_(std::move(working_dir)) {}

McpServer::~McpServer() {
  stop(std::chrono::milliseconds(200));
}

void McpServer::start() {
  std::lock_guard lock(mutex_);
  if (!config_.enabled) return;
  if (process_ && process_->running()) return;

  ProcessSpec spec;
  spec.command = config_.command;
  spec.args = config_.args;
  spec.env = config_.env;
  spec.working_dir = working_dir_;
  spec.pipe_stdout = false;

  process_ = Subprocess::spawn(spec);
  ++start_count_;

  spdlog::info("[MCP] Started {} (pid {})", config_.name, process_->pid());
  Bus::instance().publish(events::McpServerStarted{config_.name, static_cast<int>(process_->pid())});
}

void McpServer::stop(std::chrono::milliseconds grace) {
  std::lock_guard lock(mutex_);
  if (!process_) return;

  int exit_code = process_->terminate(grace);
  process_.reset();
  ++stop_count_;

  spdlog::info("[MCP] Stopped {} (exit {})", config_.name, exit_code);
  Bus::instance().publish(events::McpServerStopped{config_.name});
}

bool McpServer::running() {
  std::lock_guard lock(mutex_);
  return process_ && process_->running();
}

int McpServer::start_count() const {
  std::lock_guard lock(mutex_);
  return start_count_;
}

int McpServer::stop_count() const {
  std::lock_guard lock(mutex_);
  return stop_count_;
}

McpServerManager::McpServerManager(const std::vector<McpServerConfig>& configs, const std::filesystem::path& working_dir) {
  for (const auto& config : configs) {
    servers_.push_back(std::make_unique<McpServer>(config, working_dir));
  }
}

size_t McpServerManager::start_all() {
  size_t started = 0;
  for (auto& server : servers_) {
    if (!server->config().enabled || server->running()) continue;
    try {
      server->start();
      ++started;
    } catch (const ProcessError& e) {
      spdlog::error("[MCP] Failed to start {}: {}", server->name(), e.what());
    }
  }
  return started;
}

void McpServerManager::stop_all() {
  for (auto& server : servers_) {
    server->stop();
  }
}

McpServer* McpServerManager::find(const std::string& name) const {
  for (const auto& server : servers_) {
    if (server->name() == name) return server.get();
  }
  return nullptr;
}

}  // namespace warden
