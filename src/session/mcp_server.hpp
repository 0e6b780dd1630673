#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "process/subprocess.hpp"

namespace warden {

// Long-lived helper process started next to an agent
class McpServer {
 public:
  McpServer(McpServerConfig config, std::filesystem::path working_dir);
  ~McpServer();

  const std::string& name() const {
    return config_.name;
  }

  const McpServerConfig& config() const {
    return config_;
  }

  // No-op when already running or disabled. Throws ProcessError when the
  // helper cannot be spawned.
  void start();

  // No-op when not running
  void stop(std::chrono::milliseconds grace = std::chrono::milliseconds(1000));

  bool running();

  int start_count() const;

  int stop_count() const;

 private:
  McpServerConfig config_;
  std::filesystem::path working_dir_;

  mutable std::mutex mutex_;
  std::unique_ptr<Subprocess> process_;
  int start_count_ = 0;
  int stop_count_ = 0;
};

// The helpers of one session
class McpServerManager {
 public:
  McpServerManager(const std::vector<McpServerConfig>& configs, const std::filesystem::path& working_dir);

  // Starts every enabled helper that is not running. A helper that fails to
  // start is logged and skipped. Returns the number started.
  size_t start_all();

  void stop_all();

  McpServer* find(const std::string& name) const;

  const std::vector<std::unique_ptr<McpServer>>& servers() const {
    return servers_;
  }

 private:
  std::vector<std::unique_ptr<McpServer>> servers_;
};

}  // namespace warden
