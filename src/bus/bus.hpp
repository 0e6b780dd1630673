#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <vector>

namespace warden {

// Type-safe in-process event bus
class Bus {
 public:
  using SubscriptionId = uint64_t;

  static Bus &instance();

  // Subscribe to events of type T
  template <typename T>
  SubscriptionId subscribe(std::function<void(const T &)> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    auto type_idx = std::type_index(typeid(T));

    handlers_[type_idx].push_back({id, [handler](const std::any &event) {
                                     handler(std::any_cast<const T &>(event));
                                   }});

    return id;
  }

  void unsubscribe(SubscriptionId id);

  // Handlers run on the publishing thread, outside the lock
  template <typename T>
  void publish(const T &event) {
    std::vector<std::function<void(const std::any &)>> to_call;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = handlers_.find(std::type_index(typeid(T)));
      if (it != handlers_.end()) {
        for (const auto &entry : it->second) {
          to_call.push_back(entry.handler);
        }
      }
    }

    std::any wrapped = event;
    for (const auto &handler : to_call) {
      handler(wrapped);
    }
  }

 private:
  Bus() = default;

  struct HandlerEntry {
    SubscriptionId id;
    std::function<void(const std::any &)> handler;
  };

  std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::map<std::type_index, std::vector<HandlerEntry>> handlers_;
};

namespace events {

struct SessionCreated {
  std::string session_id;
  std::string agent_name;
};

struct SessionClosed {
  std::string session_id;
};

struct StateChanged {
  std::string session_id;
  std::string state;
};

struct TurnCompleted {
  std::string session_id;
  int64_t total_tokens;
};

struct SessionAborted {
  std::string session_id;
};

struct PermissionDecided {
  std::string session_id;
  std::string tool_name;
  std::string decision;
  std::string reason;
};

struct McpServerStarted {
  std::string server_name;
  int pid;
};

struct McpServerStopped {
  std::string server_name;
};

}  // namespace events

}  // namespace warden
