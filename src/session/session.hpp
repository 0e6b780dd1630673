#pragma once

#include <array>
#include <asio.hpp>
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conversation/state_machine.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "permission/policy.hpp"
#include "process/subprocess.hpp"
#include "protocol/decoder.hpp"
#include "session/event_log.hpp"
#include "session/mcp_server.hpp"

namespace warden {

struct SessionOptions {
  std::string agent_name = "main";
  std::string agent_type = "main";
  std::optional<std::string> task_name;
  std::optional<AgentId> parent_id;

  // Working directory override; defaults to Config::working_dir
  std::optional<std::filesystem::path> working_dir;

  // Agent-side session id to resume on first spawn
  std::optional<std::string> resume_agent_session_id;

  // Appended to Config::agent_args
  std::vector<std::string> extra_args;
};

// What a permission handler is asked
struct PermissionRequest {
  std::string request_id;
  SessionId session_id;
  std::string tool_name;
  json input = json::object();
  std::string cwd;
  std::optional<std::string> inferred_pattern;
};

// What a permission handler answers
struct PermissionResponse {
  bool allow = false;

  // Store the inferred pattern so the same kind of call is not asked again
  bool remember = false;

  // Deny reason shown to the agent
  std::string message;

  // Replaces the tool input on allow
  std::optional<json> updated_input;
};

// One agent subprocess and the conversation decoded from it.
//
// All work is serialized on a strand: public operations post to it and
// return immediately. Observers receive Conversation snapshots on their own
// executors. Call close() before dropping the last reference.
class Session : public std::enable_shared_from_this<Session> {
 public:
  using Observer = std::function<void(const Conversation&)>;
  using ObserverId = uint64_t;
  using PermissionRespond = std::function<void(PermissionResponse)>;
  using PermissionHandler = std::function<void(const PermissionRequest&, PermissionRespond)>;

  // events may be shared with other sessions of a network; a private log is
  // created when null. store defaults to the shared store of the working
  // directory, or none when project settings are disabled.
  static std::shared_ptr<Session> create(asio::io_context& io_ctx, const Config& config, SessionOptions options = {},
                                         std::shared_ptr<EventLog> events = nullptr,
                                         std::shared_ptr<permission::PermissionStore> store = nullptr);

  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  const SessionId& id() const {
    return id_;
  }

  const AgentInfo& agent() const {
    return agent_;
  }

  const std::optional<AgentId>& parent_id() const {
    return options_.parent_id;
  }

  const std::filesystem::path& working_dir() const {
    return working_dir_;
  }

  ConversationState state() const {
    return state_.load();
  }

  bool is_aborting() const {
    return aborting_.load();
  }

  bool has_process() const {
    return has_process_.load();
  }

  bool is_closed() const {
    return closed_.load();
  }

  // Latest published snapshot
  Conversation conversation() const;

  // Agent-side session id learned from the init line
  std::optional<std::string> agent_session_id() const;

  std::optional<std::string> pending_message() const;

  const std::shared_ptr<EventLog>& events() const {
    return events_;
  }

  permission::PermissionPolicy& policy() {
    return policy_;
  }

  McpServerManager& mcp_servers() {
    return mcp_servers_;
  }

  // Start MCP helpers that are not running
  void start();

  // Blank text without attachments is ignored. Spawns the agent on first use.
  // While a turn is in flight the message replaces the single pending slot.
  void send_message(const std::string& text, std::vector<Attachment> attachments = {});

  // SIGTERM, then SIGKILL after the grace period; the conversation returns to
  // Idle with an "aborted" status message. A message queued before the abort is
  // discarded; one sent while it runs is dispatched once the session is Idle.
  void abort();

  // Stop the agent, reload the persisted transcript and resume the same
  // agent-side session
  void restart();

  // Stop the agent and MCP helpers; the session cannot be used afterwards
  void close();

  ObserverId subscribe(asio::any_io_executor executor, Observer observer);

  void unsubscribe(ObserverId id);

  // Invoked on the strand for decisions the policy cannot make alone
  void set_permission_handler(PermissionHandler handler);

 private:
  Session(asio::io_context& io_ctx, const Config& config, SessionOptions options, std::shared_ptr<EventLog> events,
          std::shared_ptr<permission::PermissionStore> store);

  struct PendingMessage {
    std::string text;
    std::vector<Attachment> attachments;
  };

  struct PendingPermission {
    PermissionRequest request;
    std::shared_ptr<asio::steady_timer> timer;
  };

  // Strand-only helpers
  void do_send(PendingMessage message);
  bool ensure_process();
  void spawn_process();
  void start_read();
  void handle_read(uint64_t generation, const asio::error_code& ec, size_t bytes);
  void handle_line(const std::string& line);
  void handle_process_exit();
  void handle_control_request(const protocol::ControlRequest& request);
  void handle_permission_response(const std::string& request_id, PermissionResponse response);
  void handle_permission_timeout(const std::string& request_id);
  void write_to_agent(const std::string& data);
  // SIGTERM, then poll every 20ms until the agent exits or abort_grace ends,
  // then SIGKILL and reap. done runs on the strand.
  void stop_process(std::function<void()> done);
  void wait_for_exit(uint64_t generation, std::chrono::steady_clock::time_point deadline, std::function<void()> done);
  void finish_abort(const std::optional<std::string>& discarded);
  void finish_restart();
  void teardown_process();
  void cancel_pending_permissions();
  void emit_fragment_events(const protocol::DecodedLine& line);
  void after_change(const ConversationDelta& delta);
  void fail_turn(const std::string& error);
  void set_state(ConversationState state);
  void dispatch_pending();
  void clear_pending();
  void broadcast();
  void emit(EventType type, json data = json::object());
  std::vector<std::string> agent_arguments() const;

  asio::strand<asio::io_context::executor_type> strand_;
  Config config_;
  SessionOptions options_;

  SessionId id_;
  AgentInfo agent_;
  std::filesystem::path working_dir_;

  std::atomic<ConversationState> state_{ConversationState::Idle};
  std::atomic<bool> aborting_{false};
  std::atomic<bool> has_process_{false};
  std::atomic<bool> closed_{false};

  ConversationStateMachine machine_;
  protocol::LineSplitter splitter_;

  std::unique_ptr<Subprocess> process_;
  std::unique_ptr<asio::posix::stream_descriptor> reader_;
  std::array<char, 8192> read_buffer_{};

  // Bumped on every spawn so handlers of a previous process are ignored
  uint64_t generation_ = 0;
  bool restarting_ = false;

  std::optional<PendingMessage> pending_;
  std::map<std::string, PendingPermission> pending_permissions_;
  PermissionHandler permission_handler_;

  permission::PermissionPolicy policy_;
  McpServerManager mcp_servers_;
  std::shared_ptr<EventLog> events_;

  // Readable from any thread
  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const Conversation> snapshot_;
  std::optional<std::string> agent_session_id_;
  std::optional<std::string> pending_text_;

  struct ObserverEntry {
    asio::any_io_executor executor;
    Observer callback;
  };

  mutable std::mutex observers_mutex_;
  ObserverId next_observer_id_ = 1;
  std::map<ObserverId, ObserverEntry> observers_;
};

}  // namespace warden
