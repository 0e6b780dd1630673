#include "session/session.hpp"

#include <signal.h>
#include <spdlog/spdlog.h>

#include "bus/bus.hpp"
#include "conversation/transcript.hpp"
#include "core/errors.hpp"
#include "core/text.hpp"
#include "core/uuid.hpp"
#include "protocol/control.hpp"

namespace warden {

namespace {

std::shared_ptr<permission::PermissionStore> default_store(const Config& config, const std::filesystem::path& working_dir) {
  if (!config.permissions.load_project_settings) {
    return nullptr;
  }
  return permission::PermissionStore::for_project(working_dir);
}

}  // namespace

Session::Session(asio::io_context& io_ctx, const Config& config, SessionOptions options, std::shared_ptr<EventLog> events,
                 std::shared_ptr<permission::PermissionStore> store)
    : strand_(asio::make_strand(io_ctx)),
      config_(config),
      options_(std::move(options)),
      id_(UUID::generate()),
      working_dir_(options_.working_dir.value_or(config.working_dir)),
      policy_(config.permissions, store ? std::move(store) : default_store(config, working_dir_)),
      mcp_servers_(config.mcp_servers, working_dir_),
      events_(events ? std::move(events) : std::make_shared<EventLog>(config.event_history_limit)),
      snapshot_(std::make_shared<const Conversation>()) {
  agent_.id = id_;
  agent_.type = options_.agent_type;
  agent_.name = options_.agent_name;
  agent_.task_name = options_.task_name;
  agent_session_id_ = options_.resume_agent_session_id;
}

Session::~Session() {
  cancel_pending_permissions();
  reader_.reset();
  if (process_) {
    process_->terminate(std::chrono::milliseconds(0));
  }
}

std::shared_ptr<Session> Session::create(asio::io_context& io_ctx, const Config& config, SessionOptions options,
                                         std::shared_ptr<EventLog> events, std::shared_ptr<permission::PermissionStore> store) {
  auto session = std::shared_ptr<Session>(new Session(io_ctx, config, std::move(options), std::move(events), std::move(store)));

  spdlog::info("[Session {}] Created {} agent '{}' in {}", session->id_, session->agent_.type, session->agent_.name,
               session->working_dir_.string());
  Bus::instance().publish(events::SessionCreated{session->id_, session->agent_.name});

  session->start();
  return session;
}

Conversation Session::conversation() const {
  std::lock_guard lock(snapshot_mutex_);
  return *snapshot_;
}

std::optional<std::string> Session::agent_session_id() const {
  std::lock_guard lock(snapshot_mutex_);
  return agent_session_id_;
}

std::optional<std::string> Session::pending_message() const {
  std::lock_guard lock(snapshot_mutex_);
  return pending_text_;
}

void Session::start() {
  asio::post(strand_, [self = shared_from_this()] {
    if (self->closed_) return;
    auto started = self->mcp_servers_.start_all();
    if (started > 0) {
      spdlog::info("[Session {}] Started {} MCP server(s)", self->id_, started);
    }
  });
}

// ============================================================================
// Sending
// ============================================================================

void Session::send_message(const std::string& text, std::vector<Attachment> attachments) {
  if (text::is_blank(text) && attachments.empty()) {
    return;
  }

  asio::post(strand_, [self = shared_from_this(), message = PendingMessage{text, std::move(attachments)}]() mutable {
    if (self->closed_) {
      spdlog::warn("[Session {}] Ignoring message sent to a closed session", self->id_);
      return;
    }

    if (self->aborting_ || self->restarting_ || self->machine_.state() != ConversationState::Idle) {
      // Single slot: a newer message replaces the queued one
      if (self->pending_) {
        spdlog::debug("[Session {}] Replacing pending message", self->id_);
      }
      {
        std::lock_guard lock(self->snapshot_mutex_);
        self->pending_text_ = message.text;
      }
      self->pending_ = std::move(message);
      return;
    }

    self->do_send(std::move(message));
  });
}

void Session::do_send(PendingMessage message) {
  machine_.append_user_message(Message::user(message.text, message.attachments));
  emit(EventType::Message, {{"role", "user"}, {"content", message.text}});

  if (!ensure_process()) {
    return;
  }

  std::string line;
  try {
    line = protocol::encode_user_message(message.text, message.attachments);
  } catch (const ProtocolError& e) {
    fail_turn(e.what());
    return;
  }

  set_state(ConversationState::SendingMessage);
  try {
    write_to_agent(line);
  } catch (const ProcessError& e) {
    fail_turn(std::string("Failed to send message: ") + e.what());
    return;
  }
  set_state(ConversationState::Processing);
}

std::vector<std::string> Session::agent_arguments() const {
  auto args = config_.agent_args;
  if (config_.model) {
    args.push_back("--model");
    args.push_back(*config_.model);
  }

  std::optional<std::string> resume;
  {
    std::lock_guard lock(snapshot_mutex_);
    resume = agent_session_id_;
  }
  if (resume) {
    args.push_back("--resume");
    args.push_back(*resume);
  }

  args.insert(args.end(), options_.extra_args.begin(), options_.extra_args.end());
  return args;
}

bool Session::ensure_process() {
  if (process_ && process_->running()) {
    return true;
  }
  if (process_) {
    // Exited since the last turn
    teardown_process();
  }

  try {
    spawn_process();
  } catch (const ProcessError& e) {
    spdlog::error("[Session {}] Failed to start agent: {}", id_, e.what());
    fail_turn(std::string("Failed to start agent: ") + e.what());
    return false;
  }
  return true;
}

void Session::spawn_process() {
  ProcessSpec spec;
  spec.command = config_.agent_command;
  spec.args = agent_arguments();
  spec.env = config_.agent_env;
  spec.working_dir = working_dir_;

  process_ = Subprocess::spawn(spec);
  ++generation_;
  splitter_ = protocol::LineSplitter();
  reader_ = std::make_unique<asio::posix::stream_descriptor>(strand_, process_->release_stdout());
  has_process_ = true;

  spdlog::info("[Session {}] Agent started (pid {})", id_, process_->pid());
  start_read();
}

void Session::write_to_agent(const std::string& data) {
  if (!process_) {
    throw ProcessError("Agent is not running");
  }
  process_->write(data);
}

// ============================================================================
// Reading
// ============================================================================

void Session::start_read() {
  if (!reader_) return;

  auto generation = generation_;
  reader_->async_read_some(asio::buffer(read_buffer_),
                           asio::bind_executor(strand_, [self = shared_from_this(), generation](const asio::error_code& ec, size_t bytes) {
                             self->handle_read(generation, ec, bytes);
                           }));
}

void Session::handle_read(uint64_t generation, const asio::error_code& ec, size_t bytes) {
  if (generation != generation_) {
    return;
  }

  if (bytes > 0) {
    for (const auto& line : splitter_.feed(std::string_view(read_buffer_.data(), bytes))) {
      handle_line(line);
      if (generation != generation_) return;
    }
  }

  if (ec) {
    if (ec != asio::error::operation_aborted) {
      if (auto rest = splitter_.flush()) {
        handle_line(*rest);
      }
      handle_process_exit();
    }
    return;
  }

  start_read();
}

void Session::handle_line(const std::string& line) {
  // Output after an abort, restart or close belongs to the process being torn down
  if (aborting_ || restarting_ || closed_) {
    return;
  }

  auto decoded = protocol::decode_line(line);
  if (decoded.malformed) {
    emit(EventType::Unknown, {{"raw", decoded.raw}});
    return;
  }

  if (decoded.control_request) {
    handle_control_request(*decoded.control_request);
  }

  if (decoded.fragments.empty() && !decoded.usage && !decoded.message_id) {
    return;
  }

  auto delta = machine_.apply(decoded);

  if (machine_.agent_session_id()) {
    std::lock_guard lock(snapshot_mutex_);
    if (agent_session_id_ != machine_.agent_session_id()) {
      agent_session_id_ = machine_.agent_session_id();
      spdlog::info("[Session {}] Agent session id {}", id_, *agent_session_id_);
    }
  }

  emit_fragment_events(decoded);
  after_change(delta);
}

void Session::emit_fragment_events(const protocol::DecodedLine& line) {
  for (const auto& fragment : line.fragments) {
    if (const auto* text = fragment.as<TextFragment>()) {
      if (text->content.empty()) continue;
      json data = {{"role", "assistant"}, {"content", text->content}, {"is-partial", text->is_partial}, {"is-cumulative", text->is_cumulative}};
      if (fragment.message_id) data["message-id"] = *fragment.message_id;
      emit(EventType::Message, std::move(data));
    } else if (const auto* tool = fragment.as<ToolUseFragment>()) {
      emit(EventType::ToolUse, {{"tool-use-id", tool->tool_use_id}, {"tool-name", tool->tool_name}, {"parameters", tool->parameters}});
    } else if (const auto* result = fragment.as<ToolResultFragment>()) {
      bool orphaned = !machine_.conversation().has_tool_use(result->tool_use_id);
      emit(EventType::ToolResult,
           {{"tool-use-id", result->tool_use_id}, {"content", result->content}, {"is-error", result->is_error}, {"orphaned", orphaned}});
    } else if (const auto* unknown = fragment.as<UnknownFragment>()) {
      emit(EventType::Unknown, {{"raw", unknown->raw}});
    }
  }
}

void Session::after_change(const ConversationDelta& delta) {
  auto previous = state_.load();
  auto current = machine_.state();
  if (current != previous) {
    set_state(current);
  } else if (delta.changed() || delta.turn_completed) {
    broadcast();
  }

  if (current == ConversationState::Error) {
    auto error = machine_.conversation().current_error.value_or("Unknown error");
    emit(EventType::Error, {{"message", error}});

    // Surfaced; back to Idle
    machine_.clear_error();
    set_state(ConversationState::Idle);
    dispatch_pending();
    return;
  }

  if (delta.turn_completed) {
    const auto& conversation = machine_.conversation();
    json data = {{"total-tokens", conversation.total_tokens()}, {"current-context-tokens", conversation.current_context_tokens()},
                 {"total-cost-usd", conversation.total_cost_usd}};
    if (delta.message_id) data["message-id"] = *delta.message_id;
    emit(EventType::Done, std::move(data));
    Bus::instance().publish(events::TurnCompleted{id_, conversation.total_tokens()});
    dispatch_pending();
  }
}

void Session::fail_turn(const std::string& error) {
  Fragment fragment;
  fragment.id = UUID::with_prefix("frag_");
  fragment.body = ErrorFragment{error, std::nullopt, std::nullopt};
  after_change(machine_.apply(fragment));
}

void Session::handle_process_exit() {
  std::optional<int> exit_code;
  if (process_) {
    process_->close_stdin();
    process_->running();
    exit_code = process_->exit_code();
  }
  teardown_process();

  if (aborting_ || restarting_ || closed_) {
    return;
  }

  spdlog::warn("[Session {}] Agent exited (code {})", id_, exit_code.value_or(-1));

  if (machine_.state() != ConversationState::Idle) {
    fail_turn("Agent process exited unexpectedly (code " + std::to_string(exit_code.value_or(-1)) + ")");
  }
}

void Session::teardown_process() {
  ++generation_;
  cancel_pending_permissions();

  if (reader_) {
    asio::error_code ignored;
    reader_->close(ignored);
    reader_.reset();
  }
  if (process_) {
    // Reaps at once; stop_process() has already given the agent its grace period
    int exit_code = process_->terminate(std::chrono::milliseconds(0));
    spdlog::debug("[Session {}] Agent pid {} finished with {}", id_, process_->pid(), exit_code);
    process_.reset();
  }
  has_process_ = false;
}

// ============================================================================
// Abort / restart / close
// ============================================================================

void Session::abort() {
  asio::post(strand_, [self = shared_from_this()] {
    if (!self->process_ || self->aborting_ || self->restarting_ || self->closed_) {
      return;
    }

    spdlog::info("[Session {}] Aborting", self->id_);
    self->aborting_ = true;
    self->cancel_pending_permissions();

    // A message queued before the abort belongs to the aborted turn
    std::optional<std::string> discarded;
    if (self->pending_) {
      discarded = self->pending_->text;
      self->clear_pending();
      spdlog::info("[Session {}] Discarding message queued before the abort", self->id_);
    }

    self->stop_process([self, discarded = std::move(discarded)] {
      self->finish_abort(discarded);
    });
  });
}

void Session::stop_process(std::function<void()> done) {
  if (!process_) {
    done();
    return;
  }

  process_->close_stdin();
  process_->signal(SIGTERM);
  wait_for_exit(generation_, std::chrono::steady_clock::now() + config_.abort_grace, std::move(done));
}

void Session::wait_for_exit(uint64_t generation, std::chrono::steady_clock::time_point deadline, std::function<void()> done) {
  bool same_process = generation == generation_ && process_;
  if (same_process && process_->running() && std::chrono::steady_clock::now() < deadline) {
    auto timer = std::make_shared<asio::steady_timer>(strand_, std::chrono::milliseconds(20));
    timer->async_wait([self = shared_from_this(), timer, generation, deadline, done = std::move(done)](const asio::error_code& ec) mutable {
      if (!ec) {
        self->wait_for_exit(generation, deadline, std::move(done));
      }
    });
    return;
  }

  if (same_process) {
    if (process_->running()) {
      spdlog::warn("[Session {}] Agent ignored SIGTERM, sending SIGKILL", id_);
    }
    teardown_process();
  }
  done();
}

void Session::finish_abort(const std::optional<std::string>& discarded) {
  if (closed_) {
    return;
  }

  machine_.close_open_message();
  machine_.append_message(Message::status("aborted"));
  machine_.set_state(ConversationState::Idle);
  aborting_ = false;

  set_state(ConversationState::Idle);
  broadcast();

  json data = json::object();
  if (discarded) data["discarded-message"] = *discarded;
  emit(EventType::Aborted, std::move(data));
  Bus::instance().publish(events::SessionAborted{id_});

  // Sent while the abort was in progress
  dispatch_pending();
}

void Session::restart() {
  asio::post(strand_, [self = shared_from_this()] {
    if (self->closed_ || self->restarting_) return;

    spdlog::info("[Session {}] Restarting", self->id_);
    self->restarting_ = true;
    self->cancel_pending_permissions();
    self->clear_pending();
    self->stop_process([self] {
      self->finish_restart();
    });
  });
}

void Session::finish_restart() {
  if (closed_) return;

  restarting_ = false;
  aborting_ = false;

  auto resume = agent_session_id();
  if (resume) {
    TranscriptLoader loader(config_.transcript_root.value_or(std::filesystem::path()));
    try {
      machine_.reset(loader.load(*resume, working_dir_));
      spdlog::info("[Session {}] Reloaded {} messages from transcript", id_, machine_.conversation().messages.size());
    } catch (const TranscriptError& e) {
      spdlog::warn("[Session {}] Keeping in-memory conversation: {}", id_, e.what());
    }
  }
  machine_.set_state(ConversationState::Idle);
  set_state(ConversationState::Idle);
  broadcast();

  try {
    spawn_process();
  } catch (const ProcessError& e) {
    spdlog::error("[Session {}] Failed to restart agent: {}", id_, e.what());
    fail_turn(std::string("Failed to start agent: ") + e.what());
    return;
  }
  dispatch_pending();
}

void Session::close() {
  if (closed_.exchange(true)) {
    return;
  }

  asio::post(strand_, [self = shared_from_this()] {
    self->cancel_pending_permissions();
    self->clear_pending();
    self->stop_process([self] {
      self->mcp_servers_.stop_all();
      spdlog::info("[Session {}] Closed", self->id_);
      Bus::instance().publish(events::SessionClosed{self->id_});
    });
  });
}

// ============================================================================
// Permissions
// ============================================================================

void Session::set_permission_handler(PermissionHandler handler) {
  asio::post(strand_, [self = shared_from_this(), handler = std::move(handler)]() mutable {
    self->permission_handler_ = std::move(handler);
  });
}

void Session::handle_control_request(const protocol::ControlRequest& request) {
  auto reply = [this](const std::string& line) {
    try {
      write_to_agent(line);
    } catch (const ProcessError& e) {
      spdlog::warn("[Session {}] Failed to answer control request: {}", id_, e.what());
    }
  };

  if (!request.is_can_use_tool()) {
    spdlog::debug("[Session {}] Acknowledging control request {}", id_, request.subtype);
    reply(protocol::encode_control_success(request.request_id, json::object()));
    return;
  }

  auto decision = policy_.check_permission(request.tool_name, request.input, working_dir_.string());
  spdlog::debug("[Session {}] {} -> {} ({})", id_, request.tool_name, permission::to_string(decision.kind), decision.reason);
  Bus::instance().publish(events::PermissionDecided{id_, request.tool_name, permission::to_string(decision.kind), decision.reason});

  switch (decision.kind) {
    case permission::DecisionKind::Allow:
      reply(protocol::encode_permission_allow(request.request_id, request.input));
      return;
    case permission::DecisionKind::Deny:
      reply(protocol::encode_permission_deny(request.request_id, decision.reason));
      return;
    case permission::DecisionKind::Ask:
      break;
  }

  if (!permission_handler_) {
    spdlog::warn("[Session {}] No permission handler, denying {}", id_, request.tool_name);
    reply(protocol::encode_permission_deny(request.request_id, "Permission requires approval"));
    return;
  }

  PermissionRequest pending_request;
  pending_request.request_id = request.request_id;
  pending_request.session_id = id_;
  pending_request.tool_name = request.tool_name;
  pending_request.input = request.input;
  pending_request.cwd = working_dir_.string();
  pending_request.inferred_pattern = decision.inferred_pattern;

  PendingPermission pending{pending_request, nullptr};
  if (config_.permissions.prompt_timeout.count() > 0) {
    pending.timer = std::make_shared<asio::steady_timer>(strand_);
    pending.timer->expires_after(config_.permissions.prompt_timeout);
    pending.timer->async_wait([self = shared_from_this(), request_id = request.request_id](const asio::error_code& ec) {
      if (!ec) {
        self->handle_permission_timeout(request_id);
      }
    });
  }
  pending_permissions_[request.request_id] = std::move(pending);

  emit(EventType::PermissionRequest, {{"request-id", request.request_id},
                                      {"tool-name", request.tool_name},
                                      {"input", request.input},
                                      {"inferred-pattern", decision.inferred_pattern.value_or("")}});

  auto respond = [self = shared_from_this(), request_id = request.request_id](PermissionResponse response) {
    asio::post(self->strand_, [self, request_id, response = std::move(response)]() mutable {
      self->handle_permission_response(request_id, std::move(response));
    });
  };
  permission_handler_(pending_request, std::move(respond));
}

void Session::handle_permission_response(const std::string& request_id, PermissionResponse response) {
  auto it = pending_permissions_.find(request_id);
  if (it == pending_permissions_.end()) {
    spdlog::debug("[Session {}] Late permission response for {}", id_, request_id);
    return;
  }

  auto pending = std::move(it->second);
  pending_permissions_.erase(it);
  if (pending.timer) {
    pending.timer->cancel();
  }

  const auto& request = pending.request;
  std::string line;
  if (response.allow) {
    if (response.remember) {
      auto pattern = policy_.remember(request.tool_name, request.input);
      spdlog::info("[Session {}] Remembered {}", id_, pattern);
    }
    line = protocol::encode_permission_allow(request_id, response.updated_input.value_or(request.input));
  } else {
    auto reason = response.message.empty() ? std::string("Permission denied by user") : response.message;
    line = protocol::encode_permission_deny(request_id, reason);
  }

  try {
    write_to_agent(line);
  } catch (const ProcessError& e) {
    spdlog::warn("[Session {}] Failed to answer permission request: {}", id_, e.what());
  }
}

void Session::handle_permission_timeout(const std::string& request_id) {
  auto it = pending_permissions_.find(request_id);
  if (it == pending_permissions_.end()) {
    return;
  }
  auto request = std::move(it->second.request);
  pending_permissions_.erase(it);

  spdlog::warn("[Session {}] Permission request for {} timed out", id_, request.tool_name);
  emit(EventType::PermissionTimeout, {{"request-id", request_id}, {"tool-name", request.tool_name}});

  try {
    write_to_agent(protocol::encode_permission_deny(request_id, "Permission request timed out"));
  } catch (const ProcessError& e) {
    spdlog::warn("[Session {}] Failed to answer permission request: {}", id_, e.what());
  }
}

void Session::cancel_pending_permissions() {
  for (auto& [request_id, pending] : pending_permissions_) {
    if (pending.timer) {
      pending.timer->cancel();
    }
  }
  pending_permissions_.clear();
}

// ============================================================================
// Publishing
// ============================================================================

void Session::set_state(ConversationState state) {
  machine_.set_state(state);
  auto previous = state_.exchange(state);
  if (previous == state) return;

  broadcast();
  emit(EventType::Status, {{"state", to_string(state)}});
  Bus::instance().publish(events::StateChanged{id_, to_string(state)});
}

void Session::dispatch_pending() {
  if (!pending_ || aborting_ || restarting_ || machine_.state() != ConversationState::Idle) {
    return;
  }

  auto message = std::move(*pending_);
  clear_pending();
  do_send(std::move(message));
}

void Session::clear_pending() {
  pending_.reset();
  std::lock_guard lock(snapshot_mutex_);
  pending_text_.reset();
}

void Session::broadcast() {
  auto snapshot = std::make_shared<const Conversation>(machine_.snapshot());
  {
    std::lock_guard lock(snapshot_mutex_);
    snapshot_ = snapshot;
  }

  std::lock_guard lock(observers_mutex_);
  for (const auto& [id, entry] : observers_) {
    asio::post(entry.executor, [callback = entry.callback, snapshot] {
      callback(*snapshot);
    });
  }
}

void Session::emit(EventType type, json data) {
  events_->append(type, agent_, std::move(data));
}

Session::ObserverId Session::subscribe(asio::any_io_executor executor, Observer observer) {
  std::lock_guard lock(observers_mutex_);
  auto id = next_observer_id_++;
  observers_[id] = ObserverEntry{std::move(executor), std::move(observer)};
  return id;
}

void Session::unsubscribe(ObserverId id) {
  std::lock_guard lock(observers_mutex_);
  observers_.erase(id);
}

}  // namespace warden
