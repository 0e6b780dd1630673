#include <gtest/gtest.h>

#include <algorithm>
#include <asio.hpp>
#include <filesystem>
#include <fstream>

#include "bus/bus.hpp"
#include "core/uuid.hpp"
#include "session/session.hpp"

using namespace warden;
namespace fs = std::filesystem;

namespace {

const std::string kFakeAgent = std::string(WARDEN_TEST_DATA_DIR) + "/fake_agent.sh";

template <typename Pred>
bool run_until(asio::io_context& io_ctx, Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    io_ctx.restart();
    io_ctx.run_for(std::chrono::milliseconds(10));
  }
  return true;
}

size_t count_events(const EventLog& log, EventType type) {
  size_t count = 0;
  for (const auto& event : log.history()) {
    if (event.type == type) ++count;
  }
  return count;
}

std::vector<std::string> texts_of(const Conversation& conversation, Role role) {
  std::vector<std::string> result;
  for (const auto& msg : conversation.messages) {
    if (msg.role() == role && (msg.type() == MessageType::Normal || msg.type() == MessageType::UserMessage)) {
      result.push_back(msg.text());
    }
  }
  return result;
}

}  // namespace

class SessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("warden_test_" + UUID::generate());
    fs::create_directories(test_dir_ / "project");

    config_.agent_command = "/bin/sh";
    config_.agent_args = {kFakeAgent};
    config_.working_dir = test_dir_ / "project";
    config_.transcript_root = test_dir_ / "transcripts";
    config_.abort_grace = std::chrono::milliseconds(300);
    config_.agent_env["FAKE_AGENT_MODE"] = "echo";

    store_ = std::make_shared<permission::PermissionStore>(test_dir_ / "project" / ".claude" / "settings.local.json");
  }

  void TearDown() override {
    for (auto& session : sessions_) {
      session->close();
    }
    io_ctx_.restart();
    io_ctx_.run_for(std::chrono::milliseconds(500));
    sessions_.clear();

    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  std::shared_ptr<Session> make_session(const std::string& mode) {
    config_.agent_env["FAKE_AGENT_MODE"] = mode;
    auto session = Session::create(io_ctx_, config_, {}, nullptr, store_);
    sessions_.push_back(session);
    return session;
  }

  bool wait_for_idle_turns(const std::shared_ptr<Session>& session, size_t assistant_messages) {
    return run_until(io_ctx_, [&] {
      auto conversation = session->conversation();
      return session->state() == ConversationState::Idle && texts_of(conversation, Role::Assistant).size() >= assistant_messages;
    });
  }

  asio::io_context io_ctx_;
  Config config_;
  fs::path test_dir_;
  std::shared_ptr<permission::PermissionStore> store_;
  std::vector<std::shared_ptr<Session>> sessions_;
};

TEST_F(SessionTest, CreateSession) {
  auto session = make_session("echo");

  EXPECT_FALSE(session->id().empty());
  EXPECT_EQ(session->state(), ConversationState::Idle);
  EXPECT_FALSE(session->has_process());
  EXPECT_EQ(session->agent().name, "main");
}

TEST_F(SessionTest, SendMessageCompletesTurn) {
  auto session = make_session("echo");
  session->send_message("hello");

  ASSERT_TRUE(wait_for_idle_turns(session, 1));

  auto conversation = session->conversation();
  EXPECT_EQ(texts_of(conversation, Role::User), std::vector<std::string>{"hello"});
  EXPECT_EQ(texts_of(conversation, Role::Assistant), std::vector<std::string>{"reply 1"});
  EXPECT_EQ(conversation.total_input_tokens, 50);
  EXPECT_EQ(conversation.total_output_tokens, 10);
  EXPECT_TRUE(conversation.messages.back().is_complete());

  EXPECT_TRUE(session->has_process());
  ASSERT_TRUE(session->agent_session_id().has_value());
  EXPECT_EQ(*session->agent_session_id(), "fake-session-1");
  EXPECT_EQ(count_events(*session->events(), EventType::Done), 1u);
}

TEST_F(SessionTest, PublishesLifecycleOnBus) {
  std::vector<events::SessionCreated> created;
  std::vector<events::TurnCompleted> turns;
  std::vector<std::string> states;
  int closed = 0;
  auto created_sub = Bus::instance().subscribe<events::SessionCreated>([&](const events::SessionCreated& e) { created.push_back(e); });
  auto turn_sub = Bus::instance().subscribe<events::TurnCompleted>([&](const events::TurnCompleted& e) { turns.push_back(e); });
  auto state_sub = Bus::instance().subscribe<events::StateChanged>([&](const events::StateChanged& e) { states.push_back(e.state); });
  auto closed_sub = Bus::instance().subscribe<events::SessionClosed>([&](const events::SessionClosed&) { ++closed; });

  auto session = make_session("echo");
  session->send_message("hello");
  ASSERT_TRUE(wait_for_idle_turns(session, 1));
  session->close();
  run_until(io_ctx_, [&] { return closed > 0; });

  Bus::instance().unsubscribe(created_sub);
  Bus::instance().unsubscribe(turn_sub);
  Bus::instance().unsubscribe(state_sub);
  Bus::instance().unsubscribe(closed_sub);

  ASSERT_EQ(created.size(), 1u);
  EXPECT_EQ(created[0].session_id, session->id());
  EXPECT_EQ(created[0].agent_name, "main");

  ASSERT_EQ(turns.size(), 1u);
  EXPECT_EQ(turns[0].session_id, session->id());
  EXPECT_EQ(turns[0].total_tokens, 60);

  EXPECT_NE(std::find(states.begin(), states.end(), "processing"), states.end());
  EXPECT_EQ(states.back(), "idle");
  EXPECT_EQ(closed, 1);
}

TEST_F(SessionTest, BlankMessageIsIgnored) {
  auto session = make_session("echo");
  session->send_message("   \n");

  run_until(io_ctx_, [] { return false; }, std::chrono::milliseconds(100));

  EXPECT_FALSE(session->has_process());
  EXPECT_TRUE(session->conversation().messages.empty());
}

TEST_F(SessionTest, PendingSlotKeepsLatestMessage) {
  auto session = make_session("slow");
  session->send_message("first");
  session->send_message("second");
  session->send_message("third");

  ASSERT_TRUE(wait_for_idle_turns(session, 2));

  auto conversation = session->conversation();
  EXPECT_EQ(texts_of(conversation, Role::User), (std::vector<std::string>{"first", "third"}));
  EXPECT_EQ(texts_of(conversation, Role::Assistant), (std::vector<std::string>{"reply 1", "reply 2"}));
  EXPECT_FALSE(session->pending_message().has_value());
}

TEST_F(SessionTest, AbortWithoutProcessIsNoop) {
  auto session = make_session("echo");
  session->abort();

  run_until(io_ctx_, [] { return false; }, std::chrono::milliseconds(100));

  EXPECT_EQ(session->state(), ConversationState::Idle);
  EXPECT_EQ(count_events(*session->events(), EventType::Aborted), 0u);
}

TEST_F(SessionTest, AbortReturnsToIdleWithMarker) {
  auto session = make_session("hang");
  session->send_message("work forever");
  ASSERT_TRUE(run_until(io_ctx_, [&] { return session->state() == ConversationState::Processing; }));

  session->abort();
  ASSERT_TRUE(run_until(io_ctx_, [&] { return count_events(*session->events(), EventType::Aborted) == 1; }));

  EXPECT_EQ(session->state(), ConversationState::Idle);
  EXPECT_FALSE(session->is_aborting());
  EXPECT_FALSE(session->has_process());
  EXPECT_FALSE(session->pending_message().has_value());

  auto conversation = session->conversation();
  ASSERT_FALSE(conversation.messages.empty());
  const auto& marker = conversation.messages.back();
  EXPECT_EQ(marker.role(), Role::System);
  EXPECT_EQ(marker.type(), MessageType::Status);
  ASSERT_NE(marker.fragments().front().as<StatusFragment>(), nullptr);
  EXPECT_EQ(marker.fragments().front().as<StatusFragment>()->status, "aborted");
}

TEST_F(SessionTest, MessageSentDuringAbortIsDispatchedAfterwards) {
  auto session = make_session("hang");
  session->send_message("work forever");
  ASSERT_TRUE(run_until(io_ctx_, [&] { return session->state() == ConversationState::Processing; }));

  session->abort();
  session->send_message("next question");
  ASSERT_TRUE(run_until(io_ctx_, [&] { return count_events(*session->events(), EventType::Aborted) == 1; }));
  ASSERT_TRUE(run_until(io_ctx_, [&] { return session->has_process() && session->state() == ConversationState::Processing; }));

  EXPECT_FALSE(session->pending_message().has_value());
  auto conversation = session->conversation();
  EXPECT_EQ(texts_of(conversation, Role::User), (std::vector<std::string>{"work forever", "next question"}));
  ASSERT_GE(conversation.messages.size(), 3u);
  EXPECT_EQ(conversation.messages[conversation.messages.size() - 2].type(), MessageType::Status);

  for (const auto& event : session->events()->history()) {
    if (event.type == EventType::Aborted) {
      EXPECT_FALSE(event.data.contains("discarded-message"));
    }
  }
}

TEST_F(SessionTest, AbortDiscardsMessageQueuedBeforeIt) {
  auto session = make_session("hang");
  session->send_message("work forever");
  session->send_message("queued");
  ASSERT_TRUE(run_until(io_ctx_, [&] { return session->pending_message().has_value(); }));

  session->abort();
  ASSERT_TRUE(run_until(io_ctx_, [&] { return count_events(*session->events(), EventType::Aborted) == 1; }));

  EXPECT_FALSE(session->pending_message().has_value());
  EXPECT_FALSE(session->has_process());
  EXPECT_EQ(texts_of(session->conversation(), Role::User), std::vector<std::string>{"work forever"});

  for (const auto& event : session->events()->history()) {
    if (event.type == EventType::Aborted) {
      EXPECT_EQ(event.data.value("discarded-message", ""), "queued");
    }
  }
}

TEST_F(SessionTest, AbortEscalatesToKill) {
  auto session = make_session("stubborn");
  session->send_message("ignore signals");
  ASSERT_TRUE(run_until(io_ctx_, [&] { return session->state() == ConversationState::Processing; }));

  auto started = std::chrono::steady_clock::now();
  session->abort();
  ASSERT_TRUE(run_until(io_ctx_, [&] { return count_events(*session->events(), EventType::Aborted) == 1; }));

  EXPECT_GE(std::chrono::steady_clock::now() - started, config_.abort_grace);
  EXPECT_FALSE(session->has_process());
  EXPECT_EQ(session->state(), ConversationState::Idle);
}

TEST_F(SessionTest, SessionUsableAfterAbort) {
  auto session = make_session("hang");
  session->send_message("one");
  ASSERT_TRUE(run_until(io_ctx_, [&] { return session->state() == ConversationState::Processing; }));
  session->abort();
  ASSERT_TRUE(run_until(io_ctx_, [&] { return count_events(*session->events(), EventType::Aborted) == 1; }));

  session->send_message("two");
  ASSERT_TRUE(run_until(io_ctx_, [&] { return session->has_process() && session->state() == ConversationState::Processing; }));
}

TEST_F(SessionTest, SpawnFailureSurfacesError) {
  config_.agent_command = (test_dir_ / "missing-agent").string();
  config_.agent_args = {};
  auto session = make_session("echo");

  session->send_message("hello");
  ASSERT_TRUE(run_until(io_ctx_, [&] { return count_events(*session->events(), EventType::Error) == 1; }));

  auto conversation = session->conversation();
  ASSERT_EQ(conversation.messages.size(), 2u);
  EXPECT_EQ(conversation.messages[1].type(), MessageType::Error);
  ASSERT_TRUE(conversation.messages[1].error_text().has_value());
  EXPECT_NE(conversation.messages[1].error_text()->find("Failed to start agent"), std::string::npos);
  EXPECT_EQ(session->state(), ConversationState::Idle);
  EXPECT_FALSE(session->has_process());
}

TEST_F(SessionTest, AgentExitMidTurnSurfacesError) {
  auto session = make_session("crash");
  session->send_message("hello");

  ASSERT_TRUE(run_until(io_ctx_, [&] { return count_events(*session->events(), EventType::Error) == 1; }));
  ASSERT_TRUE(run_until(io_ctx_, [&] { return session->state() == ConversationState::Idle; }));

  auto conversation = session->conversation();
  EXPECT_EQ(conversation.messages.back().type(), MessageType::Error);
  EXPECT_FALSE(session->has_process());
}

TEST_F(SessionTest, PermissionAskRoutedToHandler) {
  auto session = make_session("tool");

  std::vector<PermissionRequest> requests;
  session->set_permission_handler([&](const PermissionRequest& request, Session::PermissionRespond respond) {
    requests.push_back(request);
    PermissionResponse response;
    response.allow = true;
    response.remember = true;
    respond(response);
  });
  session->send_message("write a file");

  ASSERT_TRUE(wait_for_idle_turns(session, 1));

  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].tool_name, "Write");
  EXPECT_EQ(requests[0].input["file_path"], "/tmp/warden-fake/out.txt");
  ASSERT_TRUE(requests[0].inferred_pattern.has_value());
  EXPECT_EQ(*requests[0].inferred_pattern, "Write(/tmp/warden-fake/**)");

  EXPECT_EQ(texts_of(session->conversation(), Role::Assistant), std::vector<std::string>{"tool allowed"});
  EXPECT_EQ(count_events(*session->events(), EventType::PermissionRequest), 1u);

  // Write approvals are remembered for the session only
  EXPECT_EQ(session->policy().session_patterns(), std::vector<std::string>{"Write(/tmp/warden-fake/**)"});
  EXPECT_TRUE(store_->allow_patterns().empty());
}

TEST_F(SessionTest, RememberedPatternSkipsHandler) {
  auto session = make_session("tool");
  session->policy().add_session_pattern("Write(/tmp/warden-fake/**)");

  bool asked = false;
  session->set_permission_handler([&](const PermissionRequest&, Session::PermissionRespond respond) {
    asked = true;
    respond(PermissionResponse{});
  });
  session->send_message("write a file");

  ASSERT_TRUE(wait_for_idle_turns(session, 1));
  EXPECT_FALSE(asked);
  EXPECT_EQ(texts_of(session->conversation(), Role::Assistant), std::vector<std::string>{"tool allowed"});
}

TEST_F(SessionTest, PermissionDeniedWithoutHandler) {
  auto session = make_session("tool");
  session->send_message("write a file");

  ASSERT_TRUE(wait_for_idle_turns(session, 1));
  EXPECT_EQ(texts_of(session->conversation(), Role::Assistant), std::vector<std::string>{"tool denied"});
}

TEST_F(SessionTest, UnansweredPermissionTimesOut) {
  config_.permissions.prompt_timeout = std::chrono::milliseconds(100);
  auto session = make_session("tool");

  Session::PermissionRespond saved;
  session->set_permission_handler([&](const PermissionRequest&, Session::PermissionRespond respond) {
    saved = std::move(respond);
  });
  session->send_message("write a file");

  ASSERT_TRUE(wait_for_idle_turns(session, 1));
  EXPECT_EQ(count_events(*session->events(), EventType::PermissionTimeout), 1u);
  EXPECT_EQ(texts_of(session->conversation(), Role::Assistant), std::vector<std::string>{"tool denied"});

  // A late answer is dropped
  ASSERT_TRUE(saved);
  PermissionResponse late;
  late.allow = true;
  saved(late);
  run_until(io_ctx_, [] { return false; }, std::chrono::milliseconds(100));
  EXPECT_EQ(texts_of(session->conversation(), Role::Assistant).size(), 1u);
}

TEST_F(SessionTest, RestartReloadsTranscript) {
  auto session = make_session("echo");
  session->send_message("hello");
  ASSERT_TRUE(wait_for_idle_turns(session, 1));

  auto transcript_dir = *config_.transcript_root / config_paths::encode_project_path(config_.working_dir);
  fs::create_directories(transcript_dir);
  {
    std::ofstream file(transcript_dir / "fake-session-1.jsonl");
    file << R"({"type":"user","uuid":"u1","message":{"role":"user","content":"persisted question"}})" << "\n";
    file << R"({"type":"assistant","uuid":"a1","message":{"id":"msg_p","role":"assistant","content":[{"type":"text","text":"persisted answer"}]}})"
         << "\n";
  }

  session->restart();
  ASSERT_TRUE(run_until(io_ctx_, [&] { return session->conversation().messages.size() == 2 && session->has_process(); }));

  auto conversation = session->conversation();
  EXPECT_EQ(texts_of(conversation, Role::User), std::vector<std::string>{"persisted question"});
  EXPECT_EQ(texts_of(conversation, Role::Assistant), std::vector<std::string>{"persisted answer"});
  EXPECT_EQ(session->state(), ConversationState::Idle);

  session->send_message("again");
  ASSERT_TRUE(wait_for_idle_turns(session, 2));
  EXPECT_EQ(*session->agent_session_id(), "fake-session-1");
}

TEST_F(SessionTest, RestartDoesNotBlockTheEventLoop) {
  config_.abort_grace = std::chrono::milliseconds(1000);
  auto session = make_session("stubborn");
  session->send_message("ignore signals");
  ASSERT_TRUE(run_until(io_ctx_, [&] { return session->state() == ConversationState::Processing; }));

  auto started = std::chrono::steady_clock::now();
  session->restart();

  std::optional<std::chrono::steady_clock::time_point> fired;
  asio::steady_timer timer(io_ctx_, std::chrono::milliseconds(50));
  timer.async_wait([&](const asio::error_code&) { fired = std::chrono::steady_clock::now(); });

  ASSERT_TRUE(run_until(io_ctx_, [&] { return fired.has_value(); }));
  EXPECT_LT(*fired - started, config_.abort_grace);

  ASSERT_TRUE(run_until(io_ctx_, [&] { return session->state() == ConversationState::Idle && session->has_process(); }));
  EXPECT_GE(std::chrono::steady_clock::now() - started, config_.abort_grace);
}

TEST_F(SessionTest, CloseDoesNotBlockTheEventLoop) {
  config_.abort_grace = std::chrono::milliseconds(1000);
  auto session = make_session("stubborn");
  session->send_message("ignore signals");
  ASSERT_TRUE(run_until(io_ctx_, [&] { return session->state() == ConversationState::Processing; }));

  auto started = std::chrono::steady_clock::now();
  session->close();
  EXPECT_TRUE(session->is_closed());

  std::optional<std::chrono::steady_clock::time_point> fired;
  asio::steady_timer timer(io_ctx_, std::chrono::milliseconds(50));
  timer.async_wait([&](const asio::error_code&) { fired = std::chrono::steady_clock::now(); });

  ASSERT_TRUE(run_until(io_ctx_, [&] { return fired.has_value(); }));
  EXPECT_LT(*fired - started, config_.abort_grace);
  ASSERT_TRUE(run_until(io_ctx_, [&] { return !session->has_process(); }));
}

TEST_F(SessionTest, ObserversReceiveSnapshots) {
  auto session = make_session("echo");

  size_t snapshots = 0;
  ConversationState last_state = ConversationState::Error;
  auto id = session->subscribe(io_ctx_.get_executor(), [&](const Conversation& conversation) {
    ++snapshots;
    last_state = conversation.state;
  });

  session->send_message("hello");
  ASSERT_TRUE(wait_for_idle_turns(session, 1));
  run_until(io_ctx_, [] { return false; }, std::chrono::milliseconds(50));

  EXPECT_GT(snapshots, 0u);
  EXPECT_EQ(last_state, ConversationState::Idle);

  session->unsubscribe(id);
  auto before = snapshots;
  session->send_message("again");
  ASSERT_TRUE(wait_for_idle_turns(session, 2));
  run_until(io_ctx_, [] { return false; }, std::chrono::milliseconds(50));
  EXPECT_EQ(snapshots, before);
}

TEST_F(SessionTest, EventsCarryAgentIdentity) {
  auto session = make_session("echo");
  session->send_message("hello");
  ASSERT_TRUE(wait_for_idle_turns(session, 1));

  auto events = session->events()->history();
  ASSERT_FALSE(events.empty());
  uint64_t previous = 0;
  for (const auto& event : events) {
    EXPECT_EQ(event.agent.id, session->id());
    EXPECT_GT(event.seq, previous);
    previous = event.seq;
  }
}
