#include <gtest/gtest.h>

#include <asio.hpp>
#include <thread>

#include "session/event_log.hpp"

using namespace warden;

namespace {

AgentInfo main_agent() {
  AgentInfo agent;
  agent.id = "agent-1";
  agent.name = "main";
  return agent;
}

}  // namespace

TEST(EventLogTest, SequenceStartsAtOneAndIncreases) {
  EventLog log;

  auto first = log.append(EventType::Status, main_agent(), {{"state", "processing"}});
  auto second = log.append(EventType::Done, main_agent());

  EXPECT_EQ(first.seq, 1u);
  EXPECT_EQ(second.seq, 2u);
  EXPECT_NE(first.event_id, second.event_id);
  EXPECT_EQ(log.last_seq(), 2u);
  EXPECT_EQ(log.size(), 2u);
  EXPECT_TRUE(second.data.is_object());
}

TEST(EventLogTest, HistorySince) {
  EventLog log;
  for (int i = 0; i < 5; ++i) {
    log.append(EventType::Message, main_agent(), {{"content", std::to_string(i)}});
  }

  auto missed = log.history_since(3);
  ASSERT_EQ(missed.size(), 2u);
  EXPECT_EQ(missed[0].seq, 4u);
  EXPECT_EQ(missed[1].data["content"], "4");

  EXPECT_EQ(log.history().size(), 5u);
  EXPECT_TRUE(log.history_since(5).empty());
}

TEST(EventLogTest, LimitDropsOldestButKeepsNumbering) {
  EventLog log(3);
  for (int i = 0; i < 5; ++i) {
    log.append(EventType::Message, main_agent());
  }

  auto history = log.history();
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history.front().seq, 3u);
  EXPECT_EQ(history.back().seq, 5u);
  EXPECT_EQ(log.last_seq(), 5u);
}

TEST(EventLogTest, HandshakeEventsAreNotRecorded) {
  EventLog log;
  log.append(EventType::Message, main_agent());
  log.append(EventType::Message, main_agent());

  auto connected = log.connected_event(main_agent());
  EXPECT_EQ(connected.type, EventType::Connected);
  EXPECT_EQ(connected.seq, 2u);
  EXPECT_EQ(connected.data["last-seq"], 2);

  Conversation conversation;
  conversation.messages.push_back(Message::user("hi"));
  auto history = log.history_event(main_agent(), conversation);
  EXPECT_EQ(history.type, EventType::History);
  EXPECT_EQ(history.data["conversation"]["messages"].size(), 1u);

  EXPECT_EQ(log.size(), 2u);
  EXPECT_EQ(log.last_seq(), 2u);
}

TEST(EventLogTest, ToJsonUsesKebabCase) {
  EventLog log;
  auto agent = main_agent();
  agent.type = "implementer";
  agent.task_name = "Fix build";

  auto j = log.append(EventType::PermissionRequest, agent, {{"tool-name", "Bash"}}).to_json();

  EXPECT_EQ(j["type"], "permission-request");
  EXPECT_EQ(j["seq"], 1);
  EXPECT_EQ(j["agent-id"], "agent-1");
  EXPECT_EQ(j["agent-type"], "implementer");
  EXPECT_EQ(j["agent-name"], "main");
  EXPECT_EQ(j["task-name"], "Fix build");
  EXPECT_EQ(j["data"]["tool-name"], "Bash");
  EXPECT_TRUE(j.contains("event-id"));
  EXPECT_TRUE(j.contains("timestamp"));
}

TEST(EventLogTest, EventTypeNames) {
  EXPECT_EQ(to_string(EventType::ToolUse), "tool-use");
  EXPECT_EQ(to_string(EventType::AgentSpawned), "agent-spawned");
  EXPECT_EQ(to_string(EventType::PermissionTimeout), "permission-timeout");
}

TEST(EventLogTest, ListenersReceiveAppendsOnTheirExecutor) {
  EventLog log;
  asio::io_context io_ctx;
  std::vector<uint64_t> seen;
  auto id = log.subscribe(io_ctx.get_executor(), [&](const OutwardEvent& event) { seen.push_back(event.seq); });

  log.append(EventType::Status, main_agent());
  log.append(EventType::Status, main_agent());
  log.unsubscribe(id);
  log.append(EventType::Status, main_agent());

  // Nothing runs until the listener's executor does
  EXPECT_TRUE(seen.empty());
  io_ctx.run();
  EXPECT_EQ(seen, (std::vector<uint64_t>{1, 2}));
}

TEST(EventLogTest, ListenerMayAppend) {
  EventLog log;
  asio::io_context io_ctx;
  log.subscribe(io_ctx.get_executor(), [&](const OutwardEvent& event) {
    if (event.type == EventType::Done) {
      log.append(EventType::Status, main_agent());
    }
  });

  log.append(EventType::Done, main_agent());
  io_ctx.run();
  EXPECT_EQ(log.size(), 2u);
}

TEST(EventLogTest, ConcurrentAppendsAreDeliveredInSeqOrder) {
  EventLog log(10000);
  asio::io_context io_ctx;
  std::vector<uint64_t> seen;
  log.subscribe(io_ctx.get_executor(), [&](const OutwardEvent& event) { seen.push_back(event.seq); });

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&log] {
      for (int i = 0; i < 100; ++i) {
        log.append(EventType::Message, main_agent());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  io_ctx.run();
  ASSERT_EQ(seen.size(), 400u);
  for (size_t i = 0; i < seen.size(); ++i) {
    EXPECT_EQ(seen[i], i + 1);
  }
}

TEST(EventLogTest, ConcurrentAppendsGetUniqueSeqs) {
  EventLog log(10000);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&log] {
      for (int i = 0; i < 250; ++i) {
        log.append(EventType::Message, main_agent());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto history = log.history();
  ASSERT_EQ(history.size(), 1000u);
  for (size_t i = 0; i < history.size(); ++i) {
    EXPECT_EQ(history[i].seq, i + 1);
  }
}
