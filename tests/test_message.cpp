#include <gtest/gtest.h>

#include "conversation/conversation.hpp"

using namespace warden;

namespace {

Fragment make(FragmentBody body) {
  Fragment fragment;
  fragment.id = UUID::with_prefix("frag_");
  fragment.body = std::move(body);
  return fragment;
}

}  // namespace

TEST(MessageTest, CreateUserMessage) {
  auto msg = Message::user("Hello, world!", {Attachment::file("/tmp/a.txt")});

  EXPECT_EQ(msg.role(), Role::User);
  EXPECT_EQ(msg.type(), MessageType::UserMessage);
  EXPECT_EQ(msg.text(), "Hello, world!");
  EXPECT_TRUE(msg.is_complete());
  ASSERT_EQ(msg.attachments().size(), 1u);
  EXPECT_EQ(msg.attachments()[0].path, "/tmp/a.txt");
}

TEST(MessageTest, StatusAndErrorMessages) {
  auto status = Message::status("aborted");
  EXPECT_EQ(status.role(), Role::System);
  EXPECT_EQ(status.type(), MessageType::Status);
  EXPECT_TRUE(status.is_complete());

  auto error = Message::error("boom");
  EXPECT_EQ(error.type(), MessageType::Error);
  EXPECT_EQ(error.error_text(), "boom");
}

TEST(MessageTest, CompleteMessageRejectsFragments) {
  auto msg = Message::assistant("msg_1");
  EXPECT_TRUE(msg.add_fragment(make(TextFragment{"a", false, true, std::nullopt})));
  msg.finalize();

  EXPECT_FALSE(msg.add_fragment(make(TextFragment{"b", false, true, std::nullopt})));
  EXPECT_EQ(msg.text(), "a");

  msg.set_streaming(true);
  EXPECT_FALSE(msg.is_streaming());
}

TEST(MessageTest, FailRecordsErrorOnce) {
  auto msg = Message::assistant();
  msg.fail("first");
  msg.fail("second");

  EXPECT_EQ(msg.error_text(), "first");
  EXPECT_TRUE(msg.is_complete());
}

TEST(MessageTest, TextJoinsSegmentsAroundTools) {
  auto msg = Message::assistant();
  msg.add_fragment(make(TextFragment{"Looking", false, true, std::nullopt}));
  msg.add_fragment(make(ToolUseFragment{"Read", json::object(), "toolu_1"}));
  msg.add_fragment(make(TextFragment{"Found it", false, true, std::nullopt}));

  EXPECT_EQ(msg.text(), "Looking\nFound it");
}

TEST(MessageTest, ToolInvocationsPairResults) {
  auto msg = Message::assistant();
  msg.add_fragment(make(ToolUseFragment{"Bash", {{"command", "ls"}}, "toolu_1"}));
  msg.add_fragment(make(ToolUseFragment{"Read", {{"file_path", "/x"}}, "toolu_2"}));
  msg.add_fragment(make(ToolResultFragment{"toolu_1", "a.txt", false, false}));

  auto invocations = msg.tool_invocations();
  ASSERT_EQ(invocations.size(), 2u);
  EXPECT_TRUE(invocations[0].has_result());
  EXPECT_EQ(invocations[0].result_content(), "a.txt");
  EXPECT_FALSE(invocations[1].has_result());
  EXPECT_TRUE(msg.has_tool_use("toolu_2"));
  EXPECT_FALSE(msg.has_tool_use("toolu_3"));
}

TEST(MessageTest, ToJson) {
  auto msg = Message::assistant("msg_9");
  msg.add_fragment(make(TextFragment{"hi", false, true, std::nullopt}));
  msg.fail("stopped");

  auto j = msg.to_json();
  EXPECT_EQ(j["id"], "msg_9");
  EXPECT_EQ(j["role"], "assistant");
  EXPECT_EQ(j["content"], "hi");
  EXPECT_EQ(j["error"], "stopped");
  EXPECT_EQ(j["is_complete"], true);
  EXPECT_EQ(j["fragments"].size(), 1u);
}

TEST(ConversationTest, InvocationsSpanMessages) {
  Conversation conversation;

  auto call = Message::assistant("msg_1");
  call.add_fragment(make(ToolUseFragment{"Bash", {{"command", "make"}}, "toolu_1"}));
  call.finalize();
  conversation.messages.push_back(call);

  auto result = Message::assistant("msg_2");
  result.add_fragment(make(ToolResultFragment{"toolu_1", "built", true, false}));
  result.finalize();
  conversation.messages.push_back(result);

  auto invocation = conversation.find_invocation("toolu_1");
  ASSERT_TRUE(invocation.has_value());
  EXPECT_TRUE(invocation->is_error());
  EXPECT_EQ(invocation->result_content(), "built");
  EXPECT_TRUE(conversation.has_tool_use("toolu_1"));
  EXPECT_FALSE(conversation.find_invocation("toolu_2").has_value());

  ASSERT_NE(conversation.find_message("msg_2"), nullptr);
  EXPECT_EQ(conversation.last_message()->id(), "msg_2");
}

TEST(ConversationTest, TokenTotals) {
  Conversation conversation;
  conversation.total_input_tokens = 100;
  conversation.total_output_tokens = 40;
  conversation.current_context_input_tokens = 30;
  conversation.current_context_cache_read_tokens = 20;

  EXPECT_EQ(conversation.total_tokens(), 140);
  EXPECT_EQ(conversation.current_context_tokens(), 50);

  conversation.state = ConversationState::ReceivingResponse;
  EXPECT_TRUE(conversation.is_processing());
  conversation.state = ConversationState::Error;
  EXPECT_FALSE(conversation.is_processing());
}

TEST(ConversationTest, ToJson) {
  Conversation conversation;
  conversation.messages.push_back(Message::user("hello"));
  conversation.current_error = "oops";

  auto j = conversation.to_json();
  EXPECT_EQ(j["state"], "idle");
  EXPECT_EQ(j["messages"].size(), 1u);
  EXPECT_EQ(j["current_error"], "oops");
}
