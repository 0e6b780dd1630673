#include <gtest/gtest.h>

#include "protocol/decoder.hpp"

using namespace warden;
using namespace warden::protocol;

TEST(DecoderTest, BlankLineYieldsNothing) {
  auto decoded = decode_line("   ");
  EXPECT_TRUE(decoded.empty());
  EXPECT_FALSE(decoded.malformed);
}

TEST(DecoderTest, NonProtocolOutputIsIgnored) {
  auto decoded = decode_line("Loading plugins...");
  EXPECT_TRUE(decoded.empty());
  EXPECT_FALSE(decoded.malformed);
}

TEST(DecoderTest, BrokenJsonWithTypeIsMalformed) {
  auto decoded = decode_line(R"({"type":"assistant","message":)");
  EXPECT_TRUE(decoded.fragments.empty());
  EXPECT_TRUE(decoded.malformed);
  EXPECT_FALSE(decoded.raw.empty());
}

TEST(DecoderTest, UnexpectedFieldTypeDoesNotThrow) {
  auto decoded = decode_line(R"({"type":"result","subtype":"success","is_error":"yes"})");
  EXPECT_TRUE(decoded.malformed);
}

TEST(DecoderTest, AssistantTextAndToolUse) {
  auto decoded = decode_line(
      R"({"type":"assistant","message":{"id":"msg_1","role":"assistant","content":[)"
      R"({"type":"text","text":"Let me look"},)"
      R"({"type":"tool_use","id":"toolu_1","name":"Read","input":{"file_path":"/src/a.cpp"}}]}})");

  ASSERT_EQ(decoded.fragments.size(), 2u);
  ASSERT_TRUE(decoded.message_id.has_value());
  EXPECT_EQ(*decoded.message_id, "msg_1");

  const auto* text = decoded.fragments[0].as<TextFragment>();
  ASSERT_NE(text, nullptr);
  EXPECT_EQ(text->content, "Let me look");
  EXPECT_TRUE(text->is_cumulative);
  EXPECT_FALSE(text->is_partial);
  EXPECT_EQ(decoded.fragments[0].message_id, "msg_1");

  const auto* tool = decoded.fragments[1].as<ToolUseFragment>();
  ASSERT_NE(tool, nullptr);
  EXPECT_EQ(tool->tool_name, "Read");
  EXPECT_EQ(tool->tool_use_id, "toolu_1");
  EXPECT_EQ(tool->parameters["file_path"], "/src/a.cpp");
}

TEST(DecoderTest, StopReasonGoesToLastText) {
  auto decoded = decode_line(
      R"({"type":"assistant","message":{"id":"msg_1","stop_reason":"end_turn","content":[)"
      R"({"type":"text","text":"one"},{"type":"text","text":"two"}]}})");

  ASSERT_EQ(decoded.fragments.size(), 2u);
  EXPECT_FALSE(decoded.fragments[0].as<TextFragment>()->stop_reason.has_value());
  EXPECT_EQ(decoded.fragments[1].as<TextFragment>()->stop_reason, "end_turn");
}

TEST(DecoderTest, HtmlEntitiesAreDecoded) {
  auto decoded = decode_line(
      R"({"type":"assistant","message":{"content":[{"type":"text","text":"a &lt; b &amp;&amp; c"},)"
      R"({"type":"tool_use","id":"t1","name":"Bash","input":{"command":"echo &quot;hi&quot; &gt; out"}}]}})");

  ASSERT_EQ(decoded.fragments.size(), 2u);
  EXPECT_EQ(decoded.fragments[0].as<TextFragment>()->content, "a < b && c");
  EXPECT_EQ(decoded.fragments[1].as<ToolUseFragment>()->parameters["command"], "echo \"hi\" > out");
}

TEST(DecoderTest, StreamDeltaIsPartial) {
  auto decoded = decode_line(R"({"type":"stream_event","event":{"type":"content_block_delta","delta":{"type":"text_delta","text":"Hel"}}})");

  ASSERT_EQ(decoded.fragments.size(), 1u);
  const auto* text = decoded.fragments[0].as<TextFragment>();
  ASSERT_NE(text, nullptr);
  EXPECT_EQ(text->content, "Hel");
  EXPECT_TRUE(text->is_partial);
}

TEST(DecoderTest, MessageStartDeclaresId) {
  auto decoded = decode_line(R"({"type":"stream_event","event":{"type":"message_start","message":{"id":"msg_7"}}})");

  EXPECT_TRUE(decoded.fragments.empty());
  EXPECT_EQ(decoded.message_id, "msg_7");
  EXPECT_FALSE(decoded.empty());
}

TEST(DecoderTest, UserToolResults) {
  auto decoded = decode_line(
      R"({"type":"user","uuid":"u1","message":{"role":"user","content":[)"
      R"({"type":"tool_result","tool_use_id":"toolu_1","content":"ok"},)"
      R"({"type":"tool_result","tool_use_id":"toolu_2","content":[{"type":"text","text":"bad"}],"is_error":true}]}})");

  ASSERT_EQ(decoded.fragments.size(), 2u);
  const auto* first = decoded.fragments[0].as<ToolResultFragment>();
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->tool_use_id, "toolu_1");
  EXPECT_EQ(first->content, "ok");
  EXPECT_FALSE(first->is_error);

  const auto* second = decoded.fragments[1].as<ToolResultFragment>();
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(second->content, "bad");
  EXPECT_TRUE(second->is_error);
}

TEST(DecoderTest, UserTextAndReplay) {
  auto decoded = decode_line(R"({"type":"user","uuid":"u2","isReplay":true,"message":{"role":"user","content":"hello"}})");

  ASSERT_EQ(decoded.fragments.size(), 1u);
  const auto* user = decoded.fragments[0].as<UserMessageFragment>();
  ASSERT_NE(user, nullptr);
  EXPECT_EQ(user->content, "hello");
  EXPECT_TRUE(user->is_replay);
  EXPECT_EQ(decoded.fragments[0].id, "u2");
}

TEST(DecoderTest, MetaUserLineIsSkipped) {
  auto decoded = decode_line(R"({"type":"user","isMeta":true,"message":{"role":"user","content":"caveat"}})");
  EXPECT_TRUE(decoded.fragments.empty());
}

TEST(DecoderTest, CompactSummary) {
  auto decoded = decode_line(R"({"type":"user","isCompactSummary":true,"message":{"role":"user","content":"Summary of earlier work"}})");

  ASSERT_EQ(decoded.fragments.size(), 1u);
  const auto* summary = decoded.fragments[0].as<CompactSummaryFragment>();
  ASSERT_NE(summary, nullptr);
  EXPECT_EQ(summary->content, "Summary of earlier work");
  EXPECT_TRUE(summary->is_visible_in_transcript_only);
}

TEST(DecoderTest, CompactBoundary) {
  auto decoded = decode_line(R"({"type":"system","subtype":"compact_boundary","compactMetadata":{"trigger":"manual","preTokens":12345}})");

  ASSERT_EQ(decoded.fragments.size(), 1u);
  const auto* boundary = decoded.fragments[0].as<CompactBoundaryFragment>();
  ASSERT_NE(boundary, nullptr);
  EXPECT_EQ(boundary->trigger, "manual");
  EXPECT_EQ(boundary->pre_tokens, 12345);
}

TEST(DecoderTest, InitIsMeta) {
  auto decoded = decode_line(R"({"type":"system","subtype":"init","session_id":"abc-123","model":"m"})");

  ASSERT_EQ(decoded.fragments.size(), 1u);
  const auto* meta = decoded.fragments[0].as<MetaFragment>();
  ASSERT_NE(meta, nullptr);
  EXPECT_EQ(meta->conversation_id, "abc-123");
  EXPECT_EQ(meta->metadata["model"], "m");
}

TEST(DecoderTest, ResultSuccessCarriesUsage) {
  auto decoded = decode_line(
      R"({"type":"result","subtype":"success","total_cost_usd":0.25,)"
      R"("usage":{"input_tokens":100,"output_tokens":20,"cache_read_input_tokens":5}})");

  ASSERT_EQ(decoded.fragments.size(), 1u);
  const auto* completion = decoded.fragments[0].as<CompletionFragment>();
  ASSERT_NE(completion, nullptr);
  EXPECT_EQ(completion->stop_reason, "end_turn");
  EXPECT_EQ(completion->usage.input_tokens, 100);
  EXPECT_EQ(completion->usage.output_tokens, 20);
  EXPECT_EQ(completion->usage.cache_read_tokens, 5);
  EXPECT_DOUBLE_EQ(completion->usage.cost_usd, 0.25);

  ASSERT_TRUE(decoded.usage.has_value());
  ASSERT_TRUE(decoded.fragments.back().usage.has_value());
  EXPECT_EQ(decoded.fragments.back().usage->input_tokens, 100);
}

TEST(DecoderTest, ResultErrorAddsErrorFragment) {
  auto decoded = decode_line(R"({"type":"result","subtype":"error_during_execution","is_error":true,"result":"boom"})");

  ASSERT_EQ(decoded.fragments.size(), 2u);
  const auto* error = decoded.fragments[0].as<ErrorFragment>();
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->message, "boom");
  EXPECT_EQ(error->code, "error_during_execution");
  EXPECT_EQ(decoded.fragments[1].as<CompletionFragment>()->stop_reason, "error");
}

TEST(DecoderTest, UsageOnlyOnLastFragment) {
  auto decoded = decode_line(
      R"({"type":"assistant","message":{"id":"m","usage":{"input_tokens":7,"output_tokens":3},"content":[)"
      R"({"type":"text","text":"a"},{"type":"text","text":"b"}]}})");

  ASSERT_EQ(decoded.fragments.size(), 2u);
  EXPECT_FALSE(decoded.fragments[0].usage.has_value());
  ASSERT_TRUE(decoded.fragments[1].usage.has_value());
  EXPECT_EQ(decoded.fragments[1].usage->total(), 10);
}

TEST(DecoderTest, ControlRequest) {
  auto decoded = decode_line(
      R"({"type":"control_request","request_id":"req-1","request":{"subtype":"can_use_tool","tool_name":"Bash","input":{"command":"ls"}}})");

  EXPECT_TRUE(decoded.fragments.empty());
  ASSERT_TRUE(decoded.control_request.has_value());
  EXPECT_EQ(decoded.control_request->request_id, "req-1");
  EXPECT_TRUE(decoded.control_request->is_can_use_tool());
  EXPECT_EQ(decoded.control_request->tool_name, "Bash");
  EXPECT_EQ(decoded.control_request->input["command"], "ls");
}

TEST(DecoderTest, GenericErrorObject) {
  auto decoded = decode_line(R"({"type":"error","error":{"message":"rate limited"},"code":"429"})");

  ASSERT_EQ(decoded.fragments.size(), 1u);
  const auto* error = decoded.fragments[0].as<ErrorFragment>();
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->message, "rate limited");
  EXPECT_EQ(error->code, "429");
}

TEST(DecoderTest, UnrecognizedTypeIsUnknown) {
  auto decoded = decode_line(R"({"type":"telemetry","value":1})");

  ASSERT_EQ(decoded.fragments.size(), 1u);
  const auto* unknown = decoded.fragments[0].as<UnknownFragment>();
  ASSERT_NE(unknown, nullptr);
  EXPECT_EQ(unknown->raw["value"], 1);
}

TEST(DecoderTest, InvalidUtf8IsSanitized) {
  std::string line = "{\"type\":\"text\",\"text\":\"bad \xff byte\"}";
  auto decoded = decode_line(line);

  ASSERT_EQ(decoded.fragments.size(), 1u);
  EXPECT_EQ(decoded.fragments[0].as<TextFragment>()->content, "bad \xEF\xBF\xBD byte");
}

TEST(LineSplitterTest, ReassemblesChunks) {
  LineSplitter splitter;

  EXPECT_TRUE(splitter.feed(R"({"type":)").empty());
  auto lines = splitter.feed("\"a\"}\r\n{\"type\":\"b\"}\n{\"par");
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], R"({"type":"a"})");
  EXPECT_EQ(lines[1], R"({"type":"b"})");
  EXPECT_GT(splitter.buffered(), 0u);

  auto rest = splitter.flush();
  ASSERT_TRUE(rest.has_value());
  EXPECT_EQ(*rest, "{\"par");
  EXPECT_FALSE(splitter.flush().has_value());
}
