/**
 * @file test_mcp_session.cc
 * @brief Frame loop tests for McpSession using an in-memory sink and a
 * manually pumped dispatcher
 */

#include <deque>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "mcpgate/server/mcp_session.h"

namespace mcpgate {
namespace server {
namespace {

constexpr const char* kSecret = "test-secret-0123456789";

// Queues posted callbacks until the test pumps them
class ManualDispatcher : public event::DispatcherBase {
 public:
  void post(event::PostCb callback) override {
    callbacks_.push_back(std::move(callback));
  }
  bool isThreadSafe() const override { return true; }

  size_t runPending() {
    size_t ran = 0;
    while (!callbacks_.empty()) {
      auto cb = std::move(callbacks_.front());
      callbacks_.pop_front();
      cb();
      ++ran;
    }
    return ran;
  }

  size_t pending() const { return callbacks_.size(); }

 private:
  std::deque<event::PostCb> callbacks_;
};

class RecordingSink : public FrameSink {
 public:
  void sendText(const std::string& payload) override {
    frames.push_back(nlohmann::json::parse(payload));
  }

  void pauseReading(bool paused) override { pause_calls.push_back(paused); }

  void closeForPolicyViolation(const std::string& reason) override {
    close_reasons.push_back(reason);
  }

  bool readingPaused() const {
    return !pause_calls.empty() && pause_calls.back();
  }

  std::vector<nlohmann::json> frames;
  std::vector<bool> pause_calls;
  std::vector<std::string> close_reasons;
};

class McpSessionTest : public ::testing::Test {
 protected:
  McpSessionTest() : guard_(kSecret) {}

  void SetUp() override {
    registry_.registerTool(
        ToolDescriptor{"get_profile_data", "Get the user's profile",
                       ToolDescriptor::defaultInputSchema()},
        [](const nlohmann::json&) {
          return nlohmann::json({{"first_name", "Ada"}});
        });
    registry_.registerTool(
        ToolDescriptor{"echo_text", "Echo a string",
                       ToolDescriptor::defaultInputSchema()},
        [](const nlohmann::json& args) { return args.value("text", ""); });
    registry_.registerTool(
        ToolDescriptor{"failing", "Always fails",
                       ToolDescriptor::defaultInputSchema()},
        [](const nlohmann::json&) -> nlohmann::json {
          throw std::runtime_error("WHOOP API error 401");
        });
    registry_.registerAsyncTool(
        ToolDescriptor{"deferred", "Completes when the test says so",
                       ToolDescriptor::defaultInputSchema()},
        [this](const nlohmann::json&, const ToolResponder& responder) {
          pending_responders_.push_back(responder);
        });
    registry_.seal();

    session_ = std::make_shared<McpSession>("ws-1", "127.0.0.1", dispatcher_,
                                            registry_, codec_, sink_);
  }

  void authenticate() { ASSERT_TRUE(session_->authenticate(guard_, kSecret)); }

  void send(const std::string& frame) {
    session_->onFrame(frame);
    dispatcher_.runPending();
  }

  const nlohmann::json& lastFrame() {
    EXPECT_FALSE(sink_.frames.empty());
    return sink_.frames.back();
  }

  auth::AccessGuard guard_;
  ToolRegistry registry_;
  protocol::EnvelopeCodec codec_;
  ManualDispatcher dispatcher_;
  RecordingSink sink_;
  std::vector<ToolResponder> pending_responders_;
  McpSessionSharedPtr session_;
};

TEST_F(McpSessionTest, RejectsWrongCredential) {
  EXPECT_FALSE(session_->authenticate(guard_, "wrong"));
  EXPECT_EQ(session_->state(), protocol::SessionState::Closed);

  send(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
  EXPECT_TRUE(sink_.frames.empty());
}

TEST_F(McpSessionTest, RejectsMissingCredential) {
  EXPECT_FALSE(session_->authenticate(guard_, ""));
  EXPECT_FALSE(session_->isOpen());
}

TEST_F(McpSessionTest, FramesBeforeAuthenticationAreDropped) {
  session_->onFrame(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
  EXPECT_TRUE(sink_.frames.empty());
  EXPECT_EQ(session_->stats().frames_received, 0u);
}

TEST_F(McpSessionTest, Initialize) {
  authenticate();
  send(R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{}})");

  const auto& frame = lastFrame();
  EXPECT_EQ(frame["jsonrpc"], "2.0");
  EXPECT_EQ(frame["id"], 0);
  EXPECT_EQ(frame["result"]["protocolVersion"], "2024-11-05");
  EXPECT_EQ(frame["result"]["serverInfo"]["name"], "whoop-mcp");
  EXPECT_EQ(frame["result"]["serverInfo"]["version"], "2.0.0");
  EXPECT_TRUE(frame["result"]["capabilities"]["tools"].is_object());
}

TEST_F(McpSessionTest, ListTools) {
  authenticate();
  send(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");

  const auto& frame = lastFrame();
  EXPECT_EQ(frame["id"], 1);
  ASSERT_EQ(frame["result"]["tools"].size(), 4u);
  EXPECT_EQ(frame["result"]["tools"][0]["name"], "get_profile_data");
  EXPECT_EQ(frame["result"]["tools"][0]["description"],
            "Get the user's profile");
  EXPECT_EQ(frame["result"]["tools"][0]["inputSchema"]["type"], "object");
  EXPECT_EQ(frame["result"]["tools"][3]["name"], "deferred");
}

TEST_F(McpSessionTest, CallToolWrapsObjectResultAsText) {
  authenticate();
  send(R"({"jsonrpc":"2.0","id":"c1","method":"tools/call","params":{"name":"get_profile_data","arguments":{}}})");

  const auto& frame = lastFrame();
  EXPECT_EQ(frame["id"], "c1");
  const auto& content = frame["result"]["content"];
  ASSERT_EQ(content.size(), 1u);
  EXPECT_EQ(content[0]["type"], "text");
  EXPECT_EQ(nlohmann::json::parse(content[0]["text"].get<std::string>()),
            nlohmann::json({{"first_name", "Ada"}}));
}

TEST_F(McpSessionTest, CallToolPassesStringResultThrough) {
  authenticate();
  send(R"({"id":5,"method":"tools/call","params":{"name":"echo_text","arguments":{"text":"hello"}}})");

  EXPECT_EQ(lastFrame()["result"]["content"][0]["text"], "hello");
}

TEST_F(McpSessionTest, CallToolWithoutArgumentsUsesEmptyObject) {
  authenticate();
  send(R"({"id":6,"method":"tools/call","params":{"name":"echo_text"}})");

  EXPECT_EQ(lastFrame()["result"]["content"][0]["text"], "");
}

TEST_F(McpSessionTest, UnknownTool) {
  authenticate();
  send(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"nonexistent"}})");

  const auto& frame = lastFrame();
  EXPECT_EQ(frame["id"], 2);
  EXPECT_EQ(frame["error"]["code"], -32601);
  EXPECT_EQ(frame["error"]["message"], "Tool not found: nonexistent");
  EXPECT_FALSE(frame.contains("result"));
}

TEST_F(McpSessionTest, ToolFailureHidesCause) {
  authenticate();
  send(R"({"id":3,"method":"tools/call","params":{"name":"failing"}})");

  const auto& frame = lastFrame();
  EXPECT_EQ(frame["error"]["code"], -32603);
  EXPECT_EQ(frame["error"]["message"],
            "Tool execution failed. Please check your authentication and "
            "try again.");
  EXPECT_EQ(session_->stats().tool_failures, 1u);
}

TEST_F(McpSessionTest, ToolCallWithoutName) {
  authenticate();
  send(R"({"id":4,"method":"tools/call","params":{"arguments":{}}})");

  EXPECT_EQ(lastFrame()["error"]["code"], -32602);
  EXPECT_EQ(lastFrame()["id"], 4);
}

TEST_F(McpSessionTest, ToolCallWithNonObjectArguments) {
  authenticate();
  send(R"({"id":4,"method":"tools/call","params":{"name":"echo_text","arguments":[1]}})");

  EXPECT_EQ(lastFrame()["error"]["code"], -32602);
}

TEST_F(McpSessionTest, UnknownMethod) {
  authenticate();
  send(R"({"jsonrpc":"2.0","id":8,"method":"resources/list"})");

  EXPECT_EQ(lastFrame()["error"]["code"], -32601);
  EXPECT_EQ(lastFrame()["error"]["message"], "Method not found: resources/list");
}

TEST_F(McpSessionTest, NumericMethodIsUnknownMethod) {
  authenticate();
  send(R"({"jsonrpc":"2.0","id":7,"method":42})");

  EXPECT_EQ(lastFrame()["id"], 7);
  EXPECT_EQ(lastFrame()["error"]["code"], -32601);
  EXPECT_EQ(lastFrame()["error"]["message"], "Method not found: 42");
  EXPECT_TRUE(session_->isOpen());
}

TEST_F(McpSessionTest, MalformedJson) {
  authenticate();
  send("{\"id\": 1, \"method\": ");

  const auto& frame = lastFrame();
  EXPECT_TRUE(frame["id"].is_null());
  EXPECT_EQ(frame["error"]["code"], -32700);
  EXPECT_EQ(frame["error"]["message"], "Invalid JSON format");
  EXPECT_TRUE(session_->isOpen());
}

TEST_F(McpSessionTest, OversizedMessage) {
  authenticate();
  send(R"({"id":1,"method":"tools/list","pad":")" + std::string(10001, 'a') +
       R"("})");

  const auto& frame = lastFrame();
  EXPECT_TRUE(frame["id"].is_null());
  EXPECT_EQ(frame["error"]["code"], -32602);
  EXPECT_EQ(frame["error"]["message"], "Invalid request format");
  EXPECT_TRUE(session_->isOpen());
}

TEST_F(McpSessionTest, InvalidShapeEchoesRecoverableId) {
  authenticate();
  send(R"({"jsonrpc":"2.0","id":11})");

  EXPECT_EQ(lastFrame()["id"], 11);
  EXPECT_EQ(lastFrame()["error"]["code"], -32602);
}

TEST_F(McpSessionTest, FramesAreAnsweredInArrivalOrder) {
  authenticate();

  session_->onFrame(
      R"({"id":1,"method":"tools/call","params":{"name":"deferred"}})");
  session_->onFrame(R"({"id":2,"method":"tools/list"})");
  session_->onFrame(R"({"id":3,"method":"initialize"})");

  EXPECT_TRUE(session_->toolCallInFlight());
  EXPECT_EQ(session_->queuedFrames(), 2u);
  EXPECT_TRUE(sink_.frames.empty());

  ASSERT_EQ(pending_responders_.size(), 1u);
  pending_responders_[0].succeed("first");
  dispatcher_.runPending();

  ASSERT_EQ(sink_.frames.size(), 3u);
  EXPECT_EQ(sink_.frames[0]["id"], 1);
  EXPECT_EQ(sink_.frames[0]["result"]["content"][0]["text"], "first");
  EXPECT_EQ(sink_.frames[1]["id"], 2);
  EXPECT_EQ(sink_.frames[2]["id"], 3);
  EXPECT_FALSE(session_->toolCallInFlight());
}

TEST_F(McpSessionTest, ReadingPausedWhileToolCallInFlight) {
  authenticate();
  send(R"({"id":1,"method":"tools/list"})");
  EXPECT_TRUE(sink_.pause_calls.empty());

  session_->onFrame(
      R"({"id":2,"method":"tools/call","params":{"name":"deferred"}})");
  EXPECT_TRUE(sink_.readingPaused());

  ASSERT_EQ(pending_responders_.size(), 1u);
  pending_responders_[0].succeed("done");
  dispatcher_.runPending();

  EXPECT_FALSE(sink_.readingPaused());
  EXPECT_EQ(sink_.pause_calls, std::vector<bool>({true, false}));
}

TEST_F(McpSessionTest, SyncToolCallResumesReading) {
  authenticate();
  send(R"({"id":1,"method":"tools/call","params":{"name":"get_profile_data"}})");
  send(R"({"id":2,"method":"tools/call","params":{"name":"failing"}})");

  EXPECT_EQ(sink_.pause_calls, std::vector<bool>({true, false, true, false}));
  EXPECT_EQ(sink_.frames.size(), 2u);
}

TEST_F(McpSessionTest, QueuedFrameCountIsBounded) {
  authenticate();
  session_->onFrame(
      R"({"id":1,"method":"tools/call","params":{"name":"deferred"}})");

  const std::string frame = R"({"id":2,"method":"tools/list"})";
  for (size_t i = 0; i < McpSession::kMaxQueuedFrames; ++i) {
    session_->onFrame(frame);
  }
  EXPECT_EQ(session_->queuedFrames(), McpSession::kMaxQueuedFrames);
  EXPECT_TRUE(session_->isOpen());
  EXPECT_TRUE(sink_.close_reasons.empty());

  session_->onFrame(frame);
  EXPECT_EQ(sink_.close_reasons.size(), 1u);
  EXPECT_EQ(session_->state(), protocol::SessionState::Closed);
  EXPECT_EQ(session_->queuedFrames(), 0u);

  // Completion after the close sends nothing
  pending_responders_[0].succeed("late");
  dispatcher_.runPending();
  EXPECT_TRUE(sink_.frames.empty());
}

TEST_F(McpSessionTest, QueuedBytesAreBoundedForLargeFrames) {
  authenticate();
  session_->onFrame(
      R"({"id":1,"method":"tools/call","params":{"name":"deferred"}})");

  const std::string big(1000 * 1000, 'x');
  for (int i = 0; i < 200 && session_->isOpen(); ++i) {
    session_->onFrame(big);
  }

  EXPECT_FALSE(session_->isOpen());
  EXPECT_EQ(sink_.close_reasons.size(), 1u);
  EXPECT_LT(session_->stats().frames_received, 200u);
  EXPECT_LE(session_->stats().frames_received * big.size(),
            McpSession::kMaxQueuedBytes + big.size() * 2);
}

TEST_F(McpSessionTest, ResultAfterCloseIsDiscarded) {
  authenticate();
  session_->onFrame(
      R"({"id":1,"method":"tools/call","params":{"name":"deferred"}})");
  ASSERT_EQ(pending_responders_.size(), 1u);

  session_->close(protocol::SessionEvent::PeerClosed, "peer went away");
  EXPECT_EQ(session_->state(), protocol::SessionState::Closed);

  pending_responders_[0].succeed("too late");
  dispatcher_.runPending();
  EXPECT_TRUE(sink_.frames.empty());
}

TEST_F(McpSessionTest, ResultAfterDestructionIsDiscarded) {
  authenticate();
  session_->onFrame(
      R"({"id":1,"method":"tools/call","params":{"name":"deferred"}})");
  ASSERT_EQ(pending_responders_.size(), 1u);

  session_.reset();
  pending_responders_[0].succeed("orphan");
  EXPECT_EQ(dispatcher_.runPending(), 1u);
  EXPECT_TRUE(sink_.frames.empty());
}

TEST_F(McpSessionTest, CloseIsIdempotent) {
  authenticate();
  session_->close(protocol::SessionEvent::TransportFault, "reset");
  session_->close(protocol::SessionEvent::PeerClosed, "again");

  EXPECT_EQ(session_->state(), protocol::SessionState::Closed);
}

TEST_F(McpSessionTest, StatsCountTraffic) {
  authenticate();
  send(R"({"id":1,"method":"tools/list"})");
  send("garbage");
  send(R"({"id":2,"method":"tools/call","params":{"name":"get_profile_data"}})");

  const auto& stats = session_->stats();
  EXPECT_EQ(stats.frames_received, 3u);
  EXPECT_EQ(stats.responses_sent, 3u);
  EXPECT_EQ(stats.errors_sent, 1u);
  EXPECT_EQ(stats.tool_calls, 1u);
}

}  // namespace
}  // namespace server
}  // namespace mcpgate
