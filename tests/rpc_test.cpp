// GENESIS-Prod headers
#include "core/SensorEvent.hpp"
#include "io/RpcHardwareLink.hpp"
#include "io/SimulatedHardwareLink.hpp"

// GENESIS-Fake headers
#include "FakeSocketChannel.hpp"
#include "Mocks.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace genesis::test {

  using namespace std::chrono_literals;
  using genesis::io::LinkError;
  using genesis::io::RpcHardwareLink;
  using genesis::io::Service;
  using nlohmann::json;

  class RpcHardwareLinkTest : public ::testing::Test {
  protected:
    void SetUp() override {
      RpcHardwareLink::Timeouts timeouts;
      timeouts.call = 50ms;
      timeouts.speech = 50ms;
      timeouts.motion = 50ms;

      link = std::make_unique<RpcHardwareLink>(
          quietLogger(),
          [this]() -> std::unique_ptr<io::SocketChannel> {
            auto fake = std::make_unique<FakeSocketChannel>();
            fake->responder = [](const json& r) { return FakeSocketChannel::okReply(r); };
            if (configure)
              configure(*fake, channels.size() % 3);
            channels.push_back(fake.get()); // raw ptr for assertions
            return fake;
          },
          timeouts);
    }

    FakeSocketChannel& channel(Service s) {
      return *channels.at(channels.size() - 3 + static_cast<std::size_t>(s));
    }

    static json lastRequest(const FakeSocketChannel& ch) {
      const auto& line = ch.written.back();
      return json::parse(line.substr(0, line.find("\r\n")));
    }

    std::function<void(FakeSocketChannel&, std::size_t)> configure;
    std::vector<FakeSocketChannel*> channels;
    std::unique_ptr<RpcHardwareLink> link;
  };

  TEST_F(RpcHardwareLinkTest, open_connects_every_service_and_pings_memory) {
    ASSERT_TRUE(link->open("pepper.local", 9559));
    EXPECT_TRUE(link->isOpen());

    ASSERT_EQ(channels.size(), 3u);
    for (auto* ch : channels)
      EXPECT_TRUE(ch->open_called);

    const auto& memory = channel(Service::Memory);
    ASSERT_EQ(memory.written.size(), 1u);
    EXPECT_TRUE(memory.written[0].ends_with("\r\n"));
    auto ping = lastRequest(memory);
    EXPECT_EQ(ping["service"], "ALMemory");
    EXPECT_EQ(ping["method"], "ping");
    EXPECT_TRUE(channel(Service::Speech).written.empty());
  }

  TEST_F(RpcHardwareLinkTest, open_is_idempotent) {
    ASSERT_TRUE(link->open("pepper.local", 9559));
    ASSERT_TRUE(link->open("pepper.local", 9559));
    EXPECT_EQ(channels.size(), 3u);
  }

  TEST_F(RpcHardwareLinkTest, unreachable_service_fails_open) {
    configure = [](FakeSocketChannel& ch, std::size_t index) {
      if (index == 1)
        ch.open_success = false;
    };
    EXPECT_FALSE(link->open("pepper.local", 9559));
    EXPECT_FALSE(link->isOpen());
    EXPECT_THROW(link->say("hello"), LinkError);
  }

  TEST_F(RpcHardwareLinkTest, rejected_handshake_fails_open) {
    configure = [](FakeSocketChannel& ch, std::size_t) {
      ch.responder = [](const json& r) -> std::optional<std::string> {
        return json{ { "id", r["id"] }, { "ok", false }, { "error", "bridge starting" } }.dump();
      };
    };
    EXPECT_FALSE(link->open("pepper.local", 9559));
    EXPECT_FALSE(link->isOpen());
  }

  TEST_F(RpcHardwareLinkTest, actuators_use_their_own_service) {
    ASSERT_TRUE(link->open("pepper.local", 9559));

    link->say("hello there");
    auto say = lastRequest(channel(Service::Speech));
    EXPECT_EQ(say["service"], "ALTextToSpeech");
    EXPECT_EQ(say["method"], "say");
    EXPECT_EQ(say["args"], json::array({ "hello there" }));

    link->goToPosture("Stand", 0.8f);
    auto move = lastRequest(channel(Service::Motion));
    EXPECT_EQ(move["service"], "ALRobotPosture");
    EXPECT_EQ(move["args"][0], "Stand");
    EXPECT_NEAR(move["args"][1].get<double>(), 0.8, 1e-6);

    EXPECT_NE(say["id"], move["id"]);
  }

  TEST_F(RpcHardwareLinkTest, get_data_returns_result) {
    ASSERT_TRUE(link->open("pepper.local", 9559));
    channel(Service::Memory).responder = [](const json& r) -> std::optional<std::string> {
      return FakeSocketChannel::okReply(r, json::array({ "hello", 0.61 }));
    };

    EXPECT_EQ(link->getData(core::events::kWordRecognized), json::array({ "hello", 0.61 }));
    EXPECT_EQ(lastRequest(channel(Service::Memory))["args"], json::array({ "WordRecognized" }));
  }

  TEST_F(RpcHardwareLinkTest, stale_and_malformed_lines_are_skipped) {
    ASSERT_TRUE(link->open("pepper.local", 9559));
    auto& memory = channel(Service::Memory);
    memory.responder = [&memory](const json& r) -> std::optional<std::string> {
      memory.inbox.push_back("not json");
      memory.inbox.push_back(R"({"id":999999,"ok":true,"result":"old"})");
      return FakeSocketChannel::okReply(r, 1);
    };

    EXPECT_EQ(link->getData("TouchChanged"), 1);
  }

  TEST_F(RpcHardwareLinkTest, remote_rejection_keeps_the_session) {
    ASSERT_TRUE(link->open("pepper.local", 9559));
    channel(Service::Speech).responder = [](const json& r) -> std::optional<std::string> {
      return json{ { "id", r["id"] }, { "ok", false }, { "error", "busy" } }.dump();
    };

    try {
      link->say("hello");
      FAIL() << "expected LinkError";
    } catch (const LinkError& e) {
      EXPECT_THAT(e.what(), testing::HasSubstr("ALTextToSpeech.say rejected: busy"));
    }
    EXPECT_TRUE(link->isOpen());
  }

  TEST_F(RpcHardwareLinkTest, silent_bridge_times_out_without_dropping) {
    ASSERT_TRUE(link->open("pepper.local", 9559));
    channel(Service::Memory).responder = [](const json&) -> std::optional<std::string> { return std::nullopt; };

    EXPECT_THROW(link->getData("TouchChanged"), LinkError);
    EXPECT_TRUE(link->isOpen());
  }

  TEST_F(RpcHardwareLinkTest, write_failure_drops_the_session) {
    ASSERT_TRUE(link->open("pepper.local", 9559));
    channel(Service::Speech).write_success = false;

    EXPECT_THROW(link->say("hello"), LinkError);
    EXPECT_FALSE(link->isOpen());
    EXPECT_FALSE(channel(Service::Memory).isOpen());
  }

  TEST_F(RpcHardwareLinkTest, peer_hang_up_drops_the_session) {
    ASSERT_TRUE(link->open("pepper.local", 9559));
    auto& memory = channel(Service::Memory);
    memory.responder = [&memory](const json&) -> std::optional<std::string> {
      memory.hangUp();
      return std::nullopt;
    };

    EXPECT_THROW(link->getData("TouchChanged"), LinkError);
    EXPECT_FALSE(link->isOpen());
  }

  TEST_F(RpcHardwareLinkTest, reopen_after_close_builds_fresh_channels) {
    ASSERT_TRUE(link->open("pepper.local", 9559));
    link->close();
    EXPECT_FALSE(link->isOpen());
    EXPECT_THROW(link->getData("TouchChanged"), LinkError);

    ASSERT_TRUE(link->open("pepper.local", 9559));
    EXPECT_EQ(channels.size(), 6u);
  }

  //---SimulatedHardwareLink----------------------------------------------------------

  TEST(simulated_hardware_link, closed_session_throws) {
    io::SimulatedHardwareLink link(quietLogger(), 0ms);
    EXPECT_THROW(link.say("hi"), LinkError);
    EXPECT_THROW(link.getData(core::events::kWordRecognized), LinkError);
  }

  TEST(simulated_hardware_link, serves_each_utterance_once) {
    io::SimulatedHardwareLink link(quietLogger(), 0ms);
    ASSERT_TRUE(link.open("localhost", 9559));
    link.injectUtterance("hello", 0.9);
    link.injectUtterance("hello", 0.9);

    const json empty = json::array({ "", 0.0 });
    EXPECT_EQ(link.getData(core::events::kWordRecognized), json::array({ "hello", 0.9 }));
    EXPECT_EQ(link.getData(core::events::kWordRecognized), empty);
    EXPECT_EQ(link.getData(core::events::kWordRecognized), json::array({ "hello", 0.9 }));
    EXPECT_EQ(link.getData(core::events::kWordRecognized), empty);
    EXPECT_EQ(link.getData(core::events::kWordRecognized), empty);
  }

  TEST(simulated_hardware_link, say_marks_text_done_and_memory_is_scriptable) {
    io::SimulatedHardwareLink link(quietLogger(), 0ms);
    ASSERT_TRUE(link.open("localhost", 9559));

    EXPECT_TRUE(link.getData(core::events::kTextDone).is_null());
    link.say("hello");
    EXPECT_EQ(link.getData(core::events::kTextDone), 1);

    link.inject(core::events::kFrontTactilTouched, 1);
    EXPECT_EQ(link.getData(core::events::kFrontTactilTouched), 1);

    link.dropSession();
    EXPECT_FALSE(link.isOpen());
    EXPECT_THROW(link.goToPosture("Stand", 0.5f), LinkError);
  }

} // namespace genesis::test
