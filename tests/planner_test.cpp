// GENESIS-Prod headers
#include "core/WorkerPool.hpp"
#include "dialogue/ActionPlanner.hpp"
#include "dialogue/Persona.hpp"
#include "io/InteractionLog.hpp"

// GENESIS-Fake headers
#include "Mocks.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace genesis::test {

  using namespace std::chrono_literals;
  using dialogue::ActionPlanner;
  using testing::_;
  using testing::HasSubstr;
  using testing::NiceMock;
  using testing::Return;

  namespace motions = dialogue::motions;

  class MockInteractionLog : public io::InteractionLog {
  public:
    MockInteractionLog() : io::InteractionLog("unused.log", quietLogger()) {}
    MOCK_METHOD(bool, append, (const std::string&, const std::string&), (override));
  };

  class ActionPlannerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      logger = quietLogger();
      reasoning = std::make_unique<core::WorkerPool>("reasoning", 1, logger);
      gateway = std::make_unique<NiceMock<MockReasoningGateway>>(*reasoning, logger);
      errors = std::make_shared<NiceMock<MockErrorMonitor>>();

      ON_CALL(resolver, resolve(_)).WillByDefault([this](const std::string& t) { return keywords.resolve(t); });
      ON_CALL(context, turnCancelled()).WillByDefault(Return(false));
      ON_CALL(context, ownsIntent(_)).WillByDefault(Return(false));
      ON_CALL(context, snapshot()).WillByDefault(Return(dialogue::ConversationSnapshot{}));
      ON_CALL(interactions, append(_, _)).WillByDefault(Return(true));

      planner = std::make_unique<ActionPlanner>(context, resolver, time, *gateway, output, interactions,
                                                errors, logger);
    }

    std::shared_ptr<core::Logger> logger;
    std::unique_ptr<core::WorkerPool> reasoning;
    std::unique_ptr<NiceMock<MockReasoningGateway>> gateway;
    std::shared_ptr<NiceMock<MockErrorMonitor>> errors;
    nlp::KeywordIntentResolver keywords;
    NiceMock<MockIntentResolver> resolver;
    NiceMock<MockDialogueContext> context;
    NiceMock<MockTimeUtils> time;
    NiceMock<MockRobotOutput> output;
    NiceMock<MockInteractionLog> interactions;
    std::unique_ptr<ActionPlanner> planner;
  };

  TEST_F(ActionPlannerTest, time_is_answered_directly_without_posture) {
    EXPECT_CALL(output, speak("It is 3:05 PM.", _));
    EXPECT_CALL(output, movePosture(_, _)).Times(0);
    EXPECT_CALL(context, processTurn(_)).Times(0);
    EXPECT_CALL(*gateway, getResponse(_, _)).Times(0);
    EXPECT_CALL(interactions, append("what time is it", "It is 3:05 PM."));

    EXPECT_EQ(planner->processUserSpeech("what time is it"), "It is 3:05 PM.");
  }

  TEST_F(ActionPlannerTest, persona_change_goes_through_the_orchestrator_with_joy) {
    EXPECT_CALL(context, processTurn("switch personality to buddy"))
        .WillOnce(Return("Okay, I've switched my personality to Buddy."));
    EXPECT_CALL(output, speak("Okay, I've switched my personality to Buddy.", _));
    EXPECT_CALL(output, movePosture(motions::kDefaultPosture, _));

    EXPECT_EQ(planner->processUserSpeech("switch personality to buddy"),
              "Okay, I've switched my personality to Buddy.");
  }

  TEST_F(ActionPlannerTest, reminder_goes_through_the_orchestrator) {
    EXPECT_CALL(context, processTurn(_)).WillOnce(Return("Done. Scheduled daily at 08:00: reminder to stretch."));
    EXPECT_CALL(*gateway, getResponse(_, _)).Times(0);

    EXPECT_EQ(planner->plan("remind me to stretch at 8am")->motion, motions::kNod);
  }

  TEST_F(ActionPlannerTest, plugin_intent_is_delegated_when_owned) {
    ON_CALL(context, ownsIntent(nlp::intents::kAddNote)).WillByDefault(Return(true));
    EXPECT_CALL(context, processTurn("take a note that the lab opens at nine"))
        .WillOnce(Return("Noted: the lab opens at nine."));
    EXPECT_CALL(*gateway, getResponse(_, _)).Times(0);

    auto plan = planner->plan("take a note that the lab opens at nine");
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->speech, "Noted: the lab opens at nine.");
  }

  TEST_F(ActionPlannerTest, open_question_goes_to_the_gateway) {
    dialogue::PersonaSet set("en-US");
    dialogue::registerBuiltinPersonas(set);
    ON_CALL(context, snapshot()).WillByDefault(Return(dialogue::ConversationSnapshot{ set.find("professor"), "" }));

    std::string instruction;
    EXPECT_CALL(*gateway, getResponse(_, "why is the sky blue?"))
        .WillOnce([&](const std::string& i, const std::string&) {
          instruction = i;
          return readyString("Because of Rayleigh scattering.");
        });
    EXPECT_CALL(output, speak("Because of Rayleigh scattering.", _));
    EXPECT_CALL(output, movePosture(motions::kDefaultPosture, _));
    EXPECT_CALL(interactions, append("why is the sky blue?", "Because of Rayleigh scattering."));

    EXPECT_EQ(planner->processUserSpeech("why is the sky blue?"), "Because of Rayleigh scattering.");
    EXPECT_THAT(instruction, HasSubstr("You are Professor"));
    EXPECT_THAT(instruction, HasSubstr("Respond in a neutral tone."));
  }

  TEST_F(ActionPlannerTest, sentinel_answer_speaks_the_fallback) {
    ON_CALL(*gateway, getResponse(_, _)).WillByDefault([](const std::string&, const std::string&) {
      return readyString(ai::ReasoningGateway::kTechnicalDifficulties);
    });
    EXPECT_CALL(output, speak(ActionPlanner::kFallbackReply, _));
    EXPECT_CALL(interactions, append(_, _)).Times(0);

    EXPECT_EQ(planner->processUserSpeech("tell me a story"), ActionPlanner::kFallbackReply);
  }

  TEST_F(ActionPlannerTest, output_failure_is_one_generic_apology) {
    ON_CALL(output, speak(_, _)).WillByDefault([](const std::string&, bool) {
      return failedVoid("ALTextToSpeech.say rejected");
    });
    EXPECT_CALL(*errors, notifyFailure(HasSubstr("[ActionPlanner] output failed")));
    EXPECT_CALL(interactions, append(_, _)).Times(0);

    EXPECT_EQ(planner->processUserSpeech("what time is it"), ActionPlanner::kErrorReply);
  }

  TEST_F(ActionPlannerTest, motion_failure_also_fails_the_turn) {
    ON_CALL(output, movePosture(_, _)).WillByDefault([](const std::string&, float) {
      return failedVoid("posture rejected");
    });
    EXPECT_CALL(context, processTurn(_)).WillOnce(Return("Alright, I'll try to adopt a calm tone."));
    EXPECT_CALL(output, speak(_, _));

    EXPECT_EQ(planner->processUserSpeech("use a calm tone"), ActionPlanner::kErrorReply);
  }

  TEST_F(ActionPlannerTest, planning_failure_is_reported) {
    EXPECT_CALL(resolver, resolve(_)).WillOnce([](const std::string&) -> nlp::IntentResult {
      throw std::runtime_error("regex blew up");
    });
    EXPECT_CALL(*errors, notifyFailure(HasSubstr("planning failed")));
    EXPECT_CALL(output, speak(_, _)).Times(0);

    EXPECT_EQ(planner->processUserSpeech("anything"), ActionPlanner::kErrorReply);
  }

  TEST_F(ActionPlannerTest, cancelled_turn_produces_no_output) {
    ON_CALL(context, turnCancelled()).WillByDefault(Return(true));
    EXPECT_CALL(output, speak(_, _)).Times(0);
    EXPECT_CALL(interactions, append(_, _)).Times(0);

    EXPECT_EQ(planner->processUserSpeech("what time is it"), "");
  }

  TEST_F(ActionPlannerTest, turn_waits_for_every_started_channel) {
    std::promise<void> speechDone;
    auto speechFuture = speechDone.get_future().share();
    ON_CALL(output, speak(_, _)).WillByDefault([speechFuture](const std::string&, bool) {
      return std::async(std::launch::async, [speechFuture] { speechFuture.wait(); });
    });
    ON_CALL(context, processTurn(_)).WillByDefault(Return("Okay, I've switched my personality to Genesis."));

    auto turn = std::async(std::launch::async, [this] { return planner->processUserSpeech("switch persona to genesis"); });
    EXPECT_EQ(turn.wait_for(50ms), std::future_status::timeout);

    speechDone.set_value();
    ASSERT_EQ(turn.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(turn.get(), "Okay, I've switched my personality to Genesis.");
  }

  TEST(action_planner, posture_for_motion_tokens) {
    EXPECT_FALSE(ActionPlanner::postureFor("").has_value());
    EXPECT_FALSE(ActionPlanner::postureFor(motions::kNeutral).has_value());
    EXPECT_EQ(ActionPlanner::postureFor("move_posture:Crouch"), "Crouch");
    EXPECT_EQ(ActionPlanner::postureFor(motions::kNod), "Stand");
    EXPECT_EQ(ActionPlanner::postureFor(motions::kThink), "Stand");
  }

  TEST(action_planner, instruction_carries_persona_and_tone) {
    dialogue::PersonaSet set("en-US");
    dialogue::registerBuiltinPersonas(set);
    auto text = ActionPlanner::composeInstruction({ set.find("buddy"), "sleepy" });

    EXPECT_THAT(text, HasSubstr("You are Buddy"));
    EXPECT_THAT(text, HasSubstr("physical robot"));
    EXPECT_THAT(text, HasSubstr("Respond in a sleepy tone."));
  }

} // namespace genesis::test
