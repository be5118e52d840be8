// GENESIS-Prod headers
#include "core/PluginRegistry.hpp"
#include "core/WorkerPool.hpp"
#include "dialogue/ConversationState.hpp"
#include "dialogue/DialogueOrchestrator.hpp"
#include "dialogue/Persona.hpp"
#include "dialogue/ResponseFormatter.hpp"
#include "nlp/IntentResolver.hpp"
#include "services/ReminderService.hpp"

// GENESIS-Fake headers
#include "Mocks.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace genesis::test {

  using namespace std::chrono_literals;
  using dialogue::DialogueOrchestrator;
  using dialogue::PersonaSet;
  using testing::_;
  using testing::HasSubstr;
  using testing::NiceMock;
  using testing::Return;
  using testing::StrictMock;

  //---Persona / PersonaSet--------------------------------------------------------

  TEST(persona, system_prompt_resolves_placeholders) {
    dialogue::Persona p("Buddy", "playful", "I am {name}, {tone} and {tone}, speaking {language}.",
                        "en-GB");
    EXPECT_EQ(p.systemPrompt(), "I am Buddy, playful and playful, speaking en-GB.");
    EXPECT_EQ(p.promptTemplate(), "I am {name}, {tone} and {tone}, speaking {language}.");
  }

  TEST(persona_set, lookup_is_case_insensitive_and_ordered) {
    PersonaSet set("en-US");
    dialogue::registerBuiltinPersonas(set);

    ASSERT_NE(set.find("PROFESSOR"), nullptr);
    EXPECT_EQ(set.find("professor")->name(), "Professor");
    EXPECT_EQ(set.find("pirate"), nullptr);
    EXPECT_EQ(set.first()->name(), "Genesis");
    EXPECT_EQ(set.names(), (std::vector<std::string>{ "Genesis", "Professor", "Buddy" }));
  }

  TEST(persona_set, duplicate_replaces_in_place) {
    PersonaSet set("en-US");
    EXPECT_TRUE(set.add("Genesis", "friendly", "a"));
    EXPECT_TRUE(set.add("Buddy", "playful", "b"));
    EXPECT_FALSE(set.add("genesis", "stern", "c"));

    EXPECT_EQ(set.size(), 2u);
    EXPECT_EQ(set.first()->tone(), "stern");
  }

  TEST(persona_set, fallback_only_when_empty) {
    PersonaSet empty("en-US");
    empty.ensureFallback();
    ASSERT_EQ(empty.size(), 1u);
    EXPECT_EQ(empty.first()->name(), PersonaSet::kFallbackName);
    EXPECT_EQ(empty.first()->tone(), "neutral");

    PersonaSet loaded("en-US");
    dialogue::registerBuiltinPersonas(loaded);
    loaded.ensureFallback();
    EXPECT_EQ(loaded.find(PersonaSet::kFallbackName), nullptr);
  }

  //---ConversationState-----------------------------------------------------------

  TEST(conversation_state, persona_switch_resets_tone) {
    PersonaSet set("en-US");
    dialogue::registerBuiltinPersonas(set);
    dialogue::ConversationState state;

    state.setPersona(set.find("genesis"));
    state.setTone("sarcastic");
    EXPECT_EQ(state.snapshot().tone, "sarcastic");

    state.setPersona(set.find("buddy"));
    auto snap = state.snapshot();
    EXPECT_EQ(snap.persona->name(), "Buddy");
    EXPECT_EQ(snap.tone, "playful");
  }

  TEST(response_formatter, wraps_message) {
    EXPECT_EQ(dialogue::formatErrorMessage("the robot is busy"),
              "Sorry, I encountered an issue: the robot is busy");
    auto logger = quietLogger();
    EXPECT_EQ(dialogue::formatErrorMessage("x", "stack detail", *logger), "Sorry, I encountered an issue: x");
  }

  //---DialogueOrchestrator--------------------------------------------------------

  class DialogueOrchestratorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      logger = quietLogger();
      turns = std::make_unique<core::WorkerPool>("dialogue", 2, logger);
      reasoning = std::make_unique<core::WorkerPool>("reasoning", 1, logger);
      gateway = std::make_unique<NiceMock<MockReasoningGateway>>(*reasoning, logger);
      ON_CALL(*gateway, getResponse(_, _)).WillByDefault([](const std::string&, const std::string&) {
        return readyString(ai::ReasoningGateway::kDisconnected);
      });
      reminders = std::make_unique<services::ReminderService>(scheduler, output, logger);

      registry = std::make_unique<core::PluginRegistry>(logger);
      registry->registerPlugin("mock", {}, [this](const plugins::SharedResources&) -> std::unique_ptr<plugins::Plugin> {
        auto p = std::make_unique<NiceMock<MockPlugin>>();
        ON_CALL(*p, name()).WillByDefault(Return("mock"));
        ON_CALL(*p, supportsIntent(_)).WillByDefault([](const std::string& i) {
          return i == nlp::intents::kAddNote;
        });
        plugin = p.get();
        return p;
      });
      registry->instantiate(plugins::SharedResources{});

      auto set = std::make_shared<PersonaSet>("en-US");
      dialogue::registerBuiltinPersonas(*set);
      personas = set;
    }

    void TearDown() override {
      turns->shutdown(1000ms);
      orchestrator.reset();
    }

    void build(bool styling = false, std::string initial = "genesis") {
      DialogueOrchestrator::Options options;
      options.personaStyling = styling;
      options.initialPersona = std::move(initial);
      orchestrator = std::make_unique<DialogueOrchestrator>(
          DialogueOrchestrator::Collaborators{ resolver, *registry, *gateway, *reminders, time, output,
                                               *turns },
          personas, options, logger);
      orchestrator->bindPlanner(planner);
    }

    static core::SensorEvent heard(const std::string& text) {
      return { core::events::kWordRecognized, nlohmann::json::array({ text, 0.8 }),
               std::chrono::steady_clock::now() };
    }

    std::shared_ptr<core::Logger> logger;
    std::unique_ptr<core::WorkerPool> turns;
    std::unique_ptr<core::WorkerPool> reasoning;
    nlp::KeywordIntentResolver resolver;
    NiceMock<MockTimeUtils> time;
    NiceMock<MockRobotOutput> output;
    NiceMock<MockTaskScheduler> scheduler;
    NiceMock<MockSpeechProcessor> planner;
    std::unique_ptr<NiceMock<MockReasoningGateway>> gateway;
    std::unique_ptr<services::ReminderService> reminders;
    std::unique_ptr<core::PluginRegistry> registry;
    NiceMock<MockPlugin>* plugin = nullptr;
    std::shared_ptr<const PersonaSet> personas;
    std::unique_ptr<DialogueOrchestrator> orchestrator;
  };

  TEST_F(DialogueOrchestratorTest, starts_with_configured_persona_or_first) {
    build(false, "Buddy");
    EXPECT_EQ(orchestrator->snapshot().persona->name(), "Buddy");

    build(false, "nobody");
    EXPECT_EQ(orchestrator->snapshot().persona->name(), "Genesis");
    EXPECT_EQ(orchestrator->snapshot().tone, "friendly");
  }

  TEST_F(DialogueOrchestratorTest, time_and_date_come_from_time_utils) {
    build();
    EXPECT_EQ(orchestrator->processTurn("What time is it?"), "It is 3:05 PM.");
    EXPECT_EQ(orchestrator->processTurn("what's the date today"), "Today is Friday, October 17, 2026.");
  }

  TEST_F(DialogueOrchestratorTest, switches_personality) {
    build();
    EXPECT_EQ(orchestrator->processTurn("switch your personality to professor"),
              "Okay, I've switched my personality to Professor.");
    auto snap = orchestrator->snapshot();
    EXPECT_EQ(snap.persona->name(), "Professor");
    EXPECT_EQ(snap.tone, "informative");
  }

  TEST_F(DialogueOrchestratorTest, unknown_personality_lists_the_available_ones) {
    build();
    EXPECT_EQ(orchestrator->processTurn("change personality to pirate"),
              "Sorry, I don't have a personality named 'pirate'. Available: Genesis, Professor, Buddy.");
    EXPECT_EQ(orchestrator->snapshot().persona->name(), "Genesis");
  }

  TEST_F(DialogueOrchestratorTest, changes_tone_until_next_persona_switch) {
    build();
    EXPECT_EQ(orchestrator->processTurn("please use a formal tone"),
              "Alright, I'll try to adopt a formal tone.");
    EXPECT_EQ(orchestrator->snapshot().tone, "formal");
    EXPECT_EQ(orchestrator->processTurn("change your tone"), "What tone would you like me to use?");

    orchestrator->processTurn("switch personality to buddy");
    EXPECT_EQ(orchestrator->snapshot().tone, "playful");
  }

  TEST_F(DialogueOrchestratorTest, reminder_goes_to_the_scheduler) {
    EXPECT_CALL(scheduler, addTask("daily_reminder_1900_take_pills", "reminder to take pills", "19:00", _,
                                   std::vector<std::string>{ "take pills" }))
        .WillOnce(Return("Done. Scheduled daily at 19:00: reminder to take pills."));
    build();

    EXPECT_EQ(orchestrator->processTurn("Remind me to take pills at 7pm"),
              "Done. Scheduled daily at 19:00: reminder to take pills.");
  }

  TEST_F(DialogueOrchestratorTest, reminder_without_details_asks_for_them) {
    EXPECT_CALL(scheduler, addTask(_, _, _, _, _)).Times(0);
    build();
    EXPECT_EQ(orchestrator->processTurn("set a reminder"),
              "To set a reminder, I need the reminder text and a specific time.");
  }

  TEST_F(DialogueOrchestratorTest, plugin_handles_its_intent) {
    build();
    ASSERT_NE(plugin, nullptr);
    EXPECT_CALL(*plugin, execute("take a note that buy milk", _)).WillOnce(Return("Noted: buy milk."));

    EXPECT_TRUE(orchestrator->ownsIntent(nlp::intents::kAddNote));
    EXPECT_FALSE(orchestrator->ownsIntent(nlp::intents::kGeneralQuery));
    EXPECT_EQ(orchestrator->processTurn("take a note that buy milk"), "Noted: buy milk.");
  }

  TEST_F(DialogueOrchestratorTest, handler_intents_never_reach_plugins) {
    build();
    ON_CALL(*plugin, supportsIntent(_)).WillByDefault(Return(true));
    EXPECT_CALL(*plugin, execute(_, _)).Times(0);

    EXPECT_EQ(orchestrator->processTurn("what time is it"), "It is 3:05 PM.");
  }

  TEST_F(DialogueOrchestratorTest, failures_become_apologies_naming_the_intent) {
    build();
    EXPECT_CALL(*plugin, execute(_, _)).WillOnce([](const std::string&, const nlp::IntentResult&) -> std::string {
      throw std::runtime_error("disk full");
    });
    EXPECT_CALL(time, tellTime()).WillOnce([]() -> std::string { throw std::runtime_error("no clock"); });

    EXPECT_EQ(orchestrator->processTurn("add a note: call mum"),
              "Sorry, I encountered an issue: I had trouble processing your request concerning 'add_note'.");
    EXPECT_EQ(orchestrator->processTurn("what time is it"),
              "Sorry, I encountered an issue: I had trouble processing your request concerning 'tell_time'.");
  }

  TEST_F(DialogueOrchestratorTest, unowned_intent_reports_missing_tool) {
    build();
    EXPECT_EQ(orchestrator->processTurn("why is the sky blue?"),
              "Sorry, I encountered an issue: I understood the intent 'general_query', but I lack the "
              "specific tool to execute it directly.");
  }

  TEST_F(DialogueOrchestratorTest, styling_rephrases_with_persona_and_tone) {
    std::string instruction;
    EXPECT_CALL(*gateway, getResponse(_, HasSubstr("It is 3:05 PM.")))
        .WillOnce([&](const std::string& i, const std::string&) {
          instruction = i;
          return readyString("Well hello, it's five past three!");
        });
    build(true);

    EXPECT_EQ(orchestrator->processTurn("what time is it"), "Well hello, it's five past three!");
    EXPECT_THAT(instruction, HasSubstr("You are Genesis"));
    EXPECT_THAT(instruction, HasSubstr("Respond in a friendly tone."));
  }

  TEST_F(DialogueOrchestratorTest, styling_rephrases_the_missing_tool_reply) {
    EXPECT_CALL(*gateway, getResponse(HasSubstr("You are Genesis"), HasSubstr("lack the specific tool")))
        .WillOnce([](const std::string&, const std::string&) {
          return readyString("Good question! Sunlight scatters off the air.");
        });
    build(true);

    EXPECT_EQ(orchestrator->processTurn("why is the sky blue?"),
              "Good question! Sunlight scatters off the air.");
  }

  TEST_F(DialogueOrchestratorTest, styling_falls_back_to_base_reply_on_sentinel) {
    build(true);
    EXPECT_EQ(orchestrator->processTurn("what time is it"), "It is 3:05 PM.");
  }

  TEST_F(DialogueOrchestratorTest, utterance_starts_a_detached_turn) {
    std::promise<std::string> got;
    EXPECT_CALL(planner, processUserSpeech("hello there")).WillOnce([&](const std::string& t) {
      got.set_value(t);
      return std::string("hi");
    });
    build();

    orchestrator->handleSensorEvent(heard("  hello there "));
    auto f = got.get_future();
    ASSERT_EQ(f.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(orchestrator->turnsStarted(), 1u);
  }

  TEST_F(DialogueOrchestratorTest, non_utf8_utterance_still_starts_a_turn) {
    std::promise<std::string> got;
    EXPECT_CALL(planner, processUserSpeech("caf\xe9")).WillOnce([&](const std::string& t) {
      got.set_value(t);
      return std::string("ok");
    });
    build();

    orchestrator->handleSensorEvent(heard("caf\xe9"));
    auto f = got.get_future();
    ASSERT_EQ(f.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(orchestrator->turnsStarted(), 1u);
  }

  TEST_F(DialogueOrchestratorTest, blank_utterance_is_ignored) {
    EXPECT_CALL(planner, processUserSpeech(_)).Times(0);
    build();

    orchestrator->handleSensorEvent(heard("   "));
    orchestrator->handleSensorEvent({ core::events::kTextDone, 1, {} });
    EXPECT_EQ(orchestrator->turnsStarted(), 0u);
  }

  TEST_F(DialogueOrchestratorTest, head_touch_gets_a_spoken_reaction) {
    std::promise<void> spoken;
    EXPECT_CALL(output, speak(DialogueOrchestrator::kHeadTouchReply, _))
        .WillOnce([&](const std::string&, bool) {
          spoken.set_value();
          return readyVoid();
        });
    build();

    orchestrator->handleSensorEvent({ core::events::kFrontTactilTouched, 1, {} });
    EXPECT_EQ(spoken.get_future().wait_for(2s), std::future_status::ready);
  }

  TEST_F(DialogueOrchestratorTest, cancelled_orchestrator_starts_nothing) {
    EXPECT_CALL(planner, processUserSpeech(_)).Times(0);
    build();

    orchestrator->cancelInFlightTurns();
    EXPECT_TRUE(orchestrator->turnCancelled());
    orchestrator->handleSensorEvent(heard("hello"));
    EXPECT_EQ(orchestrator->turnsStarted(), 0u);
  }

  TEST(dialogue_orchestrator, utterance_of_event_values) {
    EXPECT_EQ(DialogueOrchestrator::utteranceOf(nlohmann::json::array({ "hi", 0.5 })), "hi");
    EXPECT_EQ(DialogueOrchestrator::utteranceOf("plain"), "plain");
    EXPECT_EQ(DialogueOrchestrator::utteranceOf(3), "");
    EXPECT_EQ(DialogueOrchestrator::utteranceOf(nlohmann::json::array()), "");
  }

} // namespace genesis::test
