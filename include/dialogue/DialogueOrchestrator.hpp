#pragma once
/** @file  DialogueOrchestrator.hpp
 *  @brief Conversation state, intent dispatch table, plugin routing and persona styling.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "ai/PersonaStylizer.hpp"
#include "core/SensorEvent.hpp"
#include "dialogue/ConversationState.hpp"
#include "dialogue/DialogueContext.hpp"
#include "nlp/IntentResolver.hpp"

namespace genesis {
  namespace ai {
    class ReasoningGateway;
  }
  namespace core {
    class Logger;
    class PluginRegistry;
    class RobotOutput;
    class WorkerPool;
  } // namespace core
  namespace services {
    class ReminderService;
    class TimeUtils;
  } // namespace services

  namespace dialogue {

    /**
 * @class DialogueOrchestrator
 * @brief Entry point for sensor events and for text turns.
 *
 *  * `handleSensorEvent()` runs on the event loop and never blocks it: a turn
 *    is a detached job on the dialogue pool, never joined.
 *  * `processTurn()` never throws. Handler and plugin failures become apologies
 *    naming the intent.
 *  * Intents in the dispatch table never reach the plugin registry.
 *  * Two-phase set-up: construct, build the planner against this context,
 *    then `bindPlanner()`.
 */
    class DialogueOrchestrator : public DialogueContext {
    public:
      struct Collaborators {
        const nlp::IntentResolver& resolver;
        const core::PluginRegistry& plugins;
        const ai::ReasoningGateway& gateway;
        services::ReminderService& reminders;
        const services::TimeUtils& time;
        core::RobotOutput& output;
        core::WorkerPool& turns;
      };

      struct Options {
        bool personaStyling{ true };
        std::string initialPersona{ "genesis" };
      };

      static constexpr const char* kHeadTouchReply = "Please don't touch my head.";

      DialogueOrchestrator(Collaborators collaborators, std::shared_ptr<const PersonaSet> personas,
                           Options options, std::shared_ptr<core::Logger> logger);

      void bindPlanner(SpeechProcessor& planner) { planner_ = &planner; }

      //---sensor intake (event loop thread)---------------------------------
      void handleSensorEvent(const core::SensorEvent& event);

      //---DialogueContext---------------------------------------------------
      std::string processTurn(const std::string& text) override;
      ConversationSnapshot snapshot() const override { return state_.snapshot(); }
      bool ownsIntent(const std::string& intent) const override;
      bool turnCancelled() const override { return cancelled_.load(); }

      /// Mark every running and future turn as cancelled.
      void cancelInFlightTurns();

      std::size_t turnsStarted() const { return turnsStarted_.load(); }
      bool hasHandler(const std::string& intent) const { return handlers_.count(intent) != 0; }
      const PersonaSet& personas() const { return *personas_; }

      /// Utterance carried by a WordRecognized value; empty when there is none.
      static std::string utteranceOf(const core::EventValue& value);

    private:
      using Handler = std::function<std::string(const nlp::IntentResult&)>;

      std::string dispatch(const nlp::IntentResult& intent, const std::string& rawText);
      std::string style(const std::string& baseReply, const std::string& rawText) const;

      std::string changePersonality(const nlp::IntentResult& intent);
      std::string changeTone(const nlp::IntentResult& intent);
      std::string setReminder(const nlp::IntentResult& intent);

      Collaborators c_;
      std::shared_ptr<const PersonaSet> personas_;
      Options options_;
      std::shared_ptr<core::Logger> logger_;
      ai::PersonaStylizer stylizer_;

      ConversationState state_;
      std::unordered_map<std::string, Handler> handlers_;
      SpeechProcessor* planner_{ nullptr };
      std::atomic<bool> cancelled_{ false };
      std::atomic<std::size_t> turnsStarted_{ 0 };
    };

  } // namespace dialogue
} // namespace genesis
