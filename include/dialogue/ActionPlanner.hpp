#pragma once
/** @file  ActionPlanner.hpp
 *  @brief Turns an utterance into speech + motion and runs both output channels.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <optional>
#include <string>

#include "dialogue/DialogueContext.hpp"

namespace genesis {
  namespace ai {
    class ReasoningGateway;
  }
  namespace core {
    class ErrorMonitor;
    class Logger;
    class RobotOutput;
  } // namespace core
  namespace io {
    class InteractionLog;
  }
  namespace nlp {
    class IntentResolver;
  }
  namespace services {
    class TimeUtils;
  }

  namespace dialogue {

    /// Paired output for one turn.
    struct ActionPlan {
      std::string speech;
      std::string motion; ///< posture token, may be empty
    };

    namespace motions {
      inline constexpr const char* kNeutral = "HeadYaw:0";
      inline constexpr const char* kJoy = "BodyLanguage:Joy";
      inline constexpr const char* kNod = "HeadNod";
      inline constexpr const char* kThink = "BodyLanguage:Think";
      inline constexpr const char* kPosturePrefix = "move_posture:";
      inline constexpr const char* kDefaultPosture = "Stand";
    } // namespace motions

    /**
 * @class ActionPlanner
 * @brief Runs on a dialogue worker; blocking waits are fine here.
 *
 *  * Time and date are answered directly, persona / tone / reminder / plugin
 *    intents go through the orchestrator, everything else to the gateway.
 *  * A turn ends when every started output channel reported completion.
 *  * Output failures become one generic apology; the detail is logged and
 *    reported to the ErrorMonitor.
 */
    class ActionPlanner : public SpeechProcessor {
    public:
      static constexpr const char* kFallbackReply = "I'm not sure how to respond to that.";
      static constexpr const char* kErrorReply = "I encountered an error while processing your request.";

      ActionPlanner(DialogueContext& context, const nlp::IntentResolver& resolver,
                    const services::TimeUtils& time, const ai::ReasoningGateway& gateway,
                    core::RobotOutput& output, io::InteractionLog& interactions,
                    std::shared_ptr<core::ErrorMonitor> errors, std::shared_ptr<core::Logger> logger);

      //---public API------------------------------------------------------
      /// Plan, speak, move, log. @returns the reply (empty when the turn was cancelled).
      std::string processUserSpeech(const std::string& text) override;

      /// nullopt when nothing sensible can be said (e.g. the gateway gave a sentinel).
      std::optional<ActionPlan> plan(const std::string& text);

      /// Run both channels and log the turn. @returns speech or `kErrorReply`.
      std::string execute(const ActionPlan& plan, const std::string& userText);

      /// Posture to request for \p motion; nullopt for empty or neutral tokens.
      static std::optional<std::string> postureFor(const std::string& motion);

      /// System instruction for direct gateway questions.
      static std::string composeInstruction(const ConversationSnapshot& snapshot);

    private:
      std::string speakFallback();

      DialogueContext& context_;
      const nlp::IntentResolver& resolver_;
      const services::TimeUtils& time_;
      const ai::ReasoningGateway& gateway_;
      core::RobotOutput& output_;
      io::InteractionLog& interactions_;
      std::shared_ptr<core::ErrorMonitor> errors_;
      std::shared_ptr<core::Logger> logger_;
    };

  } // namespace dialogue
} // namespace genesis
