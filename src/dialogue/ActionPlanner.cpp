/* @file ActionPlanner.cpp
 * @brief intent routing to plans, dual-channel execution with a join, transcript
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <future>

#include "ai/ReasoningGateway.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/RobotOutput.hpp"
#include "dialogue/ActionPlanner.hpp"
#include "io/InteractionLog.hpp"
#include "nlp/IntentResolver.hpp"
#include "services/TimeUtils.hpp"

using namespace genesis::dialogue;
namespace intents = genesis::nlp::intents;

namespace {
  constexpr const char* kTag = "ActionPlanner";
}

ActionPlanner::ActionPlanner(DialogueContext& context, const nlp::IntentResolver& resolver,
                             const services::TimeUtils& time, const ai::ReasoningGateway& gateway,
                             core::RobotOutput& output, io::InteractionLog& interactions,
                             std::shared_ptr<core::ErrorMonitor> errors,
                             std::shared_ptr<core::Logger> logger)
    : context_(context), resolver_(resolver), time_(time), gateway_(gateway), output_(output),
      interactions_(interactions), errors_(std::move(errors)), logger_(std::move(logger)) {}

std::string ActionPlanner::processUserSpeech(const std::string& text) {
  std::optional<ActionPlan> planned;
  try {
    planned = plan(text);
  } catch (const std::exception& e) {
    logger_->error(kTag, std::string("planning failed: ") + e.what());
    if (errors_)
      errors_->notifyFailure(std::string("[ActionPlanner] planning failed: ") + e.what());
    return kErrorReply;
  }

  if (context_.turnCancelled()) {
    logger_->info(kTag, "turn cancelled before output: " + text);
    return {};
  }

  if (!planned || planned->speech.empty())
    return speakFallback();
  return execute(*planned, text);
}

std::optional<ActionPlan> ActionPlanner::plan(const std::string& text) {
  const auto intent = resolver_.resolve(text);
  logger_->info(kTag, "speech intent: " + intent.intent);

  if (intent.intent == intents::kTellTime)
    return ActionPlan{ time_.tellTime(), motions::kNeutral };
  if (intent.intent == intents::kTellDate)
    return ActionPlan{ time_.tellDate(), motions::kNeutral };

  if (intent.intent == intents::kChangePersonality || intent.intent == intents::kChangeTone)
    return ActionPlan{ context_.processTurn(text), motions::kJoy };
  if (intent.intent == intents::kSetReminder)
    return ActionPlan{ context_.processTurn(text), motions::kNod };

  if (intent.intent != intents::kUnknown && intent.intent != intents::kGeneralQuery &&
      context_.ownsIntent(intent.intent))
    return ActionPlan{ context_.processTurn(text), motions::kNod };

  auto answer = gateway_.getResponse(composeInstruction(context_.snapshot()), text).get();
  if (ai::ReasoningGateway::isSentinel(answer)) {
    logger_->warn(kTag, "gateway unavailable: " + answer);
    return std::nullopt;
  }
  return ActionPlan{ answer, motions::kThink };
}

std::string ActionPlanner::execute(const ActionPlan& plan, const std::string& userText) {
  try {
    auto speech = output_.speak(plan.speech);
    std::future<void> motion;
    if (auto posture = postureFor(plan.motion))
      motion = output_.movePosture(*posture);

    speech.wait();
    if (motion.valid())
      motion.wait();
    speech.get();
    if (motion.valid())
      motion.get();
  } catch (const std::exception& e) {
    logger_->error(kTag, "executing action plan failed: " + std::string(e.what()) +
                             " (speech='" + plan.speech + "', motion='" + plan.motion + "')");
    if (errors_)
      errors_->notifyFailure(std::string("[ActionPlanner] output failed: ") + e.what());
    return kErrorReply;
  }

  interactions_.append(userText, plan.speech);
  return plan.speech;
}

std::optional<std::string> ActionPlanner::postureFor(const std::string& motion) {
  if (motion.empty() || motion == motions::kNeutral)
    return std::nullopt;

  const std::string prefix = motions::kPosturePrefix;
  if (motion.compare(0, prefix.size(), prefix) == 0 && motion.size() > prefix.size())
    return motion.substr(prefix.size());
  return std::string(motions::kDefaultPosture);
}

std::string ActionPlanner::composeInstruction(const ConversationSnapshot& snapshot) {
  std::string out = snapshot.persona ? snapshot.persona->systemPrompt() : std::string();
  out += "\nYou are speaking through a physical robot. Keep responses concise and "
         "conversational. Respond in a " +
         (snapshot.tone.empty() ? std::string("neutral") : snapshot.tone) + " tone.";
  return out;
}

std::string ActionPlanner::speakFallback() {
  try {
    output_.speak(kFallbackReply).get();
  } catch (const std::exception& e) {
    logger_->error(kTag, std::string("speaking fallback failed: ") + e.what());
  }
  return kFallbackReply;
}
