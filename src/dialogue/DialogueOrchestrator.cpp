/* @file DialogueOrchestrator.cpp
 * @brief sensor intake, dispatch table, plugin fallback, persona styling
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "ai/ReasoningGateway.hpp"
#include "core/Logger.hpp"
#include "core/PluginRegistry.hpp"
#include "core/RobotOutput.hpp"
#include "core/Strings.hpp"
#include "core/WorkerPool.hpp"
#include "dialogue/DialogueOrchestrator.hpp"
#include "dialogue/ResponseFormatter.hpp"
#include "services/ReminderService.hpp"
#include "services/TimeUtils.hpp"

using namespace genesis::dialogue;
namespace intents = genesis::nlp::intents;
namespace entities = genesis::nlp::entities;

namespace {
  constexpr const char* kTag = "DialogueOrchestrator";

  bool isHeadTouch(const std::string& name) {
    using namespace genesis::core::events;
    return name == kFrontTactilTouched || name == kMiddleTactilTouched || name == kRearTactilTouched;
  }

  std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
      if (!out.empty())
        out += ", ";
      out += n;
    }
    return out;
  }
} // namespace

DialogueOrchestrator::DialogueOrchestrator(Collaborators collaborators,
                                           std::shared_ptr<const PersonaSet> personas,
                                           Options options, std::shared_ptr<core::Logger> logger)
    : c_(collaborators), personas_(std::move(personas)), options_(std::move(options)),
      logger_(std::move(logger)), stylizer_(c_.gateway, logger_) {

  auto initial = personas_->find(options_.initialPersona);
  if (!initial)
    initial = personas_->first();
  if (initial) {
    state_.setPersona(initial);
    logger_->info(kTag, "initial persona: " + initial->name());
  } else {
    logger_->warn(kTag, "no personas loaded, replies will not be styled");
  }

  handlers_[intents::kTellTime] = [this](const nlp::IntentResult&) { return c_.time.tellTime(); };
  handlers_[intents::kTellDate] = [this](const nlp::IntentResult&) { return c_.time.tellDate(); };
  handlers_[intents::kSetReminder] = [this](const nlp::IntentResult& i) { return setReminder(i); };
  handlers_[intents::kChangePersonality] = [this](const nlp::IntentResult& i) {
    return changePersonality(i);
  };
  handlers_[intents::kChangeTone] = [this](const nlp::IntentResult& i) { return changeTone(i); };
}

//---sensor intake--------------------------------------------------------------

std::string DialogueOrchestrator::utteranceOf(const core::EventValue& value) {
  if (value.is_array() && !value.empty()) {
    const auto& first = value.front();
    return first.is_string() ? first.get<std::string>()
                             : first.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }
  if (value.is_string())
    return value.get<std::string>();
  return {};
}

void DialogueOrchestrator::handleSensorEvent(const core::SensorEvent& event) {
  const auto shown = event.value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  logger_->info(kTag, "sensor event: " + event.eventName + " " + shown.substr(0, 50));

  if (cancelled_)
    return;

  if (event.eventName == core::events::kWordRecognized) {
    const auto text = core::trim(utteranceOf(event.value));
    if (text.empty())
      return;
    if (!planner_) {
      logger_->error(kTag, "no planner bound, dropping utterance: " + text);
      return;
    }

    auto* planner = planner_;
    if (c_.turns.detach([planner, text] { planner->processUserSpeech(text); }, "turn: " + text))
      ++turnsStarted_;
    else
      logger_->warn(kTag, "dialogue pool closed, utterance dropped: " + text);
    return;
  }

  if (isHeadTouch(event.eventName)) {
    auto& output = c_.output;
    c_.turns.detach([&output] { output.speak(kHeadTouchReply).get(); }, "head touch reaction");
  }
}

//---turn processing--------------------------------------------------------------

std::string DialogueOrchestrator::processTurn(const std::string& text) {
  const auto intent = c_.resolver.resolve(text);
  logger_->info(kTag, "turn intent: " + intent.intent);
  return style(dispatch(intent, text), text);
}

bool DialogueOrchestrator::ownsIntent(const std::string& intent) const {
  return handlers_.count(intent) != 0 || c_.plugins.findSupporter(intent) != nullptr;
}

void DialogueOrchestrator::cancelInFlightTurns() {
  if (!cancelled_.exchange(true))
    logger_->info(kTag, "in-flight turns marked cancelled");
}

std::string DialogueOrchestrator::dispatch(const nlp::IntentResult& intent,
                                           const std::string& rawText) {
  const std::string troubleMessage =
      "I had trouble processing your request concerning '" + intent.intent + "'.";

  auto handler = handlers_.find(intent.intent);
  if (handler != handlers_.end()) {
    try {
      return handler->second(intent);
    } catch (const std::exception& e) {
      return formatErrorMessage(troubleMessage, "handler '" + intent.intent + "': " + e.what(), *logger_);
    }
  }

  if (auto* plugin = c_.plugins.findSupporter(intent.intent)) {
    try {
      return plugin->execute(rawText, intent);
    } catch (const std::exception& e) {
      return formatErrorMessage(troubleMessage, "plugin '" + plugin->name() + "': " + e.what(), *logger_);
    }
  }

  return formatErrorMessage("I understood the intent '" + intent.intent +
                            "', but I lack the specific tool to execute it directly.");
}

std::string DialogueOrchestrator::style(const std::string& baseReply, const std::string& rawText) const {
  if (!options_.personaStyling || baseReply.empty())
    return baseReply;

  const auto snap = state_.snapshot();
  if (!snap.persona)
    return baseReply;

  const std::string instruction = snap.persona->systemPrompt() + "\nRespond in a " + snap.tone +
                                  " tone. Keep the response suitable for robotic speech.";
  return stylizer_.stylize(instruction, baseReply, rawText);
}

//---internal intent handlers-------------------------------------------------------

std::string DialogueOrchestrator::changePersonality(const nlp::IntentResult& intent) {
  const auto requested = intent.entity(entities::kPersonaName);
  if (auto persona = personas_->find(requested)) {
    state_.setPersona(persona);
    logger_->info(kTag, "personality changed to " + persona->name());
    return "Okay, I've switched my personality to " + persona->name() + ".";
  }
  return "Sorry, I don't have a personality named '" + requested +
         "'. Available: " + joinNames(personas_->names()) + ".";
}

std::string DialogueOrchestrator::changeTone(const nlp::IntentResult& intent) {
  const auto tone = core::trim(intent.entity(entities::kToneName));
  if (tone.empty())
    return "What tone would you like me to use?";
  state_.setTone(tone);
  logger_->info(kTag, "tone changed to " + tone);
  return "Alright, I'll try to adopt a " + tone + " tone.";
}

std::string DialogueOrchestrator::setReminder(const nlp::IntentResult& intent) {
  const auto note = intent.entity(entities::kNote);
  const auto timeStr = intent.entity(entities::kTimeStr);
  if (note.empty() || timeStr.empty())
    return "To set a reminder, I need the reminder text and a specific time.";
  return c_.reminders.setupReminder(note, timeStr);
}
