#pragma once
/** @file  DialogueContext.hpp
 *  @brief Narrow seams between the orchestrator and the action planner.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "dialogue/ConversationState.hpp"

namespace genesis::dialogue {

  /// What the planner may see of the orchestrator.
  class DialogueContext {
  public:
    virtual ~DialogueContext() = default;

    virtual ConversationSnapshot snapshot() const = 0;

    /// True when `processTurn()` routes \p intent to a handler or a plugin.
    virtual bool ownsIntent(const std::string& intent) const = 0;

    /// Full resolve -> dispatch -> style pass. Never throws.
    virtual std::string processTurn(const std::string& text) = 0;

    /// Set once shutdown began; turns must not start new output.
    virtual bool turnCancelled() const = 0;
  };

  /// What the orchestrator starts for each recognized utterance.
  class SpeechProcessor {
  public:
    virtual ~SpeechProcessor() = default;
    virtual std::string processUserSpeech(const std::string& text) = 0;
  };

} // namespace genesis::dialogue
