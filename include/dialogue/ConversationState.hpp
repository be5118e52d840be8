#pragma once
/** @file  ConversationState.hpp
 *  @brief Active persona + tone shared by every turn.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <mutex>
#include <string>

#include "dialogue/Persona.hpp"

namespace genesis::dialogue {

  /// Persona and tone as read together by one turn.
  struct ConversationSnapshot {
    std::shared_ptr<const Persona> persona;
    std::string tone;
  };

  /** @class ConversationState
 *  @brief Lock-protected pair; last writer wins.
 *
 *  * Written by the persona / tone handlers, read by every turn.
 *  * `snapshot()` never pairs a new persona with the previous tone.
 */
  class ConversationState {
  public:
    ConversationState() = default;

    /// Switch persona; the tone resets to the persona's own.
    void setPersona(std::shared_ptr<const Persona> persona);
    void setTone(std::string tone);

    ConversationSnapshot snapshot() const;

  private:
    mutable std::mutex mtx_;
    std::shared_ptr<const Persona> persona_;
    std::string tone_;
  };

} // namespace genesis::dialogue
