/* @file ConversationState.cpp
 * @brief mutex-guarded persona/tone pair
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "dialogue/ConversationState.hpp"

using namespace genesis::dialogue;

void ConversationState::setPersona(std::shared_ptr<const Persona> persona) {
  std::lock_guard<std::mutex> lock(mtx_);
  tone_ = persona ? persona->tone() : std::string();
  persona_ = std::move(persona);
}

void ConversationState::setTone(std::string tone) {
  std::lock_guard<std::mutex> lock(mtx_);
  tone_ = std::move(tone);
}

ConversationSnapshot ConversationState::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return { persona_, tone_ };
}
