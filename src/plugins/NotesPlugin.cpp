/* @file NotesPlugin.cpp
 * @brief add_note / read_notes over the shared key-value store
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Logger.hpp"
#include "nlp/IntentResolver.hpp"
#include "plugins/NotesPlugin.hpp"
#include "services/KeyValueStore.hpp"

using namespace genesis::plugins;

namespace {
  constexpr const char* kTag = "NotesPlugin";
}

NotesPlugin::NotesPlugin(services::KeyValueStore& storage, std::shared_ptr<core::Logger> logger)
    : storage_(storage), logger_(std::move(logger)) {}

bool NotesPlugin::supportsIntent(const std::string& intent) const {
  return intent == nlp::intents::kAddNote || intent == nlp::intents::kReadNotes;
}

std::string NotesPlugin::execute(const std::string& /*rawText*/, const nlp::IntentResult& intent) {
  if (intent.intent == nlp::intents::kAddNote)
    return addNote(intent.entity(nlp::entities::kNote));
  if (intent.intent == nlp::intents::kReadNotes)
    return readNotes();
  return "I can only take notes or read them back.";
}

void NotesPlugin::run() {
  auto notes = storage_.get(kStorageKey);
  logger_->info(kTag, std::to_string(notes && notes->is_array() ? notes->size() : 0) +
                          " stored note(s)");
}

std::string NotesPlugin::addNote(const std::string& note) {
  if (note.empty())
    return "What should the note say?";
  if (storage_.append(kStorageKey, note) == 0)
    return "Sorry, I couldn't save that note.";
  logger_->debug(kTag, "stored note: " + note);
  return "Noted: " + note + ".";
}

std::string NotesPlugin::readNotes() const {
  auto notes = storage_.get(kStorageKey);
  if (!notes || !notes->is_array() || notes->empty())
    return "You don't have any notes yet.";

  std::string joined;
  for (const auto& n : *notes) {
    if (!joined.empty())
      joined += "; ";
    joined += n.is_string() ? n.get<std::string>() : n.dump();
  }
  return "You have " + std::to_string(notes->size()) + " note(s): " + joined + ".";
}
