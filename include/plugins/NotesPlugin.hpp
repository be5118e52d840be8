#pragma once
/** @file  NotesPlugin.hpp
 *  @brief Built-in plugin: dictate and read back short notes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>

#include "plugins/Plugin.hpp"

namespace genesis {
  namespace core {
    class Logger;
  }

  namespace plugins {

    /// Handles `add_note` / `read_notes`; notes live under one storage key.
    class NotesPlugin : public Plugin {
    public:
      static constexpr const char* kName = "notes";
      static constexpr const char* kStorageKey = "notes";

      NotesPlugin(services::KeyValueStore& storage, std::shared_ptr<core::Logger> logger);

      std::string name() const override { return kName; }
      std::string description() const override { return "Takes and reads back short spoken notes."; }
      bool supportsIntent(const std::string& intent) const override;
      std::string execute(const std::string& rawText, const nlp::IntentResult& intent) override;
      void run() override;

    private:
      std::string addNote(const std::string& note);
      std::string readNotes() const;

      services::KeyValueStore& storage_;
      std::shared_ptr<core::Logger> logger_;
    };

  } // namespace plugins
} // namespace genesis
