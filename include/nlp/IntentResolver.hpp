#pragma once
/** @file  IntentResolver.hpp
 *  @brief Utterance text -> {intent, entities}. Pure, no side effects.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <map>
#include <regex>
#include <string>
#include <vector>

namespace genesis::nlp {

  namespace intents {
    inline constexpr const char* kTellTime = "tell_time";
    inline constexpr const char* kTellDate = "tell_date";
    inline constexpr const char* kSetReminder = "set_reminder";
    inline constexpr const char* kChangePersonality = "change_personality";
    inline constexpr const char* kChangeTone = "change_tone";
    inline constexpr const char* kGeneralQuery = "general_query";
    inline constexpr const char* kUnknown = "unknown";
    inline constexpr const char* kAddNote = "add_note";
    inline constexpr const char* kReadNotes = "read_notes";
  } // namespace intents

  /// Entity keys produced by the resolver.
  namespace entities {
    inline constexpr const char* kPersonaName = "persona_name";
    inline constexpr const char* kToneName = "tone_name";
    inline constexpr const char* kNote = "note";
    inline constexpr const char* kTimeStr = "time_str";
  } // namespace entities

  struct IntentResult {
    std::string intent{ intents::kUnknown };
    std::map<std::string, std::string> entities;

    /// Empty string when \p key is absent.
    std::string entity(const std::string& key) const {
      auto it = entities.find(key);
      return it == entities.end() ? std::string() : it->second;
    }
  };

  class IntentResolver {
  public:
    virtual ~IntentResolver() = default;
    virtual IntentResult resolve(const std::string& text) const = 0;
  };

  /**
 * @class KeywordIntentResolver
 * @brief Ordered case-insensitive regex rules; the first matching rule wins.
 *
 *  * Reminder times are normalised to "HH:MM" (24 h) when they parse.
 *  * Anything phrased as a question falls through to `general_query`.
 */
  class KeywordIntentResolver : public IntentResolver {
  public:
    KeywordIntentResolver();

    IntentResult resolve(const std::string& text) const override;

    /// "7", "7:05", "7pm", "19:30" -> "HH:MM"; input returned unchanged when it does not parse.
    static std::string normaliseTime(const std::string& hour, const std::string& minute,
                                     const std::string& meridiem);

  private:
    std::regex persona_;
    std::regex toneNamed_;
    std::regex toneBare_;
    std::regex reminder_;
    std::regex reminderBare_;
    std::regex addNote_;
    std::regex readNotes_;
    std::regex time_;
    std::regex date_;
    std::regex question_;
  };

} // namespace genesis::nlp
