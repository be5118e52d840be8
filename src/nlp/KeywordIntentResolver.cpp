/* @file KeywordIntentResolver.cpp
 * @brief regex rule table for the built-in intents
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>

#include "core/Strings.hpp"
#include "nlp/IntentResolver.hpp"

using namespace genesis::nlp;

namespace {
  constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;
}

KeywordIntentResolver::KeywordIntentResolver()
    : persona_(R"(\b(?:switch|change|set)\s+(?:your\s+|the\s+)?(?:personality|persona)\s+to\s+([a-z][\w-]*))", kFlags),
      toneNamed_(R"(\btone\s+to\s+(?:an?\s+)?([a-z]+)|\b(?:use|adopt|try)\s+(?:an?\s+)?([a-z]+)\s+tone\b)", kFlags),
      toneBare_(R"(\b(?:change|switch|set)\s+(?:your\s+|the\s+)?tone\b)", kFlags),
      reminder_(R"(\bremind\s+me\s+(?:to\s+)?(.+?)\s+at\s+(\d{1,2})(?:[:.](\d{2}))?\s*(am|pm)?\s*[.!]?$)", kFlags),
      reminderBare_(R"(\b(?:remind\s+me|reminder)\b)", kFlags),
      addNote_(R"(\b(?:take|add|make)\s+a\s+note\b(?:\s*(?:that|saying|:))?\s*(.*)$)", kFlags),
      readNotes_(R"(\b(?:read|list|show|what\s+are)\s+(?:me\s+)?(?:my\s+)?notes\b)", kFlags),
      time_(R"(\bwhat\s+time\b|\bwhat(?:'s|\s+is)\s+the\s+time\b|\btell\s+me\s+the\s+time\b)", kFlags),
      date_(R"(\bwhat(?:'s|\s+is)\s+(?:the\s+|today'?s\s+)?date\b|\bwhat\s+day\s+is\b|\btell\s+me\s+the\s+date\b)", kFlags),
      question_(R"(^(?:what|who|why|how|when|where|which|can|could|would|is|are|do|does|tell\s+me)\b)", kFlags) {}

IntentResult KeywordIntentResolver::resolve(const std::string& raw) const {
  const std::string text = core::trim(raw);
  IntentResult out;
  std::smatch m;

  if (text.empty())
    return out;

  if (std::regex_search(text, m, persona_)) {
    out.intent = intents::kChangePersonality;
    out.entities[entities::kPersonaName] = core::toLower(m[1].str());
    return out;
  }

  if (std::regex_search(text, m, toneNamed_)) {
    out.intent = intents::kChangeTone;
    out.entities[entities::kToneName] = core::toLower(m[1].matched ? m[1].str() : m[2].str());
    return out;
  }
  if (std::regex_search(text, toneBare_)) {
    out.intent = intents::kChangeTone;
    return out;
  }

  if (std::regex_search(text, m, reminder_)) {
    out.intent = intents::kSetReminder;
    out.entities[entities::kNote] = core::trim(m[1].str());
    out.entities[entities::kTimeStr] = normaliseTime(m[2].str(), m[3].str(), m[4].str());
    return out;
  }
  if (std::regex_search(text, reminderBare_)) {
    out.intent = intents::kSetReminder;
    return out;
  }

  if (std::regex_search(text, m, addNote_)) {
    out.intent = intents::kAddNote;
    auto note = core::trim(m[1].str());
    if (!note.empty())
      out.entities[entities::kNote] = note;
    return out;
  }
  if (std::regex_search(text, readNotes_)) {
    out.intent = intents::kReadNotes;
    return out;
  }

  if (std::regex_search(text, time_)) {
    out.intent = intents::kTellTime;
    return out;
  }
  if (std::regex_search(text, date_)) {
    out.intent = intents::kTellDate;
    return out;
  }

  if (text.back() == '?' || std::regex_search(text, question_))
    out.intent = intents::kGeneralQuery;
  return out;
}

std::string KeywordIntentResolver::normaliseTime(const std::string& hour, const std::string& minute,
                                                 const std::string& meridiem) {
  const std::string original = minute.empty() ? hour : hour + ":" + minute;
  if (hour.empty())
    return original;

  int h = std::stoi(hour);
  int min = minute.empty() ? 0 : std::stoi(minute);
  const auto suffix = core::toLower(meridiem);
  if (suffix == "pm" && h < 12)
    h += 12;
  else if (suffix == "am" && h == 12)
    h = 0;

  if (h > 23 || min > 59)
    return original;

  char buf[6];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", h, min);
  return buf;
}
