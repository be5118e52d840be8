/* @file Persona.cpp
 * @brief template substitution, ordered persona registry, built-in personas
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "dialogue/Persona.hpp"
#include "core/Strings.hpp"

using namespace genesis::dialogue;

namespace {
  void replaceAll(std::string& text, std::string_view token, const std::string& value) {
    for (auto pos = text.find(token); pos != std::string::npos;
         pos = text.find(token, pos + value.size()))
      text.replace(pos, token.size(), value);
  }
} // namespace

Persona::Persona(std::string name, std::string tone, std::string promptTemplate,
                 std::string language)
    : name_(std::move(name)), tone_(std::move(tone)), template_(std::move(promptTemplate)),
      language_(std::move(language)) {}

std::string Persona::systemPrompt() const {
  std::string out = template_;
  replaceAll(out, "{name}", name_);
  replaceAll(out, "{tone}", tone_);
  replaceAll(out, "{language}", language_);
  return out;
}

//---PersonaSet-----------------------------------------------------------------

PersonaSet::PersonaSet(std::string language) : language_(std::move(language)) {}

bool PersonaSet::add(std::string name, std::string tone, std::string promptTemplate) {
  auto key = core::toLower(name);
  auto persona = std::make_shared<const Persona>(std::move(name), std::move(tone),
                                                 std::move(promptTemplate), language_);

  auto it = index_.find(key);
  if (it != index_.end()) {
    ordered_[it->second] = std::move(persona);
    return false;
  }
  index_.emplace(std::move(key), ordered_.size());
  ordered_.push_back(std::move(persona));
  return true;
}

PersonaSet::Ptr PersonaSet::find(std::string_view name) const {
  auto it = index_.find(core::toLower(name));
  return it == index_.end() ? nullptr : ordered_[it->second];
}

PersonaSet::Ptr PersonaSet::first() const { return ordered_.empty() ? nullptr : ordered_.front(); }

std::vector<std::string> PersonaSet::names() const {
  std::vector<std::string> out;
  out.reserve(ordered_.size());
  for (const auto& p : ordered_)
    out.push_back(p->name());
  return out;
}

void PersonaSet::ensureFallback() {
  if (empty())
    add(kFallbackName, "neutral", "You are GENESIS, a helpful AI assistant.");
}

void genesis::dialogue::registerBuiltinPersonas(PersonaSet& set) {
  set.add("Genesis", "friendly",
          "You are {name}, the conversational brain of a humanoid robot. "
          "You are helpful, warm and {tone}. Answer in the language {language}.");
  set.add("Professor", "informative",
          "You are {name}, a patient teacher speaking through a robot. "
          "Explain things clearly in a {tone} way. Answer in the language {language}.");
  set.add("Buddy", "playful",
          "You are {name}, a cheerful companion robot. Keep it light and {tone}, "
          "never rude. Answer in the language {language}.");
}
