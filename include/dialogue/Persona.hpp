#pragma once
/** @file  Persona.hpp
 *  @brief Named tone + system-instruction template, and the process-wide persona set.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace genesis::dialogue {

  /**
 * @class Persona
 * @brief Immutable after construction.
 *
 *  * The template may use `{name}`, `{tone}` and `{language}`; they are
 *    substituted by `systemPrompt()`, not at load time.
 */
  class Persona {
  public:
    Persona(std::string name, std::string tone, std::string promptTemplate, std::string language);

    const std::string& name() const { return name_; }
    const std::string& tone() const { return tone_; }
    const std::string& language() const { return language_; }
    const std::string& promptTemplate() const { return template_; }

    /// Template with every placeholder resolved.
    std::string systemPrompt() const;

  private:
    std::string name_;
    std::string tone_;
    std::string template_;
    std::string language_;
  };

  /**
 * @class PersonaSet
 * @brief Read-only after start-up. Keyed by lower-cased name, ordered by registration.
 */
  class PersonaSet {
  public:
    using Ptr = std::shared_ptr<const Persona>;

    static constexpr const char* kFallbackName = "DefaultGenesis";

    explicit PersonaSet(std::string language);

    /// Register a persona. A duplicate name replaces the earlier one in place.
    /// @returns false when an existing entry was replaced.
    bool add(std::string name, std::string tone, std::string promptTemplate);

    /// Case-insensitive lookup; nullptr on miss.
    Ptr find(std::string_view name) const;

    /// First registered persona; nullptr when empty.
    Ptr first() const;

    /// Display names in registration order.
    std::vector<std::string> names() const;

    /// Register `DefaultGenesis` when nothing else was registered.
    void ensureFallback();

    bool empty() const { return ordered_.empty(); }
    std::size_t size() const { return ordered_.size(); }
    const std::string& language() const { return language_; }

  private:
    std::string language_;
    std::vector<Ptr> ordered_;
    std::unordered_map<std::string, std::size_t> index_; ///< lower-cased name -> ordered_ slot
  };

  /// Personas compiled into the binary (Genesis first).
  void registerBuiltinPersonas(PersonaSet& set);

} // namespace genesis::dialogue
