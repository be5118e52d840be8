#pragma once
/** @file  PersonaStylizer.hpp
 *  @brief Rephrase a base reply in the active persona's voice.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>

namespace genesis {
  namespace core {
    class Logger;
  }

  namespace ai {

    class ReasoningGateway;

    /// Blocking: call from a dialogue worker, never from the event loop.
    class PersonaStylizer {
    public:
      PersonaStylizer(const ReasoningGateway& gateway, std::shared_ptr<core::Logger> logger);

      /// @returns the styled reply, or \p baseReply when styling is not possible.
      std::string stylize(const std::string& systemPrompt, const std::string& baseReply,
                          const std::string& userQuery) const;

      static std::string composeStylingPrompt(const std::string& systemPrompt,
                                              const std::string& baseReply,
                                              const std::string& userQuery);

    private:
      const ReasoningGateway& gateway_;
      std::shared_ptr<core::Logger> logger_;
    };

  } // namespace ai
} // namespace genesis
