#pragma once
/** @file  LanguageModelClient.hpp
 *  @brief Blocking single-prompt text generation backend.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

namespace genesis::ai {

  class LanguageModelClient {
  public:
    virtual ~LanguageModelClient() = default;

    /** @returns generated text, or nullopt when the answer was empty or blocked.
     *  @throws std::runtime_error on transport or API errors. */
    virtual std::optional<std::string> generate(const std::string& prompt) = 0;
  };

} // namespace genesis::ai
