/* @file PersonaStylizer.cpp
 * @brief styling prompt + fallback to the unstyled reply
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "ai/PersonaStylizer.hpp"
#include "ai/ReasoningGateway.hpp"
#include "core/Logger.hpp"
#include "core/Strings.hpp"

using namespace genesis::ai;

namespace {
  constexpr const char* kTag = "PersonaStylizer";
}

PersonaStylizer::PersonaStylizer(const ReasoningGateway& gateway, std::shared_ptr<core::Logger> logger)
    : gateway_(gateway), logger_(std::move(logger)) {}

std::string PersonaStylizer::composeStylingPrompt(const std::string& systemPrompt,
                                                  const std::string& baseReply,
                                                  const std::string& userQuery) {
  std::string out = systemPrompt;
  if (!userQuery.empty())
    out += "\n\nUser's original query: \"" + userQuery + "\"";
  out += "\n\nThe system has generated the following CORE information to be stylized: \"" +
         baseReply + "\"";
  out += "\n\nRephrase or style this core information according to your persona and tone. "
         "The final response will be spoken by a physical robot; keep it conversational and "
         "slightly concise.";
  return out;
}

std::string PersonaStylizer::stylize(const std::string& systemPrompt, const std::string& baseReply,
                                     const std::string& userQuery) const {
  if (core::trim(baseReply).empty())
    return baseReply;

  auto styled = gateway_
                    .getResponse(systemPrompt, composeStylingPrompt(systemPrompt, baseReply, userQuery))
                    .get();

  if (ReasoningGateway::isSentinel(styled) || core::trim(styled).empty()) {
    logger_->warn(kTag, "styling unavailable (" + styled + "), using base reply");
    return baseReply;
  }
  logger_->debug(kTag, "styled reply, " + std::to_string(styled.size()) + " chars");
  return styled;
}
