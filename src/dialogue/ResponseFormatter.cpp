/* @file ResponseFormatter.cpp
 * @brief apology wording
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Logger.hpp"
#include "dialogue/ResponseFormatter.hpp"

namespace genesis::dialogue {

  std::string formatErrorMessage(const std::string& userMessage) {
    return "Sorry, I encountered an issue: " + userMessage;
  }

  std::string formatErrorMessage(const std::string& userMessage, const std::string& technicalDetail,
                                 core::Logger& logger) {
    if (!technicalDetail.empty())
      logger.error("ResponseFormatter", "error formatted for user, detail: " + technicalDetail);
    return formatErrorMessage(userMessage);
  }

} // namespace genesis::dialogue
