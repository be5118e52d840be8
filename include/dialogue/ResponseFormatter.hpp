#pragma once
/** @file  ResponseFormatter.hpp
 *  @brief User-facing wording for failures.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

namespace genesis {
  namespace core {
    class Logger;
  }

  namespace dialogue {

    /// "Sorry, I encountered an issue: <userMessage>"
    std::string formatErrorMessage(const std::string& userMessage);

    /// Same wording; \p technicalDetail goes to the log, never to the user.
    std::string formatErrorMessage(const std::string& userMessage, const std::string& technicalDetail,
                                   core::Logger& logger);

  } // namespace dialogue
} // namespace genesis
