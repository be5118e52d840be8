#pragma once
/** @file  InteractionLog.hpp
 *  @brief Append-only transcript of completed turns.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "io/FileLogger.hpp"

namespace genesis {
  namespace core {
    class Logger;
  }

  namespace io {

    /**
 * @class InteractionLog
 * @brief Two lines per turn plus a blank separator:
 *
 *     2025-01-01T12:00:00.123456+00:00 | User: what time is it
 *     2025-01-01T12:00:00.123456+00:00 | GENESIS: It is 12:00 PM.
 *
 *  * Opened lazily on the first append; the directory is created if missing.
 *  * Each entry is flushed before `append()` returns.
 */
    class InteractionLog {
    public:
      InteractionLog(std::string path, std::shared_ptr<core::Logger> logger,
                     std::string robotLabel = "GENESIS");
      virtual ~InteractionLog() = default;

      virtual bool append(const std::string& userText, const std::string& reply);

      const std::string& path() const { return path_; }

      /// UTC, microsecond precision, "+00:00" offset.
      static std::string timestamp(std::chrono::system_clock::time_point tp);

      static std::string formatEntry(std::chrono::system_clock::time_point tp,
                                     const std::string& robotLabel, const std::string& userText,
                                     const std::string& reply);

    private:
      std::string path_;
      std::shared_ptr<core::Logger> logger_;
      std::string robotLabel_;
      std::mutex mtx_;
      FileLogger file_;
    };

  } // namespace io
} // namespace genesis
