#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous application logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>

#include "io/FileLogger.hpp"

namespace genesis {
  namespace core {

    enum class LogLevel { Debug, Info, Warning, Error, Critical };

    const char* toString(LogLevel level);

    /// Case-insensitive parse of "DEBUG" / "info" / ...; nullopt when unknown.
    std::optional<LogLevel> parseLogLevel(std::string_view text);

    struct LogEvent {
      std::chrono::system_clock::time_point time{};
      LogLevel level{ LogLevel::Info };
      std::string component;
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Components enqueue lines; a worker thread formats and writes them.
 *
 *  * Shared by every component through `std::shared_ptr<Logger>`.
 *  * Outside a run (before `startNewRun()` / after `finishRun()`) lines go
 *    straight to stderr so early start-up failures are still visible.
 */
    class Logger {

    public:
      explicit Logger(LogLevel threshold = LogLevel::Info, bool console = true);
      ~Logger();

      // --- public API ---
      bool startNewRun(const std::string& filePath); ///< open file + launch worker thread
      void log(LogLevel level, std::string_view component, std::string message); ///< non-blocking
      void finishRun();                              ///< flush + join worker thread

      void debug(std::string_view component, std::string message) {
        log(LogLevel::Debug, component, std::move(message));
      }
      void info(std::string_view component, std::string message) {
        log(LogLevel::Info, component, std::move(message));
      }
      void warn(std::string_view component, std::string message) {
        log(LogLevel::Warning, component, std::move(message));
      }
      void error(std::string_view component, std::string message) {
        log(LogLevel::Error, component, std::move(message));
      }
      void critical(std::string_view component, std::string message) {
        log(LogLevel::Critical, component, std::move(message));
      }

      void setThreshold(LogLevel level) { threshold_.store(level); }
      bool enabled(LogLevel level) const { return level >= threshold_.load(); }

      /// "2025-01-01T12:00:00.123Z [INFO    ] [component] message"
      static std::string format(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();
      void write(const LogEvent& event);

      static constexpr std::size_t kQueueDepth = 1024;

      io::FileLogger file_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> threshold_;
      bool console_;
      std::mutex writeMtx_; ///< serializes console/file output
      std::shared_mutex runMtx_; ///< producers hold shared while pushing; finishRun exclusive
    };

  } // namespace core
} // namespace genesis
