/* @file Logger.cpp
 * @brief async log sink: ring buffer in, formatted lines out to stderr and file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

// GENESIS headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

namespace genesis {
  namespace core {

    const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warning:
        return "WARNING";
      case LogLevel::Error:
        return "ERROR";
      case LogLevel::Critical:
        return "CRITICAL";
      default:
        return "UNKNOWN";
      }
    }

    std::optional<LogLevel> parseLogLevel(std::string_view text) {
      std::string upper(text);
      std::transform(upper.begin(), upper.end(), upper.begin(),
                     [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
      for (auto level : { LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error,
                          LogLevel::Critical }) {
        if (upper == toString(level))
          return level;
      }
      if (upper == "WARN")
        return LogLevel::Warning;
      return std::nullopt;
    }

    Logger::Logger(LogLevel threshold, bool console)
        : buffer_(std::make_unique<RingBuffer<LogEvent>>(kQueueDepth)), threshold_(threshold),
          console_(console) {}

    Logger::~Logger() { finishRun(); }

    bool Logger::startNewRun(const std::string& filePath) {
      if (running_)
        return true;

      if (!filePath.empty() && !file_.open(filePath)) {
        std::cerr << "[Logger] cannot open log file '" << filePath << "', console only\n";
      }

      running_ = true;
      worker_ = std::thread([this] { drain(); });
      return file_.isOpen();
    }

    void Logger::log(LogLevel level, std::string_view component, std::string message) {
      if (!enabled(level))
        return;

      LogEvent event{ std::chrono::system_clock::now(), level, std::string(component),
                      std::move(message) };
      {
        std::shared_lock<std::shared_mutex> run(runMtx_);
        if (running_) {
          buffer_->push(std::move(event));
          return;
        }
      }
      write(event);
    }

    void Logger::finishRun() {
      {
        // no producer is mid-push once this lock is held, so the final drain sees everything
        std::unique_lock<std::shared_mutex> run(runMtx_);
        if (!running_.exchange(false))
          return;
      }

      buffer_->wakeAll();
      if (worker_.joinable())
        worker_.join();

      // worker is gone; flush what producers managed to enqueue meanwhile
      while (auto event = buffer_->pop(std::chrono::milliseconds{ 0 }))
        write(*event);

      std::lock_guard<std::mutex> lock(writeMtx_);
      file_.close();
    }

    void Logger::drain() {
      while (running_) {
        if (auto event = buffer_->pop(std::chrono::milliseconds{ 100 }))
          write(*event);
      }
    }

    void Logger::write(const LogEvent& event) {
      const std::string line = format(event);
      std::lock_guard<std::mutex> lock(writeMtx_);
      if (console_)
        std::cerr << line;
      if (file_.isOpen()) {
        file_.write(line);
        if (event.level >= LogLevel::Error || buffer_->size() == 0)
          file_.flush();
      }
    }

    std::string Logger::format(const LogEvent& event) {
      const auto secs = std::chrono::system_clock::to_time_t(event.time);
      const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                              event.time.time_since_epoch()) %
                          1000;

      std::tm utc{};
      gmtime_r(&secs, &utc);

      std::ostringstream out;
      out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
          << millis.count() << "Z [" << std::left << std::setfill(' ') << std::setw(8)
          << toString(event.level) << "] [" << event.component << "] " << event.message << '\n';
      return out.str();
    }

  } // namespace core
} // namespace genesis
