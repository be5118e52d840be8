#pragma once
/** @file  ReminderService.hpp
 *  @brief Spoken daily reminders on top of a TaskScheduler.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <string>

namespace genesis {
  namespace core {
    class Logger;
    class RobotOutput;
  } // namespace core

  namespace services {

    class TaskScheduler;

    class ReminderService {
    public:
      ReminderService(TaskScheduler& scheduler, core::RobotOutput& output,
                      std::shared_ptr<core::Logger> logger,
                      std::chrono::milliseconds speechWait = std::chrono::seconds{ 10 });

      /// Schedule "Reminder: <message>" every day at \p timeStr ("HH:MM").
      /// @returns the scheduler's confirmation / refusal sentence.
      std::string setupReminder(const std::string& message, const std::string& timeStr,
                                std::string name = {});

      std::string cancelReminder(const std::string& name);

      /// Name used when the caller does not give one.
      static std::string defaultName(const std::string& message, const std::string& timeStr);

    private:
      void speakReminder(const std::string& message);

      TaskScheduler& scheduler_;
      core::RobotOutput& output_;
      std::shared_ptr<core::Logger> logger_;
      std::chrono::milliseconds speechWait_;
    };

  } // namespace services
} // namespace genesis
