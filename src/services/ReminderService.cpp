/* @file ReminderService.cpp
 * @brief reminder naming + the speak action handed to the scheduler
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/Logger.hpp"
#include "core/RobotOutput.hpp"
#include "services/ReminderService.hpp"
#include "services/TaskScheduler.hpp"

using namespace genesis::services;

namespace {
  constexpr const char* kTag = "ReminderService";
}

ReminderService::ReminderService(TaskScheduler& scheduler, core::RobotOutput& output,
                                 std::shared_ptr<core::Logger> logger,
                                 std::chrono::milliseconds speechWait)
    : scheduler_(scheduler), output_(output), logger_(std::move(logger)), speechWait_(speechWait) {}

std::string ReminderService::defaultName(const std::string& message, const std::string& timeStr) {
  std::string time = timeStr;
  time.erase(std::remove(time.begin(), time.end(), ':'), time.end());
  std::string head = message.substr(0, 10);
  std::replace(head.begin(), head.end(), ' ', '_');
  return "daily_reminder_" + time + "_" + head;
}

std::string ReminderService::setupReminder(const std::string& message, const std::string& timeStr,
                                           std::string name) {
  if (name.empty())
    name = defaultName(message, timeStr);

  return scheduler_.addTask(
      name, "reminder to " + message, timeStr,
      [this](const std::vector<std::string>& args) {
        if (!args.empty())
          speakReminder(args.front());
      },
      { message });
}

std::string ReminderService::cancelReminder(const std::string& name) {
  return scheduler_.removeTask(name);
}

void ReminderService::speakReminder(const std::string& message) {
  logger_->info(kTag, "executing reminder: " + message);
  auto done = output_.speak("Reminder: " + message);
  if (done.wait_for(speechWait_) != std::future_status::ready) {
    logger_->debug(kTag, "reminder still speaking, not waiting further");
    return;
  }
  try {
    done.get();
  } catch (const std::exception& e) {
    logger_->error(kTag, "speaking reminder '" + message + "' failed: " + e.what());
  }
}
