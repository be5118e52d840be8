/* @file TimeUtils.cpp
 * @brief strftime-based time/date phrases
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "services/TimeUtils.hpp"

using namespace genesis::services;

namespace {
  constexpr const char* kWeekdays[] = { "Sunday",   "Monday", "Tuesday", "Wednesday",
                                        "Thursday", "Friday", "Saturday" };
  constexpr const char* kMonths[] = { "January", "February", "March",     "April",
                                      "May",     "June",     "July",      "August",
                                      "September", "October", "November", "December" };
} // namespace

SystemTimeUtils::SystemTimeUtils(Clock clock) : clock_(std::move(clock)) {}

std::string SystemTimeUtils::tellTime() const { return formatTime(now()); }

std::string SystemTimeUtils::tellDate() const { return formatDate(now()); }

std::string SystemTimeUtils::formatTime(const std::tm& local) {
  int hour12 = local.tm_hour % 12;
  if (hour12 == 0)
    hour12 = 12;
  const char* meridiem = local.tm_hour < 12 ? "AM" : "PM";
  std::string minutes = (local.tm_min < 10 ? "0" : "") + std::to_string(local.tm_min);
  return "It is " + std::to_string(hour12) + ":" + minutes + " " + meridiem + ".";
}

std::string SystemTimeUtils::formatDate(const std::tm& local) {
  return std::string("Today is ") + kWeekdays[local.tm_wday % 7] + ", " + kMonths[local.tm_mon % 12] +
         " " + std::to_string(local.tm_mday) + ", " + std::to_string(local.tm_year + 1900) + ".";
}

std::tm SystemTimeUtils::now() const {
  const std::time_t t = std::chrono::system_clock::to_time_t(clock_());
  std::tm local{};
  localtime_r(&t, &local);
  return local;
}
