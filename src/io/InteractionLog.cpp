/* @file InteractionLog.cpp
 * @brief transcript lines through FileLogger
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <ctime>

#include "core/Logger.hpp"
#include "io/InteractionLog.hpp"

using namespace genesis::io;

namespace {
  constexpr const char* kTag = "InteractionLog";
}

InteractionLog::InteractionLog(std::string path, std::shared_ptr<core::Logger> logger,
                               std::string robotLabel)
    : path_(std::move(path)), logger_(std::move(logger)), robotLabel_(std::move(robotLabel)) {}

std::string InteractionLog::timestamp(std::chrono::system_clock::time_point tp) {
  const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
  const std::time_t t = std::chrono::system_clock::to_time_t(secs);
  std::tm utc{};
  gmtime_r(&t, &utc);

  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00", utc.tm_year + 1900,
                utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec,
                static_cast<long long>(micros));
  return buf;
}

std::string InteractionLog::formatEntry(std::chrono::system_clock::time_point tp,
                                        const std::string& robotLabel, const std::string& userText,
                                        const std::string& reply) {
  const auto ts = timestamp(tp);
  return ts + " | User: " + userText + "\n" + ts + " | " + robotLabel + ": " + reply + "\n\n";
}

bool InteractionLog::append(const std::string& userText, const std::string& reply) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!file_.isOpen() && !file_.open(path_)) {
    logger_->error(kTag, "cannot open " + path_);
    return false;
  }

  file_.write(formatEntry(std::chrono::system_clock::now(), robotLabel_, userText, reply));
  if (!file_.flush()) {
    logger_->error(kTag, "write to " + path_ + " failed");
    return false;
  }
  return true;
}
