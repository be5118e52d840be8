/* @file DailyTaskScheduler.cpp
 * @brief once-a-day task table driven by a ticking thread
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <regex>

#include "core/Logger.hpp"
#include "services/TaskScheduler.hpp"

using namespace genesis::services;

namespace {
  constexpr const char* kTag = "TaskScheduler";

  std::tm toLocal(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    return local;
  }

  long dayKey(const std::tm& local) { return (local.tm_year + 1900L) * 1000L + local.tm_yday; }

  std::string hhmm(int h, int m) {
    char buf[6];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", h, m);
    return buf;
  }
} // namespace

DailyTaskScheduler::DailyTaskScheduler(std::shared_ptr<core::Logger> logger, Clock clock,
                                       std::chrono::milliseconds tick)
    : logger_(std::move(logger)), clock_(std::move(clock)), tick_(tick) {}

DailyTaskScheduler::~DailyTaskScheduler() { stop(); }

std::optional<std::pair<int, int>> DailyTaskScheduler::parseTime(const std::string& text) {
  static const std::regex pattern(R"(^\s*(\d{1,2}):(\d{2})\s*$)");
  std::smatch m;
  if (!std::regex_match(text, m, pattern))
    return std::nullopt;
  int h = std::stoi(m[1].str());
  int min = std::stoi(m[2].str());
  if (h > 23 || min > 59)
    return std::nullopt;
  return std::make_pair(h, min);
}

std::string DailyTaskScheduler::addTask(const std::string& name, const std::string& description,
                                        const std::string& scheduleTime, Action action,
                                        std::vector<std::string> actionArgs) {
  auto parsed = parseTime(scheduleTime);
  if (!parsed) {
    logger_->warn(kTag, "rejected task '" + name + "': bad time '" + scheduleTime + "'");
    return "Sorry, '" + scheduleTime + "' is not a valid time. Please use HH:MM.";
  }
  if (!action) {
    logger_->warn(kTag, "rejected task '" + name + "': no action");
    return "Sorry, I could not schedule that.";
  }

  Task task{ name, description, parsed->first, parsed->second, std::move(action),
             std::move(actionArgs) };

  // already past today's slot -> first firing tomorrow
  const auto now = toLocal(clock_());
  if (now.tm_hour * 60 + now.tm_min >= task.hour * 60 + task.minute)
    task.lastRunDay = dayKey(now);

  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [&](const Task& t) { return t.name == name; });
    if (it != tasks_.end())
      *it = std::move(task);
    else
      tasks_.push_back(std::move(task));
  }

  const auto when = hhmm(parsed->first, parsed->second);
  logger_->info(kTag, "scheduled '" + name + "' daily at " + when);
  return "Done. Scheduled daily at " + when + ": " + description + ".";
}

std::string DailyTaskScheduler::removeTask(const std::string& name) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = std::find_if(tasks_.begin(), tasks_.end(), [&](const Task& t) { return t.name == name; });
  if (it == tasks_.end())
    return "No scheduled task named '" + name + "'.";
  tasks_.erase(it);
  logger_->info(kTag, "removed '" + name + "'");
  return "Cancelled '" + name + "'.";
}

std::size_t DailyTaskScheduler::taskCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return tasks_.size();
}

std::size_t DailyTaskScheduler::runPending(std::chrono::system_clock::time_point nowPoint) {
  const auto now = toLocal(nowPoint);
  const int minuteOfDay = now.tm_hour * 60 + now.tm_min;
  const long today = dayKey(now);

  struct Due {
    std::string name;
    Action action;
    std::vector<std::string> args;
  };
  std::vector<Due> due;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& t : tasks_) {
      if (t.lastRunDay == today || minuteOfDay < t.hour * 60 + t.minute)
        continue;
      t.lastRunDay = today;
      due.push_back({ t.name, t.action, t.args });
    }
  }

  // actions run unlocked; they may add or remove tasks
  for (auto& d : due) {
    logger_->info(kTag, "running '" + d.name + "'");
    try {
      d.action(d.args);
    } catch (const std::exception& e) {
      logger_->error(kTag, "task '" + d.name + "' failed: " + e.what());
    }
  }
  return due.size();
}

void DailyTaskScheduler::start() {
  if (worker_.joinable())
    return;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopping_ = false;
  }
  worker_ = std::thread(&DailyTaskScheduler::loop, this);
}

void DailyTaskScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

void DailyTaskScheduler::loop() {
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      if (cv_.wait_for(lock, tick_, [this] { return stopping_; }))
        return;
    }
    runPending(clock_());
  }
}
