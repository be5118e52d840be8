#pragma once
/** @file  TaskScheduler.hpp
 *  @brief Daily HH:MM actions, run on the scheduler's own thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace genesis {
  namespace core {
    class Logger;
  }

  namespace services {

    class TaskScheduler {
    public:
      using Action = std::function<void(const std::vector<std::string>&)>;

      virtual ~TaskScheduler() = default;

      /// @returns a sentence for the user: confirmation or why it was refused.
      virtual std::string addTask(const std::string& name, const std::string& description,
                                  const std::string& scheduleTime, Action action,
                                  std::vector<std::string> actionArgs) = 0;

      virtual std::string removeTask(const std::string& name) = 0;
    };

    /**
 * @class DailyTaskScheduler
 * @brief Each task fires once per local calendar day at its HH:MM.
 *
 *  * A task added after its time of day first fires tomorrow.
 *  * Re-adding a name replaces the earlier task.
 *  * A throwing action is logged; the task stays scheduled.
 */
    class DailyTaskScheduler : public TaskScheduler {
    public:
      using Clock = std::function<std::chrono::system_clock::time_point()>;

      explicit DailyTaskScheduler(std::shared_ptr<core::Logger> logger,
                                  Clock clock = [] { return std::chrono::system_clock::now(); },
                                  std::chrono::milliseconds tick = std::chrono::milliseconds{ 1000 });
      ~DailyTaskScheduler() override;

      std::string addTask(const std::string& name, const std::string& description,
                          const std::string& scheduleTime, Action action,
                          std::vector<std::string> actionArgs) override;
      std::string removeTask(const std::string& name) override;

      void start();
      void stop();

      /// Fire every task due at \p now. @returns number of actions run.
      std::size_t runPending(std::chrono::system_clock::time_point now);

      std::size_t taskCount() const;

      /// "H:MM" / "HH:MM" -> {hour, minute}; nullopt when out of range.
      static std::optional<std::pair<int, int>> parseTime(const std::string& text);

      DailyTaskScheduler(const DailyTaskScheduler&) = delete;
      DailyTaskScheduler& operator=(const DailyTaskScheduler&) = delete;

    private:
      struct Task {
        std::string name;
        std::string description;
        int hour{ 0 };
        int minute{ 0 };
        Action action;
        std::vector<std::string> args;
        long lastRunDay{ -1 }; ///< year * 1000 + day-of-year of the last firing
      };

      void loop();

      std::shared_ptr<core::Logger> logger_;
      Clock clock_;
      std::chrono::milliseconds tick_;

      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::vector<Task> tasks_;
      bool stopping_{ false };
      std::thread worker_;
    };

  } // namespace services
} // namespace genesis
