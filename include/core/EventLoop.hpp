#pragma once
/** @file  EventLoop.hpp
 *  @brief Single-threaded task loop that owns all orchestration work.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace genesis {
  namespace core {

    class Logger;

    /**
 * @class EventLoop
 * @brief Cooperative scheduler: tasks posted from any thread run one after the
 *        other on whichever thread drives `run()` / `runOnce()`.
 *
 *  * `post()` is the only cross-thread entry point; it never blocks on task execution.
 *  * A throwing task is logged and the loop carries on.
 *  * `watch()` tracks a future started from a task without awaiting it; its
 *    exception (if any) is logged once it completes.
 */
    class EventLoop {
    public:
      using Task = std::function<void()>;

      explicit EventLoop(std::shared_ptr<Logger> logger);
      ~EventLoop() = default;

      //---public API------------------------------------------------------
      /// Thread-safe submission. @returns false once the loop was stopped.
      bool post(Task task);

      /// Keep \p pending alive until ready and log its failure.
      void watch(std::future<void> pending, std::string label);

      /// Run every task that is ready, waiting up to \p maxWait for the first.
      /// @returns number of tasks executed.
      std::size_t runOnce(std::chrono::milliseconds maxWait);

      /// Drive the loop until `stop()`.
      void run();

      void stop();
      bool stopped() const { return stopped_.load(); }

      /// True when called from the thread currently driving the loop.
      bool isLoopThread() const;

      std::size_t pendingTasks() const;
      std::size_t watchedFutures() const;

      EventLoop(const EventLoop&) = delete;
      EventLoop& operator=(const EventLoop&) = delete;

    private:
      struct Watched {
        std::future<void> future;
        std::string label;
      };

      void reapWatched();

      std::shared_ptr<Logger> logger_;
      std::deque<Task> queue_;
      std::vector<Watched> watched_;
      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::atomic<bool> stopped_{ false };
      std::atomic<std::thread::id> loopThread_{};
    };

  } // namespace core
} // namespace genesis
