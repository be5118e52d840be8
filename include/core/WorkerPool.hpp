#pragma once
/** @file  WorkerPool.hpp
 *  @brief Fixed-size thread pool for blocking work (hardware I/O, HTTP, turns).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace genesis {
  namespace core {

    class Logger;

    /**
 * @class WorkerPool
 * @brief Runs submitted callables on N worker threads.
 *
 *  * `submit()` returns a future; `detach()` is fire-and-forget with errors logged.
 *  * `shutdown()` drops queued jobs, waits a bounded grace period and detaches
 *    any worker still stuck in a blocking call. Workers only touch shared state,
 *    so a detached worker outliving the pool is safe.
 */
    class WorkerPool {
    public:
      WorkerPool(std::string name, std::size_t threads, std::shared_ptr<Logger> logger);
      ~WorkerPool();

      //---public API------------------------------------------------------
      template <typename F> auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto fut = task->get_future();
        if (!enqueue([task] { (*task)(); })) {
          std::promise<R> rejected;
          rejected.set_exception(
              std::make_exception_ptr(std::runtime_error("[WorkerPool] " + name_ + " is shut down")));
          return rejected.get_future();
        }
        return fut;
      }

      /// Run \p fn without a result channel. @returns false if the pool is shut down.
      bool detach(std::function<void()> fn, std::string label);

      /// @returns true when every worker joined within \p grace.
      bool shutdown(std::chrono::milliseconds grace);

      bool accepting() const;
      std::size_t queued() const;
      std::size_t busy() const;
      const std::string& name() const { return name_; }

      WorkerPool(const WorkerPool&) = delete;
      WorkerPool& operator=(const WorkerPool&) = delete;

    private:
      struct State {
        std::mutex mtx;
        std::condition_variable cv;
        std::condition_variable exitCv;
        std::deque<std::function<void()>> jobs;
        std::vector<bool> exited;
        std::size_t busy{ 0 };
        bool stopping{ false };
      };

      bool enqueue(std::function<void()> job);
      static void workerLoop(std::shared_ptr<State> state, std::size_t index);

      std::string name_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<State> state_;
      std::vector<std::thread> workers_;
      bool shutDown_{ false };
    };

  } // namespace core
} // namespace genesis
