/* @file EventLoop.cpp
 * @brief mutex/condvar task queue drained on the main thread
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <exception>

#include "core/EventLoop.hpp"
#include "core/Logger.hpp"

namespace genesis {
  namespace core {

    namespace {
      constexpr const char* kTag = "EventLoop";
    }

    EventLoop::EventLoop(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

    bool EventLoop::post(Task task) {
      if (!task)
        return false;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopped_)
          return false;
        queue_.push_back(std::move(task));
      }
      cv_.notify_one();
      return true;
    }

    void EventLoop::watch(std::future<void> pending, std::string label) {
      if (!pending.valid())
        return;
      std::lock_guard<std::mutex> lock(mtx_);
      watched_.push_back({ std::move(pending), std::move(label) });
    }

    std::size_t EventLoop::runOnce(std::chrono::milliseconds maxWait) {
      loopThread_ = std::this_thread::get_id();

      std::deque<Task> ready;
      {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, maxWait, [this] { return !queue_.empty() || stopped_; });
        ready.swap(queue_);
      }

      std::size_t executed = 0;
      for (auto& task : ready) {
        try {
          task();
        } catch (const std::exception& e) {
          logger_->error(kTag, std::string("task failed: ") + e.what());
        } catch (...) {
          logger_->error(kTag, "task failed with a non-standard exception");
        }
        ++executed;
      }

      reapWatched();
      return executed;
    }

    void EventLoop::run() {
      while (!stopped_)
        runOnce(std::chrono::milliseconds{ 100 });
    }

    void EventLoop::stop() {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        stopped_ = true;
      }
      cv_.notify_all();
    }

    bool EventLoop::isLoopThread() const { return loopThread_.load() == std::this_thread::get_id(); }

    std::size_t EventLoop::pendingTasks() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return queue_.size();
    }

    std::size_t EventLoop::watchedFutures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return watched_.size();
    }

    void EventLoop::reapWatched() {
      std::vector<Watched> done;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto it = watched_.begin(); it != watched_.end();) {
          if (it->future.wait_for(std::chrono::seconds{ 0 }) == std::future_status::ready) {
            done.push_back(std::move(*it));
            it = watched_.erase(it);
          } else {
            ++it;
          }
        }
      }

      for (auto& w : done) {
        try {
          w.future.get();
        } catch (const std::exception& e) {
          logger_->error(kTag, w.label + " failed: " + e.what());
        } catch (...) {
          logger_->error(kTag, w.label + " failed with a non-standard exception");
        }
      }
    }

  } // namespace core
} // namespace genesis
