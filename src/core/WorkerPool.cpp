/* @file WorkerPool.cpp
 * @brief blocking-safe executor with bounded shutdown
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/WorkerPool.hpp"
#include "core/Logger.hpp"

namespace genesis {
  namespace core {

    WorkerPool::WorkerPool(std::string name, std::size_t threads, std::shared_ptr<Logger> logger)
        : name_(std::move(name)), logger_(std::move(logger)), state_(std::make_shared<State>()) {
      if (threads == 0)
        threads = 1;
      state_->exited.assign(threads, false);
      workers_.reserve(threads);
      for (std::size_t i = 0; i < threads; ++i)
        workers_.emplace_back(&WorkerPool::workerLoop, state_, i);
    }

    WorkerPool::~WorkerPool() { shutdown(std::chrono::milliseconds{ 1000 }); }

    bool WorkerPool::detach(std::function<void()> fn, std::string label) {
      auto logger = logger_;
      auto poolName = name_;
      return enqueue([fn = std::move(fn), label = std::move(label), logger, poolName] {
        try {
          fn();
        } catch (const std::exception& e) {
          logger->error(poolName, "detached task '" + label + "' failed: " + e.what());
        } catch (...) {
          logger->error(poolName, "detached task '" + label + "' failed with a non-standard exception");
        }
      });
    }

    bool WorkerPool::shutdown(std::chrono::milliseconds grace) {
      if (shutDown_)
        return true;
      shutDown_ = true;

      std::size_t dropped = 0;
      {
        std::lock_guard<std::mutex> lock(state_->mtx);
        state_->stopping = true;
        dropped = state_->jobs.size();
        state_->jobs.clear();
      }
      state_->cv.notify_all();
      if (dropped > 0)
        logger_->debug(name_, "dropped " + std::to_string(dropped) + " queued job(s) at shutdown");

      std::vector<bool> exited;
      {
        std::unique_lock<std::mutex> lock(state_->mtx);
        state_->exitCv.wait_for(lock, grace, [this] {
          for (bool e : state_->exited)
            if (!e)
              return false;
          return true;
        });
        exited = state_->exited;
      }

      bool clean = true;
      for (std::size_t i = 0; i < workers_.size(); ++i) {
        if (!workers_[i].joinable())
          continue;
        if (exited[i]) {
          workers_[i].join();
        } else {
          clean = false;
          workers_[i].detach();
        }
      }
      if (!clean)
        logger_->warn(name_, "worker(s) still busy after grace period, detached");
      return clean;
    }

    bool WorkerPool::accepting() const {
      std::lock_guard<std::mutex> lock(state_->mtx);
      return !state_->stopping;
    }

    std::size_t WorkerPool::queued() const {
      std::lock_guard<std::mutex> lock(state_->mtx);
      return state_->jobs.size();
    }

    std::size_t WorkerPool::busy() const {
      std::lock_guard<std::mutex> lock(state_->mtx);
      return state_->busy;
    }

    bool WorkerPool::enqueue(std::function<void()> job) {
      {
        std::lock_guard<std::mutex> lock(state_->mtx);
        if (state_->stopping)
          return false;
        state_->jobs.push_back(std::move(job));
      }
      state_->cv.notify_one();
      return true;
    }

    void WorkerPool::workerLoop(std::shared_ptr<State> state, std::size_t index) {
      for (;;) {
        std::function<void()> job;
        {
          std::unique_lock<std::mutex> lock(state->mtx);
          state->cv.wait(lock, [&] { return state->stopping || !state->jobs.empty(); });
          if (state->stopping && state->jobs.empty())
            break;
          job = std::move(state->jobs.front());
          state->jobs.pop_front();
          ++state->busy;
        }

        job(); // packaged_task / detach wrapper never throw

        std::lock_guard<std::mutex> lock(state->mtx);
        --state->busy;
      }

      {
        std::lock_guard<std::mutex> lock(state->mtx);
        state->exited[index] = true;
      }
      state->exitCv.notify_all();
    }

  } // namespace core
} // namespace genesis
