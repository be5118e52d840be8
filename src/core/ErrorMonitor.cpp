/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault fan-in for every subsystem
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/ErrorMonitor.hpp"

namespace genesis {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      if (!rememberIfNew(message))
        return;

      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        cb = escalation_;
      }
      // invoked outside the lock so the callback may call back into us
      if (cb)
        cb(message);
    }

    void ErrorMonitor::clear() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    std::size_t ErrorMonitor::uniqueFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      std::lock_guard<std::mutex> lock(mtx_);
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace genesis
