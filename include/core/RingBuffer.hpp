#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded, blocking-on-read FIFO used by the async logger.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace genesis {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity circular queue shared between producers and one consumer.
 *
 *  * `push()` never blocks: when full, the oldest element is overwritten.
 *  * `pop()` waits up to a timeout for data.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity ? capacity : 1) {}

      /// @returns false if an element had to be dropped to make room.
      bool push(T value) {
        bool dropped = false;
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (count_ == slots_.size()) {
            head_ = (head_ + 1) % slots_.size();
            --count_;
            ++dropped_;
            dropped = true;
          }
          slots_[(head_ + count_) % slots_.size()] = std::move(value);
          ++count_;
        }
        cv_.notify_one();
        return !dropped;
      }

      std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!cv_.wait_for(lock, timeout, [this] { return count_ > 0; }))
          return std::nullopt;
        T out = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return out;
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return count_;
      }

      std::size_t capacity() const { return slots_.size(); }

      std::size_t dropped() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return dropped_;
      }

      /// Wake a blocked consumer (used at shutdown).
      void wakeAll() { cv_.notify_all(); }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
      std::size_t dropped_{ 0 };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace genesis
