#pragma once
/** @file  EventPoller.hpp
 *  @brief Dedicated thread that samples robot event memory and forwards meaningful changes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "core/SensorEvent.hpp"

namespace genesis {
  namespace io {
    class HardwareLink;
  }

  namespace core {

    class Logger;

    /**
 * @class EventPoller
 * @brief Owns the polling thread; never runs orchestration work itself.
 *
 *  * Each sweep samples every monitored key; a failing key is skipped, not fatal.
 *  * Meaningful values are forwarded once per change (a latched value is not re-sent).
 *  * `stop()` is cooperative and bounded: a thread stuck in a hardware call
 *    is detached after the timeout instead of blocking shutdown.
 */
    class EventPoller {
    public:
      /// Cross-boundary submission; must not block.
      using Dispatch = std::function<void(SensorEvent)>;
      using HealthCheck = std::function<bool()>;
      using LinkLost = std::function<void(const std::string&)>;

      struct Options {
        std::vector<std::string> keys = events::monitored();
        std::chrono::milliseconds interval{ 100 };
        std::chrono::milliseconds backoff{ 1000 };
      };

      EventPoller(std::shared_ptr<io::HardwareLink> link, Dispatch dispatch, HealthCheck healthy,
                  LinkLost onLinkLost, std::shared_ptr<Logger> logger, Options options);
      EventPoller(std::shared_ptr<io::HardwareLink> link, Dispatch dispatch, HealthCheck healthy,
                  LinkLost onLinkLost, std::shared_ptr<Logger> logger)
          : EventPoller(std::move(link), std::move(dispatch), std::move(healthy),
                        std::move(onLinkLost), std::move(logger), Options{}) {}
      ~EventPoller();

      //---public API------------------------------------------------------
      /// Launch the thread (restarts cleanly if one is already running).
      bool start();

      /// @returns false if the thread had to be detached after \p timeout.
      bool stop(std::chrono::milliseconds timeout);

      bool running() const;

      /// One synchronous pass over every key. @returns number of events dispatched.
      std::size_t sweep();

      /// Per-key noise filter.
      static bool isMeaningful(const std::string& key, const EventValue& value);

      EventPoller(const EventPoller&) = delete;
      EventPoller& operator=(const EventPoller&) = delete;

    private:
      // Everything the thread touches; shared so a detached thread stays valid.
      struct Shared {
        std::shared_ptr<io::HardwareLink> link;
        Dispatch dispatch;
        HealthCheck healthy;
        LinkLost onLinkLost;
        std::shared_ptr<Logger> logger;
        Options options;

        std::atomic<bool> stopRequested{ false };
        std::atomic<bool> running{ false };
        std::mutex sleepMtx;
        std::condition_variable sleepCv;
        std::unordered_map<std::string, EventValue> lastDelivered; ///< poller thread only
      };

      static void loop(std::shared_ptr<Shared> shared, std::promise<void> done);
      static std::size_t sweepOnce(Shared& shared);
      static void sleepFor(Shared& shared, std::chrono::milliseconds d);

      std::shared_ptr<Shared> makeShared() const;

      std::shared_ptr<io::HardwareLink> link_;
      Dispatch dispatch_;
      HealthCheck healthy_;
      LinkLost onLinkLost_;
      std::shared_ptr<Logger> logger_;
      Options options_;

      std::shared_ptr<Shared> current_;
      std::thread worker_;
      std::future<void> done_;
    };

  } // namespace core
} // namespace genesis
