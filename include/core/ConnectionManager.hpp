#pragma once
/** @file  ConnectionManager.hpp
 *  @brief Session lifecycle against the HardwareLink plus the gated speech/motion path.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "core/EventPoller.hpp"
#include "core/RobotOutput.hpp"
#include "core/SensorEvent.hpp"

namespace genesis {
  namespace io {
    class HardwareLink;
  }

  namespace core {

    class ErrorMonitor;
    class EventLoop;
    class Logger;
    class WorkerPool;

    enum class ConnectionState { Disconnected, Connecting, Connected };

    const char* toString(ConnectionState state);

    /**
 * @class ConnectionManager
 * @brief Owns ConnectionState and the EventPoller; every link call runs on the hardware pool.
 *
 *  * `connect()` / `reconnect()` never throw; the future carries success.
 *  * No link command is issued unless Connected; otherwise speech and motion
 *    are logged no-ops with a ready future.
 *  * A LinkError that leaves the session closed flips the state to Disconnected,
 *    the heartbeat notices on its next tick.
 *  * Call `subscribe()` / `resubscribe()` / `disconnect()` from the loop thread.
 */
    class ConnectionManager : public RobotOutput {
    public:
      struct Endpoint {
        std::string host{ "127.0.0.1" };
        std::uint16_t port{ 9559 };
      };

      ConnectionManager(std::shared_ptr<io::HardwareLink> link, Endpoint endpoint,
                        std::shared_ptr<EventLoop> loop, WorkerPool& hardware,
                        std::shared_ptr<Logger> logger, std::shared_ptr<ErrorMonitor> errors,
                        EventPoller::Options pollOptions);
      ConnectionManager(std::shared_ptr<io::HardwareLink> link, Endpoint endpoint,
                        std::shared_ptr<EventLoop> loop, WorkerPool& hardware,
                        std::shared_ptr<Logger> logger, std::shared_ptr<ErrorMonitor> errors)
          : ConnectionManager(std::move(link), std::move(endpoint), std::move(loop), hardware,
                              std::move(logger), std::move(errors), EventPoller::Options{}) {}
      ~ConnectionManager() override;

      //---lifecycle---------------------------------------------------------
      std::future<bool> connect();
      /// Close any stale session, then connect once. Callers resubscribe on success.
      std::future<bool> reconnect();
      void disconnect(std::chrono::milliseconds timeout);

      bool isHealthy() const { return state() == ConnectionState::Connected; }
      ConnectionState state() const { return status_->state.load(); }
      const Endpoint& endpoint() const { return endpoint_; }

      /// Connected -> Disconnected. No-op in any other state.
      void markLost(const std::string& reason);

      //---event subscription------------------------------------------------
      /// Remember \p handler as the latest handler and (re)start polling.
      void subscribe(EventHandler handler);
      /// Re-arm the poller with the latest handler. @returns false without one or while disconnected.
      bool resubscribe();
      bool pollerRunning() const;
      std::size_t subscriptionCount() const { return subscriptions_; }

      //---output (RobotOutput)----------------------------------------------
      std::future<void> speak(const std::string& text, bool animated = true) override;
      std::future<void> movePosture(const std::string& posture, float speed = 0.8f) override;

      ConnectionManager(const ConnectionManager&) = delete;
      ConnectionManager& operator=(const ConnectionManager&) = delete;

    private:
      // Outlives the manager when a pool job or a detached poller still holds it.
      struct Status {
        std::atomic<ConnectionState> state{ ConnectionState::Disconnected };
        std::mutex handlerMtx;
        std::optional<EventHandler> handler;
      };

      std::future<bool> attempt(bool closeFirst);
      EventPoller::Dispatch makeDispatch() const;

      static void lose(Status& status, Logger& logger, ErrorMonitor* errors,
                       const std::string& reason);

      std::shared_ptr<io::HardwareLink> link_;
      Endpoint endpoint_;
      std::shared_ptr<EventLoop> loop_;
      WorkerPool& hardware_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errors_;
      std::shared_ptr<Status> status_;
      std::unique_ptr<EventPoller> poller_;
      std::size_t subscriptions_{ 0 };
    };

  } // namespace core
} // namespace genesis
