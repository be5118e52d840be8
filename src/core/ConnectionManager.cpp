/* @file ConnectionManager.cpp
 * @brief connect / reconnect on the hardware pool, health flag, gated output, poller wiring
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <type_traits>
#include <variant>

#include "core/ConnectionManager.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventLoop.hpp"
#include "core/Logger.hpp"
#include "core/WorkerPool.hpp"
#include "io/HardwareLink.hpp"

namespace genesis {
  namespace core {

    namespace {
      constexpr const char* kTag = "ConnectionManager";

      template <typename T> std::future<T> ready(T value) {
        std::promise<T> p;
        p.set_value(std::move(value));
        return p.get_future();
      }

      std::future<void> readyVoid() {
        std::promise<void> p;
        p.set_value();
        return p.get_future();
      }
    } // namespace

    const char* toString(ConnectionState state) {
      switch (state) {
      case ConnectionState::Disconnected:
        return "Disconnected";
      case ConnectionState::Connecting:
        return "Connecting";
      case ConnectionState::Connected:
        return "Connected";
      }
      return "Unknown";
    }

    ConnectionManager::ConnectionManager(std::shared_ptr<io::HardwareLink> link, Endpoint endpoint,
                                         std::shared_ptr<EventLoop> loop, WorkerPool& hardware,
                                         std::shared_ptr<Logger> logger,
                                         std::shared_ptr<ErrorMonitor> errors,
                                         EventPoller::Options pollOptions)
        : link_(std::move(link)), endpoint_(std::move(endpoint)), loop_(std::move(loop)),
          hardware_(hardware), logger_(std::move(logger)), errors_(std::move(errors)),
          status_(std::make_shared<Status>()) {

      auto status = status_;
      auto log = logger_;
      auto errorMonitor = errors_;
      poller_ = std::make_unique<EventPoller>(
          link_, makeDispatch(),
          [status] { return status->state.load() == ConnectionState::Connected; },
          [status, log, errorMonitor](const std::string& reason) {
            lose(*status, *log, errorMonitor.get(), reason);
          },
          logger_, std::move(pollOptions));
    }

    ConnectionManager::~ConnectionManager() { poller_->stop(std::chrono::milliseconds{ 1000 }); }

    //---lifecycle-----------------------------------------------------------

    std::future<bool> ConnectionManager::connect() { return attempt(false); }

    std::future<bool> ConnectionManager::reconnect() {
      logger_->info(kTag, "reconnecting to " + endpoint_.host + ":" + std::to_string(endpoint_.port));
      return attempt(true);
    }

    std::future<bool> ConnectionManager::attempt(bool closeFirst) {
      auto expected = status_->state.load();
      if (expected == ConnectionState::Connecting) {
        logger_->debug(kTag, "connect already in progress");
        return ready(false);
      }
      if (expected == ConnectionState::Connected && !closeFirst)
        return ready(true);
      if (!status_->state.compare_exchange_strong(expected, ConnectionState::Connecting))
        return ready(false);

      if (!hardware_.accepting()) {
        status_->state = ConnectionState::Disconnected;
        return ready(false);
      }

      logger_->info(kTag, "connecting to " + endpoint_.host + ":" + std::to_string(endpoint_.port));
      return hardware_.submit([link = link_, endpoint = endpoint_, status = status_,
                               logger = logger_, errors = errors_, closeFirst] {
        if (closeFirst) {
          try {
            link->close();
          } catch (const std::exception& e) {
            logger->debug(kTag, std::string("closing stale session: ") + e.what());
          }
        }

        bool ok = false;
        try {
          ok = link->open(endpoint.host, endpoint.port);
        } catch (const std::exception& e) {
          logger->error(kTag, std::string("open threw: ") + e.what());
        }

        // a disconnect() that ran meanwhile owns the state; never overwrite it
        auto connecting = ConnectionState::Connecting;
        if (!status->state.compare_exchange_strong(
                connecting, ok ? ConnectionState::Connected : ConnectionState::Disconnected)) {
          logger->info(kTag, "connect finished after disconnect, leaving session closed");
          if (ok) {
            try {
              link->close();
            } catch (const std::exception& e) {
              logger->debug(kTag, std::string("closing late session: ") + e.what());
            }
          }
          return false;
        }
        if (ok) {
          logger->info(kTag, "connected to " + endpoint.host + ":" + std::to_string(endpoint.port));
        } else {
          const std::string msg = "[ConnectionManager] cannot reach robot at " + endpoint.host +
                                  ":" + std::to_string(endpoint.port);
          logger->error(kTag, msg);
          if (errors)
            errors->notifyFailure(msg);
        }
        return ok;
      });
    }

    void ConnectionManager::disconnect(std::chrono::milliseconds timeout) {
      if (!poller_->stop(timeout))
        logger_->warn(kTag, "proceeding with disconnect while the poller is still busy");

      if (hardware_.accepting()) {
        auto closing = hardware_.submit([link = link_] { link->close(); });
        if (closing.wait_for(timeout) != std::future_status::ready) {
          logger_->warn(kTag, "session teardown timed out");
        } else {
          try {
            closing.get();
          } catch (const std::exception& e) {
            logger_->warn(kTag, std::string("session teardown failed: ") + e.what());
          }
        }
      }

      status_->state = ConnectionState::Disconnected;
      logger_->info(kTag, "disconnected");
    }

    void ConnectionManager::markLost(const std::string& reason) {
      lose(*status_, *logger_, errors_.get(), reason);
    }

    void ConnectionManager::lose(Status& status, Logger& logger, ErrorMonitor* errors,
                                 const std::string& reason) {
      auto expected = ConnectionState::Connected;
      if (!status.state.compare_exchange_strong(expected, ConnectionState::Disconnected))
        return;
      logger.warn(kTag, "connection lost: " + reason);
      if (errors)
        errors->notifyFailure("[ConnectionManager] connection lost");
    }

    //---event subscription----------------------------------------------------

    void ConnectionManager::subscribe(EventHandler handler) {
      {
        std::lock_guard<std::mutex> lock(status_->handlerMtx);
        status_->handler = std::move(handler);
      }
      ++subscriptions_;
      resubscribe();
    }

    bool ConnectionManager::resubscribe() {
      {
        std::lock_guard<std::mutex> lock(status_->handlerMtx);
        if (!status_->handler) {
          logger_->warn(kTag, "resubscribe without a handler");
          return false;
        }
      }
      if (!isHealthy()) {
        logger_->warn(kTag, "not connected, subscription deferred");
        return false;
      }
      return poller_->start();
    }

    bool ConnectionManager::pollerRunning() const { return poller_->running(); }

    EventPoller::Dispatch ConnectionManager::makeDispatch() const {
      std::weak_ptr<EventLoop> weakLoop = loop_;
      auto status = status_;
      auto logger = logger_;

      return [weakLoop, status, logger](SensorEvent event) {
        auto loop = weakLoop.lock();
        if (!loop)
          return;

        EventLoop* raw = loop.get(); // the posted task only runs while the loop is alive
        bool posted = loop->post([raw, status, event = std::move(event)] {
          std::optional<EventHandler> handler;
          {
            std::lock_guard<std::mutex> lock(status->handlerMtx);
            handler = status->handler;
          }
          if (!handler)
            return;

          std::visit(
              [&](auto& cb) {
                using Callback = std::decay_t<decltype(cb)>;
                if constexpr (std::is_same_v<Callback, AsyncSensorCallback>)
                  raw->watch(cb(event), "async handler for " + event.eventName);
                else
                  cb(event);
              },
              *handler);
        });
        if (!posted)
          logger->debug(kTag, "event loop stopped, event dropped");
      };
    }

    //---output----------------------------------------------------------------

    std::future<void> ConnectionManager::speak(const std::string& text, bool animated) {
      if (!isHealthy()) {
        logger_->warn(kTag, "not connected, speech dropped: " + text);
        return readyVoid();
      }

      std::string payload = animated ? "\\rspd=80\\ " + text : text;
      return hardware_.submit([link = link_, status = status_, logger = logger_, errors = errors_,
                               payload = std::move(payload)] {
        try {
          link->say(payload);
        } catch (const io::LinkError&) {
          if (!link->isOpen())
            lose(*status, *logger, errors.get(), "speech failed");
          throw;
        }
      });
    }

    std::future<void> ConnectionManager::movePosture(const std::string& posture, float speed) {
      if (!isHealthy()) {
        logger_->warn(kTag, "not connected, posture dropped: " + posture);
        return readyVoid();
      }

      return hardware_.submit([link = link_, status = status_, logger = logger_, errors = errors_,
                               posture, speed] {
        try {
          link->goToPosture(posture, speed);
        } catch (const io::LinkError&) {
          if (!link->isOpen())
            lose(*status, *logger, errors.get(), "motion failed");
          throw;
        }
      });
    }

  } // namespace core
} // namespace genesis
