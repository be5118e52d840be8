/* @file EventPoller.cpp
 * @brief sampling thread: getData per key, noise filter, edge detection, dispatch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/EventPoller.hpp"
#include "core/Logger.hpp"
#include "core/Strings.hpp"
#include "io/HardwareLink.hpp"

namespace genesis {
  namespace core {

    namespace {
      constexpr const char* kTag = "EventPoller";

      bool isPressedSentinel(const EventValue& v) {
        return v.is_number() && v.get<double>() == 1.0;
      }

      bool isTruthy(const EventValue& v) {
        if (v.is_null())
          return false;
        if (v.is_boolean())
          return v.get<bool>();
        if (v.is_number())
          return v.get<double>() != 0.0;
        if (v.is_string())
          return !v.get_ref<const std::string&>().empty();
        return !v.empty(); // array / object
      }
    } // namespace

    EventPoller::EventPoller(std::shared_ptr<io::HardwareLink> link, Dispatch dispatch,
                             HealthCheck healthy, LinkLost onLinkLost,
                             std::shared_ptr<Logger> logger, Options options)
        : link_(std::move(link)), dispatch_(std::move(dispatch)), healthy_(std::move(healthy)),
          onLinkLost_(std::move(onLinkLost)), logger_(std::move(logger)),
          options_(std::move(options)) {}

    EventPoller::~EventPoller() { stop(std::chrono::milliseconds{ 1000 }); }

    bool EventPoller::start() {
      if (worker_.joinable())
        stop(std::chrono::milliseconds{ 1000 });

      auto shared = makeShared();
      // carry edge state over a clean restart so a latched value is not replayed
      if (current_ && !current_->running)
        shared->lastDelivered = current_->lastDelivered;
      shared->running = true;
      current_ = shared;

      std::promise<void> done;
      done_ = done.get_future();
      worker_ = std::thread(&EventPoller::loop, shared, std::move(done));
      logger_->info(kTag, "polling " + std::to_string(options_.keys.size()) + " key(s) every " +
                              std::to_string(options_.interval.count()) + " ms");
      return true;
    }

    bool EventPoller::stop(std::chrono::milliseconds timeout) {
      if (!worker_.joinable())
        return true;

      {
        std::lock_guard<std::mutex> lock(current_->sleepMtx);
        current_->stopRequested = true;
      }
      current_->sleepCv.notify_all();

      if (done_.wait_for(timeout) == std::future_status::ready) {
        worker_.join();
        logger_->debug(kTag, "poller stopped");
        return true;
      }

      worker_.detach();
      logger_->warn(kTag, "poller did not stop within " + std::to_string(timeout.count()) +
                              " ms, detached");
      return false;
    }

    bool EventPoller::running() const { return current_ && current_->running.load(); }

    std::size_t EventPoller::sweep() {
      if (!current_)
        current_ = makeShared();
      return sweepOnce(*current_);
    }

    bool EventPoller::isMeaningful(const std::string& key, const EventValue& value) {
      if (key == events::kWordRecognized) {
        if (!value.is_array() || value.empty() || !value.front().is_string())
          return false;
        return !trim(value.front().get<std::string>()).empty();
      }

      if (key.find("Touched") != std::string::npos || key.find("TouchChanged") != std::string::npos) {
        if (isPressedSentinel(value))
          return true;
        if (value.is_array())
          for (const auto& item : value)
            if (isPressedSentinel(item))
              return true;
        return false;
      }

      if (key.find("TextDone") != std::string::npos)
        return isPressedSentinel(value);

      return isTruthy(value);
    }

    std::shared_ptr<EventPoller::Shared> EventPoller::makeShared() const {
      auto shared = std::make_shared<Shared>();
      shared->link = link_;
      shared->dispatch = dispatch_;
      shared->healthy = healthy_;
      shared->onLinkLost = onLinkLost_;
      shared->logger = logger_;
      shared->options = options_;
      return shared;
    }

    void EventPoller::loop(std::shared_ptr<Shared> shared, std::promise<void> done) {
      auto& s = *shared;
      while (!s.stopRequested) {
        try {
          if (s.healthy && !s.healthy()) {
            s.logger->info(kTag, "connection unhealthy, poller exiting");
            break;
          }
          if (!s.link->isOpen()) {
            s.logger->warn(kTag, "hardware session closed, poller exiting");
            if (s.onLinkLost)
              s.onLinkLost("event memory session closed");
            break;
          }

          sweepOnce(s);
          sleepFor(s, s.options.interval);
        } catch (const std::exception& e) {
          s.logger->error(kTag, std::string("poll cycle failed: ") + e.what());
          sleepFor(s, s.options.backoff);
        }
      }

      s.running = false;
      done.set_value();
    }

    std::size_t EventPoller::sweepOnce(Shared& s) {
      std::size_t delivered = 0;
      for (const auto& key : s.options.keys) {
        EventValue value;
        try {
          value = s.link->getData(key);
        } catch (const std::exception& e) {
          s.logger->debug(kTag, "sampling '" + key + "' failed: " + e.what());
          continue;
        }

        auto last = s.lastDelivered.find(key);
        if (!isMeaningful(key, value)) {
          if (last != s.lastDelivered.end())
            s.lastDelivered.erase(last); // re-arm
          continue;
        }
        if (last != s.lastDelivered.end() && last->second == value)
          continue;

        s.lastDelivered[key] = value;
        s.dispatch(SensorEvent{ key, std::move(value), std::chrono::steady_clock::now() });
        ++delivered;
      }
      return delivered;
    }

    void EventPoller::sleepFor(Shared& s, std::chrono::milliseconds d) {
      std::unique_lock<std::mutex> lock(s.sleepMtx);
      s.sleepCv.wait_for(lock, d, [&s] { return s.stopRequested.load(); });
    }

  } // namespace core
} // namespace genesis
