#pragma once
/** @file  SensorEvent.hpp
 *  @brief Event record handed from the poller thread to the event loop.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace genesis {
  namespace core {

    /// Opaque sampled value: scalar, small list, or `[text, confidence]`.
    using EventValue = nlohmann::json;

    namespace events {
      inline constexpr const char* kWordRecognized = "WordRecognized";
      inline constexpr const char* kTextDone = "ALTextToSpeech/TextDone";
      inline constexpr const char* kTouchChanged = "TouchChanged";
      inline constexpr const char* kFrontTactilTouched = "FrontTactilTouched";
      inline constexpr const char* kMiddleTactilTouched = "MiddleTactilTouched";
      inline constexpr const char* kRearTactilTouched = "RearTactilTouched";

      /// Fixed key set sampled every poll cycle.
      inline const std::vector<std::string>& monitored() {
        static const std::vector<std::string> keys{ kWordRecognized,      kTextDone,
                                                    kTouchChanged,        kFrontTactilTouched,
                                                    kMiddleTactilTouched, kRearTactilTouched };
        return keys;
      }
    } // namespace events

    struct SensorEvent {
      std::string eventName;
      EventValue value;
      std::chrono::steady_clock::time_point timestamp{};

      /// Seconds on the monotonic clock, for log lines.
      double timestampSeconds() const {
        return std::chrono::duration<double>(timestamp.time_since_epoch()).count();
      }
    };

    /// Runs inline on the event loop thread.
    using SensorCallback = std::function<void(const SensorEvent&)>;
    /// Started on the event loop thread; its future is watched, never awaited.
    using AsyncSensorCallback = std::function<std::future<void>(const SensorEvent&)>;

    using EventHandler = std::variant<SensorCallback, AsyncSensorCallback>;

  } // namespace core
} // namespace genesis
