#pragma once
/** @file  SimulatedHardwareLink.hpp
 *  @brief In-process stand-in for the robot, for development without hardware.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "io/HardwareLink.hpp"

namespace genesis {
  namespace core {
    class Logger;
  }

  namespace io {

    /**
 * @class SimulatedHardwareLink
 * @brief Logs actuator calls and serves an event memory fed by `inject*()`.
 *
 *  * Queued utterances are served one per `WordRecognized` read, with an
 *    empty `["", 0.0]` sample in between so repeated phrases re-arm the poller.
 *  * `say()` toggles `ALTextToSpeech/TextDone` 0 → 1 like the real robot.
 */
    class SimulatedHardwareLink : public HardwareLink {
    public:
      explicit SimulatedHardwareLink(std::shared_ptr<core::Logger> logger,
                                     std::chrono::milliseconds perCharacter = std::chrono::milliseconds{ 20 });

      bool open(const std::string& host, std::uint16_t port) override;
      void close() override;
      bool isOpen() const override { return open_.load(); }

      void say(const std::string& text) override;
      void goToPosture(const std::string& posture, float speed) override;
      nlohmann::json getData(const std::string& key) override;

      //---simulation hooks---------------------------------------------------
      void injectUtterance(const std::string& text, double confidence = 1.0);
      void inject(const std::string& key, nlohmann::json value);

      /// Pretend the robot went away; the next `open()` brings it back.
      void dropSession() { open_ = false; }

    private:
      std::shared_ptr<core::Logger> logger_;
      std::chrono::milliseconds perCharacter_;
      std::atomic<bool> open_{ false };

      std::mutex mtx_;
      std::unordered_map<std::string, nlohmann::json> memory_;
      std::deque<nlohmann::json> utterances_;
      bool servedUtterance_{ false };
    };

  } // namespace io
} // namespace genesis
