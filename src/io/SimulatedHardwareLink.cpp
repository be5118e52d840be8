/* @file SimulatedHardwareLink.cpp
 * @brief mock robot: logged actuators, scripted event memory
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <thread>

#include "core/Logger.hpp"
#include "core/SensorEvent.hpp"
#include "io/SimulatedHardwareLink.hpp"

using namespace genesis::io;

namespace {
  constexpr const char* kTag = "SimulatedLink";
  constexpr auto kMaxSpeechDelay = std::chrono::milliseconds{ 3000 };
} // namespace

SimulatedHardwareLink::SimulatedHardwareLink(std::shared_ptr<core::Logger> logger,
                                             std::chrono::milliseconds perCharacter)
    : logger_(std::move(logger)), perCharacter_(perCharacter) {}

bool SimulatedHardwareLink::open(const std::string& host, std::uint16_t port) {
  logger_->info(kTag, "[MOCK] connecting to " + host + ":" + std::to_string(port) + " (simulated)");
  open_ = true;
  return true;
}

void SimulatedHardwareLink::close() {
  if (open_.exchange(false))
    logger_->info(kTag, "[MOCK] session closed");
}

void SimulatedHardwareLink::say(const std::string& text) {
  if (!open_)
    throw LinkError("[SimulatedLink] say on a closed session");

  inject(core::events::kTextDone, 0);
  logger_->info(kTag, "[MOCK SPEAK] " + text);
  std::this_thread::sleep_for(
      std::min<std::chrono::milliseconds>(perCharacter_ * static_cast<long>(text.size()), kMaxSpeechDelay));
  inject(core::events::kTextDone, 1);
}

void SimulatedHardwareLink::goToPosture(const std::string& posture, float speed) {
  if (!open_)
    throw LinkError("[SimulatedLink] goToPosture on a closed session");
  logger_->info(kTag, "[MOCK MOVE] posture=" + posture + " speed=" + std::to_string(speed));
}

nlohmann::json SimulatedHardwareLink::getData(const std::string& key) {
  if (!open_)
    throw LinkError("[SimulatedLink] getData on a closed session");

  std::lock_guard<std::mutex> lock(mtx_);
  if (key == core::events::kWordRecognized) {
    if (servedUtterance_ || utterances_.empty()) {
      servedUtterance_ = false;
      return nlohmann::json::array({ "", 0.0 });
    }
    servedUtterance_ = true;
    auto value = std::move(utterances_.front());
    utterances_.pop_front();
    return value;
  }

  auto it = memory_.find(key);
  return it == memory_.end() ? nlohmann::json() : it->second;
}

void SimulatedHardwareLink::injectUtterance(const std::string& text, double confidence) {
  std::lock_guard<std::mutex> lock(mtx_);
  utterances_.push_back(nlohmann::json::array({ text, confidence }));
}

void SimulatedHardwareLink::inject(const std::string& key, nlohmann::json value) {
  std::lock_guard<std::mutex> lock(mtx_);
  memory_[key] = std::move(value);
}
