#pragma once
/** @file  RobotOutput.hpp
 *  @brief Narrow speech + motion surface used by dialogue code.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <future>
#include <string>

namespace genesis::core {

  /**
 * @class RobotOutput
 * @brief Both calls start the action on a blocking executor and return at once.
 *
 *  * The future completes when the robot reports the action done.
 *  * Hardware failures surface as an exception stored in the future.
 */
  class RobotOutput {
  public:
    virtual ~RobotOutput() = default;

    virtual std::future<void> speak(const std::string& text, bool animated = true) = 0;
    virtual std::future<void> movePosture(const std::string& posture, float speed = 0.8f) = 0;
  };

} // namespace genesis::core
