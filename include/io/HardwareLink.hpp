#pragma once
/** @file  HardwareLink.hpp
 *  @brief Abstract robot control surface: speech, posture, event memory.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace genesis {
  namespace io {

    /// Raised by any HardwareLink call that fails (transport or remote error).
    class LinkError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /**
 * @class HardwareLink
 * @brief Blocking, synchronous primitives only. Callers decide which thread blocks.
 *
 *  * Every method may be called from several threads at once.
 *  * `isOpen()` turns false once the session is known to be gone.
 */
    class HardwareLink {
    public:
      virtual ~HardwareLink() = default;

      //---session-----------------------------------------------------------
      /** @returns false if the session handshake fails. Never throws. */
      virtual bool open(const std::string& host, std::uint16_t port) = 0;
      virtual void close() = 0;
      virtual bool isOpen() const = 0;

      //---actuators (block until the robot reports completion)--------------
      virtual void say(const std::string& text) = 0;
      virtual void goToPosture(const std::string& posture, float speed) = 0;

      //---event memory------------------------------------------------------
      /** Current value stored under \p key (null when unset). */
      virtual nlohmann::json getData(const std::string& key) = 0;
    };

  } // namespace io
} // namespace genesis
