#pragma once
/** @file  Command.hpp
 *  @brief Request line sent to the robot bridge.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace genesis {
  namespace protocols {

    /// `{"id":7,"service":"ALMemory","method":"getData","args":["WordRecognized"]}\r\n`
    struct Command {
      std::uint32_t id{ 0 };
      std::string service;
      std::string method;
      nlohmann::json args = nlohmann::json::array();

      std::string toWire() const {
        nlohmann::json doc{ { "id", id }, { "service", service }, { "method", method }, { "args", args } };
        return doc.dump() + "\r\n";
      }
    };

  } // namespace protocols
} // namespace genesis
