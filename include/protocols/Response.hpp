#pragma once
/** @file  Response.hpp
 *  @brief Reply line received from the robot bridge.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace genesis {
  namespace protocols {

    /// `{"id":7,"ok":true,"result":["hello",0.61]}` or `{"id":7,"ok":false,"error":"..."}`
    struct Response {
      std::uint32_t id{ 0 };
      bool ok{ false };
      nlohmann::json result;
      std::string error;

      /// nullopt if the line is not a JSON object carrying an integer `id`.
      static std::optional<Response> fromWire(const std::string& line) {
        auto doc = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (!doc.is_object())
          return std::nullopt;

        auto id = doc.find("id");
        if (id == doc.end() || !id->is_number_unsigned())
          return std::nullopt;

        Response response;
        response.id = id->get<std::uint32_t>();
        response.ok = doc.value("ok", false);
        if (auto r = doc.find("result"); r != doc.end())
          response.result = *r;
        if (auto e = doc.find("error"); e != doc.end() && e->is_string())
          response.error = e->get<std::string>();
        return response;
      }
    };

  } // namespace protocols
} // namespace genesis
