#pragma once
/** @file  Settings.hpp
 *  @brief Explicit configuration struct handed to every component at construction.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/Logger.hpp"

namespace genesis {
  namespace core {

    /// Extra persona supplied through the config file.
    struct PersonaConfig {
      std::string name;
      std::string tone;
      std::string systemPrompt;
    };

    /**
 * @struct Settings
 * @brief Every tunable the runtime reads. Defaults match a robot on the local net.
 *
 *  * Built once by `fromJson()` + `applyEnvironment()`, then passed by const ref.
 *  * Schema errors (wrong JSON type) throw `std::runtime_error`.
 */
    struct Settings {
      // --- hardware link ---
      std::string robotHost{ "127.0.0.1" };
      std::uint16_t robotPort{ 9559 };
      bool simulateHardware{ false };
      std::vector<std::string> simulatedPhrases; ///< scripted utterances in simulate mode

      // --- external reasoning ---
      std::string reasoningApiKey;
      std::string reasoningModel{ "gemini-2.0-flash" };
      std::chrono::seconds reasoningTimeout{ 30 };

      // --- dialogue ---
      std::string language{ "en-US" };
      std::string defaultPersona{ "genesis" };
      bool personaStyling{ true };
      std::vector<PersonaConfig> personas;

      // --- files ---
      std::string dataDir{ "data" };
      std::string logFileName{ "genesis.log" };
      std::string interactionsLogFileName{ "interactions.log" };
      std::string storageFileName{ "memory.json" };
      LogLevel logLevel{ LogLevel::Info };

      // --- timing ---
      std::chrono::milliseconds heartbeatInterval{ 5000 };
      std::chrono::milliseconds pollInterval{ 100 };
      std::chrono::milliseconds pollBackoff{ 1000 };
      std::chrono::milliseconds shutdownGrace{ 3000 };

      std::string logFilePath() const;
      std::string interactionsLogPath() const;
      std::string storagePath() const;

      /// Overlay the keys present in \p doc on top of the defaults.
      static Settings fromJson(const nlohmann::json& doc);

      using EnvLookup = std::function<std::optional<std::string>(const char*)>;

      /// Apply PEPPER_IP, PEPPER_PORT, GEMINI_API_KEY, LANGUAGE, PERSONALITY,
      /// USE_GEMINI_STYLING and LOG_LEVEL. \p lookup defaults to `std::getenv`.
      void applyEnvironment(const EnvLookup& lookup = {});
    };

  } // namespace core
} // namespace genesis
