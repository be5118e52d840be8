/* @file Settings.cpp
 * @brief JSON -> Settings mapping and environment overrides
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// GENESIS headers
#include "core/Settings.hpp"

namespace genesis {
  namespace core {

    namespace {

      template <typename T>
      void readInto(const nlohmann::json& obj, const char* key, T& out) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null())
          return;
        try {
          out = it->get<T>();
        } catch (const nlohmann::json::exception& e) {
          throw std::runtime_error(std::string("[Settings] bad value for '") + key + "': " + e.what());
        }
      }

      template <typename Duration>
      void readMillis(const nlohmann::json& obj, const char* key, Duration& out) {
        std::int64_t raw = -1;
        readInto(obj, key, raw);
        if (raw > 0)
          out = std::chrono::duration_cast<Duration>(std::chrono::milliseconds{ raw });
      }

      const nlohmann::json& section(const nlohmann::json& doc, const char* key) {
        static const nlohmann::json kEmpty = nlohmann::json::object();
        auto it = doc.find(key);
        if (it == doc.end())
          return kEmpty;
        if (!it->is_object())
          throw std::runtime_error(std::string("[Settings] section '") + key + "' must be an object");
        return *it;
      }

      bool parseBool(const std::string& raw) {
        std::string v(raw);
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return v == "1" || v == "true" || v == "yes" || v == "on";
      }

    } // namespace

    std::string Settings::logFilePath() const {
      return (std::filesystem::path(dataDir) / logFileName).string();
    }

    std::string Settings::interactionsLogPath() const {
      return (std::filesystem::path(dataDir) / interactionsLogFileName).string();
    }

    std::string Settings::storagePath() const {
      return (std::filesystem::path(dataDir) / storageFileName).string();
    }

    Settings Settings::fromJson(const nlohmann::json& doc) {
      Settings s;

      const auto& robot = section(doc, "robot");
      readInto(robot, "host", s.robotHost);
      int port = s.robotPort;
      readInto(robot, "port", port);
      if (port <= 0 || port > 65535)
        throw std::runtime_error("[Settings] robot.port out of range");
      s.robotPort = static_cast<std::uint16_t>(port);
      readInto(robot, "simulate", s.simulateHardware);
      readInto(robot, "simulated_phrases", s.simulatedPhrases);

      const auto& reasoning = section(doc, "reasoning");
      readInto(reasoning, "api_key", s.reasoningApiKey);
      readInto(reasoning, "model", s.reasoningModel);
      readMillis(reasoning, "timeout_ms", s.reasoningTimeout);

      const auto& dialogue = section(doc, "dialogue");
      readInto(dialogue, "language", s.language);
      readInto(dialogue, "persona", s.defaultPersona);
      readInto(dialogue, "persona_styling", s.personaStyling);
      if (auto it = dialogue.find("personas"); it != dialogue.end()) {
        if (!it->is_array())
          throw std::runtime_error("[Settings] dialogue.personas must be an array");
        for (const auto& p : *it) {
          PersonaConfig pc;
          readInto(p, "name", pc.name);
          readInto(p, "tone", pc.tone);
          readInto(p, "system_prompt", pc.systemPrompt);
          if (pc.name.empty())
            throw std::runtime_error("[Settings] persona entry without a name");
          s.personas.push_back(std::move(pc));
        }
      }

      const auto& files = section(doc, "files");
      readInto(files, "data_dir", s.dataDir);
      readInto(files, "log_file", s.logFileName);
      readInto(files, "interactions_log_file", s.interactionsLogFileName);
      readInto(files, "storage_file", s.storageFileName);

      const auto& logging = section(doc, "logging");
      std::string level;
      readInto(logging, "level", level);
      if (!level.empty()) {
        auto parsed = parseLogLevel(level);
        if (!parsed)
          throw std::runtime_error("[Settings] unknown logging.level: " + level);
        s.logLevel = *parsed;
      }

      const auto& timing = section(doc, "timing");
      readMillis(timing, "heartbeat_ms", s.heartbeatInterval);
      readMillis(timing, "poll_ms", s.pollInterval);
      readMillis(timing, "poll_backoff_ms", s.pollBackoff);
      readMillis(timing, "shutdown_grace_ms", s.shutdownGrace);

      return s;
    }

    void Settings::applyEnvironment(const EnvLookup& lookup) {
      EnvLookup get = lookup;
      if (!get) {
        get = [](const char* key) -> std::optional<std::string> {
          const char* v = std::getenv(key);
          if (!v || !*v)
            return std::nullopt;
          return std::string(v);
        };
      }

      if (auto v = get("PEPPER_IP"))
        robotHost = *v;
      if (auto v = get("PEPPER_PORT")) {
        int port = 0;
        try {
          port = std::stoi(*v);
        } catch (const std::exception&) {
          throw std::runtime_error("[Settings] PEPPER_PORT is not a number: " + *v);
        }
        if (port <= 0 || port > 65535)
          throw std::runtime_error("[Settings] PEPPER_PORT out of range: " + *v);
        robotPort = static_cast<std::uint16_t>(port);
      }
      if (auto v = get("GEMINI_API_KEY"))
        reasoningApiKey = *v;
      if (auto v = get("LANGUAGE"))
        language = *v;
      if (auto v = get("PERSONALITY"))
        defaultPersona = *v;
      if (auto v = get("USE_GEMINI_STYLING"))
        personaStyling = parseBool(*v);
      if (auto v = get("LOG_LEVEL")) {
        auto parsed = parseLogLevel(*v);
        if (!parsed)
          throw std::runtime_error("[Settings] unknown LOG_LEVEL: " + *v);
        logLevel = *parsed;
      }
    }

  } // namespace core
} // namespace genesis
