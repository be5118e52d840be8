#pragma once
/** @file  GeminiClient.hpp
 *  @brief Google Gemini `generateContent` over libcurl.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "ai/LanguageModelClient.hpp"

namespace genesis {
  namespace core {
    class Logger;
  }

  namespace ai {

    /**
 * @class GeminiClient
 * @brief One HTTPS POST per prompt; a fresh curl handle per call so several
 *        reasoning workers can generate at once.
 *
 *  * `curl_global_init()` is the process's job (see main.cpp).
 */
    class GeminiClient : public LanguageModelClient {
    public:
      struct Config {
        std::string apiKey;
        std::string model{ "gemini-2.0-flash" };
        std::string baseUrl{ "https://generativelanguage.googleapis.com/v1beta/models/" };
        std::chrono::milliseconds timeout{ 30000 };
        int maxOutputTokens{ 1024 };
        double temperature{ 0.75 };
      };

      GeminiClient(Config config, std::shared_ptr<core::Logger> logger);

      std::optional<std::string> generate(const std::string& prompt) override;

      const Config& config() const { return config_; }
      std::string endpoint() const;

      /// JSON body for one prompt (generation config + safety settings).
      static nlohmann::json buildRequest(const std::string& prompt, const Config& config);

      /// Extract the reply text. nullopt when no candidate text came back.
      /// @throws std::runtime_error on malformed bodies or API error objects.
      static std::optional<std::string> parseResponse(const std::string& body);

    private:
      Config config_;
      std::shared_ptr<core::Logger> logger_;
    };

  } // namespace ai
} // namespace genesis
