/* @file GeminiClient.cpp
 * @brief request/response JSON for generateContent and the curl transport
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <stdexcept>

#include <curl/curl.h>

#include "ai/GeminiClient.hpp"
#include "core/Logger.hpp"
#include "core/Strings.hpp"

using namespace genesis::ai;

namespace {
  constexpr const char* kTag = "GeminiClient";

  std::size_t writeCallback(void* contents, std::size_t size, std::size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
  }

  struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
  };
  struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
  };
} // namespace

GeminiClient::GeminiClient(Config config, std::shared_ptr<core::Logger> logger)
    : config_(std::move(config)), logger_(std::move(logger)) {
  if (config_.apiKey.empty())
    throw std::invalid_argument("[GeminiClient] missing API key");
  logger_->info(kTag, "configured with model '" + config_.model + "'");
}

std::string GeminiClient::endpoint() const {
  return config_.baseUrl + config_.model + ":generateContent";
}

nlohmann::json GeminiClient::buildRequest(const std::string& prompt, const Config& config) {
  nlohmann::json safety = nlohmann::json::array();
  for (const char* category : { "HARM_CATEGORY_HARASSMENT", "HARM_CATEGORY_HATE_SPEECH",
                                "HARM_CATEGORY_SEXUALLY_EXPLICIT", "HARM_CATEGORY_DANGEROUS_CONTENT" })
    safety.push_back({ { "category", category }, { "threshold", "BLOCK_MEDIUM_AND_ABOVE" } });

  return {
    { "contents", nlohmann::json::array({ { { "role", "user" },
                                            { "parts", nlohmann::json::array({ { { "text", prompt } } }) } } }) },
    { "generationConfig",
      { { "maxOutputTokens", config.maxOutputTokens }, { "temperature", config.temperature } } },
    { "safetySettings", safety },
  };
}

std::optional<std::string> GeminiClient::parseResponse(const std::string& body) {
  auto doc = nlohmann::json::parse(body, nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    throw std::runtime_error("[GeminiClient] malformed response body");

  if (doc.contains("error")) {
    const auto& err = doc["error"];
    std::string message = err.is_object() ? err.value("message", std::string("unknown error")) : err.dump();
    throw std::runtime_error("[GeminiClient] API error: " + message);
  }

  auto candidates = doc.find("candidates");
  if (candidates == doc.end() || !candidates->is_array() || candidates->empty())
    return std::nullopt; // prompt blocked before generation

  const auto& first = candidates->front();
  if (!first.contains("content") || !first["content"].contains("parts"))
    return std::nullopt; // candidate stopped by safety filter

  std::string text;
  for (const auto& part : first["content"]["parts"])
    if (part.contains("text") && part["text"].is_string())
      text += part["text"].get<std::string>();

  text = core::trim(text);
  if (text.empty())
    return std::nullopt;
  return text;
}

std::optional<std::string> GeminiClient::generate(const std::string& prompt) {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl)
    throw std::runtime_error("[GeminiClient] curl_easy_init failed");

  const std::string url = endpoint();
  const std::string payload = buildRequest(prompt, config_).dump();
  const std::string keyHeader = "x-goog-api-key: " + config_.apiKey;

  curl_slist* raw = curl_slist_append(nullptr, "Content-Type: application/json");
  raw = curl_slist_append(raw, keyHeader.c_str());
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw);

  std::string response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "GENESIS/1.0");

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK)
    throw std::runtime_error(std::string("[GeminiClient] request failed: ") + curl_easy_strerror(res));

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status != 200) {
    logger_->warn(kTag, "HTTP " + std::to_string(status) + " from " + url);
    auto parsed = parseResponse(response); // throws with the API's own message when present
    if (!parsed)
      throw std::runtime_error("[GeminiClient] HTTP " + std::to_string(status));
    return parsed;
  }
  return parseResponse(response);
}
