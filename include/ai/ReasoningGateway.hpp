#pragma once
/** @file  ReasoningGateway.hpp
 *  @brief Stateless bridge to the remote language model with fixed failure sentinels.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <future>
#include <memory>
#include <string>

namespace genesis {
  namespace core {
    class Logger;
    class WorkerPool;
  } // namespace core

  namespace ai {

    class LanguageModelClient;

    /**
 * @class ReasoningGateway
 * @brief Never throws past its boundary, every failure maps to a sentinel.
 *
 *  * No client (missing credential) -> `kDisconnected`, immediately.
 *  * Empty or filtered answer        -> `kEmptyOrFiltered`.
 *  * Transport / API error           -> `kTechnicalDifficulties`.
 *  * The model call runs on the reasoning pool; the caller only holds a future.
 */
    class ReasoningGateway {
    public:
      static constexpr const char* kDisconnected =
          "I am currently disconnected from the external AI services.";
      static constexpr const char* kEmptyOrFiltered = "The external AI response was empty or filtered.";
      static constexpr const char* kTechnicalDifficulties =
          "I am experiencing technical difficulties reaching the external AI brain.";

      ReasoningGateway(std::shared_ptr<LanguageModelClient> client, core::WorkerPool& pool,
                       std::shared_ptr<core::Logger> logger);
      virtual ~ReasoningGateway() = default;

      virtual std::future<std::string> getResponse(const std::string& instruction,
                                                   const std::string& query) const;

      bool available() const { return client_ != nullptr; }

      static bool isSentinel(const std::string& text);
      static std::string composePrompt(const std::string& instruction, const std::string& query);

    private:
      std::shared_ptr<LanguageModelClient> client_;
      core::WorkerPool& pool_;
      std::shared_ptr<core::Logger> logger_;
    };

  } // namespace ai
} // namespace genesis
