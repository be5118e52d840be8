/* @file ReasoningGateway.cpp
 * @brief prompt composition + sentinel mapping around LanguageModelClient
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "ai/LanguageModelClient.hpp"
#include "ai/ReasoningGateway.hpp"
#include "core/Logger.hpp"
#include "core/Strings.hpp"
#include "core/WorkerPool.hpp"

using namespace genesis::ai;

namespace {
  constexpr const char* kTag = "ReasoningGateway";

  // Answers exactly once; a job dropped by a shutting-down pool still answers.
  class Reply {
  public:
    std::future<std::string> future() { return promise_.get_future(); }

    void fulfil(std::string text) {
      if (done_)
        return;
      done_ = true;
      promise_.set_value(std::move(text));
    }

    ~Reply() { fulfil(ReasoningGateway::kTechnicalDifficulties); }

  private:
    std::promise<std::string> promise_;
    bool done_{ false };
  };
} // namespace

ReasoningGateway::ReasoningGateway(std::shared_ptr<LanguageModelClient> client,
                                   core::WorkerPool& pool, std::shared_ptr<core::Logger> logger)
    : client_(std::move(client)), pool_(pool), logger_(std::move(logger)) {
  if (!client_)
    logger_->warn(kTag, "no language model client, external AI services are disabled");
}

bool ReasoningGateway::isSentinel(const std::string& text) {
  return text == kDisconnected || text == kEmptyOrFiltered || text == kTechnicalDifficulties;
}

std::string ReasoningGateway::composePrompt(const std::string& instruction, const std::string& query) {
  return instruction + "\n\nUser: " + query + "\n\nAssistant:";
}

std::future<std::string> ReasoningGateway::getResponse(const std::string& instruction,
                                                       const std::string& query) const {
  auto reply = std::make_shared<Reply>();
  auto future = reply->future();

  if (!client_) {
    reply->fulfil(kDisconnected);
    return future;
  }

  const bool queued = pool_.detach(
      [reply, client = client_, logger = logger_, prompt = composePrompt(instruction, query), query] {
        try {
          auto text = client->generate(prompt);
          auto trimmed = text ? core::trim(*text) : std::string();
          if (trimmed.empty()) {
            logger->warn(kTag, "empty or blocked response for query: " + query.substr(0, 50));
            reply->fulfil(kEmptyOrFiltered);
          } else {
            reply->fulfil(std::move(trimmed));
          }
        } catch (const std::exception& e) {
          logger->error(kTag, std::string("model call failed: ") + e.what());
          reply->fulfil(kTechnicalDifficulties);
        }
      },
      "reasoning call");

  if (!queued)
    logger_->warn(kTag, "reasoning pool is shut down");
  return future;
}
