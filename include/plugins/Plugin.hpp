#pragma once
/** @file  Plugin.hpp
 *  @brief Polymorphic extension interface for intents the orchestrator does not own.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

namespace genesis {
  namespace core { // forward decls only
    class EventLoop;
    class RobotOutput;
    struct Settings;
  } // namespace core
  namespace nlp {
    struct IntentResult;
  }
  namespace services {
    class KeyValueStore;
    class TaskScheduler;
  } // namespace services

  namespace plugins {

    /// Shared services a plugin may ask for at registration time.
    enum class Resource { Storage, Scheduler, HardwareLink, Settings, MainLoop };

    const char* toString(Resource resource);

    /**
 * @struct SharedResources
 * @brief Non-owning handles; the coordinator keeps every target alive
 *        for as long as any plugin exists.
 */
    struct SharedResources {
      services::KeyValueStore* storage = nullptr;
      services::TaskScheduler* scheduler = nullptr;
      core::RobotOutput* hardwareLink = nullptr;
      const core::Settings* settings = nullptr;
      core::EventLoop* mainLoop = nullptr;

      bool has(Resource resource) const;

      /// Copy holding only the \p declared handles, every other one null.
      SharedResources filtered(const std::vector<Resource>& declared) const;
    };

    /**
 * @class Plugin
 * @brief One instance per registered name.
 *
 *  * `execute()` may be called from several dialogue workers at once.
 *  * `run()` is invoked once at start-up on the hardware pool.
 */
    class Plugin {
    public:
      virtual ~Plugin() = default;

      virtual std::string name() const = 0;
      virtual std::string description() const = 0;
      virtual bool supportsIntent(const std::string& intent) const = 0;

      /// @returns the reply to speak. May throw; the caller isolates it.
      virtual std::string execute(const std::string& rawText, const nlp::IntentResult& intent) = 0;

      virtual void run() {}
    };

  } // namespace plugins
} // namespace genesis
