#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for genesis::core::SystemCoordinator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>

#include "core/Settings.hpp"

namespace genesis {
  namespace ai {
    class LanguageModelClient;
    class ReasoningGateway;
  } // namespace ai
  namespace dialogue {
    class ActionPlanner;
    class DialogueOrchestrator;
    class PersonaSet;
  } // namespace dialogue
  namespace io {
    class HardwareLink;
    class InteractionLog;
  } // namespace io
  namespace nlp {
    class IntentResolver;
  }
  namespace services {
    class DailyTaskScheduler;
    class KeyValueStore;
    class ReminderService;
    class TaskScheduler;
    class TimeUtils;
  } // namespace services

  namespace core {

    class ConnectionManager;
    class ErrorMonitor;
    class EventLoop;
    class Logger;
    class PluginRegistry;
    class WorkerPool;

    /**
 * @class SystemCoordinator
 * @brief Builds the whole runtime, drives the event loop and heartbeat, tears it down.
 *
 *  * `initialize()` failing is fatal: nothing subscribes, `run()` must not be called.
 *  * `run()` owns the calling thread as the event loop thread.
 *  * A lost connection is never fatal; the heartbeat reconnects and resubscribes.
 */
    class SystemCoordinator {

    public:
      /// Swappable collaborators. Null scheduler / time / resolver get the built-in ones;
      /// a null model client disables the external reasoning backend.
      struct Dependencies {
        std::shared_ptr<io::HardwareLink> link;
        std::shared_ptr<ai::LanguageModelClient> modelClient;
        std::shared_ptr<nlp::IntentResolver> resolver;
        std::shared_ptr<services::TimeUtils> time;
        std::shared_ptr<services::TaskScheduler> scheduler;
      };

      enum class State { BOOT, INIT, RUNNING, STOPPING, FINISHED, ERROR };

      SystemCoordinator(Settings settings, std::shared_ptr<Logger> logger, Dependencies deps);
      ~SystemCoordinator();

      //---public API------------------------------------------------------
      bool initialize(); ///< storage, connect, plugins, scheduler, subscribe
      void run(const std::atomic<bool>& stopRequested); ///< greeting + loop + heartbeat
      void shutdown();   ///< cancel turns, disconnect, drain pools (bounded)
      void handleError(const std::string& reason);

      /// One health check. Unhealthy -> reconnect submitted, result picked up later.
      void heartbeat();
      /// Collect a finished reconnect, waiting at most \p wait. @returns true on a fresh session.
      bool pollReconnect(std::chrono::milliseconds wait);

      State state() const { return currentState_.load(); }
      static const char* toString(State state);

      //---component access (wiring and tests)-------------------------------
      EventLoop& loop() { return *loop_; }
      ConnectionManager& connection() { return *connection_; }
      dialogue::DialogueOrchestrator& orchestrator() { return *orchestrator_; }
      dialogue::ActionPlanner& planner() { return *planner_; }
      PluginRegistry& plugins() { return *plugins_; }
      ErrorMonitor& errors() { return *errors_; }
      const Settings& settings() const { return settings_; }

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    private:
      void transitionTo(State next);
      void registerBuiltinPlugins();
      void startPlugins();
      void greet();

      static constexpr std::size_t kHardwareThreads = 3;
      static constexpr std::size_t kReasoningThreads = 2;
      static constexpr std::size_t kDialogueThreads = 4; ///< also the cap on concurrent turns

      Settings settings_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<io::HardwareLink> link_;

      // pools first: everything below may hold a reference to them
      std::unique_ptr<WorkerPool> hardwarePool_;
      std::unique_ptr<WorkerPool> reasoningPool_;
      std::unique_ptr<WorkerPool> dialoguePool_;

      std::shared_ptr<EventLoop> loop_;
      std::shared_ptr<ErrorMonitor> errors_;
      std::unique_ptr<ConnectionManager> connection_;

      std::shared_ptr<nlp::IntentResolver> resolver_;
      std::shared_ptr<services::TimeUtils> time_;
      std::shared_ptr<services::TaskScheduler> scheduler_;
      std::shared_ptr<services::DailyTaskScheduler> ownedScheduler_; ///< set when we built it
      std::unique_ptr<services::KeyValueStore> storage_;
      std::unique_ptr<services::ReminderService> reminders_;
      std::unique_ptr<io::InteractionLog> interactions_;

      std::unique_ptr<ai::ReasoningGateway> gateway_;
      std::unique_ptr<PluginRegistry> plugins_;
      std::shared_ptr<dialogue::PersonaSet> personas_;
      std::unique_ptr<dialogue::DialogueOrchestrator> orchestrator_;
      std::unique_ptr<dialogue::ActionPlanner> planner_;

      std::future<bool> pendingReconnect_;
      bool greeted_{ false };
      std::atomic<bool> initialized_{ false };
      std::atomic<State> currentState_{ State::BOOT };
    };

  } // namespace core
} // namespace genesis
