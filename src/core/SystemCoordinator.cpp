/* @file SystemCoordinator.cpp
 * @brief composition root: build, connect, subscribe, heartbeat, shut down
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>
#include <stdexcept>

#include "ai/LanguageModelClient.hpp"
#include "ai/ReasoningGateway.hpp"
#include "core/ConnectionManager.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventLoop.hpp"
#include "core/Logger.hpp"
#include "core/PluginRegistry.hpp"
#include "core/SystemCoordinator.hpp"
#include "core/WorkerPool.hpp"
#include "dialogue/ActionPlanner.hpp"
#include "dialogue/DialogueOrchestrator.hpp"
#include "dialogue/Persona.hpp"
#include "io/HardwareLink.hpp"
#include "io/InteractionLog.hpp"
#include "nlp/IntentResolver.hpp"
#include "plugins/NotesPlugin.hpp"
#include "services/KeyValueStore.hpp"
#include "services/ReminderService.hpp"
#include "services/TaskScheduler.hpp"
#include "services/TimeUtils.hpp"

namespace genesis {
  namespace core {

    namespace {
      constexpr const char* kTag = "SystemCoordinator";
      constexpr auto kLoopSlice = std::chrono::milliseconds{ 50 };
    } // namespace

    const char* SystemCoordinator::toString(State state) {
      switch (state) {
      case State::BOOT:
        return "BOOT";
      case State::INIT:
        return "INIT";
      case State::RUNNING:
        return "RUNNING";
      case State::STOPPING:
        return "STOPPING";
      case State::FINISHED:
        return "FINISHED";
      case State::ERROR:
        return "ERROR";
      }
      return "UNKNOWN";
    }

    SystemCoordinator::SystemCoordinator(Settings settings, std::shared_ptr<Logger> logger,
                                         Dependencies deps)
        : settings_(std::move(settings)), logger_(std::move(logger)), link_(std::move(deps.link)) {
      if (!link_)
        throw std::invalid_argument("[SystemCoordinator] no hardware link");

      hardwarePool_ = std::make_unique<WorkerPool>("hardware", kHardwareThreads, logger_);
      reasoningPool_ = std::make_unique<WorkerPool>("reasoning", kReasoningThreads, logger_);
      dialoguePool_ = std::make_unique<WorkerPool>("dialogue", kDialogueThreads, logger_);

      loop_ = std::make_shared<EventLoop>(logger_);
      errors_ = std::make_shared<ErrorMonitor>();
      errors_->registerEscalation([this](const std::string& msg) { handleError(msg); });

      EventPoller::Options pollOptions;
      pollOptions.interval = settings_.pollInterval;
      pollOptions.backoff = settings_.pollBackoff;
      connection_ = std::make_unique<ConnectionManager>(
          link_, ConnectionManager::Endpoint{ settings_.robotHost, settings_.robotPort }, loop_,
          *hardwarePool_, logger_, errors_, std::move(pollOptions));

      resolver_ = deps.resolver ? std::move(deps.resolver)
                                : std::make_shared<nlp::KeywordIntentResolver>();
      time_ = deps.time ? std::move(deps.time) : std::make_shared<services::SystemTimeUtils>();
      if (deps.scheduler) {
        scheduler_ = std::move(deps.scheduler);
      } else {
        ownedScheduler_ = std::make_shared<services::DailyTaskScheduler>(logger_);
        scheduler_ = ownedScheduler_;
      }

      storage_ = std::make_unique<services::KeyValueStore>(settings_.storagePath(), logger_);
      reminders_ = std::make_unique<services::ReminderService>(*scheduler_, *connection_, logger_);
      interactions_ = std::make_unique<io::InteractionLog>(settings_.interactionsLogPath(), logger_);
      gateway_ = std::make_unique<ai::ReasoningGateway>(std::move(deps.modelClient), *reasoningPool_,
                                                        logger_);

      plugins_ = std::make_unique<PluginRegistry>(logger_);
      registerBuiltinPlugins();

      personas_ = std::make_shared<dialogue::PersonaSet>(settings_.language);
      dialogue::registerBuiltinPersonas(*personas_);
      for (const auto& p : settings_.personas)
        if (!personas_->add(p.name, p.tone, p.systemPrompt))
          logger_->info(kTag, "config persona '" + p.name + "' replaces the built-in one");
      personas_->ensureFallback();

      dialogue::DialogueOrchestrator::Collaborators collaborators{
        *resolver_, *plugins_, *gateway_, *reminders_, *time_, *connection_, *dialoguePool_
      };
      dialogue::DialogueOrchestrator::Options dialogueOptions;
      dialogueOptions.personaStyling = settings_.personaStyling;
      dialogueOptions.initialPersona = settings_.defaultPersona;
      orchestrator_ = std::make_unique<dialogue::DialogueOrchestrator>(collaborators, personas_,
                                                                       dialogueOptions, logger_);

      planner_ = std::make_unique<dialogue::ActionPlanner>(*orchestrator_, *resolver_, *time_,
                                                           *gateway_, *connection_, *interactions_,
                                                           errors_, logger_);
      orchestrator_->bindPlanner(*planner_);
    }

    SystemCoordinator::~SystemCoordinator() { shutdown(); }

    //---lifecycle---------------------------------------------------------------

    bool SystemCoordinator::initialize() {
      transitionTo(State::INIT);

      std::error_code ec;
      std::filesystem::create_directories(settings_.dataDir, ec);
      if (ec)
        logger_->warn(kTag, "cannot create data dir '" + settings_.dataDir + "': " + ec.message());

      try {
        storage_->load();
      } catch (const std::exception& e) {
        handleError(e.what());
        return false;
      }

      if (!connection_->connect().get()) {
        handleError("[SystemCoordinator] cannot reach the robot at " + settings_.robotHost + ":" +
                    std::to_string(settings_.robotPort));
        return false;
      }

      plugins::SharedResources resources;
      resources.storage = storage_.get();
      resources.scheduler = scheduler_.get();
      resources.hardwareLink = connection_.get();
      resources.settings = &settings_;
      resources.mainLoop = loop_.get();
      logger_->info(kTag, std::to_string(plugins_->instantiate(resources)) + " plugin(s) live");
      startPlugins();

      if (ownedScheduler_)
        ownedScheduler_->start();

      auto* orchestrator = orchestrator_.get();
      connection_->subscribe(
          SensorCallback([orchestrator](const SensorEvent& e) { orchestrator->handleSensorEvent(e); }));

      initialized_ = true;
      logger_->info(kTag, "initialized; persona set: " + std::to_string(personas_->size()) +
                              ", styling " + (settings_.personaStyling ? "on" : "off") +
                              ", reasoning " + (gateway_->available() ? "on" : "off"));
      return true;
    }

    void SystemCoordinator::run(const std::atomic<bool>& stopRequested) {
      if (state() != State::INIT) {
        logger_->error(kTag, std::string("run() in state ") + toString(state()));
        return;
      }
      transitionTo(State::RUNNING);
      greet();

      auto nextBeat = std::chrono::steady_clock::now() + settings_.heartbeatInterval;
      while (!stopRequested.load() && !loop_->stopped()) {
        loop_->runOnce(kLoopSlice);
        pollReconnect(std::chrono::milliseconds{ 0 });

        if (std::chrono::steady_clock::now() >= nextBeat) {
          heartbeat();
          nextBeat += settings_.heartbeatInterval;
        }
      }
      logger_->info(kTag, "main loop left");
    }

    void SystemCoordinator::shutdown() {
      auto s = state();
      if (s == State::FINISHED || s == State::STOPPING)
        return;
      transitionTo(State::STOPPING);

      const auto grace = settings_.shutdownGrace;
      orchestrator_->cancelInFlightTurns();
      connection_->disconnect(grace);
      if (ownedScheduler_)
        ownedScheduler_->stop();

      dialoguePool_->shutdown(grace);
      reasoningPool_->shutdown(grace);
      hardwarePool_->shutdown(grace);

      loop_->stop();
      loop_->runOnce(std::chrono::milliseconds{ 0 });
      transitionTo(State::FINISHED);
    }

    void SystemCoordinator::handleError(const std::string& reason) {
      logger_->critical(kTag, "escalated: " + reason);
      // after start-up, faults are recovered by the heartbeat instead
      if (!initialized_ && (state() == State::INIT || state() == State::BOOT))
        transitionTo(State::ERROR);
    }

    //---heartbeat---------------------------------------------------------------

    void SystemCoordinator::heartbeat() {
      if (pendingReconnect_.valid())
        return; // previous attempt still running

      if (connection_->isHealthy()) {
        logger_->debug(kTag, "heartbeat ok");
        return;
      }

      logger_->warn(kTag, std::string("heartbeat: connection ") + core::toString(connection_->state()) +
                              ", attempting reconnect");
      pendingReconnect_ = connection_->reconnect();
    }

    bool SystemCoordinator::pollReconnect(std::chrono::milliseconds wait) {
      if (!pendingReconnect_.valid())
        return false;
      if (pendingReconnect_.wait_for(wait) != std::future_status::ready)
        return false;

      bool ok = false;
      try {
        ok = pendingReconnect_.get();
      } catch (const std::exception& e) {
        logger_->error(kTag, std::string("reconnect failed: ") + e.what());
      }

      if (!ok) {
        logger_->warn(kTag, "reconnect failed, retrying next heartbeat");
        return false;
      }

      connection_->resubscribe();
      errors_->clear();
      logger_->info(kTag, "reconnected and resubscribed");
      return true;
    }

    //---helpers-----------------------------------------------------------------

    void SystemCoordinator::transitionTo(State next) {
      auto prev = currentState_.exchange(next);
      if (prev != next)
        logger_->info(kTag, std::string("state ") + toString(prev) + " -> " + toString(next));
    }

    void SystemCoordinator::registerBuiltinPlugins() {
      auto logger = logger_;
      plugins_->registerPlugin(plugins::NotesPlugin::kName, { plugins::Resource::Storage },
                               [logger](const plugins::SharedResources& r) {
                                 return std::make_unique<plugins::NotesPlugin>(*r.storage, logger);
                               });
    }

    void SystemCoordinator::startPlugins() {
      for (const auto& p : plugins_->plugins()) {
        auto* plugin = p.get();
        hardwarePool_->detach([plugin] { plugin->run(); }, "plugin run: " + plugin->name());
      }
    }

    void SystemCoordinator::greet() {
      if (greeted_)
        return;
      greeted_ = true;
      loop_->watch(connection_->speak("Hello. I am Genesis, the middleware brain. I am now connected to " +
                                      settings_.robotHost + "."),
                   "startup greeting");
    }

  } // namespace core
} // namespace genesis
