#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventLoop.hpp"
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "core/Settings.hpp"
#include "core/WorkerPool.hpp"

#include "Mocks.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <atomic>
#include <map>
#include <thread>
#include <vector>

using namespace genesis::core;
using namespace genesis::test;
using namespace std::chrono_literals;

namespace {
  std::filesystem::path scratchFile(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "genesis_core_test";
    std::filesystem::create_directories(dir);
    return dir / name;
  }
} // namespace

//---RingBuffer---------------------------------------------------------------

TEST(ring_buffer, overwrites_oldest_when_full) {
  RingBuffer<int> buf(2);
  EXPECT_TRUE(buf.push(1));
  EXPECT_TRUE(buf.push(2));
  EXPECT_FALSE(buf.push(3)); // 1 dropped

  EXPECT_EQ(buf.dropped(), 1u);
  EXPECT_EQ(buf.pop(0ms), 2);
  EXPECT_EQ(buf.pop(0ms), 3);
  EXPECT_FALSE(buf.pop(1ms).has_value());
}

//---ErrorMonitor-------------------------------------------------------------

TEST(error_monitor, escalates_each_unique_message_once) {
  ErrorMonitor monitor;
  std::vector<std::string> escalated;
  monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

  monitor.notifyFailure("[ConnectionManager] connection lost");
  monitor.notifyFailure("[ConnectionManager] connection lost");
  monitor.notifyFailure("[ActionPlanner] output failed: boom");

  ASSERT_EQ(escalated.size(), 2u);
  EXPECT_EQ(monitor.uniqueFailures(), 2u);
}

TEST(error_monitor, clear_rearms_messages) {
  ErrorMonitor monitor;
  int calls = 0;
  monitor.registerEscalation([&](const std::string&) { ++calls; });

  monitor.notifyFailure("lost");
  monitor.clear();
  monitor.notifyFailure("lost");
  EXPECT_EQ(calls, 2);
}

//---Logger-------------------------------------------------------------------

TEST(logger, parses_levels_case_insensitively) {
  EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
  EXPECT_EQ(parseLogLevel("WARN"), LogLevel::Warning);
  EXPECT_EQ(parseLogLevel("Critical"), LogLevel::Critical);
  EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(logger, format_carries_level_component_and_message) {
  LogEvent ev{ std::chrono::system_clock::time_point{}, LogLevel::Info, "EventPoller", "polling" };
  EXPECT_EQ(Logger::format(ev), "1970-01-01T00:00:00.000Z [INFO    ] [EventPoller] polling\n");
}

TEST(logger, writes_run_to_file) {
  auto path = scratchFile("run.log");
  std::filesystem::remove(path);

  Logger logger(LogLevel::Debug, false);
  ASSERT_TRUE(logger.startNewRun(path.string()));
  logger.info("main", "hello");
  logger.debug("main", "details");
  logger.finishRun();

  std::ifstream in(path);
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_NE(content.find("[main] hello"), std::string::npos);
  EXPECT_NE(content.find("[main] details"), std::string::npos);
}

TEST(logger, lines_logged_before_finish_reach_the_file) {
  auto path = scratchFile("finish_race.log");
  std::filesystem::remove(path);

  Logger logger(LogLevel::Debug, false);
  ASSERT_TRUE(logger.startNewRun(path.string()));

  constexpr int kThreads = 4;
  constexpr int kPerThread = 200; // total stays under the queue depth
  std::atomic<bool> finishing{ false };
  std::vector<int> completed(kThreads, -1);
  std::vector<std::thread> producers;
  for (int t = 0; t < kThreads; ++t) {
    producers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        logger.info("p" + std::to_string(t), "line " + std::to_string(i) + ";");
        if (!finishing.load())
          completed[t] = i;
        std::this_thread::yield();
      }
    });
  }

  std::this_thread::sleep_for(2ms);
  finishing = true;
  logger.finishRun();
  for (auto& p : producers)
    p.join();

  std::ifstream in(path);
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  for (int t = 0; t < kThreads; ++t) {
    for (int i = 0; i <= completed[t]; ++i) {
      const auto needle = "[p" + std::to_string(t) + "] line " + std::to_string(i) + ";";
      ASSERT_NE(content.find(needle), std::string::npos) << needle;
    }
  }
}

//---EventLoop----------------------------------------------------------------

TEST(event_loop, runs_posted_tasks_in_order) {
  EventLoop loop(quietLogger());
  std::vector<int> order;
  loop.post([&] { order.push_back(1); });
  loop.post([&] { order.push_back(2); });

  EXPECT_EQ(loop.runOnce(10ms), 2u);
  EXPECT_EQ(order, (std::vector<int>{ 1, 2 }));
}

TEST(event_loop, throwing_task_does_not_stop_the_loop) {
  EventLoop loop(quietLogger());
  bool ran = false;
  loop.post([] { throw std::runtime_error("boom"); });
  loop.post([&] { ran = true; });

  loop.runOnce(10ms);
  EXPECT_TRUE(ran);
  EXPECT_FALSE(loop.stopped());
}

TEST(event_loop, post_from_another_thread_wakes_the_loop) {
  EventLoop loop(quietLogger());
  std::atomic<bool> ran{ false };
  std::thread producer([&] { loop.post([&] { ran = true; }); });
  producer.join();

  loop.runOnce(500ms);
  EXPECT_TRUE(ran.load());
}

TEST(event_loop, rejects_tasks_after_stop) {
  EventLoop loop(quietLogger());
  loop.stop();
  EXPECT_FALSE(loop.post([] {}));
  EXPECT_EQ(loop.runOnce(0ms), 0u);
}

TEST(event_loop, watched_futures_are_reaped_once_ready) {
  EventLoop loop(quietLogger());
  std::promise<void> pending;
  loop.watch(pending.get_future(), "greeting");
  loop.watch(failedVoid("speech failed"), "failing");

  loop.runOnce(0ms);
  EXPECT_EQ(loop.watchedFutures(), 1u);

  pending.set_value();
  loop.runOnce(0ms);
  EXPECT_EQ(loop.watchedFutures(), 0u);
}

//---WorkerPool---------------------------------------------------------------

TEST(worker_pool, submit_returns_result_and_exception) {
  WorkerPool pool("test", 2, quietLogger());
  auto value = pool.submit([] { return 42; });
  auto error = pool.submit([]() -> int { throw std::runtime_error("bad"); });

  EXPECT_EQ(value.get(), 42);
  EXPECT_THROW(error.get(), std::runtime_error);
}

TEST(worker_pool, detach_runs_and_survives_exceptions) {
  WorkerPool pool("test", 1, quietLogger());
  std::promise<void> done;
  EXPECT_TRUE(pool.detach([] { throw std::runtime_error("ignored"); }, "throws"));
  EXPECT_TRUE(pool.detach([&] { done.set_value(); }, "after"));
  EXPECT_EQ(done.get_future().wait_for(1s), std::future_status::ready);
}

TEST(worker_pool, rejects_work_after_shutdown) {
  WorkerPool pool("test", 1, quietLogger());
  EXPECT_TRUE(pool.shutdown(100ms));
  EXPECT_FALSE(pool.accepting());
  EXPECT_FALSE(pool.detach([] {}, "late"));

  auto late = pool.submit([] { return 1; });
  EXPECT_THROW(late.get(), std::runtime_error);
}

TEST(worker_pool, shutdown_is_bounded_by_grace) {
  WorkerPool pool("test", 1, quietLogger());
  auto release = std::make_shared<std::promise<void>>();
  std::shared_future<void> gate = release->get_future().share();
  std::promise<void> started;
  auto running = started.get_future();
  pool.detach([gate, &started] {
    started.set_value();
    gate.wait();
  }, "stuck");
  ASSERT_EQ(running.wait_for(1s), std::future_status::ready);

  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_FALSE(pool.shutdown(50ms));
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
  release->set_value(); // let the detached worker finish
}

//---Settings / ConfigLoader--------------------------------------------------

TEST(settings, json_overlays_defaults) {
  auto doc = nlohmann::json::parse(R"({
    "robot": { "host": "10.0.0.5", "port": 9600, "simulate": true },
    "dialogue": { "persona": "professor", "persona_styling": false,
                  "personas": [ { "name": "Nurse", "tone": "calm", "system_prompt": "You are {name}." } ] },
    "logging": { "level": "debug" },
    "timing": { "heartbeat_ms": 2500 }
  })");

  auto s = Settings::fromJson(doc);
  EXPECT_EQ(s.robotHost, "10.0.0.5");
  EXPECT_EQ(s.robotPort, 9600);
  EXPECT_TRUE(s.simulateHardware);
  EXPECT_EQ(s.defaultPersona, "professor");
  EXPECT_FALSE(s.personaStyling);
  ASSERT_EQ(s.personas.size(), 1u);
  EXPECT_EQ(s.personas[0].tone, "calm");
  EXPECT_EQ(s.logLevel, LogLevel::Debug);
  EXPECT_EQ(s.heartbeatInterval, 2500ms);
  EXPECT_EQ(s.pollInterval, 100ms); // untouched default
  EXPECT_EQ(s.language, "en-US");
}

TEST(settings, rejects_schema_errors) {
  EXPECT_THROW(Settings::fromJson(nlohmann::json::parse(R"({"robot":{"port":70000}})")),
               std::runtime_error);
  EXPECT_THROW(Settings::fromJson(nlohmann::json::parse(R"({"robot":[]})")), std::runtime_error);
  EXPECT_THROW(Settings::fromJson(nlohmann::json::parse(R"({"robot":{"host":5}})")),
               std::runtime_error);
  EXPECT_THROW(Settings::fromJson(nlohmann::json::parse(R"({"logging":{"level":"loud"}})")),
               std::runtime_error);
}

TEST(settings, environment_overrides_file_values) {
  std::map<std::string, std::string> env{ { "PEPPER_IP", "192.168.1.20" },
                                          { "PEPPER_PORT", "9560" },
                                          { "GEMINI_API_KEY", "k-123" },
                                          { "PERSONALITY", "buddy" },
                                          { "USE_GEMINI_STYLING", "False" },
                                          { "LOG_LEVEL", "error" } };
  Settings s;
  s.applyEnvironment([&](const char* key) -> std::optional<std::string> {
    auto it = env.find(key);
    if (it == env.end())
      return std::nullopt;
    return it->second;
  });

  EXPECT_EQ(s.robotHost, "192.168.1.20");
  EXPECT_EQ(s.robotPort, 9560);
  EXPECT_EQ(s.reasoningApiKey, "k-123");
  EXPECT_EQ(s.defaultPersona, "buddy");
  EXPECT_FALSE(s.personaStyling);
  EXPECT_EQ(s.logLevel, LogLevel::Error);
}

TEST(settings, bad_environment_port_throws) {
  Settings s;
  EXPECT_THROW(s.applyEnvironment([](const char* key) -> std::optional<std::string> {
    if (std::string(key) == "PEPPER_PORT")
      return std::string("robot");
    return std::nullopt;
  }),
               std::runtime_error);
}

TEST(settings, file_paths_live_under_data_dir) {
  Settings s;
  s.dataDir = "var";
  EXPECT_EQ(s.logFilePath(), (std::filesystem::path("var") / "genesis.log").string());
  EXPECT_EQ(s.storagePath(), (std::filesystem::path("var") / "memory.json").string());
}

TEST(config_loader, missing_and_malformed_files_throw) {
  EXPECT_THROW(ConfigLoader("/nonexistent/genesis.json").load(), std::runtime_error);

  auto path = scratchFile("broken.json");
  std::ofstream(path) << "{ \"robot\": ";
  EXPECT_THROW(ConfigLoader(path.string()).load(), std::runtime_error);
}

TEST(config_loader, loads_object) {
  auto path = scratchFile("ok.json");
  std::ofstream(path) << R"({"robot":{"host":"pepper.local"}})";
  auto doc = ConfigLoader(path.string()).load();
  EXPECT_EQ(Settings::fromJson(doc).robotHost, "pepper.local");
}
