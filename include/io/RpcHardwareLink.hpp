#pragma once
/** @file  RpcHardwareLink.hpp
 *  @brief HardwareLink over the robot bridge's JSON-line RPC protocol.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// GENESIS headers
#include "io/HardwareLink.hpp"
#include "io/SocketChannel.hpp" // RpcHardwareLink owns SocketChannels and requires full type knowledge

namespace genesis {
  namespace core {
    class Logger;
  }

  namespace io {

    enum class Service : std::uint8_t { Speech, Motion, Memory, Count };
    static_assert(static_cast<std::uint8_t>(Service::Count) == 3,
                  "Service count changed please update code that depends on it");

    /// Remote module name addressed on the bridge.
    inline const char* toString(Service s) {
      switch (s) {
      case Service::Speech:
        return "ALTextToSpeech";
      case Service::Motion:
        return "ALRobotPosture";
      case Service::Memory:
        return "ALMemory";
      default:
        return "Unknown";
      }
    }

    struct RpcHardwareLinkTimeouts {
      std::chrono::milliseconds connect{ 3000 };
      std::chrono::milliseconds call{ 2000 };
      std::chrono::milliseconds speech{ 60000 }; ///< say blocks until the utterance ends
      std::chrono::milliseconds motion{ 15000 };
    };

    /**
 * @class RpcHardwareLink
 * @brief One TCP connection per service so a long `say` never delays memory polling.
 *
 *  * Requests on the same service are serialized; services run in parallel.
 *  * A transport failure closes the whole session (`isOpen()` turns false).
 *  * A remote `ok:false` reply raises LinkError but keeps the session.
 */
    class RpcHardwareLink : public HardwareLink {
    public:
      using ChannelFactory = std::function<std::unique_ptr<SocketChannel>()>;

      using Timeouts = RpcHardwareLinkTimeouts;

      explicit RpcHardwareLink(std::shared_ptr<core::Logger> logger, ChannelFactory factory = {},
                               Timeouts timeouts = Timeouts{});
      ~RpcHardwareLink() override;

      //---HardwareLink------------------------------------------------------
      bool open(const std::string& host, std::uint16_t port) override;
      void close() override;
      bool isOpen() const override { return open_.load(); }

      void say(const std::string& text) override;
      void goToPosture(const std::string& posture, float speed) override;
      nlohmann::json getData(const std::string& key) override;

    private:
      struct Slot {
        std::unique_ptr<SocketChannel> channel;
        std::mutex mtx;
      };

      nlohmann::json call(Service svc, const std::string& method, nlohmann::json args,
                          std::chrono::milliseconds timeout);
      void dropSession(const std::string& reason);

      std::shared_ptr<core::Logger> logger_;
      ChannelFactory factory_;
      Timeouts timeouts_;
      std::array<Slot, static_cast<std::size_t>(Service::Count)> slots_;
      std::atomic<bool> open_{ false };
      std::atomic<std::uint32_t> nextId_{ 1 };
      std::mutex sessionMtx_; ///< guards open()/close()
    };

  } // namespace io
} // namespace genesis
