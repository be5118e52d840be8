/* @file RpcHardwareLink.cpp
 * @brief blocking request/response calls to the robot bridge, one socket per service
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// GENESIS headers
#include "core/Logger.hpp"
#include "io/RpcHardwareLink.hpp"
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

using namespace genesis::io;

namespace {
  constexpr const char* kTag = "RpcHardwareLink";
  constexpr std::size_t kMaxCommandBytes = 4096;

  std::size_t slotIndex(Service s) { return static_cast<std::size_t>(s); }
} // namespace

RpcHardwareLink::RpcHardwareLink(std::shared_ptr<core::Logger> logger, ChannelFactory factory,
                                 Timeouts timeouts)
    : logger_(std::move(logger)), factory_(std::move(factory)), timeouts_(timeouts) {
  if (!factory_)
    factory_ = [] { return std::make_unique<SocketChannel>(); };
}

RpcHardwareLink::~RpcHardwareLink() { close(); }

bool RpcHardwareLink::open(const std::string& host, std::uint16_t port) {
  std::lock_guard<std::mutex> session(sessionMtx_);
  if (open_)
    return true;

  for (auto svc : { Service::Speech, Service::Motion, Service::Memory }) {
    auto channel = factory_();
    if (!channel || !channel->open(host, port, timeouts_.connect)) {
      logger_->error(kTag, std::string("channel for ") + toString(svc) + " to " + host + ":" +
                               std::to_string(port) + " failed: " +
                               (channel ? channel->lastError() : std::string("no channel")));
      for (auto& slot : slots_) {
        std::lock_guard<std::mutex> lock(slot.mtx);
        slot.channel.reset();
      }
      return false;
    }
    auto& slot = slots_[slotIndex(svc)];
    std::lock_guard<std::mutex> lock(slot.mtx);
    slot.channel = std::move(channel);
  }

  open_ = true;

  // handshake proves the bridge answers, not just that the port is open
  try {
    call(Service::Memory, "ping", nlohmann::json::array(), timeouts_.call);
  } catch (const LinkError& e) {
    logger_->error(kTag, std::string("handshake failed: ") + e.what());
    dropSession("handshake failed");
    return false;
  }

  logger_->info(kTag, "session open to " + host + ":" + std::to_string(port));
  return true;
}

void RpcHardwareLink::close() {
  std::lock_guard<std::mutex> session(sessionMtx_);
  dropSession("closed by caller");
}

void RpcHardwareLink::say(const std::string& text) {
  call(Service::Speech, "say", nlohmann::json::array({ text }), timeouts_.speech);
}

void RpcHardwareLink::goToPosture(const std::string& posture, float speed) {
  call(Service::Motion, "goToPosture", nlohmann::json::array({ posture, speed }), timeouts_.motion);
}

nlohmann::json RpcHardwareLink::getData(const std::string& key) {
  return call(Service::Memory, "getData", nlohmann::json::array({ key }), timeouts_.call);
}

nlohmann::json RpcHardwareLink::call(Service svc, const std::string& method, nlohmann::json args,
                                     std::chrono::milliseconds timeout) {
  if (!open_)
    throw LinkError(std::string("[RpcHardwareLink] not connected, dropped ") + toString(svc) + "." +
                    method);

  auto& slot = slots_[slotIndex(svc)];
  std::unique_lock<std::mutex> lock(slot.mtx);
  if (!open_ || !slot.channel || !slot.channel->isOpen()) {
    std::string reason = std::string(toString(svc)) + " channel closed";
    lock.unlock();
    dropSession(reason);
    throw LinkError("[RpcHardwareLink] " + reason);
  }

  protocols::Command cmd;
  cmd.id = nextId_++;
  cmd.service = toString(svc);
  cmd.method = method;
  cmd.args = std::move(args);

  const std::string wire = cmd.toWire();
  if (wire.size() > kMaxCommandBytes)
    throw LinkError("[RpcHardwareLink] command exceeds " + std::to_string(kMaxCommandBytes) +
                    " byte threshold");

  if (!slot.channel->writeLine(wire)) {
    std::string reason = std::string("write to ") + toString(svc) + " failed: " +
                         slot.channel->lastError();
    lock.unlock();
    dropSession(reason);
    throw LinkError("[RpcHardwareLink] " + reason);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0)
      throw LinkError(std::string("[RpcHardwareLink] ") + toString(svc) + "." + method +
                      " timed out");

    auto line = slot.channel->readLine(left);
    if (!line) {
      if (!slot.channel->isOpen()) {
        std::string reason = std::string(toString(svc)) + " channel lost: " +
                             slot.channel->lastError();
        lock.unlock();
        dropSession(reason);
        throw LinkError("[RpcHardwareLink] " + reason);
      }
      continue; // deadline re-checked at the top
    }

    auto response = protocols::Response::fromWire(*line);
    if (!response) {
      logger_->warn(kTag, "ignoring malformed line from " + std::string(toString(svc)));
      continue;
    }
    if (response->id != cmd.id)
      continue; // stale reply to an earlier, timed-out request

    if (!response->ok)
      throw LinkError(std::string("[RpcHardwareLink] ") + toString(svc) + "." + method +
                      " rejected: " + response->error);
    return response->result;
  }
}

void RpcHardwareLink::dropSession(const std::string& reason) {
  const bool wasOpen = open_.exchange(false);
  // a slot busy in a long call is closed by the next open(); never wait on it here
  for (auto& slot : slots_) {
    std::unique_lock<std::mutex> lock(slot.mtx, std::try_to_lock);
    if (lock.owns_lock() && slot.channel)
      slot.channel->close();
  }
  if (wasOpen)
    logger_->warn(kTag, "session dropped: " + reason);
}
