/* @file SocketChannel.cpp
 * @brief IO abstraction layer that wraps a TCP socket - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_NONBLOCK
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h> // read(), close()

// GENESIS headers
#include "io/SocketChannel.hpp"

using namespace genesis::io;

namespace {
  int millisLeft(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
  }
} // namespace

SocketChannel::~SocketChannel() { close(); }

SocketChannel::SocketChannel(SocketChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)),
      lastError_(std::move(other.lastError_)) {}

SocketChannel& SocketChannel::operator=(SocketChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
    lastError_ = std::move(other.lastError_);
  }
  return *this;
}

bool SocketChannel::open(const std::string& host, std::uint16_t port,
                         std::chrono::milliseconds timeout) {
  close();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  const std::string service = std::to_string(port);
  if (int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results); rc != 0) {
    lastError_ = std::string("getaddrinfo: ") + gai_strerror(rc);
    return false;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    // open non-blocking so connect() honours our timeout
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      fail("socket");
      continue;
    }

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0 && errno != EINPROGRESS) {
      fail("connect");
      ::close(fd);
      continue;
    }

    pollfd pfd{ fd, POLLOUT, 0 };
    int rc = ::poll(&pfd, 1, millisLeft(deadline));
    int soError = 0;
    socklen_t len = sizeof(soError);
    if (rc <= 0 || ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
      if (rc == 0)
        lastError_ = "connect: timed out";
      else {
        errno = soError ? soError : errno;
        fail("connect");
      }
      ::close(fd);
      continue;
    }

    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    fd_ = fd;
    break;
  }

  ::freeaddrinfo(results);
  return fd_ >= 0;
}

bool SocketChannel::adopt(int fd) {
  close();
  if (fd < 0)
    return false;
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
    fail("fcntl");
    return false;
  }
  fd_ = fd;
  return true;
}

bool SocketChannel::writeLine(const std::string& line) {

  if (fd_ < 0) {
    lastError_ = "write: channel closed";
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\r\n")) {
    out += "\r\n";
  }

  // POSIX write loop, waiting for POLLOUT when the kernel buffer is full
  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::send(fd_, out.data() + total, out.size() - total, MSG_NOSIGNAL);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, 1000) <= 0) {
        lastError_ = "write: peer not draining";
        return false;
      }
    } else {
      fail("write");
      close();
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// SocketChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> SocketChannel::readLine(std::chrono::milliseconds timeout) {
  auto takeLine = [this]() -> std::optional<std::string> {
    if (auto pos = rx_buffer_.find('\n'); pos != std::string::npos) {
      std::string line = rx_buffer_.substr(0, pos);
      rx_buffer_.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      return line;
    }
    return std::nullopt;
  };

  // a previous read may already hold a complete line
  if (auto line = takeLine())
    return line;

  if (fd_ < 0)
    return std::nullopt;

  char temp[512];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    int rc = ::poll(&pfd, 1, millisLeft(deadline));
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      fail("poll");
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLIN | POLLHUP | POLLERR)) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / disconnect
        lastError_ = "read: peer closed the connection";
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        fail("read");
        close();
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
    }
  }
  return std::nullopt; // timeout/partial
}

void SocketChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
  rx_buffer_.clear();
}

void SocketChannel::fail(const char* what) {
  lastError_ = std::string(what) + ": " + std::strerror(errno);
}
