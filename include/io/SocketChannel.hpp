#pragma once
/** @file  SocketChannel.hpp
 *  @brief Non-blocking TCP line I/O wrapper (uses poll under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace genesis {
  namespace io {

    /**
 * @class SocketChannel
 * @brief RAII wrapper around a single connected TCP socket.
 *
 *  * Frames I/O as ASCII lines (`\r\n` on write, `\n` or `\r\n` on read).
 *  * *Non-copyable*, but move-constructible.
 *  * Virtual so tests can substitute a scripted fake.
 */

    class SocketChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SocketChannel() = default;
      virtual ~SocketChannel(); // close the socket at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& host, std::uint16_t port,
                        std::chrono::milliseconds timeout);
      virtual bool writeLine(const std::string& line); // returns false on EIO / EPIPE
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual void close();
      virtual bool isOpen() const { return fd_ >= 0; }

      /// Human-readable reason for the last failed call.
      const std::string& lastError() const { return lastError_; }

      /// Adopt an already-connected descriptor (used by tests with socketpair()).
      bool adopt(int fd);

      //---non-copyable-----------------------------------------
      SocketChannel(const SocketChannel&) = delete;
      SocketChannel& operator=(const SocketChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SocketChannel(SocketChannel&& other) noexcept;
      SocketChannel& operator=(SocketChannel&& other) noexcept;

    protected:
      void fail(const char* what); ///< record `what: strerror(errno)`

    private:
      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      std::string rx_buffer_{}; ///< bytes received but not yet returned as a line
      std::string lastError_{};
    };
  } // namespace io
} // namespace genesis
